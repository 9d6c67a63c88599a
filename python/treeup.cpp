#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "config.hpp"
#include "exception.hpp"
#include "log.hpp"
#include "simple.hpp"
#include "upload_result.hpp"

namespace py = pybind11;

PYBIND11_MODULE(treeup, m) {
    m.doc() = "Python bindings for treeup - upload files and folder trees to a file host";

    py::register_exception<treeup::exception>(m, "Error", PyExc_RuntimeError);
    py::register_exception<treeup::configuration_error>(m, "ConfigurationError", PyExc_ValueError);

    m.def("set_log_level", [](const std::string& level) {
        treeup::set_log_level(treeup::parse_log_level(level));
    }, py::arg("level"));

    // Expose the configuration
    py::class_<treeup::config>(m, "Config")
        .def(py::init<>())
        .def_static("load", [](const std::string& path) { return treeup::config::load(path); }, py::arg("path"))
        .def_readwrite("username", &treeup::config::username)
        .def_readwrite("password", &treeup::config::password)
        .def_readwrite("base_folder_hash", &treeup::config::base_folder_hash)
        .def_readwrite("folder_key", &treeup::config::folder_key)
        .def_readwrite("remote_url", &treeup::config::remote_url)
        .def("save", [](const treeup::config& cfg, const std::string& path) { cfg.save(path); }, py::arg("path"))
        .def("__repr__", [](const treeup::config& cfg) { return cfg.dump(true); });

    py::class_<treeup::upload_failure>(m, "UploadFailure")
        .def_property_readonly("path", [](const treeup::upload_failure& f) { return f.path.string(); })
        .def_readonly("message", &treeup::upload_failure::message)
        .def_property_readonly("is_folder", [](const treeup::upload_failure& f) {
            return f.kind == treeup::failure_kind::folder;
        });

    // Expose the aggregate result
    py::class_<treeup::upload_result>(m, "UploadResult")
        .def_readonly("success", &treeup::upload_result::success)
        .def_readonly("files_attempted", &treeup::upload_result::files_attempted)
        .def_readonly("files_succeeded", &treeup::upload_result::files_succeeded)
        .def_readonly("folders_created", &treeup::upload_result::folders_created)
        .def_readonly("cancelled", &treeup::upload_result::cancelled)
        .def_readonly("error", &treeup::upload_result::error)
        .def_readonly("failures", &treeup::upload_result::failures)
        .def_property_readonly("root_folder_hash", [](const treeup::upload_result& r) {
            return r.root_folder.hash;
        })
        .def_property_readonly("uploaded", [](const treeup::upload_result& r) {
            py::list files;
            for (const auto& file : r.uploaded) {
                files.append(py::make_tuple(file.path.string(), file.identifier));
            }
            return files;
        })
        .def("summary", &treeup::upload_result::summary)
        .def("__bool__", [](const treeup::upload_result& r) { return r.success; });

    // Expose the simple API
    py::class_<treeup::simple>(m, "Simple")
        .def(py::init<>())
        .def(py::init<const std::string&>(), py::arg("config_path"))
        .def(py::init<const treeup::config&>(), py::arg("config"))
        .def("upload_file", &treeup::simple::upload_file, py::arg("path"), py::arg("want_hash") = false)
        .def("upload_folder", &treeup::simple::upload_folder, py::arg("path"), py::arg("want_hashes") = false);
}
