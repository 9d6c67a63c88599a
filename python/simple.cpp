#include "simple.hpp"

#include "filesystem.hpp"
#include "remote.hpp"
#include "upload_engine.hpp"
#include "url.hpp"

namespace treeup {

simple::simple() : _config(config::load(default_config_path())) {}

simple::simple(const std::string& config_path) : _config(config::load(config_path)) {}

simple::simple(const config& cfg) : _config(cfg) {}

upload_result simple::upload_file(const std::string& path, bool want_hash) {
    _config.validate_for_file_upload();

    std::unique_ptr<remote_client> client = remote_client::create(url(_config.remote_url), _config.options());
    upload_engine engine(*client, _sink);
    return engine.upload_single_file(std::filesystem::absolute(path), _config.base_folder_hash, _config.folder_key, want_hash);
}

upload_result simple::upload_folder(const std::string& path, bool want_hashes) {
    _config.validate_for_folder_upload();

    std::unique_ptr<remote_client> client = remote_client::create(url(_config.remote_url), _config.options());
    upload_engine engine(*client, _sink);

    upload_context context(*client, _config.credentials(), _config.base_folder(), _config.access);
    context.want_hashes = want_hashes;
    return engine.upload_folder_recursive(std::filesystem::absolute(path).lexically_normal(), context);
}

} // namespace treeup
