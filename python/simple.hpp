#pragma once

#include "config.hpp"
#include "progress.hpp"
#include "upload_result.hpp"

#include <memory>
#include <string>

namespace treeup {

// Configuration driven entry points for scripting: each call connects to the
// configured remote, runs one upload and returns its result.
class simple {
public:
    simple();
    explicit simple(const std::string& config_path);
    explicit simple(const config& cfg);

    const config& settings() const { return _config; }

    upload_result upload_file(const std::string& path, bool want_hash);
    upload_result upload_folder(const std::string& path, bool want_hashes);

private:
    config _config;
    log_progress_sink _sink;
};

} // namespace treeup
