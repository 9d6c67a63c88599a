#include "argparser.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "filesystem.hpp"
#include "log.hpp"
#include "progress.hpp"
#include "remote.hpp"
#include "upload_engine.hpp"
#include "url.hpp"
#include "version.hpp"

#include <algorithm>
#include <cctype>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

treeup::cancel_token cancel;

void on_interrupt(int) { cancel.cancel(); }

}  // namespace

int usage() {
  std::cerr << "treeup upload [--hashes] [--access LINK|PRIVATE] <path>" << std::endl;
  std::cerr << "treeup mkdir [--parent <hash>] [--access LINK|PRIVATE] <name>" << std::endl;
  std::cerr << "treeup ls [--folders] [<hash>]" << std::endl;
  std::cerr << "treeup login" << std::endl;
  std::cerr << "treeup config" << std::endl;
  std::cerr << std::endl;
  std::cerr << "options: [--config <file>] [--remote <url>] [--user <name>] [--password <pass>]" << std::endl;
  std::cerr << "         [--timeout <seconds>] [--json] [--log-level <level>] [--verbose]" << std::endl;
  return EXIT_FAILURE;
}

int version() {
  std::cout << "treeup " << TREEUP_VERSION << std::endl;
  return EXIT_SUCCESS;
}

std::string tolower(std::string s) {
  // Convert string to lowercase
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
  return s;
}

// Loads the configuration file if present and applies command line overrides.
treeup::config load_config(const treeup::argparser& args) {
  std::filesystem::path path = args.get_option_path("--config");

  treeup::config cfg;
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    cfg = treeup::config::load(path);
  }
  else if (args.has_option("--config")) {
    throw treeup::configuration_error("configuration file not found: " + path.string());
  }
  else {
    treeup::log(treeup::log_level::debug) << "no configuration file at " << path.string() << std::endl;
  }

  if (args.has_option("--remote")) cfg.remote_url = args.get_option("--remote");
  if (args.has_option("--user")) cfg.username = args.get_option("--user");
  if (args.has_option("--password")) cfg.password = args.get_option("--password");
  if (args.has_option("--access")) cfg.access = treeup::parse_access_type(args.get_option("--access"));
  if (args.has_option("--timeout")) {
    long long seconds = args.get_option_int("--timeout");
    if (seconds <= 0) throw std::invalid_argument("invalid timeout: " + args.get_option("--timeout"));
    cfg.timeout = std::chrono::seconds(seconds);
  }

  return cfg;
}

std::unique_ptr<treeup::progress_sink> make_progress_sink(const treeup::argparser& args) {
  if (args.has_option("--json")) return std::make_unique<treeup::json_progress_sink>(std::cerr);
  return std::make_unique<treeup::log_progress_sink>();
}

int print_result(const treeup::upload_result& result) {
  if (!result.root_folder.hash.empty()) {
    std::cout << "folder " << result.root_folder.hash << std::endl;
  }
  for (const auto& file : result.uploaded) {
    std::cout << file.identifier << " " << file.path.string() << std::endl;
  }
  for (const auto& failure : result.failures) {
    std::cerr << "failed: " << failure.path.string() << ": " << tolower(failure.message) << std::endl;
  }
  if (!result.error.empty()) {
    std::cerr << "error: " << tolower(result.error) << std::endl;
    return EXIT_FAILURE;
  }

  std::cout << result.summary() << std::endl;
  return result.success ? EXIT_SUCCESS : EXIT_FAILURE;
}

int cmd_treeup(const treeup::argparser& args) {
  if (args.size() < 1) throw std::invalid_argument("missing command argument");

  treeup::config cfg = load_config(args);

  if (args[0] == "config") {
    std::cout << cfg.dump(true) << std::endl;
    return EXIT_SUCCESS;
  }

  treeup::url remoteurl(cfg.remote_url);
  if (remoteurl.host().empty()) throw std::invalid_argument("invalid remote URL: " + cfg.remote_url);

  if (args[0] == "upload") {
    if (args.size() < 2) throw std::invalid_argument("missing path argument");

    std::filesystem::path path = args.get_value_path(1);
    if (!path.has_filename() && path.has_parent_path()) path = path.parent_path();

    treeup::file_stat st;
    treeup::stat(path, st);
    if (st.type == treeup::entry_type::missing) {
      throw std::invalid_argument("no such file or directory: " + path.string());
    }

    std::unique_ptr<treeup::remote_client> client = treeup::remote_client::create(remoteurl, cfg.options());
    std::unique_ptr<treeup::progress_sink> sink = make_progress_sink(args);
    treeup::upload_engine engine(*client, *sink);

    std::signal(SIGINT, on_interrupt);

    if (st.type == treeup::entry_type::directory) {
      cfg.validate_for_folder_upload();

      treeup::upload_context context(*client, cfg.credentials(), cfg.base_folder(), cfg.access);
      context.want_hashes = args.has_option("--hashes");
      context.cancel = &cancel;

      return print_result(engine.upload_folder_recursive(path, context));
    }

    cfg.validate_for_file_upload();
    return print_result(
        engine.upload_single_file(path, cfg.base_folder_hash, cfg.folder_key, args.has_option("--hashes"), &cancel));
  }
  else if (args[0] == "mkdir") {
    if (args.size() < 2) throw std::invalid_argument("missing name argument");

    std::string name = args[1];
    if (name.empty()) throw std::invalid_argument("missing name argument");

    std::string parent = args.has_option("--parent") ? args.get_option("--parent") : cfg.base_folder_hash;
    if (parent.empty()) throw treeup::configuration_error("incomplete configuration, missing: BaseFolderHash");
    if (cfg.credentials().empty()) {
      throw treeup::configuration_error("incomplete configuration, missing: Username Password");
    }

    std::unique_ptr<treeup::remote_client> client = treeup::remote_client::create(remoteurl, cfg.options());
    treeup::remote_folder folder = client->create_folder(name, parent, cfg.credentials(), cfg.access);

    std::cout << "hash " << folder.hash << std::endl;
    if (!folder.add_key.empty()) std::cout << "add_key " << folder.add_key << std::endl;
    if (!folder.edit_key.empty()) std::cout << "edit_key " << folder.edit_key << std::endl;
    return EXIT_SUCCESS;
  }
  else if (args[0] == "ls") {
    std::string hash = args.size() > 1 ? args[1] : cfg.base_folder_hash;
    if (hash.empty()) throw std::invalid_argument("missing folder hash argument");

    std::unique_ptr<treeup::remote_client> client = treeup::remote_client::create(remoteurl, cfg.options());
    for (const auto& entry : client->list_folder(hash, args.has_option("--folders"))) {
      std::cout << std::setw(20) << entry.hash << " " << (entry.is_folder ? "d" : "-") << " " << std::setw(12)
                << entry.size << " " << entry.name << std::endl;
    }
    return EXIT_SUCCESS;
  }
  else if (args[0] == "login") {
    if (cfg.credentials().empty()) {
      throw treeup::configuration_error("incomplete configuration, missing: Username Password");
    }

    std::unique_ptr<treeup::remote_client> client = treeup::remote_client::create(remoteurl, cfg.options());
    treeup::login_result login = client->login(cfg.credentials());

    cfg.base_folder_hash = login.base_folder.hash;
    if (!login.base_folder.upload_key().empty()) cfg.folder_key = login.base_folder.upload_key();

    std::filesystem::path path = args.get_option_path("--config");
    cfg.save(path);

    treeup::log(treeup::log_level::info) << "saved configuration to " << path.string() << std::endl;
    std::cout << login.base_folder.hash << std::endl;
    return EXIT_SUCCESS;
  }
  else {
    throw std::invalid_argument("unknown command: " + args[0]);
  }
}

int main(int argc, char* argv[]) {
  try {
    if (argc < 2) {
      return usage();
    }

    treeup::argparser args;
    args.set_env_prefix("TREEUP");
    args.add_option("--config", treeup::default_config_path().string());
    args.add_option_alias("--config", "-c");
    args.add_option("--remote", "");
    args.add_option_alias("--remote", "-r");
    args.add_option("--user", "");
    args.add_option_alias("--user", "-u");
    args.add_option("--password", "");
    args.add_option_alias("--password", "-p");
    args.add_option("--timeout", "");
    args.add_option_alias("--timeout", "-t");
    args.add_option("--access", "");
    args.add_option("--parent", "");
    args.add_option("--log-level", "warn");
    args.add_bool_option("--hashes");
    args.add_bool_option("--folders");
    args.add_bool_option("--json");
    args.add_option_alias("--json", "-J");
    args.add_bool_option("--verbose");
    args.add_option_alias("--verbose", "-v");
    args.add_bool_option("--help");
    args.add_option_alias("--help", "-h");
    args.add_bool_option("--version");
    args.add_option_alias("--version", "-V");
    args.parse(argc, argv);

    if (args.has_option("--help")) return usage();
    if (args.has_option("--version")) return version();

    treeup::set_log_level(treeup::parse_log_level(args.get_option("--log-level")));
    if (args.has_option("--verbose")) treeup::set_log_level(treeup::log_level::debug);

    return cmd_treeup(args);
  }
  catch (const std::exception& e) {
    std::cerr << "error: " << tolower(e.what()) << std::endl;
    return EXIT_FAILURE;
  }
}
