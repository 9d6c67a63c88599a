#include "config.hpp"

#include "exception.hpp"

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace treeup {

namespace {

void read_string(const json& object, const char* key, std::string& out) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) return;
  if (!it->is_string()) {
    throw configuration_error(std::string("invalid configuration: ") + key + " must be a string");
  }
  out = it->get<std::string>();
}

void throw_missing(const std::vector<std::string>& missing) {
  std::string message = "incomplete configuration, missing:";
  for (const auto& field : missing) {
    message += " " + field;
  }
  throw configuration_error(message);
}

}  // namespace

config config::parse(const std::string& text) {
  json object = json::parse(text, nullptr, false);
  if (object.is_discarded()) {
    throw configuration_error("invalid configuration: not valid JSON");
  }
  if (!object.is_object()) {
    throw configuration_error("invalid configuration: expected a JSON object");
  }

  config cfg;
  read_string(object, "Username", cfg.username);
  read_string(object, "Password", cfg.password);
  read_string(object, "BaseFolderHash", cfg.base_folder_hash);
  read_string(object, "FolderKey", cfg.folder_key);
  read_string(object, "RemoteUrl", cfg.remote_url);

  std::string access;
  read_string(object, "AccessType", access);
  if (!access.empty()) {
    try {
      cfg.access = parse_access_type(access);
    }
    catch (const std::invalid_argument& e) {
      throw configuration_error(std::string("invalid configuration: ") + e.what());
    }
  }

  auto timeout = object.find("Timeout");
  if (timeout != object.end() && !timeout->is_null()) {
    if (!timeout->is_number_integer() || timeout->get<long long>() <= 0) {
      throw configuration_error("invalid configuration: Timeout must be a positive number of seconds");
    }
    cfg.timeout = std::chrono::seconds(timeout->get<long long>());
  }

  if (cfg.remote_url.empty()) cfg.remote_url = default_remote_url;
  return cfg;
}

config config::load(const std::filesystem::path& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw configuration_error("failed to open configuration file: " + path.string());
  }

  std::stringstream ss;
  ss << file.rdbuf();

  try {
    return parse(ss.str());
  }
  catch (const configuration_error& e) {
    throw configuration_error(path.string() + ": " + e.what());
  }
}

std::string config::dump(bool mask_password) const {
  json object = {
      {"Username", username},
      {"Password", mask_password && !password.empty() ? std::string(8, '*') : password},
      {"BaseFolderHash", base_folder_hash},
      {"FolderKey", folder_key},
      {"RemoteUrl", remote_url},
      {"AccessType", to_string(access)},
      {"Timeout", timeout.count()},
  };
  return object.dump(2);
}

void config::save(const std::filesystem::path& path) const {
  std::error_code ec;
  if (path.has_parent_path() && !std::filesystem::exists(path.parent_path(), ec)) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      throw configuration_error("failed to create directory: " + path.parent_path().string() + ": " + ec.message());
    }
  }

  // The file holds the account password, restrict it before anything is written
  {
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
      throw configuration_error("failed to write configuration file: " + path.string());
    }
  }
  std::filesystem::permissions(
      path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
      std::filesystem::perm_options::replace, ec);
  if (ec) {
    throw configuration_error("failed to restrict permissions of " + path.string() + ": " + ec.message());
  }

  std::ofstream file(path, std::ios::trunc);
  if (!file.is_open()) {
    throw configuration_error("failed to write configuration file: " + path.string());
  }
  file << dump() << std::endl;
  if (!file) {
    throw configuration_error("failed to write configuration file: " + path.string());
  }
}

void config::validate_for_file_upload() const {
  std::vector<std::string> missing;
  if (base_folder_hash.empty()) missing.push_back("BaseFolderHash");
  if (folder_key.empty()) missing.push_back("FolderKey");
  if (!missing.empty()) throw_missing(missing);
}

void config::validate_for_folder_upload() const {
  std::vector<std::string> missing;
  if (username.empty()) missing.push_back("Username");
  if (password.empty()) missing.push_back("Password");
  if (base_folder_hash.empty()) missing.push_back("BaseFolderHash");
  if (!missing.empty()) throw_missing(missing);
}

remote_folder config::base_folder() const {
  remote_folder folder;
  folder.hash = base_folder_hash;
  folder.add_key = folder_key;
  return folder;
}

remote_options config::options() const {
  remote_options opts;
  opts.timeout = timeout;
  return opts;
}

}  // namespace treeup
