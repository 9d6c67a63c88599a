#pragma once

#include "remote.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace treeup {

// Installation settings: who uploads, and the remote folder uploads go to.
// Stored as a JSON object with the keys Username, Password, BaseFolderHash
// and FolderKey, plus the optional RemoteUrl, AccessType and Timeout.
class config {
 public:
  static constexpr const char* default_remote_url = "https://api.files.fm";
  static constexpr std::chrono::seconds default_timeout{600};

  std::string username;
  std::string password;
  std::string base_folder_hash;
  std::string folder_key;
  std::string remote_url = default_remote_url;
  access_type access = access_type::link;
  std::chrono::seconds timeout = default_timeout;

  // Load settings from a JSON file. Throws configuration_error.
  static config load(const std::filesystem::path& path);

  // Parse settings from JSON text. Throws configuration_error.
  static config parse(const std::string& text);

  // Write settings to a JSON file, creating parent directories. Throws configuration_error.
  void save(const std::filesystem::path& path) const;

  // JSON text of the settings. The password is replaced by asterisks if `mask_password` is set.
  std::string dump(bool mask_password = false) const;

  // Throw configuration_error naming every field missing for the upload mode.
  void validate_for_file_upload() const;
  void validate_for_folder_upload() const;

  treeup::credentials credentials() const { return treeup::credentials{username, password}; }
  remote_folder base_folder() const;
  remote_options options() const;
};

}  // namespace treeup
