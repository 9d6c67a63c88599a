#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace treeup {

class url;

// Account credentials sent with folder management requests.
struct credentials {
  std::string username;
  std::string password;

  bool empty() const { return username.empty() || password.empty(); }
};

// Folder identity assigned by the remote service.
// Immutable once created; the keys are cached with the hash because
// deriving them again costs a round trip.
struct remote_folder {
  std::string hash;
  std::string add_key;
  std::string edit_key;

  // Key presented when uploading into this folder: add_key if present, otherwise edit_key.
  const std::string& upload_key() const { return add_key.empty() ? edit_key : add_key; }
};

// Visibility of newly created folders.
enum class access_type {
  link,
  private_access,
};

std::string to_string(access_type type);
access_type parse_access_type(const std::string& value);

// An entry in a remote folder listing.
struct remote_entry {
  std::string name;
  std::string hash;
  uint64_t size = 0;
  bool is_folder = false;
};

// Outcome of a login request.
struct login_result {
  std::string session;
  remote_folder base_folder;
};

// Connection options for remote clients.
struct remote_options {
  std::chrono::seconds connect_timeout{30};
  std::chrono::seconds timeout{600};
};

// Receives (bytes sent, bytes total) while a file is uploaded.
using transfer_callback = std::function<void(uint64_t, uint64_t)>;

class remote_client {
 public:
  static std::unique_ptr<remote_client> create(const url& address, const remote_options& options = {});

  virtual ~remote_client() = default;

  // Authenticates and returns the session token and the account's base folder.
  // Throws remote_error.
  virtual login_result login(const credentials& creds) = 0;

  // Creates a folder named `name` below `parent_hash`.
  // The service does not deduplicate by name, every call creates a new folder.
  // Throws folder_create_error.
  virtual remote_folder create_folder(
      const std::string& name, const std::string& parent_hash, const credentials& creds, access_type access) = 0;

  // Uploads the file at `path` into the folder `folder_hash` using `key` for authorization.
  // Returns the acknowledgement token "d", or the file's content hash if `want_hash` is set.
  // Throws upload_error.
  virtual std::string upload_file(
      const std::filesystem::path& path,
      const std::string& folder_hash,
      const std::string& key,
      bool want_hash,
      const transfer_callback& progress = nullptr) = 0;

  // Lists the contents of a folder. Throws remote_error.
  virtual std::vector<remote_entry> list_folder(const std::string& folder_hash, bool include_folders) = 0;
};

}  // namespace treeup
