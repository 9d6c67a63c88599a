#pragma once

#include "remote.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>

namespace treeup {

// Maps local directories to the remote folders created for them, keyed by absolute path.
// Each directory is created remotely at most once per mapper; entries are
// only added, never removed. Not thread safe.
class path_mapper {
  remote_client& _client;
  access_type _access;
  std::map<std::filesystem::path, remote_folder> _folders;

 public:
  explicit path_mapper(remote_client& client, access_type access = access_type::link);

  // Returns the remote folder for `local_dir`, creating it below `parent` on first use.
  // The folder is named after the last component of `local_dir`.
  // folder_create_error propagates unchanged and leaves the cache untouched.
  const remote_folder& resolve(
      const std::filesystem::path& local_dir, const remote_folder& parent, const credentials& creds);

  // Returns the cached folder or nullptr.
  const remote_folder* find(const std::filesystem::path& local_dir) const;

  // Records an existing remote folder for a directory, e.g. from an earlier run.
  void insert(const std::filesystem::path& local_dir, const remote_folder& folder);

  bool contains(const std::filesystem::path& local_dir) const { return find(local_dir) != nullptr; }
  size_t size() const { return _folders.size(); }

  auto begin() const { return _folders.begin(); }
  auto end() const { return _folders.end(); }

  // Client folders are created with.
  remote_client& client() const { return _client; }

  // Absolute, lexically normal form without a trailing separator.
  // "." and "dir/.." name their directory, so the folder is named after it.
  static std::filesystem::path normalize(const std::filesystem::path& path);
};

}  // namespace treeup
