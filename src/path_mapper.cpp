#include "path_mapper.hpp"

#include "exception.hpp"
#include "log.hpp"

#include <system_error>

namespace treeup {

path_mapper::path_mapper(remote_client& client, access_type access) : _client(client), _access(access) {}

std::filesystem::path path_mapper::normalize(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::path normal = std::filesystem::absolute(path, ec);
  if (ec) {
    throw traversal_error("failed to resolve path: " + path.string() + ": " + ec.message());
  }
  normal = normal.lexically_normal();

  // "dir/" and "dir" name the same directory
  if (!normal.has_filename() && normal.has_parent_path() && normal != normal.root_path()) {
    normal = normal.parent_path();
  }
  return normal;
}

const remote_folder& path_mapper::resolve(
    const std::filesystem::path& local_dir, const remote_folder& parent, const credentials& creds) {
  std::filesystem::path key = normalize(local_dir);

  auto it = _folders.find(key);
  if (it != _folders.end()) {
    log(log_level::debug) << "reusing remote folder " << it->second.hash << " for " << key.string() << std::endl;
    return it->second;
  }

  std::string name = key.filename().string();
  remote_folder folder = _client.create_folder(name, parent.hash, creds, _access);

  log(log_level::info) << "created remote folder " << folder.hash << " for " << key.string() << std::endl;
  return _folders.emplace(key, folder).first->second;
}

const remote_folder* path_mapper::find(const std::filesystem::path& local_dir) const {
  auto it = _folders.find(normalize(local_dir));
  return it == _folders.end() ? nullptr : &it->second;
}

void path_mapper::insert(const std::filesystem::path& local_dir, const remote_folder& folder) {
  _folders[normalize(local_dir)] = folder;
}

}  // namespace treeup
