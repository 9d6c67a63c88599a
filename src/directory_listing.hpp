#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace treeup {

// A filesystem node seen while listing a directory.
struct local_entry {
  std::filesystem::path path;
  std::string name;
  uint64_t size = 0;
  bool is_directory = false;
};

// Non-recursive snapshot of one directory level.
// Regular files and subdirectories are collected separately and sorted by name.
// Symbolic links, sockets, devices and other special files are skipped.
class directory_listing {
  std::filesystem::path _path;
  std::vector<local_entry> _files;
  std::vector<local_entry> _directories;

 public:
  // Reads the directory. Throws traversal_error if it cannot be opened.
  explicit directory_listing(const std::filesystem::path& path);

  const std::filesystem::path& path() const { return _path; }
  const std::vector<local_entry>& files() const { return _files; }
  const std::vector<local_entry>& directories() const { return _directories; }

  bool empty() const { return _files.empty() && _directories.empty(); }

 private:
  void read_directory();
};

// Counts regular files below `path`, recursively. Unreadable directories are skipped.
size_t count_files(const std::filesystem::path& path);

}  // namespace treeup
