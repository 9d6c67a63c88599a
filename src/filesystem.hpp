#ifndef TREEUP_FILESYSTEM_HPP
#define TREEUP_FILESYSTEM_HPP

#include <cstdint>
#include <filesystem>

namespace treeup {

enum class entry_type {
  missing,
  regular,
  directory,
  other,
};

struct file_stat {
  entry_type type = entry_type::missing;
  uint64_t size = 0;
};

std::filesystem::path home_path();
std::filesystem::path config_home_path();

// Default configuration file location.
std::filesystem::path default_config_path();

// Stat a path, following symlinks. Missing paths are reported as entry_type::missing.
// Throws traversal_error for any other failure.
void stat(const std::filesystem::path& path, file_stat& st);

// Returns true if the file can be opened for reading.
bool is_readable(const std::filesystem::path& path);

}  // namespace treeup

#endif  // TREEUP_FILESYSTEM_HPP
