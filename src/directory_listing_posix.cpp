#include "directory_listing.hpp"

#include "exception.hpp"
#include "log.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <dirent.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace treeup {

directory_listing::directory_listing(const std::filesystem::path& path) : _path(path) {
  read_directory();

  auto by_name = [](const local_entry& a, const local_entry& b) { return a.name < b.name; };
  std::sort(_files.begin(), _files.end(), by_name);
  std::sort(_directories.begin(), _directories.end(), by_name);
}

void directory_listing::read_directory() {
  // Open the directory
  DIR* dir = opendir(_path.c_str());
  if (dir == nullptr) {
    throw traversal_error("failed to open directory: " + _path.string() + ": " + std::strerror(errno));
  }

  // Iterate the directory
  const struct dirent* entry;
  while ((entry = readdir(dir)) != nullptr) {
    std::string name = entry->d_name;

    // Skip . and ..
    if (name == "." || name == "..") {
      continue;
    }

    // Skip anything that's not a directory or file. Unknown types are resolved by lstat below.
    if (entry->d_type != DT_DIR && entry->d_type != DT_REG && entry->d_type != DT_UNKNOWN) {
      log(log_level::debug) << "skipping special file: " << (_path / name).string() << std::endl;
      continue;
    }

    std::filesystem::path abspath = _path / name;

    // Stat the file, it may have vanished since readdir
    struct ::stat st;
    if (::lstat(abspath.c_str(), &st) != 0) {
      log(log_level::debug) << "skipping vanished entry: " << abspath.string() << std::endl;
      continue;
    }

    switch (st.st_mode & S_IFMT) {
      case S_IFDIR:
        _directories.push_back(local_entry{abspath, name, 0, true});
        break;
      case S_IFREG:
        _files.push_back(local_entry{abspath, name, uint64_t(st.st_size), false});
        break;
      default:
        break;
    }
  }

  // Close the directory
  closedir(dir);
}

size_t count_files(const std::filesystem::path& path) {
  size_t count = 0;
  try {
    directory_listing listing(path);
    count += listing.files().size();
    for (const auto& dir : listing.directories()) {
      count += count_files(dir.path);
    }
  }
  catch (const traversal_error& e) {
    log(log_level::debug) << "not counting files below " << path.string() << ": " << e.what() << std::endl;
  }
  return count;
}

}  // namespace treeup
