#include "filesystem.hpp"

#include "exception.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <sys/stat.h>
#include <unistd.h>

namespace treeup {

void stat(const std::filesystem::path& path, file_stat& status_out) {
  struct ::stat st;

  int ret = ::stat(path.c_str(), &st);
  if (ret != 0) {
    if (errno == ENOENT || errno == ENOTDIR) {
      status_out.type = entry_type::missing;
      status_out.size = 0;
      return;
    }
    throw traversal_error("failed to stat: " + path.string() + ": " + std::strerror(errno));
  }

  switch (st.st_mode & S_IFMT) {
    case S_IFDIR:
      status_out.type = entry_type::directory;
      break;
    case S_IFREG:
      status_out.type = entry_type::regular;
      break;
    default:
      status_out.type = entry_type::other;
      break;
  }
  status_out.size = status_out.type == entry_type::regular ? uint64_t(st.st_size) : 0;
}

bool is_readable(const std::filesystem::path& path) { return ::access(path.c_str(), R_OK) == 0; }

std::filesystem::path home_path() {
  std::filesystem::path home = getenv("HOME") ? getenv("HOME") : "";
  return home;
}

std::filesystem::path config_home_path() {
  const char* xdg = getenv("XDG_CONFIG_HOME");
  if (xdg && *xdg) return std::filesystem::path(xdg);

  std::filesystem::path config = home_path();
  if (!config.empty()) config /= ".config";
  return config;
}

std::filesystem::path default_config_path() {
  std::filesystem::path config = config_home_path();
  if (config.empty()) return "treeup.json";
  return config / "treeup" / "config.json";
}

}  // namespace treeup
