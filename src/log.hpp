#pragma once

#include <iostream>
#include <mutex>
#include <ostream>
#include <string>

namespace treeup {

enum class log_level {
  debug = 0,
  info = 1,
  warn = 2,
  error = 3,
  off = 4,
};

// An output stream holding the logger lock for its lifetime, so that
// lines written from different places never interleave.
// A default constructed log_stream has no buffer and discards everything.
class log_stream : public std::ostream {
  std::unique_lock<std::mutex> _lock;

 public:
  log_stream() : std::ostream(nullptr) {}

  log_stream(std::ostream& stream, std::mutex& mutex) : std::ostream(stream.rdbuf()), _lock(mutex) {}

  log_stream(log_stream&& other) : std::ostream(other.rdbuf()), _lock(std::move(other._lock)) {}
};

// Set log level
void set_log_level(log_level level);

// Get log level
log_level get_log_level();

// Parse a level name (debug, info, warn, error, off)
log_level parse_log_level(const std::string& name);

// Redirect log output, mainly for tests. The stream must outlive all logging.
void set_log_stream(std::ostream& stream);

// Returns the log stream if enabled, otherwise returns a null stream
log_stream log(log_level level = log_level::info);

}  // namespace treeup
