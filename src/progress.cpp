#include "progress.hpp"

#include "log.hpp"

#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

namespace treeup {

// Emit an event in JSON format
void json_progress_sink::emit(const progress_event& event) {
  nlohmann::json object = {
      {"label", event.label},
      {"total", event.total},
      {"done_count", event.done_count},
      {"elapsed_ms", event.elapsed.count()},
      {"done", event.done},
  };

  // Invalid UTF-8 in file names is replaced rather than thrown.
  std::string line = object.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

  std::lock_guard<std::mutex> lock(_mutex);
  _stream << line << "\n";
  _stream.flush();
}

void log_progress_sink::emit(const progress_event& event) {
  if (event.done) {
    log(log_level::info) << event.label << ": done " << event.done_count << "/" << event.total << " in "
                         << event.elapsed.count() << " ms" << std::endl;
  }
  else {
    log(log_level::debug) << event.label << ": " << event.done_count << "/" << event.total << std::endl;
  }
}

progress_tracker::progress_tracker(progress_sink& sink, const std::string& label, uint64_t total)
    : _sink(sink), _label(label), _total(total), _start(std::chrono::steady_clock::now()) {
  _sink.emit(make_event(false));
}

progress_tracker::~progress_tracker() { finish(); }

void progress_tracker::update(uint64_t done_count) {
  if (_finished) return;
  _done_count = done_count;
  _sink.emit(make_event(false));
}

void progress_tracker::update(uint64_t done_count, uint64_t total) {
  _total = total;
  update(done_count);
}

void progress_tracker::finish() {
  if (_finished) return;
  _finished = true;
  _sink.emit(make_event(true));
}

progress_event progress_tracker::make_event(bool done) const {
  progress_event event;
  event.label = _label;
  event.total = _total;
  event.done_count = _done_count;
  event.elapsed =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - _start);
  event.done = done;
  return event;
}

}  // namespace treeup
