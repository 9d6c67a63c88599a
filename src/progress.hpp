#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>

namespace treeup {

struct progress_event {
  std::string label;
  uint64_t total = 0;       // bytes or items, 0 if unknown
  uint64_t done_count = 0;  // bytes or items completed
  std::chrono::milliseconds elapsed{0};
  bool done = false;        // terminal event of the tracked operation
};

// Receives progress events from the engine.
// Implementations must not throw; the engine never waits on them.
class progress_sink {
 public:
  virtual ~progress_sink() = default;
  virtual void emit(const progress_event& event) = 0;
};

class null_progress_sink : public progress_sink {
 public:
  void emit(const progress_event&) override {}
};

// Writes one JSON object per event and line.
class json_progress_sink : public progress_sink {
  std::ostream& _stream;
  std::mutex _mutex;

 public:
  explicit json_progress_sink(std::ostream& stream) : _stream(stream) {}
  void emit(const progress_event& event) override;
};

// Writes terminal events to the log at info level, intermediate events at debug level.
class log_progress_sink : public progress_sink {
 public:
  void emit(const progress_event& event) override;
};

// Tracks one operation and guarantees that exactly one terminal event
// (done = true) is emitted for it, even if the owner unwinds through an exception.
class progress_tracker {
  progress_sink& _sink;
  std::string _label;
  uint64_t _total;
  uint64_t _done_count = 0;
  std::chrono::steady_clock::time_point _start;
  bool _finished = false;

 public:
  progress_tracker(progress_sink& sink, const std::string& label, uint64_t total);
  ~progress_tracker();

  progress_tracker(const progress_tracker&) = delete;
  progress_tracker& operator=(const progress_tracker&) = delete;

  // Emit an intermediate event. Ignored after finish().
  void update(uint64_t done_count);

  // Emit an intermediate event with a new total.
  void update(uint64_t done_count, uint64_t total);

  // Emit the terminal event. Subsequent calls are ignored.
  void finish();

  bool finished() const { return _finished; }

 private:
  progress_event make_event(bool done) const;
};

}  // namespace treeup
