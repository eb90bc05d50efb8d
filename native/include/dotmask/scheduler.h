#ifndef DOTMASK_SCHEDULER_H
#define DOTMASK_SCHEDULER_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace dotmask {

using Clock = std::chrono::steady_clock;
using Task = std::function<void()>;

// Cooperative single-threaded timer wheel driven by the host loop.
//
// Timers are keyed; scheduling a key that is already pending replaces it, so a key has at
// most one pending task. Deferred tasks run on the next RunDue() regardless of time.
// Time is always passed in, which keeps tests deterministic.
class TaskScheduler {
 public:
  TaskScheduler() = default;
  TaskScheduler(const TaskScheduler&) = delete;
  TaskScheduler& operator=(const TaskScheduler&) = delete;

  uint64_t Schedule(const std::string& key, std::chrono::milliseconds delay, Clock::time_point now, Task task);
  void Defer(Task task);

  bool Cancel(const std::string& key);
  void CancelAll();

  // Runs deferred tasks queued before this call, then every timer due at |now| in due
  // order. Tasks may schedule or cancel others. Returns the number of tasks run.
  size_t RunDue(Clock::time_point now);

  bool IsPending(const std::string& key) const { return timers_.count(key) > 0; }
  size_t ActiveCount() const { return timers_.size(); }
  size_t DeferredCount() const { return deferred_.size(); }

 private:
  struct Timer {
    uint64_t id;
    Clock::time_point due;
    Task task;
  };

  std::map<std::string, Timer> timers_;
  std::vector<Task> deferred_;
  uint64_t next_id_{1};
};

}  // namespace dotmask

#endif
