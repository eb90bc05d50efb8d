#include "dotmask/scheduler.h"

#include <algorithm>
#include <tuple>
#include <utility>

namespace dotmask {

uint64_t TaskScheduler::Schedule(const std::string& key, std::chrono::milliseconds delay, Clock::time_point now,
                                 Task task) {
  const uint64_t id = next_id_++;
  timers_[key] = Timer{id, now + delay, std::move(task)};
  return id;
}

void TaskScheduler::Defer(Task task) { deferred_.push_back(std::move(task)); }

bool TaskScheduler::Cancel(const std::string& key) { return timers_.erase(key) > 0; }

void TaskScheduler::CancelAll() { timers_.clear(); }

size_t TaskScheduler::RunDue(Clock::time_point now) {
  size_t ran = 0;

  std::vector<Task> batch;
  batch.swap(deferred_);
  for (Task& t : batch) {
    if (t) t();
    ++ran;
  }

  std::vector<std::tuple<Clock::time_point, uint64_t, std::string>> due;
  for (const auto& kv : timers_) {
    if (kv.second.due <= now) due.emplace_back(kv.second.due, kv.second.id, kv.first);
  }
  std::sort(due.begin(), due.end());

  for (const auto& d : due) {
    auto it = timers_.find(std::get<2>(d));
    // Cancelled or replaced by an earlier task in this pass.
    if (it == timers_.end() || it->second.id != std::get<1>(d)) continue;
    Task task = std::move(it->second.task);
    timers_.erase(it);
    if (task) task();
    ++ran;
  }
  return ran;
}

}  // namespace dotmask
