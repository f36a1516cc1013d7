// Clock and manual event loop implementation.

#include "core/event_loop.h"

#include <chrono>

namespace vitals {

Timestamp SystemClock::now() const {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

ManualEventLoop::ManualEventLoop(Timestamp start_seconds)
    : now_ms_(start_seconds * 1000) {}

Timestamp ManualEventLoop::now() const {
  // Floor toward negative infinity so pre-epoch times stay consistent.
  int64_t seconds = now_ms_ / 1000;
  if (now_ms_ % 1000 != 0 && now_ms_ < 0) --seconds;
  return seconds;
}

TaskId ManualEventLoop::scheduleAfter(int64_t delay_ms, std::function<void()> task) {
  if (delay_ms < 0) delay_ms = 0;
  TaskId id = next_id_++;
  int64_t deadline = now_ms_ + delay_ms;
  tasks_.emplace(TaskKey{deadline, id}, std::move(task));
  deadlines_[id] = deadline;
  return id;
}

void ManualEventLoop::cancel(TaskId id) {
  auto found = deadlines_.find(id);
  if (found == deadlines_.end()) return;
  tasks_.erase(TaskKey{found->second, id});
  deadlines_.erase(found);
}

size_t ManualEventLoop::advanceMs(int64_t delta_ms) {
  if (delta_ms < 0) delta_ms = 0;
  const int64_t target = now_ms_ + delta_ms;
  size_t executed = 0;

  while (!tasks_.empty()) {
    auto first = tasks_.begin();
    if (first->first.first > target) break;

    // Move time to the task's deadline before running it, so work it
    // schedules is relative to the correct instant.
    now_ms_ = first->first.first;
    std::function<void()> task = std::move(first->second);
    deadlines_.erase(first->first.second);
    tasks_.erase(first);

    task();
    ++executed;
  }

  now_ms_ = target;
  return executed;
}

size_t ManualEventLoop::setNow(Timestamp seconds) {
  const int64_t target_ms = seconds * 1000;
  if (target_ms <= now_ms_) {
    now_ms_ = target_ms;
    return 0;
  }
  return advanceMs(target_ms - now_ms_);
}

}  // namespace vitals
