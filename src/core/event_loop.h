// Serial execution context: wall clock and delayed single-shot tasks.
//
// Everything in vitals runs on one logical thread. The host supplies the
// run loop through TaskScheduler; ManualEventLoop drives time explicitly
// (tests, batch replays, hosts that pump their own loop).

#ifndef VITALS_CORE_EVENT_LOOP_H
#define VITALS_CORE_EVENT_LOOP_H

#include <cstdint>
#include <functional>
#include <map>
#include <utility>

#include "core/time_types.h"

namespace vitals {

/// @brief Source of the current wall-clock time.
class Clock {
 public:
  virtual ~Clock() = default;

  /// @brief Current instant in Unix epoch seconds.
  virtual Timestamp now() const = 0;
};

/// @brief Clock backed by the system real-time clock.
class SystemClock : public Clock {
 public:
  Timestamp now() const override;
};

/// Handle of a scheduled task. 0 is never issued.
using TaskId = uint64_t;

/// @brief Schedules single-shot tasks on the serial context.
class TaskScheduler {
 public:
  virtual ~TaskScheduler() = default;

  /// @brief Run a task once after a delay.
  /// @param delay_ms Delay in milliseconds (negative treated as 0).
  /// @param task Callback run on the serial context.
  /// @return Handle usable with cancel().
  virtual TaskId scheduleAfter(int64_t delay_ms, std::function<void()> task) = 0;

  /// @brief Cancel a pending task. Unknown or already-run ids are ignored.
  virtual void cancel(TaskId id) = 0;
};

/// @brief Deterministic clock + scheduler whose time only moves on request.
///
/// Time is kept in milliseconds so that sub-second debounce windows work;
/// now() reports whole seconds.
class ManualEventLoop : public Clock, public TaskScheduler {
 public:
  explicit ManualEventLoop(Timestamp start_seconds = 0);

  Timestamp now() const override;
  TaskId scheduleAfter(int64_t delay_ms, std::function<void()> task) override;
  void cancel(TaskId id) override;

  /// @brief Advance time, running every task that falls due in order.
  ///
  /// Tasks scheduled by a running task are honoured if they fall due
  /// within the same advance.
  /// @return Number of tasks executed.
  size_t advanceMs(int64_t delta_ms);

  /// @brief Advance by whole seconds.
  size_t advanceSeconds(int64_t delta_seconds) { return advanceMs(delta_seconds * 1000); }

  /// @brief Move the clock to an absolute time in seconds.
  ///
  /// Equivalent to advanceMs(target - current) when target is ahead.
  /// Moving backwards only rewinds the clock; no task runs.
  size_t setNow(Timestamp seconds);

  /// @brief Current time in milliseconds.
  int64_t nowMs() const { return now_ms_; }

  /// @brief Number of tasks waiting to run.
  size_t pendingCount() const { return tasks_.size(); }

 private:
  // Key orders by deadline, then by issue order for equal deadlines.
  using TaskKey = std::pair<int64_t, TaskId>;

  int64_t now_ms_ = 0;
  TaskId next_id_ = 1;
  std::map<TaskKey, std::function<void()>> tasks_;
  std::map<TaskId, int64_t> deadlines_;
};

}  // namespace vitals

#endif  // VITALS_CORE_EVENT_LOOP_H
