// Trailing-edge debounce on the serial context.

#ifndef VITALS_ORCHESTRATOR_DEBOUNCER_H
#define VITALS_ORCHESTRATOR_DEBOUNCER_H

#include <cstdint>
#include <functional>

#include "core/event_loop.h"

namespace vitals {

/// @brief Coalesces bursts of triggers into one action.
///
/// Each trigger() restarts the window; the action runs once the window
/// elapses with no further trigger. Destruction cancels a pending run.
class Debouncer {
 public:
  Debouncer(TaskScheduler& scheduler, int64_t window_ms, std::function<void()> action);
  ~Debouncer();

  Debouncer(const Debouncer&) = delete;
  Debouncer& operator=(const Debouncer&) = delete;

  /// @brief Start or restart the window.
  void trigger();

  /// @brief Run a pending action now. No-op when nothing is pending.
  /// @return True if the action ran.
  bool flush();

  /// @brief Drop a pending action without running it.
  void cancel();

  bool isPending() const { return pending_ != 0; }
  int64_t windowMs() const { return window_ms_; }

 private:
  void fire();

  TaskScheduler& scheduler_;
  int64_t window_ms_;
  std::function<void()> action_;
  TaskId pending_ = 0;
};

}  // namespace vitals

#endif  // VITALS_ORCHESTRATOR_DEBOUNCER_H
