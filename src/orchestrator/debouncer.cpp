// Debouncer implementation.

#include "orchestrator/debouncer.h"

#include <utility>

namespace vitals {

Debouncer::Debouncer(TaskScheduler& scheduler, int64_t window_ms, std::function<void()> action)
    : scheduler_(scheduler), window_ms_(window_ms < 0 ? 0 : window_ms),
      action_(std::move(action)) {}

Debouncer::~Debouncer() { cancel(); }

void Debouncer::trigger() {
  cancel();
  pending_ = scheduler_.scheduleAfter(window_ms_, [this]() { fire(); });
}

bool Debouncer::flush() {
  if (pending_ == 0) return false;
  cancel();
  if (action_) action_();
  return true;
}

void Debouncer::cancel() {
  if (pending_ == 0) return;
  scheduler_.cancel(pending_);
  pending_ = 0;
}

void Debouncer::fire() {
  pending_ = 0;
  if (action_) action_();
}

}  // namespace vitals
