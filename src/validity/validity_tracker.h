// Tracks the newest observation per metric and publishes its validity.

#ifndef VITALS_VALIDITY_VALIDITY_TRACKER_H
#define VITALS_VALIDITY_VALIDITY_TRACKER_H

#include <array>
#include <optional>

#include "core/event_loop.h"
#include "core/metric_types.h"
#include "core/observable.h"
#include "validity/metric_state.h"

namespace vitals {

/// @brief Per-metric tri-state validity with change notification.
///
/// Only the newest observation (by timestamp) is kept per metric. Every
/// upstream update reclassifies all metrics against the clock, so a state
/// never outlives the observation it was derived from. Channels notify
/// only on an actual state change.
class MetricValidityTracker {
 public:
  MetricValidityTracker(const Clock& clock, const RecencyPolicy& policy = {},
                        bool verbose = false);

  MetricValidityTracker(const MetricValidityTracker&) = delete;
  MetricValidityTracker& operator=(const MetricValidityTracker&) = delete;

  /// @brief Record an observation and reclassify every metric.
  ///
  /// An observation older than the one already held is ignored for that
  /// metric; reclassification still runs.
  /// @return True if the observation became the metric's newest.
  bool recordObservation(MetricKind kind, double value, Timestamp timestamp);

  /// @brief Reclassify every metric at the current clock time.
  void reevaluate();

  /// @brief Current classification.
  const MetricState& state(MetricKind kind) const;

  /// @brief Change channel for a metric's classification.
  Observable<MetricState>& channel(MetricKind kind);

  /// @brief Newest observation, if any.
  std::optional<MetricObservation> latest(MetricKind kind) const;

  const RecencyPolicy& policy() const { return policy_; }

 private:
  const Clock& clock_;
  RecencyPolicy policy_;
  bool verbose_;
  std::array<std::optional<MetricObservation>, kMetricKindCount> latest_{};
  std::array<Observable<MetricState>, kMetricKindCount> states_;
};

}  // namespace vitals

#endif  // VITALS_VALIDITY_VALIDITY_TRACKER_H
