// Metric validity tracking.

#include "validity/validity_tracker.h"

#include <cstdio>

namespace vitals {

MetricValidityTracker::MetricValidityTracker(const Clock& clock, const RecencyPolicy& policy,
                                             bool verbose)
    : clock_(clock), policy_(policy), verbose_(verbose) {}

bool MetricValidityTracker::recordObservation(MetricKind kind, double value,
                                              Timestamp timestamp) {
  auto& slot = latest_[metricIndex(kind)];
  bool accepted = false;
  if (!slot.has_value() || timestamp >= slot->timestamp) {
    slot = MetricObservation{value, timestamp};
    accepted = true;
  } else if (verbose_) {
    std::fprintf(stderr, "[MetricValidityTracker] %s: older observation ignored\n",
                 metricKindToString(kind));
  }
  reevaluate();
  return accepted;
}

void MetricValidityTracker::reevaluate() {
  const Timestamp now = clock_.now();
  for (MetricKind kind : kAllMetricKinds) {
    const size_t idx = metricIndex(kind);
    MetricState next = classifyMetric(latest_[idx], now, recencyThreshold(kind, policy_));
    const MetricValidity before = states_[idx].get().validity();
    if (states_[idx].set(next) && verbose_ && before != next.validity()) {
      std::fprintf(stderr, "[MetricValidityTracker] %s: %s -> %s\n", metricKindToString(kind),
                   metricValidityToString(before), metricValidityToString(next.validity()));
    }
  }
}

const MetricState& MetricValidityTracker::state(MetricKind kind) const {
  return states_[metricIndex(kind)].get();
}

Observable<MetricState>& MetricValidityTracker::channel(MetricKind kind) {
  return states_[metricIndex(kind)];
}

std::optional<MetricObservation> MetricValidityTracker::latest(MetricKind kind) const {
  return latest_[metricIndex(kind)];
}

}  // namespace vitals
