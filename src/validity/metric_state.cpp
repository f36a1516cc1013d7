// Metric classification.

#include "validity/metric_state.h"

namespace vitals {

const char* metricValidityToString(MetricValidity validity) {
  switch (validity) {
    case MetricValidity::Valid:   return "valid";
    case MetricValidity::Stale:   return "stale";
    case MetricValidity::Missing: return "missing";
  }
  return "unknown";
}

Duration recencyThreshold(MetricKind kind, const RecencyPolicy& policy) {
  switch (kind) {
    case MetricKind::Hrv:
    case MetricKind::RestingHeartRate:
    case MetricKind::Vo2Max:
      return policy.wearable;
    case MetricKind::BodyWeight:
      return policy.manual;
    case MetricKind::RespiratoryRate:
    case MetricKind::OxygenSaturation:
    case MetricKind::BodyTemperature:
    case MetricKind::SleepDuration:
    case MetricKind::Steps:
    case MetricKind::ActiveEnergy:
      return policy.same_day;
  }
  return policy.same_day;
}

MetricState classifyMetric(const std::optional<MetricObservation>& latest, Timestamp now,
                           Duration threshold) {
  if (!latest.has_value()) return MetricState::missing();
  Timestamp age = now - latest->timestamp;
  if (age < 0) age = 0;
  if (static_cast<Duration>(age) <= threshold) {
    return MetricState::valid(latest->value, latest->timestamp);
  }
  return MetricState::stale(latest->timestamp);
}

}  // namespace vitals
