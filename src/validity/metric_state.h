// Tri-state metric validity: valid, stale or missing.

#ifndef VITALS_VALIDITY_METRIC_STATE_H
#define VITALS_VALIDITY_METRIC_STATE_H

#include <cstdint>
#include <optional>

#include "core/metric_types.h"
#include "core/time_types.h"

namespace vitals {

enum class MetricValidity : uint8_t {
  Valid,    ///< Observed within the recency threshold.
  Stale,    ///< Observed, but too long ago to score with.
  Missing   ///< Never observed.
};

const char* metricValidityToString(MetricValidity validity);

/// @brief Classification of one metric at one instant.
///
/// Valid carries the value and observation time, Stale only the time,
/// Missing nothing.
class MetricState {
 public:
  /// Default-constructed state is Missing.
  MetricState() = default;

  static MetricState missing() { return MetricState(); }
  static MetricState stale(Timestamp last_seen) {
    return MetricState(MetricValidity::Stale, 0.0, last_seen);
  }
  static MetricState valid(double value, Timestamp last_seen) {
    return MetricState(MetricValidity::Valid, value, last_seen);
  }

  MetricValidity validity() const { return validity_; }
  bool isValid() const { return validity_ == MetricValidity::Valid; }
  bool isStale() const { return validity_ == MetricValidity::Stale; }
  bool isMissing() const { return validity_ == MetricValidity::Missing; }

  /// @brief Observed value; present only when Valid.
  std::optional<double> value() const {
    if (validity_ != MetricValidity::Valid) return std::nullopt;
    return value_;
  }

  /// @brief Observation time; absent when Missing.
  std::optional<Timestamp> lastSeen() const {
    if (validity_ == MetricValidity::Missing) return std::nullopt;
    return last_seen_;
  }

  bool operator==(const MetricState& other) const {
    return validity_ == other.validity_ && value_ == other.value_ &&
           last_seen_ == other.last_seen_;
  }
  bool operator!=(const MetricState& other) const { return !(*this == other); }

 private:
  MetricState(MetricValidity validity, double value, Timestamp last_seen)
      : validity_(validity), value_(value), last_seen_(last_seen) {}

  MetricValidity validity_ = MetricValidity::Missing;
  double value_ = 0.0;
  Timestamp last_seen_ = 0;
};

/// Maximum observation age per metric family.
struct RecencyPolicy {
  Duration wearable = days(7);   ///< HRV, resting heart rate, VO2 max.
  Duration manual = days(90);    ///< Body weight.
  Duration same_day = hours(24); ///< Vitals, activity totals, sleep duration.
};

/// @brief Threshold that applies to a metric under a policy.
Duration recencyThreshold(MetricKind kind, const RecencyPolicy& policy = {});

/// Newest known observation of a metric.
struct MetricObservation {
  double value = 0.0;
  Timestamp timestamp = 0;
};

/// @brief Classify a metric's newest observation.
///
/// Valid iff now - timestamp <= threshold; the boundary itself is Valid.
/// Observations from the future count as age 0.
MetricState classifyMetric(const std::optional<MetricObservation>& latest, Timestamp now,
                           Duration threshold);

}  // namespace vitals

#endif  // VITALS_VALIDITY_METRIC_STATE_H
