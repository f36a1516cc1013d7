// Tracked physiological metrics and quantity-series points.

#ifndef VITALS_CORE_METRIC_TYPES_H
#define VITALS_CORE_METRIC_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "core/time_types.h"

namespace vitals {

/// Scalar metrics whose latest observation is tracked for validity.
enum class MetricKind : uint8_t {
  Hrv,               ///< Heart-rate variability, SDNN in ms.
  RestingHeartRate,  ///< bpm.
  RespiratoryRate,   ///< Breaths per minute.
  OxygenSaturation,  ///< SpO2 fraction.
  BodyTemperature,   ///< Celsius.
  SleepDuration,     ///< Hours slept in today's summary.
  Steps,             ///< Daily step total.
  ActiveEnergy,      ///< Daily active energy, kcal.
  Vo2Max,            ///< ml/kg/min.
  BodyWeight         ///< kg, manually logged.
};

constexpr size_t kMetricKindCount = 10;

/// All metric kinds in declaration order.
constexpr std::array<MetricKind, kMetricKindCount> kAllMetricKinds = {
    MetricKind::Hrv,           MetricKind::RestingHeartRate, MetricKind::RespiratoryRate,
    MetricKind::OxygenSaturation, MetricKind::BodyTemperature, MetricKind::SleepDuration,
    MetricKind::Steps,         MetricKind::ActiveEnergy,     MetricKind::Vo2Max,
    MetricKind::BodyWeight};

/// @brief Array index for a metric kind.
inline constexpr size_t metricIndex(MetricKind kind) { return static_cast<size_t>(kind); }

/// @brief Stable snake_case identifier (JSON keys, config keys).
const char* metricKindToString(MetricKind kind);

/// @brief Human-readable label used in unavailable reasons ("HRV").
const char* metricDisplayName(MetricKind kind);

/// One sample of a quantity series.
struct MetricPoint {
  Timestamp timestamp = 0;
  double value = 0.0;

  bool operator==(const MetricPoint& other) const {
    return timestamp == other.timestamp && value == other.value;
  }
  bool operator!=(const MetricPoint& other) const { return !(*this == other); }
};

using MetricSeries = std::vector<MetricPoint>;

}  // namespace vitals

#endif  // VITALS_CORE_METRIC_TYPES_H
