// Metric kind names.

#include "core/metric_types.h"

namespace vitals {

const char* metricKindToString(MetricKind kind) {
  switch (kind) {
    case MetricKind::Hrv:              return "hrv";
    case MetricKind::RestingHeartRate: return "resting_heart_rate";
    case MetricKind::RespiratoryRate:  return "respiratory_rate";
    case MetricKind::OxygenSaturation: return "oxygen_saturation";
    case MetricKind::BodyTemperature:  return "body_temperature";
    case MetricKind::SleepDuration:    return "sleep_duration";
    case MetricKind::Steps:            return "steps";
    case MetricKind::ActiveEnergy:     return "active_energy";
    case MetricKind::Vo2Max:           return "vo2_max";
    case MetricKind::BodyWeight:       return "body_weight";
  }
  return "unknown";
}

const char* metricDisplayName(MetricKind kind) {
  switch (kind) {
    case MetricKind::Hrv:              return "HRV";
    case MetricKind::RestingHeartRate: return "resting heart rate";
    case MetricKind::RespiratoryRate:  return "respiratory rate";
    case MetricKind::OxygenSaturation: return "SpO2";
    case MetricKind::BodyTemperature:  return "temperature";
    case MetricKind::SleepDuration:    return "sleep";
    case MetricKind::Steps:            return "step";
    case MetricKind::ActiveEnergy:     return "active energy";
    case MetricKind::Vo2Max:           return "VO2 max";
    case MetricKind::BodyWeight:       return "weight";
  }
  return "unknown";
}

}  // namespace vitals
