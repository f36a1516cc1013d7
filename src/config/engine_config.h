// Aggregate engine configuration and its JSON loader.

#ifndef VITALS_CONFIG_ENGINE_CONFIG_H
#define VITALS_CONFIG_ENGINE_CONFIG_H

#include <cstddef>
#include <string>
#include <string_view>

#include "baseline/baseline_stats.h"
#include "core/json_parser.h"
#include "orchestrator/score_orchestrator.h"
#include "sleep/session_builder.h"
#include "source/health_data_loader.h"
#include "validity/metric_state.h"

namespace vitals {

/// Every tunable of the engine. Defaults reproduce documented behavior.
struct EngineConfig {
  SessionBuilderConfig session;
  BaselineConfig baseline;
  RecencyPolicy recency;
  OrchestratorConfig orchestrator;
  LoaderConfig loader;
  size_t history_days = 30;
  bool verbose = false;

  /// @brief Set one UTC offset on every component that reads local days.
  void setUtcOffset(int32_t utc_offset_seconds);

  /// @brief Set the verbose flag on every component.
  void setVerbose(bool enabled);
};

struct EngineConfigResult {
  bool success = false;
  EngineConfig config;
  std::string error_message;
};

/// @brief Apply recognised keys of a parsed object over the defaults.
///
/// Recognised keys (units in the name):
///   utc_offset_seconds, verbose,
///   session_max_gap_minutes, session_min_minutes, latency_awake_fraction,
///   consistency_window, consistency_min_history, consistency_spread_minutes,
///   baseline_min_points, baseline_window, baseline_stddev_floor_fraction,
///   baseline_ttl_hours,
///   recency_wearable_days, recency_manual_days, recency_same_day_hours,
///   debounce_ms, sleep_lookback_hours, baseline_lookback_days, history_days.
/// Unknown keys are ignored. A recognised key with the wrong JSON type is
/// an error.
EngineConfigResult engineConfigFromValues(const JsonObject& values);

/// @brief Check ranges.
/// @return Empty string when valid, else a description of the first problem.
std::string validateEngineConfig(const EngineConfig& config);

/// @brief Parse, apply and validate a flat JSON configuration object.
EngineConfigResult engineConfigFromJson(std::string_view json);

}  // namespace vitals

#endif  // VITALS_CONFIG_ENGINE_CONFIG_H
