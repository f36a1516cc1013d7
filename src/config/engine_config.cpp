// Engine configuration loading and validation.

#include "config/engine_config.h"

#include <cmath>

namespace vitals {

void EngineConfig::setUtcOffset(int32_t utc_offset_seconds) {
  session.utc_offset_seconds = utc_offset_seconds;
  orchestrator.utc_offset_seconds = utc_offset_seconds;
  loader.session.utc_offset_seconds = utc_offset_seconds;
}

void EngineConfig::setVerbose(bool enabled) {
  verbose = enabled;
  session.verbose = enabled;
  baseline.verbose = enabled;
  orchestrator.verbose = enabled;
  loader.verbose = enabled;
  loader.session.verbose = enabled;
}

namespace {

/// Reads one typed key; records the first type error in `error`.
class KeyReader {
 public:
  KeyReader(const JsonObject& values, std::string& error) : values_(values), error_(error) {}

  bool number(const char* key, double& out) {
    auto it = values_.find(key);
    if (it == values_.end()) return false;
    if (!it->second.isNumber() || !std::isfinite(it->second.number_val)) {
      typeError(key, "a number");
      return false;
    }
    out = it->second.number_val;
    return true;
  }

  bool integer(const char* key, int64_t& out) {
    double val = 0.0;
    if (!number(key, val)) return false;
    if (val != std::floor(val)) {
      typeError(key, "an integer");
      return false;
    }
    if (!fitsInt64(val)) {
      if (error_.empty()) error_ = std::string("'") + key + "' is out of range";
      return false;
    }
    out = static_cast<int64_t>(val);
    return true;
  }

  bool boolean(const char* key, bool& out) {
    auto it = values_.find(key);
    if (it == values_.end()) return false;
    if (!it->second.isBool()) {
      typeError(key, "a boolean");
      return false;
    }
    out = it->second.bool_val;
    return true;
  }

 private:
  void typeError(const char* key, const char* expected) {
    if (error_.empty()) error_ = std::string("'") + key + "' must be " + expected;
  }

  const JsonObject& values_;
  std::string& error_;
};

}  // namespace

EngineConfigResult engineConfigFromValues(const JsonObject& values) {
  EngineConfigResult result;
  EngineConfig& config = result.config;
  std::string error;
  KeyReader reader(values, error);

  double num = 0.0;
  int64_t whole = 0;
  bool flag = false;

  if (reader.integer("utc_offset_seconds", whole)) {
    if (whole < -50400 || whole > 50400) {
      error = "utc_offset_seconds must be within +/-14 hours";
    } else {
      config.setUtcOffset(static_cast<int32_t>(whole));
    }
  }
  if (reader.boolean("verbose", flag)) config.setVerbose(flag);

  if (reader.number("session_max_gap_minutes", num)) {
    config.session.max_gap = minutes(num);
  }
  if (reader.number("session_min_minutes", num)) {
    config.session.min_session = minutes(num);
  }
  if (reader.number("latency_awake_fraction", num)) {
    config.session.latency_awake_fraction = num;
  }
  if (reader.integer("consistency_window", whole)) {
    config.session.consistency_window = whole < 0 ? 0 : static_cast<size_t>(whole);
  }
  if (reader.integer("consistency_min_history", whole)) {
    config.session.consistency_min_history = whole < 0 ? 0 : static_cast<size_t>(whole);
  }
  if (reader.number("consistency_spread_minutes", num)) {
    config.session.consistency_spread_minutes = num;
  }

  if (reader.integer("baseline_min_points", whole)) {
    config.baseline.min_points = whole < 0 ? 0 : static_cast<size_t>(whole);
  }
  if (reader.integer("baseline_window", whole)) {
    config.baseline.window = whole < 0 ? 0 : static_cast<size_t>(whole);
  }
  if (reader.number("baseline_stddev_floor_fraction", num)) {
    config.baseline.stddev_floor_fraction = num;
  }
  if (reader.number("baseline_ttl_hours", num)) {
    config.baseline.ttl = hours(num);
  }

  if (reader.number("recency_wearable_days", num)) config.recency.wearable = days(num);
  if (reader.number("recency_manual_days", num)) config.recency.manual = days(num);
  if (reader.number("recency_same_day_hours", num)) config.recency.same_day = hours(num);

  if (reader.integer("debounce_ms", whole)) config.orchestrator.debounce_ms = whole;
  if (reader.number("sleep_lookback_hours", num)) config.loader.sleep_lookback = hours(num);
  if (reader.number("baseline_lookback_days", num)) {
    config.loader.baseline_lookback = days(num);
  }
  if (reader.integer("history_days", whole)) {
    config.history_days = whole < 0 ? 0 : static_cast<size_t>(whole);
  }

  // The loader builds sessions with the same policy.
  config.loader.session = config.session;

  if (error.empty()) error = validateEngineConfig(config);
  result.success = error.empty();
  result.error_message = error;
  return result;
}

std::string validateEngineConfig(const EngineConfig& config) {
  if (config.session.max_gap < 0.0) return "session_max_gap_minutes must not be negative";
  if (config.session.min_session <= 0.0) return "session_min_minutes must be positive";
  if (config.session.latency_awake_fraction < 0.0 ||
      config.session.latency_awake_fraction > 1.0) {
    return "latency_awake_fraction must be within [0, 1]";
  }
  if (config.session.consistency_window < 2) return "consistency_window must be at least 2";
  if (config.session.consistency_spread_minutes <= 0.0) {
    return "consistency_spread_minutes must be positive";
  }
  if (config.baseline.min_points < 1) return "baseline_min_points must be at least 1";
  if (config.baseline.window < config.baseline.min_points) {
    return "baseline_window must not be smaller than baseline_min_points";
  }
  if (config.baseline.stddev_floor_fraction < 0.0 ||
      config.baseline.stddev_floor_fraction > 1.0) {
    return "baseline_stddev_floor_fraction must be within [0, 1]";
  }
  if (config.baseline.ttl < 0.0) return "baseline_ttl_hours must not be negative";
  if (config.recency.wearable <= 0.0 || config.recency.manual <= 0.0 ||
      config.recency.same_day <= 0.0) {
    return "recency thresholds must be positive";
  }
  if (config.orchestrator.debounce_ms < 0) return "debounce_ms must not be negative";
  if (config.loader.sleep_lookback <= 0.0) return "sleep_lookback_hours must be positive";
  if (config.loader.baseline_lookback <= 0.0) return "baseline_lookback_days must be positive";
  if (config.history_days < 1) return "history_days must be at least 1";
  return "";
}

EngineConfigResult engineConfigFromJson(std::string_view json) {
  JsonParseResult parsed = parseJsonObject(json);
  if (!parsed.success) {
    EngineConfigResult result;
    result.error_message = "invalid JSON: " + parsed.error_message;
    return result;
  }
  return engineConfigFromValues(parsed.values);
}

}  // namespace vitals
