#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/metric_types.h"
#include "core/time_types.h"
#include "sleep/sleep_types.h"
#include "source/sample_source.h"

namespace test_helpers {

using vitals::Timestamp;

/// 2024-03-10 00:00:00 UTC. Tests use UTC offset 0 unless stated.
constexpr Timestamp kMidnight = 1710028800;

/// @brief Instant relative to kMidnight.
/// @param day Day offset (negative for earlier days).
inline Timestamp at(int day, int hour, int minute = 0) {
  return kMidnight + static_cast<Timestamp>(day) * vitals::kSecondsPerDay +
         static_cast<Timestamp>(hour) * vitals::kSecondsPerHour +
         static_cast<Timestamp>(minute) * vitals::kSecondsPerMinute;
}

inline vitals::RawIntervalSample sample(vitals::SleepCategory category, Timestamp start,
                                        Timestamp end) {
  vitals::RawIntervalSample result;
  result.category = category;
  result.start = start;
  result.end = end;
  return result;
}

/// @brief A staged night: InBed over [start, end] plus core/deep/rem
///        blocks and one awake block in the middle.
///
/// Stage lengths are in minutes and are laid out back to back from start.
inline std::vector<vitals::RawIntervalSample> stagedNight(Timestamp start, int core_min,
                                                          int deep_min, int awake_min,
                                                          int rem_min) {
  using vitals::SleepCategory;
  const Timestamp minute = vitals::kSecondsPerMinute;
  std::vector<vitals::RawIntervalSample> samples;
  Timestamp cursor = start;
  samples.push_back(sample(SleepCategory::AsleepCore, cursor, cursor + core_min * minute));
  cursor += core_min * minute;
  samples.push_back(sample(SleepCategory::AsleepDeep, cursor, cursor + deep_min * minute));
  cursor += deep_min * minute;
  if (awake_min > 0) {
    samples.push_back(sample(SleepCategory::Awake, cursor, cursor + awake_min * minute));
    cursor += awake_min * minute;
  }
  samples.push_back(sample(SleepCategory::AsleepREM, cursor, cursor + rem_min * minute));
  cursor += rem_min * minute;
  samples.insert(samples.begin(), sample(SleepCategory::InBed, start, cursor));
  return samples;
}

/// @brief One point per day, the last at `last`, oldest first.
inline vitals::MetricSeries dailySeries(Timestamp last, const std::vector<double>& values) {
  vitals::MetricSeries series;
  const size_t count = values.size();
  for (size_t idx = 0; idx < count; ++idx) {
    const Timestamp offset = static_cast<Timestamp>(count - 1 - idx) * vitals::kSecondsPerDay;
    series.push_back({last - offset, values[idx]});
  }
  return series;
}

/// @brief `count` copies of one value, one per day ending at `last`.
inline vitals::MetricSeries constantSeries(Timestamp last, size_t count, double value) {
  return dailySeries(last, std::vector<double>(count, value));
}

/// @brief Scriptable in-memory SampleSource.
class FakeSampleSource : public vitals::SampleSource {
 public:
  vitals::IntervalFetchResult sleep_result{true, {}, ""};
  std::map<vitals::MetricKind, vitals::SeriesFetchResult> series;
  std::map<vitals::MetricKind, vitals::LatestFetchResult> latest;

  int interval_calls = 0;
  int series_calls = 0;
  int latest_calls = 0;
  Timestamp last_interval_start = 0;
  Timestamp last_interval_end = 0;

  void setLatest(vitals::MetricKind metric, double value, Timestamp timestamp) {
    latest[metric] = vitals::LatestFetchResult{true, vitals::MetricPoint{timestamp, value}, ""};
  }

  void failLatest(vitals::MetricKind metric, const std::string& message) {
    latest[metric] = vitals::LatestFetchResult{false, std::nullopt, message};
  }

  void setSeries(vitals::MetricKind metric, vitals::MetricSeries points) {
    series[metric] = vitals::SeriesFetchResult{true, std::move(points), ""};
  }

  vitals::IntervalFetchResult fetchIntervalSamples(
      const std::vector<vitals::SleepCategory>& /*categories*/, Timestamp start,
      Timestamp end) override {
    ++interval_calls;
    last_interval_start = start;
    last_interval_end = end;
    return sleep_result;
  }

  vitals::SeriesFetchResult fetchQuantitySeries(vitals::MetricKind metric, Timestamp /*start*/,
                                                Timestamp /*end*/) override {
    ++series_calls;
    auto it = series.find(metric);
    if (it == series.end()) return vitals::SeriesFetchResult{true, {}, ""};
    return it->second;
  }

  vitals::LatestFetchResult fetchLatest(vitals::MetricKind metric) override {
    ++latest_calls;
    auto it = latest.find(metric);
    if (it == latest.end()) return vitals::LatestFetchResult{true, std::nullopt, ""};
    return it->second;
  }
};

}  // namespace test_helpers
