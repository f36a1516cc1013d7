// Per-metric baseline cache with a time-to-live.

#ifndef VITALS_BASELINE_BASELINE_CACHE_H
#define VITALS_BASELINE_BASELINE_CACHE_H

#include <array>
#include <optional>

#include "baseline/baseline_stats.h"
#include "core/metric_types.h"
#include "core/time_types.h"

namespace vitals {

/// Result of a cache lookup.
struct BaselineLookup {
  std::optional<BaselineStats> stats;
  /// True when stats came from the user's history, false for a prior.
  bool from_history = false;
  /// Mean of the most recent points of the last series offered.
  std::optional<double> recent_average;
};

/// @brief Caches computed baselines for up to ttl per metric.
///
/// Inside the TTL an update returns the cached stats untouched, unless the
/// cached result is a prior and the new series now has min_points. After it,
/// a series whose fingerprint (count, last timestamp, value sum) changed is
/// recomputed; an unchanged series only refreshes the cache time. When
/// history is insufficient, lookups report the static prior with
/// from_history = false.
class BaselineCache {
 public:
  explicit BaselineCache(const BaselineConfig& config = {});

  /// @brief Offer a fresh series for a metric.
  /// @param now Current time, compared against the cache time.
  /// @return The baseline in effect after the update.
  BaselineLookup update(MetricKind metric, const MetricSeries& series, Timestamp now);

  /// @brief Baseline in effect: cached history stats, else the prior.
  BaselineLookup lookup(MetricKind metric) const;

  /// @brief History-derived stats only.
  std::optional<BaselineStats> personal(MetricKind metric) const;

  /// @brief History baselines for the four scored metrics.
  PersonalBaselines personalBaselines() const;

  /// @brief Mean of the last recent_points points, e.g. a 7-day HRV average.
  std::optional<double> recentAverage(MetricKind metric) const;

  /// @brief Time of the last computation or refresh, if any.
  std::optional<Timestamp> cachedAt(MetricKind metric) const;

  /// @brief Drop one metric so the next update recomputes.
  void invalidate(MetricKind metric);

  void clear();

  const BaselineConfig& config() const { return config_; }

 private:
  struct Fingerprint {
    size_t count = 0;
    Timestamp last_timestamp = 0;
    double value_sum = 0.0;

    bool operator==(const Fingerprint& other) const {
      return count == other.count && last_timestamp == other.last_timestamp &&
             value_sum == other.value_sum;
    }
  };

  struct Entry {
    bool present = false;
    std::optional<BaselineStats> stats;
    std::optional<double> recent_average;
    Fingerprint fingerprint;
    Timestamp computed_at = 0;
  };

  static Fingerprint fingerprintOf(const MetricSeries& series);

  BaselineConfig config_;
  std::array<Entry, kMetricKindCount> entries_{};
};

}  // namespace vitals

#endif  // VITALS_BASELINE_BASELINE_CACHE_H
