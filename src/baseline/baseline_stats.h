// Rolling personal baselines: mean and standard deviation per metric.

#ifndef VITALS_BASELINE_BASELINE_STATS_H
#define VITALS_BASELINE_BASELINE_STATS_H

#include <cstddef>
#include <optional>

#include "core/metric_types.h"
#include "core/time_types.h"

namespace vitals {

/// Baseline computation policy.
struct BaselineConfig {
  /// Points required before a history baseline exists.
  size_t min_points = 14;
  /// Trailing points (by timestamp) that enter the statistics.
  size_t window = 30;
  /// Standard deviation is never below this fraction of |mean|.
  double stddev_floor_fraction = 0.05;
  /// Cached baselines are reused for this long.
  Duration ttl = hours(24);
  /// Trailing points averaged into BaselineLookup::recent_average.
  size_t recent_points = 7;
  bool verbose = false;
};

/// Population statistics over a metric's recent history.
struct BaselineStats {
  double mean = 0.0;
  double std_dev = 0.0;
  size_t count = 0;  ///< Points used; 0 for a static prior.

  bool operator==(const BaselineStats& other) const {
    return mean == other.mean && std_dev == other.std_dev && count == other.count;
  }
  bool operator!=(const BaselineStats& other) const { return !(*this == other); }
};

/// Baselines that personalize scoring. Only history-derived stats belong
/// here; an empty field means the score falls back to fixed curves.
struct PersonalBaselines {
  std::optional<BaselineStats> hrv;
  std::optional<BaselineStats> resting_heart_rate;
  std::optional<BaselineStats> steps;
  std::optional<BaselineStats> active_energy;
};

/// @brief Statistics over the trailing window of a series.
///
/// Points are ordered by timestamp before the window is taken, so the
/// input order does not matter. The stored std_dev is already floored.
/// @return Nothing when fewer than min_points points exist.
std::optional<BaselineStats> computeBaseline(const MetricSeries& series,
                                             const BaselineConfig& config = {});

/// @brief Population prior for cold start.
///
/// steps 8000/2000, active energy 400/150 kcal, HRV 45/15 ms,
/// RHR 60/8 bpm. Other metrics have no prior.
std::optional<BaselineStats> staticPrior(MetricKind metric);

/// @brief Map a value onto 0-100 by its z-score against a baseline.
///
/// clamp(((value - mean) / sd + scale) / (2 * scale) * 100, 0, 100), where
/// sd is the baseline's stored standard deviation, which computeBaseline has
/// already floored. Saturates beyond +/- scale sigma. A zero sd yields 0,
/// 50 or 100 by the sign of value - mean.
double normalizedScore(double value, const BaselineStats& baseline, double scale = 3.0);

/// @brief Mean of the last n points by timestamp.
/// @return Nothing for an empty series or n == 0.
std::optional<double> trailingAverage(const MetricSeries& series, size_t n);

}  // namespace vitals

#endif  // VITALS_BASELINE_BASELINE_STATS_H
