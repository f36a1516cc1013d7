// Baseline statistics and z-score normalization.

#include "baseline/baseline_stats.h"

#include <algorithm>
#include <cmath>

namespace vitals {

namespace {

/// Copy of the series sorted by timestamp (stable for equal timestamps).
MetricSeries sortedByTime(const MetricSeries& series) {
  MetricSeries sorted = series;
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const MetricPoint& lhs, const MetricPoint& rhs) {
                     return lhs.timestamp < rhs.timestamp;
                   });
  return sorted;
}

}  // namespace

std::optional<BaselineStats> computeBaseline(const MetricSeries& series,
                                             const BaselineConfig& config) {
  if (series.size() < config.min_points || series.empty()) return std::nullopt;

  MetricSeries sorted = sortedByTime(series);
  const size_t window = std::max<size_t>(config.window, 1);
  const size_t first = sorted.size() > window ? sorted.size() - window : 0;
  const size_t count = sorted.size() - first;

  double sum = 0.0;
  for (size_t idx = first; idx < sorted.size(); ++idx) sum += sorted[idx].value;
  const double mean = sum / static_cast<double>(count);

  double sq_sum = 0.0;
  for (size_t idx = first; idx < sorted.size(); ++idx) {
    const double diff = sorted[idx].value - mean;
    sq_sum += diff * diff;
  }

  BaselineStats stats;
  stats.mean = mean;
  stats.std_dev = std::max(std::sqrt(sq_sum / static_cast<double>(count)),
                           config.stddev_floor_fraction * std::fabs(mean));
  stats.count = count;
  return stats;
}

std::optional<BaselineStats> staticPrior(MetricKind metric) {
  switch (metric) {
    case MetricKind::Steps:            return BaselineStats{8000.0, 2000.0, 0};
    case MetricKind::ActiveEnergy:     return BaselineStats{400.0, 150.0, 0};
    case MetricKind::Hrv:              return BaselineStats{45.0, 15.0, 0};
    case MetricKind::RestingHeartRate: return BaselineStats{60.0, 8.0, 0};
    default:
      return std::nullopt;
  }
}

double normalizedScore(double value, const BaselineStats& baseline, double scale) {
  const double sd = baseline.std_dev;
  if (sd <= 0.0 || scale <= 0.0) {
    if (value > baseline.mean) return 100.0;
    if (value < baseline.mean) return 0.0;
    return 50.0;
  }
  const double z_score = (value - baseline.mean) / sd;
  const double score = (z_score + scale) / (2.0 * scale) * 100.0;
  return std::clamp(score, 0.0, 100.0);
}

std::optional<double> trailingAverage(const MetricSeries& series, size_t n) {
  if (series.empty() || n == 0) return std::nullopt;
  MetricSeries sorted = sortedByTime(series);
  const size_t first = sorted.size() > n ? sorted.size() - n : 0;
  double sum = 0.0;
  for (size_t idx = first; idx < sorted.size(); ++idx) sum += sorted[idx].value;
  return sum / static_cast<double>(sorted.size() - first);
}

}  // namespace vitals
