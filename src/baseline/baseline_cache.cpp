// Baseline cache implementation.

#include "baseline/baseline_cache.h"

#include <cstdio>

namespace vitals {

BaselineCache::BaselineCache(const BaselineConfig& config) : config_(config) {}

BaselineCache::Fingerprint BaselineCache::fingerprintOf(const MetricSeries& series) {
  Fingerprint print;
  print.count = series.size();
  for (const auto& point : series) {
    if (point.timestamp > print.last_timestamp) print.last_timestamp = point.timestamp;
    print.value_sum += point.value;
  }
  return print;
}

BaselineLookup BaselineCache::update(MetricKind metric, const MetricSeries& series,
                                     Timestamp now) {
  Entry& entry = entries_[metricIndex(metric)];

  // A prior cached from a short history gives way as soon as enough points arrive.
  const bool backfilled = entry.present && !entry.stats.has_value() &&
                          series.size() >= config_.min_points;
  if (entry.present && !backfilled &&
      static_cast<Duration>(now - entry.computed_at) < config_.ttl) {
    return lookup(metric);
  }

  const Fingerprint print = fingerprintOf(series);
  if (entry.present && entry.fingerprint == print) {
    entry.computed_at = now;
    return lookup(metric);
  }

  entry.present = true;
  entry.fingerprint = print;
  entry.computed_at = now;
  entry.stats = computeBaseline(series, config_);
  entry.recent_average = trailingAverage(series, config_.recent_points);

  if (config_.verbose) {
    if (entry.stats.has_value()) {
      std::fprintf(stderr, "[BaselineCache] %s: mean=%.2f sd=%.2f n=%zu\n",
                   metricKindToString(metric), entry.stats->mean, entry.stats->std_dev,
                   entry.stats->count);
    } else {
      std::fprintf(stderr, "[BaselineCache] %s: %zu points, using prior\n",
                   metricKindToString(metric), series.size());
    }
  }
  return lookup(metric);
}

BaselineLookup BaselineCache::lookup(MetricKind metric) const {
  BaselineLookup result;
  const Entry& entry = entries_[metricIndex(metric)];
  result.recent_average = entry.recent_average;
  if (entry.present && entry.stats.has_value()) {
    result.stats = entry.stats;
    result.from_history = true;
    return result;
  }
  result.stats = staticPrior(metric);
  return result;
}

std::optional<BaselineStats> BaselineCache::personal(MetricKind metric) const {
  const Entry& entry = entries_[metricIndex(metric)];
  if (!entry.present) return std::nullopt;
  return entry.stats;
}

PersonalBaselines BaselineCache::personalBaselines() const {
  PersonalBaselines baselines;
  baselines.hrv = personal(MetricKind::Hrv);
  baselines.resting_heart_rate = personal(MetricKind::RestingHeartRate);
  baselines.steps = personal(MetricKind::Steps);
  baselines.active_energy = personal(MetricKind::ActiveEnergy);
  return baselines;
}

std::optional<double> BaselineCache::recentAverage(MetricKind metric) const {
  return entries_[metricIndex(metric)].recent_average;
}

std::optional<Timestamp> BaselineCache::cachedAt(MetricKind metric) const {
  const Entry& entry = entries_[metricIndex(metric)];
  if (!entry.present) return std::nullopt;
  return entry.computed_at;
}

void BaselineCache::invalidate(MetricKind metric) { entries_[metricIndex(metric)] = Entry{}; }

void BaselineCache::clear() {
  for (auto& entry : entries_) entry = Entry{};
}

}  // namespace vitals
