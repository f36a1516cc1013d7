// Health data refresh cycle.

#include "source/health_data_loader.h"

#include <cstdio>
#include <utility>

#include "sleep/daily_aggregator.h"

namespace vitals {

namespace {

const std::vector<SleepCategory>& allSleepCategories() {
  static const std::vector<SleepCategory> kCategories = {
      SleepCategory::InBed,      SleepCategory::AsleepUnspecified, SleepCategory::Awake,
      SleepCategory::AsleepCore, SleepCategory::AsleepDeep,        SleepCategory::AsleepREM};
  return kCategories;
}

}  // namespace

HealthDataLoader::HealthDataLoader(SampleSource& source, MetricValidityTracker& tracker,
                                   BaselineCache& baselines, ScoreOrchestrator& orchestrator,
                                   const Clock& clock, const LoaderConfig& config)
    : source_(source), tracker_(tracker), baselines_(baselines), orchestrator_(orchestrator),
      clock_(clock), config_(config) {}

const std::vector<MetricKind>& HealthDataLoader::baselineMetrics() {
  static const std::vector<MetricKind> kMetrics = {MetricKind::Hrv, MetricKind::RestingHeartRate,
                                                   MetricKind::Steps, MetricKind::ActiveEnergy};
  return kMetrics;
}

LoadReport HealthDataLoader::refresh() {
  LoadReport report;
  const Timestamp now = clock_.now();

  loadSleep(now, report);
  loadBaselines(now, report);
  loadLatest(now, report);
  tracker_.reevaluate();

  if (config_.verbose) {
    std::fprintf(stderr,
                 "[HealthDataLoader] refresh: %zu sessions, %zu baselines, %zu observations, "
                 "%zu failures\n",
                 report.sessions_built, report.baselines_updated, report.observations_recorded,
                 report.failures.size());
  }
  return report;
}

void HealthDataLoader::fail(LoadReport& report, std::string source, std::string message) const {
  if (config_.verbose) {
    std::fprintf(stderr, "[HealthDataLoader] %s fetch failed: %s\n", source.c_str(),
                 message.c_str());
  }
  report.success = false;
  report.failures.push_back({std::move(source), std::move(message)});
}

void HealthDataLoader::loadSleep(Timestamp now, LoadReport& report) {
  const Timestamp range_start = now - static_cast<Timestamp>(config_.sleep_lookback);
  IntervalFetchResult fetched = source_.fetchIntervalSamples(allSleepCategories(), range_start, now);
  if (!fetched.success) {
    fail(report, "sleep", fetched.error_message);
    return;
  }

  std::vector<SleepSession> sessions =
      buildSleepSessions(fetched.samples, range_start, now, now, config_.session);
  const DayIndex today = dayIndexOf(now, config_.session.utc_offset_seconds);
  DailySleepSummary summary =
      buildDailySummary(today, sessions, config_.session.utc_offset_seconds);
  report.sessions_built = sessions.size();

  orchestrator_.publishSleep(std::move(sessions), summary);

  if (summary.hasData()) {
    tracker_.recordObservation(MetricKind::SleepDuration, summary.durationHours(),
                               *summary.wake_time);
    ++report.observations_recorded;
  }
}

void HealthDataLoader::loadBaselines(Timestamp now, LoadReport& report) {
  const Timestamp range_start = now - static_cast<Timestamp>(config_.baseline_lookback);
  for (MetricKind metric : baselineMetrics()) {
    SeriesFetchResult fetched = source_.fetchQuantitySeries(metric, range_start, now);
    if (!fetched.success) {
      fail(report, metricKindToString(metric), fetched.error_message);
      continue;
    }

    MetricSeries accepted;
    accepted.reserve(fetched.points.size());
    for (const auto& point : fetched.points) {
      if (point.timestamp > now || point.timestamp < range_start) {
        ++report.samples_rejected;
        continue;
      }
      accepted.push_back(point);
    }
    baselines_.update(metric, accepted, now);
    ++report.baselines_updated;
  }
}

void HealthDataLoader::loadLatest(Timestamp now, LoadReport& report) {
  for (MetricKind metric : kAllMetricKinds) {
    // Sleep duration is derived from sessions, not fetched.
    if (metric == MetricKind::SleepDuration) continue;

    LatestFetchResult fetched = source_.fetchLatest(metric);
    if (!fetched.success) {
      fail(report, metricKindToString(metric), fetched.error_message);
      continue;
    }
    if (!fetched.point.has_value()) continue;
    if (fetched.point->timestamp > now) {
      ++report.samples_rejected;
      continue;
    }
    tracker_.recordObservation(metric, fetched.point->value, fetched.point->timestamp);
    ++report.observations_recorded;
  }
}

}  // namespace vitals
