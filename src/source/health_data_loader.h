// One refresh cycle: sample source -> sessions, baselines, observations.

#ifndef VITALS_SOURCE_HEALTH_DATA_LOADER_H
#define VITALS_SOURCE_HEALTH_DATA_LOADER_H

#include <cstddef>
#include <string>
#include <vector>

#include "baseline/baseline_cache.h"
#include "core/event_loop.h"
#include "orchestrator/score_orchestrator.h"
#include "sleep/session_builder.h"
#include "source/sample_source.h"
#include "validity/validity_tracker.h"

namespace vitals {

struct LoaderConfig {
  /// Sleep samples are fetched for [now - sleep_lookback, now].
  Duration sleep_lookback = hours(36);
  /// Baseline series are fetched for [now - baseline_lookback, now].
  Duration baseline_lookback = days(30);
  SessionBuilderConfig session;
  bool verbose = false;
};

/// One failed fetch.
struct LoadFailure {
  std::string source;  ///< "sleep" or a metric identifier.
  std::string message;
};

/// Outcome of a refresh. success is false when any fetch failed.
struct LoadReport {
  bool success = true;
  std::vector<LoadFailure> failures;
  size_t sessions_built = 0;
  size_t baselines_updated = 0;
  size_t observations_recorded = 0;
  size_t samples_rejected = 0;  ///< Future-dated or out-of-range points.
};

/// @brief Pulls data from a SampleSource into the scoring state.
///
/// A failed fetch never clears state: the affected metric keeps its
/// last-known observation and decays to Stale on its own.
class HealthDataLoader {
 public:
  HealthDataLoader(SampleSource& source, MetricValidityTracker& tracker,
                   BaselineCache& baselines, ScoreOrchestrator& orchestrator,
                   const Clock& clock, const LoaderConfig& config = {});

  /// @brief Run one cycle (sleep, baselines, latest values, reclassify).
  LoadReport refresh();

  /// Metrics whose 30-day series feed a baseline.
  static const std::vector<MetricKind>& baselineMetrics();

 private:
  void loadSleep(Timestamp now, LoadReport& report);
  void loadBaselines(Timestamp now, LoadReport& report);
  void loadLatest(Timestamp now, LoadReport& report);
  void fail(LoadReport& report, std::string source, std::string message) const;

  SampleSource& source_;
  MetricValidityTracker& tracker_;
  BaselineCache& baselines_;
  ScoreOrchestrator& orchestrator_;
  const Clock& clock_;
  LoaderConfig config_;
};

}  // namespace vitals

#endif  // VITALS_SOURCE_HEALTH_DATA_LOADER_H
