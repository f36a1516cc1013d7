// Reactive score orchestration: validity changes -> debounced, gated
// recomputation -> published score states and a daily snapshot.

#ifndef VITALS_ORCHESTRATOR_SCORE_ORCHESTRATOR_H
#define VITALS_ORCHESTRATOR_SCORE_ORCHESTRATOR_H

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "baseline/baseline_cache.h"
#include "core/event_loop.h"
#include "core/metric_types.h"
#include "core/observable.h"
#include "orchestrator/debouncer.h"
#include "orchestrator/snapshot.h"
#include "scoring/score_inputs.h"
#include "scoring/score_types.h"
#include "sleep/sleep_types.h"
#include "validity/validity_tracker.h"

namespace vitals {

struct OrchestratorConfig {
  /// Quiet period before a pipeline recomputes.
  int64_t debounce_ms = 1000;
  /// Offset that defines "today" for snapshots.
  int32_t utc_offset_seconds = 0;
  bool verbose = false;
};

/// @brief Drives the four score pipelines.
///
/// | Pipeline | Triggered by                       | Ready set (all Valid) |
/// |----------|------------------------------------|-----------------------|
/// | recovery | HRV, resting heart rate            | HRV, resting HR       |
/// | sleep    | sleep duration, publishSleep()     | sleep duration        |
/// | strain   | steps, active energy               | steps, active energy  |
/// | stress   | HRV                                | HRV                   |
///
/// Every trigger restarts the pipeline's debounce window. When it elapses
/// the ready set is checked in table order; the first non-Valid input
/// yields Unavailable ("No <metric> data" or "<Metric> data is stale").
/// Otherwise the score is computed from the tracker's Valid values, the
/// current history baselines and the published daily sleep summary.
///
/// A snapshot of all four states goes to the sink at most once per local
/// day, only from a recovery evaluation that produced Computed.
///
/// The tracker, baselines, scheduler, clock and sink must outlive the
/// orchestrator. Destruction unsubscribes and cancels pending work.
class ScoreOrchestrator {
 public:
  ScoreOrchestrator(MetricValidityTracker& tracker, const BaselineCache& baselines,
                    TaskScheduler& scheduler, const Clock& clock, SnapshotSink* sink,
                    const OrchestratorConfig& config = {});
  ~ScoreOrchestrator();

  ScoreOrchestrator(const ScoreOrchestrator&) = delete;
  ScoreOrchestrator& operator=(const ScoreOrchestrator&) = delete;

  /// @brief Publish reconstructed sessions and today's summary.
  ///
  /// Triggers the sleep pipeline only; never causes a snapshot.
  void publishSleep(std::vector<SleepSession> sessions, const DailySleepSummary& summary);

  /// @brief Run every pipeline with a pending debounce immediately.
  void flush();

  /// @brief Mark every pipeline dirty and run them all now.
  void recomputeAll();

  const ScoreState& scoreState(ScoreCategory category) const;
  Observable<ScoreState>& scoreChannel(ScoreCategory category);

  const std::vector<SleepSession>& sessions() const { return sessions_; }
  const DailySleepSummary& dailySummary() const { return summary_; }

  std::optional<DayIndex> lastSnapshotDay() const { return last_snapshot_day_; }

  /// @brief Completed evaluations of a pipeline (gate failures included).
  size_t evaluationCount(ScoreCategory category) const {
    return evaluation_counts_[scoreIndex(category)];
  }

  /// @brief Metrics a pipeline requires to be Valid.
  static std::vector<MetricKind> readySet(ScoreCategory category);

  /// @brief Metric states that trigger a pipeline.
  static std::vector<MetricKind> triggerSet(ScoreCategory category);

 private:
  void evaluate(ScoreCategory category);
  std::optional<ScoreState> gate(ScoreCategory category) const;
  DailyMetrics collectMetrics() const;
  void maybeSnapshot();

  MetricValidityTracker& tracker_;
  const BaselineCache& baselines_;
  const Clock& clock_;
  SnapshotSink* sink_;
  OrchestratorConfig config_;

  std::array<std::unique_ptr<Debouncer>, kScoreCategoryCount> debouncers_;
  std::array<Observable<ScoreState>, kScoreCategoryCount> states_;
  std::array<size_t, kScoreCategoryCount> evaluation_counts_{};
  std::vector<std::pair<MetricKind, SubscriptionId>> subscriptions_;

  std::vector<SleepSession> sessions_;
  DailySleepSummary summary_;
  std::optional<DayIndex> last_snapshot_day_;
};

}  // namespace vitals

#endif  // VITALS_ORCHESTRATOR_SCORE_ORCHESTRATOR_H
