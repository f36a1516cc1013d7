// Read-only capture of every published output, serializable to JSON.

#ifndef VITALS_REPORT_STATE_REPORT_H
#define VITALS_REPORT_STATE_REPORT_H

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "baseline/baseline_cache.h"
#include "core/metric_types.h"
#include "orchestrator/score_orchestrator.h"
#include "scoring/score_types.h"
#include "sleep/sleep_types.h"
#include "validity/metric_state.h"
#include "validity/validity_tracker.h"

namespace vitals {

/// Value copy of the engine's published state at one instant.
struct HealthState {
  Timestamp captured_at = 0;
  std::array<MetricState, kMetricKindCount> metrics{};
  std::array<ScoreState, kScoreCategoryCount> scores{};
  std::array<BaselineLookup, kMetricKindCount> baselines{};
  std::vector<SleepSession> sessions;
  DailySleepSummary daily_summary;
  std::optional<DayIndex> last_snapshot_day;
};

/// @brief Copy all published outputs.
HealthState captureHealthState(const MetricValidityTracker& tracker,
                               const ScoreOrchestrator& orchestrator,
                               const BaselineCache& baselines, Timestamp captured_at);

/// @brief Serialize a captured state.
/// @param pretty Indented output when true.
std::string healthStateToJson(const HealthState& state, bool pretty = false);

}  // namespace vitals

#endif  // VITALS_REPORT_STATE_REPORT_H
