// Inputs shared by the score functions.

#ifndef VITALS_SCORING_SCORE_INPUTS_H
#define VITALS_SCORING_SCORE_INPUTS_H

#include <optional>

#include "baseline/baseline_stats.h"
#include "sleep/sleep_types.h"

namespace vitals {

/// @brief Today's usable metric values. Absent fields are unknown, never 0.
struct DailyMetrics {
  std::optional<double> hrv;                 ///< ms.
  std::optional<double> resting_heart_rate;  ///< bpm.
  std::optional<double> steps;
  std::optional<double> active_energy;       ///< kcal.
  std::optional<double> sleep_duration_hours;
  std::optional<double> sleep_efficiency;    ///< [0, 1].
  std::optional<int> wake_events;
  /// Primary session of the day, when one was reconstructed.
  std::optional<SleepSession> sleep_session;

  /// @brief Fill the sleep fields from a daily summary with data.
  void applySleepSummary(const DailySleepSummary& summary) {
    if (!summary.hasData()) return;
    sleep_duration_hours = summary.durationHours();
    sleep_efficiency = summary.average_efficiency;
    wake_events = summary.total_wake_events;
    sleep_session = summary.primary_session;
  }
};

}  // namespace vitals

#endif  // VITALS_SCORING_SCORE_INPUTS_H
