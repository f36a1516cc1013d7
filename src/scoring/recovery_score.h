// Recovery score: HRV, resting heart rate and sleep efficiency.

#ifndef VITALS_SCORING_RECOVERY_SCORE_H
#define VITALS_SCORING_RECOVERY_SCORE_H

#include "baseline/baseline_stats.h"
#include "scoring/score_inputs.h"
#include "scoring/score_types.h"

namespace vitals {

/// @brief Recovery readiness, 0-100.
///
/// Base 50, adjusted by HRV bands, HRV against its baseline, resting heart
/// rate bands, resting heart rate against its baseline and sleep
/// efficiency. Baseline adjustments apply only with history baselines.
/// Status: >= 75 optimal, >= 50 moderate, else poor.
/// @return Unavailable when HRV, resting heart rate and sleep efficiency
///         are all unknown.
ScoreResult computeRecoveryScore(const DailyMetrics& metrics,
                                 const PersonalBaselines& baselines);

}  // namespace vitals

#endif  // VITALS_SCORING_RECOVERY_SCORE_H
