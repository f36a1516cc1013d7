// Stress score: HRV suppression against the personal baseline.

#ifndef VITALS_SCORING_STRESS_SCORE_H
#define VITALS_SCORING_STRESS_SCORE_H

#include "baseline/baseline_stats.h"
#include "scoring/score_inputs.h"
#include "scoring/score_types.h"

namespace vitals {

/// @brief Stress proxy, 0-100 (higher is more stressed).
///
/// Base 50; HRV/baseline ratio < 0.8 adds 25, < 0.9 adds 15, > 1.1
/// subtracts 20. Without a history baseline the score stays 50.
/// Status is inverted: >= 70 poor, >= 40 moderate, else optimal.
/// @return Unavailable without HRV.
ScoreResult computeStressScore(const DailyMetrics& metrics,
                               const PersonalBaselines& baselines);

}  // namespace vitals

#endif  // VITALS_SCORING_STRESS_SCORE_H
