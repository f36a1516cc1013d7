// Single entry point over the four score functions.

#ifndef VITALS_SCORING_SCORE_ENGINE_H
#define VITALS_SCORING_SCORE_ENGINE_H

#include "baseline/baseline_stats.h"
#include "scoring/score_inputs.h"
#include "scoring/score_types.h"

namespace vitals {

/// @brief Compute one category. Pure and idempotent.
ScoreResult computeScore(ScoreCategory category, const DailyMetrics& metrics,
                         const PersonalBaselines& baselines);

}  // namespace vitals

#endif  // VITALS_SCORING_SCORE_ENGINE_H
