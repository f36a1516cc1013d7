// Strain score: daily activity load from steps and active energy.

#ifndef VITALS_SCORING_STRAIN_SCORE_H
#define VITALS_SCORING_STRAIN_SCORE_H

#include "baseline/baseline_stats.h"
#include "scoring/score_inputs.h"
#include "scoring/score_types.h"

namespace vitals {

/// Low-activity guard: below both thresholds the strain is exactly 0.
constexpr double kStrainMinSteps = 1000.0;
constexpr double kStrainMinActiveEnergy = 200.0;

/// @brief Activity strain, 0-100.
///
/// 40% steps + 60% active energy. Each component is normalized against a
/// history baseline when one exists, otherwise read off a fixed curve. A
/// component that is present alone carries the full weight.
/// Status: >= 70 optimal, >= 40 moderate, else poor.
/// @return Unavailable when both steps and active energy are unknown.
ScoreResult computeStrainScore(const DailyMetrics& metrics,
                               const PersonalBaselines& baselines);

/// @brief Fixed step curve used without a history baseline.
double stepsCurvePoints(double steps);

/// @brief Fixed active energy curve used without a history baseline.
double activeEnergyCurvePoints(double kcal);

}  // namespace vitals

#endif  // VITALS_SCORING_STRAIN_SCORE_H
