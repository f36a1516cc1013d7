// Strain score computation.

#include "scoring/strain_score.h"

#include <algorithm>

namespace vitals {

double stepsCurvePoints(double steps) {
  if (steps >= 12000.0) return 90.0 + std::min(10.0, (steps - 12000.0) / 3000.0 * 10.0);
  if (steps >= 8000.0) return 70.0 + (steps - 8000.0) / 4000.0 * 20.0;
  if (steps >= 5000.0) return 40.0 + (steps - 5000.0) / 3000.0 * 30.0;
  if (steps >= 2000.0) return 20.0 + (steps - 2000.0) / 3000.0 * 20.0;
  return std::max(5.0, steps / 2000.0 * 20.0);
}

double activeEnergyCurvePoints(double kcal) {
  if (kcal >= 600.0) return 85.0 + std::min(15.0, (kcal - 600.0) / 200.0 * 15.0);
  if (kcal >= 400.0) return 65.0 + (kcal - 400.0) / 200.0 * 20.0;
  if (kcal >= 200.0) return 35.0 + (kcal - 200.0) / 200.0 * 30.0;
  if (kcal >= 100.0) return 15.0 + (kcal - 100.0) / 100.0 * 20.0;
  return std::max(5.0, kcal / 100.0 * 15.0);
}

ScoreResult computeStrainScore(const DailyMetrics& metrics,
                               const PersonalBaselines& baselines) {
  if (!metrics.steps.has_value() && !metrics.active_energy.has_value()) {
    return ScoreResult::unavailable("No step or active energy data");
  }

  // An absent component counts as below its threshold.
  const bool low_steps = metrics.steps.value_or(0.0) < kStrainMinSteps;
  const bool low_energy = metrics.active_energy.value_or(0.0) < kStrainMinActiveEnergy;
  if (low_steps && low_energy) {
    return ScoreResult::computed(0.0, ScoreStatus::Poor);
  }

  double weighted = 0.0;
  double weight = 0.0;
  if (metrics.steps.has_value()) {
    const double points = baselines.steps.has_value()
                              ? normalizedScore(*metrics.steps, *baselines.steps)
                              : stepsCurvePoints(*metrics.steps);
    weighted += 0.4 * points;
    weight += 0.4;
  }
  if (metrics.active_energy.has_value()) {
    const double points = baselines.active_energy.has_value()
                              ? normalizedScore(*metrics.active_energy, *baselines.active_energy)
                              : activeEnergyCurvePoints(*metrics.active_energy);
    weighted += 0.6 * points;
    weight += 0.6;
  }

  const double score = std::clamp(weighted / weight, 0.0, 100.0);
  ScoreStatus status = ScoreStatus::Poor;
  if (score >= 70.0) {
    status = ScoreStatus::Optimal;
  } else if (score >= 40.0) {
    status = ScoreStatus::Moderate;
  }
  return ScoreResult::computed(score, status);
}

}  // namespace vitals
