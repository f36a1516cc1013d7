// Stress score computation.

#include "scoring/stress_score.h"

#include <algorithm>

namespace vitals {

ScoreResult computeStressScore(const DailyMetrics& metrics,
                               const PersonalBaselines& baselines) {
  if (!metrics.hrv.has_value()) {
    return ScoreResult::unavailable("No HRV data");
  }

  double score = 50.0;
  if (baselines.hrv.has_value() && baselines.hrv->mean > 0.0) {
    const double ratio = *metrics.hrv / baselines.hrv->mean;
    if (ratio < 0.8) {
      score += 25.0;
    } else if (ratio < 0.9) {
      score += 15.0;
    } else if (ratio > 1.1) {
      score -= 20.0;
    }
  }
  score = std::clamp(score, 0.0, 100.0);

  ScoreStatus status = ScoreStatus::Optimal;
  if (score >= 70.0) {
    status = ScoreStatus::Poor;
  } else if (score >= 40.0) {
    status = ScoreStatus::Moderate;
  }
  return ScoreResult::computed(score, status);
}

}  // namespace vitals
