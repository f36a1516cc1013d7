// Score dispatch.

#include "scoring/score_engine.h"

#include "scoring/recovery_score.h"
#include "scoring/sleep_score.h"
#include "scoring/strain_score.h"
#include "scoring/stress_score.h"

namespace vitals {

ScoreResult computeScore(ScoreCategory category, const DailyMetrics& metrics,
                         const PersonalBaselines& baselines) {
  switch (category) {
    case ScoreCategory::Recovery: return computeRecoveryScore(metrics, baselines);
    case ScoreCategory::Sleep:    return computeSleepScore(metrics);
    case ScoreCategory::Strain:   return computeStrainScore(metrics, baselines);
    case ScoreCategory::Stress:   return computeStressScore(metrics, baselines);
  }
  return ScoreResult::unavailable("Unknown score category");
}

}  // namespace vitals
