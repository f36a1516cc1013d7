// Recovery score computation.

#include "scoring/recovery_score.h"

#include <algorithm>

namespace vitals {

namespace {

double hrvAdjustment(double hrv) {
  if (hrv >= 70.0) return 20.0;
  if (hrv >= 50.0) return 15.0;
  if (hrv >= 30.0) return 10.0;
  if (hrv >= 20.0) return -5.0;
  return -15.0;
}

double restingHeartRateAdjustment(double rhr) {
  if (rhr < 40.0) return 0.0;  // Atypically low; neither rewarded nor penalized.
  if (rhr < 60.0) return 15.0;
  if (rhr < 80.0) return 8.0;
  if (rhr < 100.0) return -5.0;
  return -15.0;
}

double efficiencyAdjustment(double efficiency) {
  if (efficiency >= 0.85) return 15.0;
  if (efficiency >= 0.75) return 8.0;
  if (efficiency < 0.65) return -12.0;
  return 0.0;
}

}  // namespace

ScoreResult computeRecoveryScore(const DailyMetrics& metrics,
                                 const PersonalBaselines& baselines) {
  if (!metrics.hrv.has_value() && !metrics.resting_heart_rate.has_value() &&
      !metrics.sleep_efficiency.has_value()) {
    return ScoreResult::unavailable("No HRV, resting heart rate or sleep data");
  }

  double score = 50.0;

  if (metrics.hrv.has_value()) {
    const double hrv = *metrics.hrv;
    score += hrvAdjustment(hrv);
    if (baselines.hrv.has_value() && baselines.hrv->mean > 0.0) {
      const double ratio = hrv / baselines.hrv->mean;
      if (ratio > 1.1) {
        score += 10.0;
      } else if (ratio < 0.8) {
        score -= 10.0;
      }
    }
  }

  if (metrics.resting_heart_rate.has_value()) {
    const double rhr = *metrics.resting_heart_rate;
    score += restingHeartRateAdjustment(rhr);
    if (baselines.resting_heart_rate.has_value()) {
      const double delta = baselines.resting_heart_rate->mean - rhr;
      if (delta > 5.0) {
        score += 10.0;
      } else if (delta < -3.0) {
        score -= 10.0;
      }
    }
  }

  if (metrics.sleep_efficiency.has_value()) {
    score += efficiencyAdjustment(*metrics.sleep_efficiency);
  }

  score = std::clamp(score, 0.0, 100.0);

  ScoreStatus status = ScoreStatus::Poor;
  if (score >= 75.0) {
    status = ScoreStatus::Optimal;
  } else if (score >= 50.0) {
    status = ScoreStatus::Moderate;
  }
  return ScoreResult::computed(score, status);
}

}  // namespace vitals
