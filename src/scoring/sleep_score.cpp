// Sleep score computation.

#include "scoring/sleep_score.h"

#include <algorithm>

namespace vitals {

namespace {

ScoreStatus sleepStatus(double score) {
  if (score >= 80.0) return ScoreStatus::Optimal;
  if (score >= 60.0) return ScoreStatus::Moderate;
  return ScoreStatus::Poor;
}

}  // namespace

// ---------------------------------------------------------------------------
// Comprehensive model components
// ---------------------------------------------------------------------------

double sleepDurationPoints(double hours) {
  if (hours >= 8.5 && hours <= 9.5) return 100.0;
  if (hours >= 7.5 && hours < 8.5) return 85.0 + (hours - 7.5) * 15.0;
  if (hours >= 6.5 && hours < 7.5) return 70.0 + (hours - 6.5) * 15.0;
  if (hours >= 5.5 && hours < 6.5) return 50.0 + (hours - 5.5) * 20.0;
  if (hours < 5.5) return std::max(0.0, 50.0 - (5.5 - hours) * 15.0);
  if (hours <= 10.5) return 100.0 - (hours - 9.5) * 15.0;
  return std::max(40.0, 85.0 - (hours - 10.5) * 10.0);
}

double sleepEfficiencyPoints(double efficiency) {
  if (efficiency >= 0.90) return 100.0;
  if (efficiency >= 0.85) return 85.0;
  if (efficiency >= 0.80) return 70.0;
  if (efficiency >= 0.75) return 55.0;
  if (efficiency >= 0.65) return 35.0;
  return 15.0;
}

double stageSharePoints(double percent, double low, double high) {
  if (percent >= low && percent <= high) return 100.0;
  const double distance = percent < low ? low - percent : percent - high;
  return std::max(0.0, 100.0 - distance * 5.0);
}

double fragmentationPoints(double fragmentation_index) {
  return std::max(0.0, 100.0 - fragmentation_index * 10.0);
}

double wasoPenalty(double waso_minutes) {
  if (waso_minutes <= 0.0) return 0.0;
  if (waso_minutes <= 10.0) return 2.0;
  if (waso_minutes <= 20.0) return 5.0;
  if (waso_minutes <= 30.0) return 10.0;
  return 15.0;
}

// ---------------------------------------------------------------------------
// Models
// ---------------------------------------------------------------------------

double comprehensiveSleepScore(const SleepSession& session) {
  double score = 0.40 * sleepDurationPoints(session.durationHours()) +
                 0.25 * sleepEfficiencyPoints(session.efficiency) +
                 0.15 * stageSharePoints(session.stages.remPercent(), 20.0, 25.0) +
                 0.15 * stageSharePoints(session.stages.deepPercent(), 15.0, 20.0) +
                 0.05 * fragmentationPoints(session.metrics.fragmentation_index);
  score -= wasoPenalty(toMinutes(session.metrics.waso));
  return std::clamp(score, 0.0, 100.0);
}

double basicSleepScore(const DailyMetrics& metrics) {
  double score = 50.0;

  if (metrics.sleep_duration_hours.has_value()) {
    const double hours = *metrics.sleep_duration_hours;
    if (hours >= 8.0) {
      score += 20.0;
    } else if (hours >= 7.0) {
      score += 12.0;
    } else if (hours >= 6.0) {
      score += 5.0;
    } else if (hours < 5.0) {
      score -= 20.0;
    } else {
      score -= 10.0;
    }
  }

  if (metrics.sleep_efficiency.has_value()) {
    const double efficiency = *metrics.sleep_efficiency;
    if (efficiency >= 0.9) {
      score += 20.0;
    } else if (efficiency >= 0.85) {
      score += 12.0;
    } else if (efficiency >= 0.8) {
      score += 5.0;
    } else if (efficiency < 0.75) {
      score -= 20.0;
    } else {
      score -= 10.0;
    }
  }

  if (metrics.wake_events.has_value()) {
    const int wake_events = *metrics.wake_events;
    if (wake_events == 0) {
      score += 10.0;
    } else if (wake_events <= 2) {
      score += 5.0;
    } else if (wake_events > 5) {
      score -= 10.0;
    }
  }

  return std::clamp(score, 0.0, 100.0);
}

ScoreResult computeSleepScore(const DailyMetrics& metrics) {
  if (metrics.sleep_session.has_value() &&
      metrics.sleep_session->source == SourceQuality::Detailed) {
    const double score = comprehensiveSleepScore(*metrics.sleep_session);
    return ScoreResult::computed(score, sleepStatus(score));
  }

  if (!metrics.sleep_duration_hours.has_value() && !metrics.sleep_efficiency.has_value()) {
    return ScoreResult::unavailable("No sleep duration or efficiency data");
  }
  const double score = basicSleepScore(metrics);
  return ScoreResult::computed(score, sleepStatus(score));
}

}  // namespace vitals
