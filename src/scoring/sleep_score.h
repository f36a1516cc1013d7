// Sleep score: comprehensive weighted model with a basic fallback.

#ifndef VITALS_SCORING_SLEEP_SCORE_H
#define VITALS_SCORING_SLEEP_SCORE_H

#include "scoring/score_inputs.h"
#include "scoring/score_types.h"
#include "sleep/sleep_types.h"

namespace vitals {

/// @brief Sleep quality, 0-100.
///
/// A session with detailed stage data is scored by the comprehensive model.
/// Without one, the basic band model over duration, efficiency and wake
/// events is used. Status: >= 80 optimal, >= 60 moderate, else poor.
/// @return Unavailable when neither duration nor efficiency is known.
ScoreResult computeSleepScore(const DailyMetrics& metrics);

/// @brief Weighted model over one staged session.
///
/// 40% duration, 25% efficiency, 15% REM share, 15% deep share,
/// 5% fragmentation, minus a WASO penalty, clamped to 0-100.
double comprehensiveSleepScore(const SleepSession& session);

/// @brief Base-50 band model.
double basicSleepScore(const DailyMetrics& metrics);

/// @name Comprehensive model components (each 0-100)
/// @{
double sleepDurationPoints(double hours);
double sleepEfficiencyPoints(double efficiency);
/// 100 inside [low, high]; loses 5 points per percentage point outside.
double stageSharePoints(double percent, double low, double high);
double fragmentationPoints(double fragmentation_index);
/// Points subtracted for wake after sleep onset, by minutes.
double wasoPenalty(double waso_minutes);
/// @}

}  // namespace vitals

#endif  // VITALS_SCORING_SLEEP_SCORE_H
