// Calendar-day view over reconstructed sleep sessions.

#ifndef VITALS_SLEEP_DAILY_AGGREGATOR_H
#define VITALS_SLEEP_DAILY_AGGREGATOR_H

#include <vector>

#include "core/time_types.h"
#include "sleep/sleep_types.h"

namespace vitals {

/// @brief Summarize the sessions that overlap a local calendar day.
///
/// A session overlaps the day when start < day_end and end > day_start, so
/// a night spanning midnight counts toward both days. The primary session
/// is the longest one; on equal durations the first in input order wins.
/// Bedtime and wake time come from the primary session.
///
/// @param date Local day index.
/// @param sessions Sessions in any order.
/// @param utc_offset_seconds Offset used to locate the day boundaries.
/// @return Summary; hasData() is false when nothing overlaps.
DailySleepSummary buildDailySummary(DayIndex date, const std::vector<SleepSession>& sessions,
                                    int32_t utc_offset_seconds);

}  // namespace vitals

#endif  // VITALS_SLEEP_DAILY_AGGREGATOR_H
