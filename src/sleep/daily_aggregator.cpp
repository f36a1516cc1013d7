// Daily sleep aggregation.

#include "sleep/daily_aggregator.h"

namespace vitals {

DailySleepSummary buildDailySummary(DayIndex date, const std::vector<SleepSession>& sessions,
                                    int32_t utc_offset_seconds) {
  DailySleepSummary summary;
  summary.date = date;

  const DayBounds bounds = boundsOfDay(date, utc_offset_seconds);
  const SleepSession* primary = nullptr;
  double efficiency_sum = 0.0;
  int overlapping = 0;

  for (const auto& session : sessions) {
    if (!bounds.overlaps(session.start, session.end)) continue;
    ++overlapping;
    summary.total_duration += session.duration;
    summary.total_wake_events += session.wake_events;
    efficiency_sum += session.efficiency;
    // Strict comparison keeps the first of equally long sessions.
    if (primary == nullptr || session.duration > primary->duration) {
      primary = &session;
    }
  }

  if (overlapping > 0) {
    summary.average_efficiency = efficiency_sum / static_cast<double>(overlapping);
  }
  if (primary != nullptr) {
    summary.primary_session = *primary;
    summary.bedtime = primary->start;
    summary.wake_time = primary->end;
  }
  return summary;
}

}  // namespace vitals
