// Calendar arithmetic with an explicit UTC offset.

#include "core/time_types.h"

namespace vitals {

namespace {

/// Floor division for possibly negative numerators (divisor > 0).
int64_t floorDiv(int64_t numerator, int64_t divisor) {
  int64_t quotient = numerator / divisor;
  if ((numerator % divisor != 0) && (numerator < 0)) {
    --quotient;
  }
  return quotient;
}

}  // namespace

DayIndex dayIndexOf(Timestamp ts, int32_t utc_offset_seconds) {
  return floorDiv(ts + utc_offset_seconds, kSecondsPerDay);
}

DayBounds boundsOfDay(DayIndex day, int32_t utc_offset_seconds) {
  DayBounds bounds;
  bounds.start = day * kSecondsPerDay - utc_offset_seconds;
  bounds.end = bounds.start + kSecondsPerDay;
  return bounds;
}

DayBounds dayContaining(Timestamp ts, int32_t utc_offset_seconds) {
  return boundsOfDay(dayIndexOf(ts, utc_offset_seconds), utc_offset_seconds);
}

Timestamp secondsIntoDay(Timestamp ts, int32_t utc_offset_seconds) {
  return ts - dayContaining(ts, utc_offset_seconds).start;
}

}  // namespace vitals
