// Time and calendar primitives shared by every vitals module.

#ifndef VITALS_CORE_TIME_TYPES_H
#define VITALS_CORE_TIME_TYPES_H

#include <cstdint>

namespace vitals {

/// Wall-clock instant: Unix epoch seconds (UTC).
using Timestamp = int64_t;

/// Elapsed time in seconds. Fractional values arise from stage apportionment.
using Duration = double;

/// Calendar day index: days since 1970-01-01 in local time.
using DayIndex = int64_t;

constexpr Timestamp kSecondsPerMinute = 60;
constexpr Timestamp kSecondsPerHour = 60 * kSecondsPerMinute;  // 3600
constexpr Timestamp kSecondsPerDay = 24 * kSecondsPerHour;     // 86400

/// @brief Convert minutes to a Duration.
inline constexpr Duration minutes(double count) {
  return count * static_cast<double>(kSecondsPerMinute);
}

/// @brief Convert hours to a Duration.
inline constexpr Duration hours(double count) {
  return count * static_cast<double>(kSecondsPerHour);
}

/// @brief Convert days to a Duration.
inline constexpr Duration days(double count) {
  return count * static_cast<double>(kSecondsPerDay);
}

/// @brief Convert a Duration in seconds to fractional hours.
inline constexpr double toHours(Duration seconds) {
  return seconds / static_cast<double>(kSecondsPerHour);
}

/// @brief Convert a Duration in seconds to fractional minutes.
inline constexpr double toMinutes(Duration seconds) {
  return seconds / static_cast<double>(kSecondsPerMinute);
}

/// Half-open local calendar day [start, end) expressed in UTC timestamps.
struct DayBounds {
  Timestamp start = 0;
  Timestamp end = 0;

  /// @brief True if [range_start, range_end) overlaps this day.
  bool overlaps(Timestamp range_start, Timestamp range_end) const {
    return range_start < end && range_end > start;
  }
};

/// @brief Local calendar day containing a timestamp.
/// @param ts Instant to classify.
/// @param utc_offset_seconds Local offset from UTC (east positive).
/// @return Day index; pre-epoch instants floor toward negative infinity.
DayIndex dayIndexOf(Timestamp ts, int32_t utc_offset_seconds);

/// @brief Bounds of a local calendar day.
DayBounds boundsOfDay(DayIndex day, int32_t utc_offset_seconds);

/// @brief Bounds of the local calendar day containing a timestamp.
DayBounds dayContaining(Timestamp ts, int32_t utc_offset_seconds);

/// @brief Seconds elapsed since local midnight (0..86399).
Timestamp secondsIntoDay(Timestamp ts, int32_t utc_offset_seconds);

}  // namespace vitals

#endif  // VITALS_CORE_TIME_TYPES_H
