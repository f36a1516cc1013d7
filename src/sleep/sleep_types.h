// Sleep data model: raw interval samples, stages, sessions and daily summaries.

#ifndef VITALS_SLEEP_SLEEP_TYPES_H
#define VITALS_SLEEP_SLEEP_TYPES_H

#include <cstdint>
#include <optional>
#include <vector>

#include "core/time_types.h"

namespace vitals {

/// Sleep analysis category, using the health store's raw codes.
enum class SleepCategory : uint8_t {
  InBed = 0,
  AsleepUnspecified = 1,
  Awake = 2,
  AsleepCore = 3,
  AsleepDeep = 4,
  AsleepREM = 5
};

/// @brief True for the six recognised sleep categories.
///
/// Samples from the source may carry any raw code; anything else is not
/// sleep data.
bool isSleepCategory(SleepCategory category);

/// @brief True for AsleepUnspecified, AsleepCore, AsleepDeep, AsleepREM.
bool isAsleepCategory(SleepCategory category);

/// @brief True for AsleepCore, AsleepDeep, AsleepREM.
bool isStagedCategory(SleepCategory category);

const char* sleepCategoryToString(SleepCategory category);

/// One externally supplied interval sample. Immutable.
struct RawIntervalSample {
  SleepCategory category = SleepCategory::InBed;
  Timestamp start = 0;
  Timestamp end = 0;

  Duration duration() const { return static_cast<Duration>(end - start); }
};

/// Whether stage data backed a session.
enum class SourceQuality : uint8_t {
  Detailed,  ///< At least one Core/Deep/REM sample (wearable staging).
  Basic      ///< Only in-bed / unspecified / awake samples.
};

const char* sourceQualityToString(SourceQuality source);

/// Accumulated stage durations.
struct SleepStages {
  Duration core = 0.0;
  Duration deep = 0.0;
  Duration rem = 0.0;
  Duration awake = 0.0;

  Duration totalAsleep() const { return core + deep + rem; }
  Duration totalInBed() const { return totalAsleep() + awake; }

  /// Stage share of total asleep time in percent; 0 when nothing was asleep.
  double corePercent() const { return percentOfAsleep(core); }
  double deepPercent() const { return percentOfAsleep(deep); }
  double remPercent() const { return percentOfAsleep(rem); }

 private:
  double percentOfAsleep(Duration stage) const {
    const Duration asleep = totalAsleep();
    return asleep > 0.0 ? stage / asleep * 100.0 : 0.0;
  }
};

/// Quality metrics derived after stage and wake-event calculation.
struct SleepMetrics {
  /// Total awake time in the session. Approximates WASO: it is not
  /// measured from sleep onset.
  Duration waso = 0.0;
  double fragmentation_index = 0.0;  ///< Wake events per hour.
  /// Heuristic estimate (fraction of awake time), not a measured latency.
  Duration sleep_latency = 0.0;
  double consistency = 1.0;  ///< Bedtime regularity in [0, 1].
};

/// One reconstructed sleep period bounded by in-bed markers.
struct SleepSession {
  Timestamp start = 0;
  Timestamp end = 0;
  Duration duration = 0.0;  ///< end - start.
  double efficiency = 0.0;  ///< totalAsleep / totalInBed, in [0, 1].
  SleepStages stages;
  int wake_events = 0;
  SourceQuality source = SourceQuality::Basic;
  SleepMetrics metrics;

  double durationHours() const { return toHours(duration); }
};

/// Calendar-day view over the sessions overlapping that day.
struct DailySleepSummary {
  DayIndex date = 0;
  std::optional<SleepSession> primary_session;  ///< Longest overlapping session.
  Duration total_duration = 0.0;
  double average_efficiency = 0.0;
  int total_wake_events = 0;
  std::optional<Timestamp> bedtime;
  std::optional<Timestamp> wake_time;

  /// @brief True iff a primary session exists and total duration > 0.
  bool hasData() const { return primary_session.has_value() && total_duration > 0.0; }

  double durationHours() const { return toHours(total_duration); }
};

}  // namespace vitals

#endif  // VITALS_SLEEP_SLEEP_TYPES_H
