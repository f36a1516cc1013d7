// Sleep session reconstruction from raw interval samples.
//
// Pipeline: validate -> sort -> merge into contiguous intervals -> nap filter
// -> in-bed boundaries -> stage accumulation -> wake events -> efficiency
// -> derived metrics -> bedtime consistency.

#ifndef VITALS_SLEEP_SESSION_BUILDER_H
#define VITALS_SLEEP_SESSION_BUILDER_H

#include <cstddef>
#include <optional>
#include <vector>

#include "core/time_types.h"
#include "sleep/sleep_types.h"

namespace vitals {

/// Session reconstruction policy.
struct SessionBuilderConfig {
  /// A sample starting within this gap of the interval end extends it.
  Duration max_gap = minutes(30);
  /// Intervals and sessions shorter than this are dropped (naps).
  Duration min_session = minutes(90);
  /// Sleep latency estimate as a fraction of awake time.
  double latency_awake_fraction = 0.1;
  /// Sessions (including the current one) considered for consistency.
  size_t consistency_window = 8;
  /// Preceding sessions required before consistency departs from 1.0.
  size_t consistency_min_history = 3;
  /// Bedtime standard deviation (minutes) that maps to consistency 0.
  double consistency_spread_minutes = 120.0;
  /// Local offset used to read bedtimes as clock-of-day.
  int32_t utc_offset_seconds = 0;
  bool verbose = false;
};

/// Samples merged by the gap rule, in chronological order.
struct SleepInterval {
  Timestamp start = 0;
  Timestamp end = 0;
  std::vector<RawIntervalSample> samples;

  Duration duration() const { return static_cast<Duration>(end - start); }
};

/// @brief Drop samples that are malformed, future-dated, outside the range
///        or not sleep data.
///
/// A sample is kept when end > start, end <= now, it overlaps
/// [range_start, range_end) and its category is one of the six sleep
/// categories.
std::vector<RawIntervalSample> filterValidSamples(const std::vector<RawIntervalSample>& samples,
                                                  Timestamp range_start, Timestamp range_end,
                                                  Timestamp now,
                                                  const SessionBuilderConfig& config = {});

/// @brief Merge samples into contiguous intervals.
///
/// Samples are sorted by start (stable). A sample whose start lies within
/// max_gap of the current interval end joins it; the interval end becomes
/// the max of all member ends.
std::vector<SleepInterval> groupIntoIntervals(std::vector<RawIntervalSample> samples,
                                              const SessionBuilderConfig& config = {});

/// @brief Sum stage durations over chronologically ordered samples.
///
/// AsleepUnspecified time is split by the core:deep:rem ratio accumulated
/// so far, or credited entirely to core when nothing staged has been seen.
/// The result therefore depends on sample order.
SleepStages accumulateStages(const std::vector<RawIntervalSample>& samples);

/// @brief Count asleep -> Awake transitions in chronological order.
///
/// Consecutive Awake samples count once; InBed samples neither start nor
/// end a sleep run.
int countWakeEvents(const std::vector<RawIntervalSample>& samples);

/// @brief Build the basic session for one interval.
/// @return Nothing when the interval is a nap, has no InBed sample, or the
///         in-bed span is itself shorter than min_session.
std::optional<SleepSession> sessionFromInterval(const SleepInterval& interval,
                                                const SessionBuilderConfig& config = {});

/// @brief Copy of a session with WASO, fragmentation and latency filled in.
SleepSession withDerivedMetrics(const SleepSession& session,
                                const SessionBuilderConfig& config = {});

/// @brief Bedtime regularity for a session given its predecessors.
/// @param bedtimes Chronological bedtimes; the last entry is the session's own.
/// @return 1.0 when fewer than consistency_min_history predecessors exist.
double bedtimeConsistency(const std::vector<Timestamp>& bedtimes,
                          const SessionBuilderConfig& config = {});

/// @brief Reconstruct sleep sessions for a date range.
///
/// Never fails: invalid input is dropped and an empty result is normal.
/// @param samples Raw interval samples in any order.
/// @param range_start Inclusive range start.
/// @param range_end Exclusive range end.
/// @param now Current time; samples ending later are rejected.
/// @return Sessions in chronological order with derived metrics.
std::vector<SleepSession> buildSleepSessions(const std::vector<RawIntervalSample>& samples,
                                             Timestamp range_start, Timestamp range_end,
                                             Timestamp now,
                                             const SessionBuilderConfig& config = {});

}  // namespace vitals

#endif  // VITALS_SLEEP_SESSION_BUILDER_H
