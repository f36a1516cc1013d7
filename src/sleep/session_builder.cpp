// Sleep session reconstruction.

#include "sleep/session_builder.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <utility>

namespace vitals {

namespace {

/// @brief Clamp a double to [0, 1].
double clamp01(double val) {
  if (val < 0.0) return 0.0;
  if (val > 1.0) return 1.0;
  return val;
}

/// @brief Bedtime as minutes after local noon (0..1439).
///
/// Measuring from noon keeps a 23:30 / 00:30 pair one hour apart instead
/// of wrapping across midnight.
double minutesAfterNoon(Timestamp bedtime, int32_t utc_offset_seconds) {
  Timestamp into_day = secondsIntoDay(bedtime, utc_offset_seconds);
  Timestamp from_noon = (into_day - 12 * kSecondsPerHour + kSecondsPerDay) % kSecondsPerDay;
  return toMinutes(static_cast<Duration>(from_noon));
}

}  // namespace

// ---------------------------------------------------------------------------
// Filtering and grouping
// ---------------------------------------------------------------------------

std::vector<RawIntervalSample> filterValidSamples(const std::vector<RawIntervalSample>& samples,
                                                  Timestamp range_start, Timestamp range_end,
                                                  Timestamp now,
                                                  const SessionBuilderConfig& config) {
  std::vector<RawIntervalSample> valid;
  valid.reserve(samples.size());

  int rejected = 0;
  for (const auto& sample : samples) {
    if (sample.end <= sample.start) {
      ++rejected;
      continue;
    }
    if (sample.end > now) {
      ++rejected;
      continue;
    }
    if (!(sample.start < range_end && sample.end > range_start)) {
      ++rejected;
      continue;
    }
    if (!isSleepCategory(sample.category)) {
      ++rejected;
      continue;
    }
    valid.push_back(sample);
  }

  if (config.verbose && rejected > 0) {
    std::fprintf(stderr, "[SleepSessionBuilder] rejected %d of %zu samples\n", rejected,
                 samples.size());
  }
  return valid;
}

std::vector<SleepInterval> groupIntoIntervals(std::vector<RawIntervalSample> samples,
                                              const SessionBuilderConfig& config) {
  std::stable_sort(samples.begin(), samples.end(),
                   [](const RawIntervalSample& lhs, const RawIntervalSample& rhs) {
                     return lhs.start < rhs.start;
                   });

  std::vector<SleepInterval> intervals;
  for (const auto& sample : samples) {
    if (!intervals.empty()) {
      SleepInterval& current = intervals.back();
      const Duration gap = static_cast<Duration>(sample.start - current.end);
      if (gap <= config.max_gap) {
        current.end = std::max(current.end, sample.end);
        current.samples.push_back(sample);
        continue;
      }
    }
    SleepInterval fresh;
    fresh.start = sample.start;
    fresh.end = sample.end;
    fresh.samples.push_back(sample);
    intervals.push_back(std::move(fresh));
  }
  return intervals;
}

// ---------------------------------------------------------------------------
// Stage accounting
// ---------------------------------------------------------------------------

SleepStages accumulateStages(const std::vector<RawIntervalSample>& samples) {
  SleepStages stages;
  for (const auto& sample : samples) {
    const Duration length = sample.duration();
    switch (sample.category) {
      case SleepCategory::AsleepCore:
        stages.core += length;
        break;
      case SleepCategory::AsleepDeep:
        stages.deep += length;
        break;
      case SleepCategory::AsleepREM:
        stages.rem += length;
        break;
      case SleepCategory::Awake:
        stages.awake += length;
        break;
      case SleepCategory::AsleepUnspecified: {
        const Duration specified = stages.totalAsleep();
        if (specified > 0.0) {
          // Ratios are taken before any of this sample is credited.
          const double core_ratio = stages.core / specified;
          const double deep_ratio = stages.deep / specified;
          const double rem_ratio = stages.rem / specified;
          stages.core += length * core_ratio;
          stages.deep += length * deep_ratio;
          stages.rem += length * rem_ratio;
        } else {
          stages.core += length;
        }
        break;
      }
      case SleepCategory::InBed:
        break;
    }
  }
  return stages;
}

int countWakeEvents(const std::vector<RawIntervalSample>& samples) {
  int wake_events = 0;
  bool was_asleep = false;
  for (const auto& sample : samples) {
    if (isAsleepCategory(sample.category)) {
      was_asleep = true;
    } else if (sample.category == SleepCategory::Awake && was_asleep) {
      ++wake_events;
      was_asleep = false;
    }
  }
  return wake_events;
}

// ---------------------------------------------------------------------------
// Session reconstruction
// ---------------------------------------------------------------------------

std::optional<SleepSession> sessionFromInterval(const SleepInterval& interval,
                                                const SessionBuilderConfig& config) {
  if (interval.duration() < config.min_session) {
    if (config.verbose) {
      std::fprintf(stderr, "[SleepSessionBuilder] interval %.2fh below nap threshold\n",
                   toHours(interval.duration()));
    }
    return std::nullopt;
  }

  // Samples are sorted by start; the session ends with the latest-ending
  // InBed sample, so a short overlapping one cannot truncate the night.
  const RawIntervalSample* first_in_bed = nullptr;
  const RawIntervalSample* last_in_bed = nullptr;
  bool has_staged = false;
  for (const auto& sample : interval.samples) {
    if (sample.category == SleepCategory::InBed) {
      if (first_in_bed == nullptr) first_in_bed = &sample;
      if (last_in_bed == nullptr || sample.end > last_in_bed->end) last_in_bed = &sample;
    }
    if (isStagedCategory(sample.category)) has_staged = true;
  }

  if (first_in_bed == nullptr) {
    if (config.verbose) {
      std::fprintf(stderr, "[SleepSessionBuilder] interval without in-bed marker skipped\n");
    }
    return std::nullopt;
  }

  SleepSession session;
  session.start = first_in_bed->start;
  session.end = last_in_bed->end;
  if (session.end <= session.start) return std::nullopt;
  session.duration = static_cast<Duration>(session.end - session.start);
  if (session.duration < config.min_session) {
    if (config.verbose) {
      std::fprintf(stderr, "[SleepSessionBuilder] in-bed span %.2fh below nap threshold\n",
                   session.durationHours());
    }
    return std::nullopt;
  }

  session.stages = accumulateStages(interval.samples);
  session.wake_events = countWakeEvents(interval.samples);

  const Duration in_bed = session.stages.totalInBed();
  session.efficiency = in_bed > 0.0 ? clamp01(session.stages.totalAsleep() / in_bed) : 0.0;
  session.source = has_staged ? SourceQuality::Detailed : SourceQuality::Basic;
  return session;
}

SleepSession withDerivedMetrics(const SleepSession& session,
                                const SessionBuilderConfig& config) {
  SleepSession enhanced = session;
  enhanced.metrics.waso = session.stages.awake;
  const double hours_slept = session.durationHours();
  enhanced.metrics.fragmentation_index =
      (session.wake_events > 0 && hours_slept > 0.0)
          ? static_cast<double>(session.wake_events) / hours_slept
          : 0.0;
  enhanced.metrics.sleep_latency = session.stages.awake * config.latency_awake_fraction;
  enhanced.metrics.consistency = 1.0;
  return enhanced;
}

double bedtimeConsistency(const std::vector<Timestamp>& bedtimes,
                          const SessionBuilderConfig& config) {
  if (bedtimes.empty()) return 1.0;
  const size_t predecessors = bedtimes.size() - 1;
  if (predecessors < config.consistency_min_history) return 1.0;

  const size_t window = std::max<size_t>(config.consistency_window, 2);
  const size_t first = bedtimes.size() > window ? bedtimes.size() - window : 0;

  double sum = 0.0;
  size_t count = 0;
  for (size_t idx = first; idx < bedtimes.size(); ++idx) {
    sum += minutesAfterNoon(bedtimes[idx], config.utc_offset_seconds);
    ++count;
  }
  const double mean = sum / static_cast<double>(count);

  double sq_sum = 0.0;
  for (size_t idx = first; idx < bedtimes.size(); ++idx) {
    const double diff = minutesAfterNoon(bedtimes[idx], config.utc_offset_seconds) - mean;
    sq_sum += diff * diff;
  }
  const double spread = std::sqrt(sq_sum / static_cast<double>(count));

  if (config.consistency_spread_minutes <= 0.0) return spread > 0.0 ? 0.0 : 1.0;
  return clamp01(1.0 - spread / config.consistency_spread_minutes);
}

std::vector<SleepSession> buildSleepSessions(const std::vector<RawIntervalSample>& samples,
                                             Timestamp range_start, Timestamp range_end,
                                             Timestamp now,
                                             const SessionBuilderConfig& config) {
  std::vector<RawIntervalSample> valid =
      filterValidSamples(samples, range_start, range_end, now, config);
  std::vector<SleepInterval> intervals = groupIntoIntervals(std::move(valid), config);

  std::vector<SleepSession> sessions;
  sessions.reserve(intervals.size());
  std::vector<Timestamp> bedtimes;

  for (const auto& interval : intervals) {
    std::optional<SleepSession> basic = sessionFromInterval(interval, config);
    if (!basic.has_value()) continue;

    SleepSession session = withDerivedMetrics(*basic, config);
    bedtimes.push_back(session.start);
    session.metrics.consistency = bedtimeConsistency(bedtimes, config);
    sessions.push_back(session);
  }

  if (config.verbose) {
    std::fprintf(stderr, "[SleepSessionBuilder] %zu samples -> %zu intervals -> %zu sessions\n",
                 samples.size(), intervals.size(), sessions.size());
  }
  return sessions;
}

}  // namespace vitals
