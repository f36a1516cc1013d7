// Abstract access to the platform health store.

#ifndef VITALS_SOURCE_SAMPLE_SOURCE_H
#define VITALS_SOURCE_SAMPLE_SOURCE_H

#include <optional>
#include <string>
#include <vector>

#include "core/metric_types.h"
#include "core/time_types.h"
#include "sleep/sleep_types.h"

namespace vitals {

struct IntervalFetchResult {
  bool success = false;
  std::vector<RawIntervalSample> samples;
  std::string error_message;
};

struct SeriesFetchResult {
  bool success = false;
  MetricSeries points;
  std::string error_message;
};

struct LatestFetchResult {
  bool success = false;
  std::optional<MetricPoint> point;  ///< Empty when nothing was ever recorded.
  std::string error_message;
};

/// @brief Supplier of raw samples.
///
/// Implementations wrap the host's health store. Calls complete before
/// returning; a host with an asynchronous store awaits it and re-enters the
/// serial context before handing results to the loader. Returned data is
/// re-validated by the caller.
class SampleSource {
 public:
  virtual ~SampleSource() = default;

  /// @brief Interval samples of the given categories overlapping [start, end].
  virtual IntervalFetchResult fetchIntervalSamples(const std::vector<SleepCategory>& categories,
                                                   Timestamp start, Timestamp end) = 0;

  /// @brief Daily values of a metric in [start, end].
  virtual SeriesFetchResult fetchQuantitySeries(MetricKind metric, Timestamp start,
                                                Timestamp end) = 0;

  /// @brief Most recent value of a metric.
  virtual LatestFetchResult fetchLatest(MetricKind metric) = 0;
};

}  // namespace vitals

#endif  // VITALS_SOURCE_SAMPLE_SOURCE_H
