// Tests for baseline/baseline_cache.h -- TTL and fingerprint behavior.

#include "baseline/baseline_cache.h"

#include <gtest/gtest.h>

#include <vector>

#include "test_helpers.h"

namespace vitals {
namespace {

using test_helpers::at;
using test_helpers::constantSeries;
using test_helpers::dailySeries;

TEST(BaselineCacheTest, EmptyCacheReportsPrior) {
  BaselineCache cache;
  BaselineLookup lookup = cache.lookup(MetricKind::Steps);
  ASSERT_TRUE(lookup.stats.has_value());
  EXPECT_FALSE(lookup.from_history);
  EXPECT_DOUBLE_EQ(lookup.stats->mean, 8000.0);
  EXPECT_FALSE(cache.personal(MetricKind::Steps).has_value());
  EXPECT_FALSE(cache.lookup(MetricKind::BodyWeight).stats.has_value());
}

TEST(BaselineCacheTest, InsufficientHistoryFallsBackToPrior) {
  BaselineCache cache;
  BaselineLookup lookup = cache.update(MetricKind::Hrv, constantSeries(at(0, 8), 5, 70.0), at(0, 9));
  EXPECT_FALSE(lookup.from_history);
  EXPECT_DOUBLE_EQ(lookup.stats->mean, 45.0);
  EXPECT_FALSE(cache.personalBaselines().hrv.has_value());
}

TEST(BaselineCacheTest, HistoryBaselinePersonalizes) {
  BaselineCache cache;
  BaselineLookup lookup =
      cache.update(MetricKind::Hrv, constantSeries(at(0, 8), 20, 70.0), at(0, 9));
  EXPECT_TRUE(lookup.from_history);
  EXPECT_DOUBLE_EQ(lookup.stats->mean, 70.0);
  ASSERT_TRUE(cache.personalBaselines().hrv.has_value());
  EXPECT_DOUBLE_EQ(cache.personalBaselines().hrv->mean, 70.0);
  EXPECT_EQ(*cache.cachedAt(MetricKind::Hrv), at(0, 9));
}

TEST(BaselineCacheTest, WithinTtlCachedStatsAreReused) {
  BaselineCache cache;
  cache.update(MetricKind::Steps, constantSeries(at(0, 8), 20, 9000.0), at(0, 9));
  BaselineLookup lookup =
      cache.update(MetricKind::Steps, constantSeries(at(0, 20), 20, 5000.0), at(0, 21));
  EXPECT_DOUBLE_EQ(lookup.stats->mean, 9000.0);
  EXPECT_EQ(*cache.cachedAt(MetricKind::Steps), at(0, 9));
}

TEST(BaselineCacheTest, BackfillReplacesCachedPriorWithinTtl) {
  BaselineCache cache;
  cache.update(MetricKind::Hrv, constantSeries(at(0, 8), 5, 70.0), at(0, 9));
  BaselineLookup after =
      cache.update(MetricKind::Hrv, constantSeries(at(0, 8), 20, 70.0), at(0, 10));
  EXPECT_TRUE(after.from_history);
  EXPECT_DOUBLE_EQ(after.stats->mean, 70.0);
  ASSERT_TRUE(cache.personal(MetricKind::Hrv).has_value());
  EXPECT_EQ(*cache.cachedAt(MetricKind::Hrv), at(0, 10));
}

TEST(BaselineCacheTest, ShortSeriesWithinTtlKeepsCachedPrior) {
  BaselineCache cache;
  cache.update(MetricKind::Hrv, constantSeries(at(0, 8), 5, 70.0), at(0, 9));
  BaselineLookup after =
      cache.update(MetricKind::Hrv, constantSeries(at(0, 8), 13, 70.0), at(0, 10));
  EXPECT_FALSE(after.from_history);
  EXPECT_EQ(*cache.cachedAt(MetricKind::Hrv), at(0, 9));
}

TEST(BaselineCacheTest, AfterTtlChangedSeriesIsRecomputed) {
  BaselineCache cache;
  cache.update(MetricKind::Steps, constantSeries(at(0, 8), 20, 9000.0), at(0, 9));
  BaselineLookup lookup =
      cache.update(MetricKind::Steps, constantSeries(at(1, 8), 20, 5000.0), at(1, 9));
  EXPECT_DOUBLE_EQ(lookup.stats->mean, 5000.0);
  EXPECT_EQ(*cache.cachedAt(MetricKind::Steps), at(1, 9));
}

TEST(BaselineCacheTest, AfterTtlUnchangedSeriesOnlyRefreshes) {
  BaselineCache cache;
  MetricSeries series = constantSeries(at(0, 8), 20, 9000.0);
  cache.update(MetricKind::Steps, series, at(0, 9));
  BaselineLookup lookup = cache.update(MetricKind::Steps, series, at(2, 9));
  EXPECT_DOUBLE_EQ(lookup.stats->mean, 9000.0);
  EXPECT_EQ(*cache.cachedAt(MetricKind::Steps), at(2, 9));
}

TEST(BaselineCacheTest, InvalidateForcesRecompute) {
  BaselineCache cache;
  cache.update(MetricKind::Steps, constantSeries(at(0, 8), 20, 9000.0), at(0, 9));
  cache.invalidate(MetricKind::Steps);
  EXPECT_FALSE(cache.cachedAt(MetricKind::Steps).has_value());
  BaselineLookup lookup =
      cache.update(MetricKind::Steps, constantSeries(at(0, 8), 20, 5000.0), at(0, 10));
  EXPECT_DOUBLE_EQ(lookup.stats->mean, 5000.0);
}

TEST(BaselineCacheTest, ClearDropsEverything) {
  BaselineCache cache;
  cache.update(MetricKind::Hrv, constantSeries(at(0, 8), 20, 60.0), at(0, 9));
  cache.update(MetricKind::Steps, constantSeries(at(0, 8), 20, 9000.0), at(0, 9));
  cache.clear();
  EXPECT_FALSE(cache.personal(MetricKind::Hrv).has_value());
  EXPECT_FALSE(cache.personal(MetricKind::Steps).has_value());
}

TEST(BaselineCacheTest, RecentAverageOfLastSevenPoints) {
  BaselineCache cache;
  std::vector<double> values(13, 40.0);
  values.insert(values.end(), 7, 54.0);
  cache.update(MetricKind::Hrv, dailySeries(at(0, 8), values), at(0, 9));
  ASSERT_TRUE(cache.recentAverage(MetricKind::Hrv).has_value());
  EXPECT_DOUBLE_EQ(*cache.recentAverage(MetricKind::Hrv), 54.0);
  EXPECT_DOUBLE_EQ(*cache.lookup(MetricKind::Hrv).recent_average, 54.0);
}

TEST(BaselineCacheTest, RecentAverageWithoutEnoughHistory) {
  BaselineCache cache;
  cache.update(MetricKind::RestingHeartRate, dailySeries(at(0, 8), {50.0, 60.0}), at(0, 9));
  BaselineLookup lookup = cache.lookup(MetricKind::RestingHeartRate);
  EXPECT_FALSE(lookup.from_history);
  EXPECT_DOUBLE_EQ(*lookup.recent_average, 55.0);
  EXPECT_FALSE(cache.recentAverage(MetricKind::Steps).has_value());
}

}  // namespace
}  // namespace vitals
