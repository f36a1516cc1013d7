// Tests for sleep/daily_aggregator.h -- per-day sleep summary.

#include "sleep/daily_aggregator.h"

#include <gtest/gtest.h>

#include <vector>

#include "test_helpers.h"

namespace vitals {
namespace {

using test_helpers::at;
using test_helpers::kMidnight;

SleepSession makeSession(Timestamp start, Timestamp end, double efficiency, int wake_events) {
  SleepSession session;
  session.start = start;
  session.end = end;
  session.duration = static_cast<Duration>(end - start);
  session.efficiency = efficiency;
  session.wake_events = wake_events;
  return session;
}

const DayIndex kDay0 = dayIndexOf(kMidnight, 0);

TEST(DailyAggregatorTest, NoSessionsHasNoData) {
  DailySleepSummary summary = buildDailySummary(kDay0, {}, 0);
  EXPECT_EQ(summary.date, kDay0);
  EXPECT_FALSE(summary.hasData());
  EXPECT_FALSE(summary.primary_session.has_value());
  EXPECT_DOUBLE_EQ(summary.average_efficiency, 0.0);
  EXPECT_FALSE(summary.bedtime.has_value());
  EXPECT_FALSE(summary.wake_time.has_value());
}

TEST(DailyAggregatorTest, SumsAndAveragesOverlappingSessions) {
  std::vector<SleepSession> sessions = {
      makeSession(at(-1, 23), at(0, 7), 0.9, 2),  // crosses into day 0
      makeSession(at(0, 14), at(0, 16), 0.7, 1),
      makeSession(at(2, 23), at(3, 6), 0.95, 0),  // another day
  };
  DailySleepSummary summary = buildDailySummary(kDay0, sessions, 0);
  ASSERT_TRUE(summary.hasData());
  EXPECT_DOUBLE_EQ(summary.durationHours(), 10.0);
  EXPECT_EQ(summary.total_wake_events, 3);
  EXPECT_DOUBLE_EQ(summary.average_efficiency, 0.8);
  EXPECT_EQ(summary.primary_session->start, at(-1, 23));
  EXPECT_EQ(*summary.bedtime, at(-1, 23));
  EXPECT_EQ(*summary.wake_time, at(0, 7));
}

TEST(DailyAggregatorTest, NightCountsTowardBothDays) {
  std::vector<SleepSession> sessions = {makeSession(at(-1, 23), at(0, 7), 0.9, 0)};
  EXPECT_TRUE(buildDailySummary(kDay0 - 1, sessions, 0).hasData());
  EXPECT_TRUE(buildDailySummary(kDay0, sessions, 0).hasData());
  EXPECT_FALSE(buildDailySummary(kDay0 + 1, sessions, 0).hasData());
}

TEST(DailyAggregatorTest, SessionEndingAtMidnightDoesNotOverlapNextDay) {
  std::vector<SleepSession> sessions = {makeSession(at(-1, 20), at(0, 0), 0.9, 0)};
  EXPECT_FALSE(buildDailySummary(kDay0, sessions, 0).hasData());
}

TEST(DailyAggregatorTest, TieKeepsFirstSession) {
  std::vector<SleepSession> sessions = {
      makeSession(at(0, 1), at(0, 4), 0.8, 0),
      makeSession(at(0, 13), at(0, 16), 0.9, 0),
  };
  DailySleepSummary summary = buildDailySummary(kDay0, sessions, 0);
  ASSERT_TRUE(summary.primary_session.has_value());
  EXPECT_EQ(summary.primary_session->start, at(0, 1));
}

TEST(DailyAggregatorTest, UtcOffsetShiftsDayBoundaries) {
  // 22:00-23:30 UTC on day 0 is 00:00-01:30 on day 1 at UTC+2.
  std::vector<SleepSession> sessions = {makeSession(at(0, 22), at(0, 23, 30), 0.9, 0)};
  EXPECT_FALSE(buildDailySummary(kDay0, sessions, 7200).hasData());
  EXPECT_TRUE(buildDailySummary(kDay0 + 1, sessions, 7200).hasData());
}

}  // namespace
}  // namespace vitals
