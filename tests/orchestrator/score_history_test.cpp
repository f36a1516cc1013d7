// Tests for orchestrator/score_history.h.

#include "orchestrator/score_history.h"

#include <gtest/gtest.h>

#include <utility>
#include <vector>

namespace vitals {
namespace {

DailyScoreSnapshot snapshotWithRecovery(DayIndex day, ScoreState recovery) {
  DailyScoreSnapshot snapshot;
  snapshot.day = day;
  snapshot.captured_at = static_cast<Timestamp>(day) * kSecondsPerDay;
  snapshot.scores[scoreIndex(ScoreCategory::Recovery)] = std::move(recovery);
  return snapshot;
}

DailyScoreSnapshot computedDay(DayIndex day, double recovery) {
  return snapshotWithRecovery(day, ScoreState::computed(recovery, ScoreStatus::Moderate));
}

TEST(ScoreHistoryTest, StartsEmpty) {
  ScoreHistory history;
  EXPECT_EQ(history.size(), 0u);
  EXPECT_EQ(history.maxDays(), 30u);
  EXPECT_FALSE(history.latest().has_value());
  EXPECT_TRUE(history.trend(ScoreCategory::Recovery, 7).empty());
}

TEST(ScoreHistoryTest, KeepsOneSnapshotPerDay) {
  ScoreHistory history;
  history.recordSnapshot(computedDay(100, 60.0));
  history.recordSnapshot(computedDay(100, 90.0));
  EXPECT_EQ(history.size(), 1u);
  EXPECT_DOUBLE_EQ(*history.latest()->score(ScoreCategory::Recovery).value(), 60.0);
}

TEST(ScoreHistoryTest, IgnoresOlderDays) {
  ScoreHistory history;
  history.recordSnapshot(computedDay(100, 60.0));
  history.recordSnapshot(computedDay(99, 70.0));
  EXPECT_EQ(history.size(), 1u);
  EXPECT_EQ(history.latest()->day, 100);
}

TEST(ScoreHistoryTest, EvictsBeyondCapacity) {
  ScoreHistory history(3);
  for (DayIndex day = 1; day <= 5; ++day) {
    history.recordSnapshot(computedDay(day, 10.0 * day));
  }
  EXPECT_EQ(history.size(), 3u);
  EXPECT_FALSE(history.snapshotFor(2).has_value());
  ASSERT_TRUE(history.snapshotFor(3).has_value());
  EXPECT_EQ(history.snapshotFor(3)->captured_at, 3 * kSecondsPerDay);
}

TEST(ScoreHistoryTest, ZeroCapacityKeepsOne) {
  ScoreHistory history(0);
  history.recordSnapshot(computedDay(1, 10.0));
  history.recordSnapshot(computedDay(2, 20.0));
  EXPECT_EQ(history.maxDays(), 1u);
  EXPECT_EQ(history.size(), 1u);
  EXPECT_EQ(history.latest()->day, 2);
}

TEST(ScoreHistoryTest, TrendIsOldestFirstAndSkipsUncomputed) {
  ScoreHistory history;
  history.recordSnapshot(computedDay(1, 50.0));
  history.recordSnapshot(snapshotWithRecovery(2, ScoreState::unavailable("No HRV data")));
  history.recordSnapshot(computedDay(3, 70.0));
  history.recordSnapshot(computedDay(4, 80.0));

  EXPECT_EQ(history.trend(ScoreCategory::Recovery, 10), (std::vector<double>{50.0, 70.0, 80.0}));
  // The window counts days held, not computed values.
  EXPECT_EQ(history.trend(ScoreCategory::Recovery, 3), (std::vector<double>{70.0, 80.0}));
  EXPECT_TRUE(history.trend(ScoreCategory::Sleep, 10).empty());
}

TEST(ScoreHistoryTest, WorksThroughSinkInterface) {
  ScoreHistory history;
  SnapshotSink& sink = history;
  sink.recordSnapshot(computedDay(7, 42.0));
  EXPECT_TRUE(history.snapshotFor(7).has_value());
}

}  // namespace
}  // namespace vitals
