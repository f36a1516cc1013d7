// Tests for core/event_loop.h -- ManualEventLoop scheduling.

#include "core/event_loop.h"

#include <gtest/gtest.h>

#include <vector>

namespace vitals {
namespace {

TEST(ManualEventLoopTest, StartsAtGivenTime) {
  ManualEventLoop loop(1000);
  EXPECT_EQ(loop.now(), 1000);
  EXPECT_EQ(loop.nowMs(), 1000000);
  EXPECT_EQ(loop.pendingCount(), 0u);
}

TEST(ManualEventLoopTest, TaskRunsOnlyWhenDue) {
  ManualEventLoop loop;
  int runs = 0;
  loop.scheduleAfter(1000, [&runs]() { ++runs; });

  EXPECT_EQ(loop.advanceMs(999), 0u);
  EXPECT_EQ(runs, 0);
  EXPECT_EQ(loop.advanceMs(1), 1u);
  EXPECT_EQ(runs, 1);
  EXPECT_EQ(loop.pendingCount(), 0u);
}

TEST(ManualEventLoopTest, TasksRunInDeadlineThenIssueOrder) {
  ManualEventLoop loop;
  std::vector<int> order;
  loop.scheduleAfter(500, [&order]() { order.push_back(2); });
  loop.scheduleAfter(100, [&order]() { order.push_back(1); });
  loop.scheduleAfter(500, [&order]() { order.push_back(3); });

  EXPECT_EQ(loop.advanceSeconds(1), 3u);
  EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(ManualEventLoopTest, CancelledTaskNeverRuns) {
  ManualEventLoop loop;
  int runs = 0;
  TaskId id = loop.scheduleAfter(100, [&runs]() { ++runs; });
  loop.cancel(id);
  loop.cancel(id);  // Second cancel is a no-op.
  loop.cancel(9999);

  EXPECT_EQ(loop.advanceSeconds(1), 0u);
  EXPECT_EQ(runs, 0);
}

TEST(ManualEventLoopTest, TaskSeesItsDeadlineAsNow) {
  ManualEventLoop loop;
  int64_t seen_ms = -1;
  loop.scheduleAfter(250, [&]() { seen_ms = loop.nowMs(); });
  loop.advanceSeconds(2);
  EXPECT_EQ(seen_ms, 250);
  EXPECT_EQ(loop.nowMs(), 2000);
}

TEST(ManualEventLoopTest, TaskScheduledByTaskRunsInSameAdvance) {
  ManualEventLoop loop;
  int runs = 0;
  loop.scheduleAfter(100, [&]() {
    ++runs;
    loop.scheduleAfter(100, [&runs]() { ++runs; });
  });
  EXPECT_EQ(loop.advanceMs(300), 2u);
  EXPECT_EQ(runs, 2);
}

TEST(ManualEventLoopTest, NegativeDelayRunsOnNextAdvance) {
  ManualEventLoop loop;
  int runs = 0;
  loop.scheduleAfter(-50, [&runs]() { ++runs; });
  EXPECT_EQ(loop.advanceMs(0), 1u);
  EXPECT_EQ(runs, 1);
}

TEST(ManualEventLoopTest, SetNowForwardRunsTasks) {
  ManualEventLoop loop(100);
  int runs = 0;
  loop.scheduleAfter(5000, [&runs]() { ++runs; });
  EXPECT_EQ(loop.setNow(110), 1u);
  EXPECT_EQ(loop.now(), 110);
  EXPECT_EQ(runs, 1);
}

TEST(ManualEventLoopTest, SetNowBackwardOnlyRewinds) {
  ManualEventLoop loop(100);
  int runs = 0;
  loop.scheduleAfter(1000, [&runs]() { ++runs; });
  EXPECT_EQ(loop.setNow(50), 0u);
  EXPECT_EQ(loop.now(), 50);
  EXPECT_EQ(runs, 0);
  EXPECT_EQ(loop.pendingCount(), 1u);
}

TEST(SystemClockTest, ReportsPlausibleTime) {
  SystemClock clock;
  // After 2020-01-01.
  EXPECT_GT(clock.now(), 1577836800);
}

}  // namespace
}  // namespace vitals
