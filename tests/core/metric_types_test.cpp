// Tests for core/metric_types.h.

#include "core/metric_types.h"

#include <gtest/gtest.h>

#include <set>
#include <string>

namespace vitals {
namespace {

TEST(MetricTypesTest, IndexFollowsDeclarationOrder) {
  for (size_t idx = 0; idx < kAllMetricKinds.size(); ++idx) {
    EXPECT_EQ(metricIndex(kAllMetricKinds[idx]), idx);
  }
}

TEST(MetricTypesTest, IdentifiersAreUnique) {
  std::set<std::string> seen;
  for (MetricKind kind : kAllMetricKinds) {
    EXPECT_TRUE(seen.insert(metricKindToString(kind)).second) << metricKindToString(kind);
  }
  EXPECT_STREQ(metricKindToString(MetricKind::RestingHeartRate), "resting_heart_rate");
  EXPECT_STREQ(metricKindToString(MetricKind::BodyWeight), "body_weight");
}

TEST(MetricTypesTest, DisplayNames) {
  EXPECT_STREQ(metricDisplayName(MetricKind::Hrv), "HRV");
  EXPECT_STREQ(metricDisplayName(MetricKind::ActiveEnergy), "active energy");
  EXPECT_STREQ(metricDisplayName(MetricKind::SleepDuration), "sleep");
}

}  // namespace
}  // namespace vitals
