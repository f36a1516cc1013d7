// Sleep category classification and names.

#include "sleep/sleep_types.h"

namespace vitals {

bool isSleepCategory(SleepCategory category) {
  switch (category) {
    case SleepCategory::InBed:
    case SleepCategory::AsleepUnspecified:
    case SleepCategory::Awake:
    case SleepCategory::AsleepCore:
    case SleepCategory::AsleepDeep:
    case SleepCategory::AsleepREM:
      return true;
  }
  return false;
}

bool isAsleepCategory(SleepCategory category) {
  return category == SleepCategory::AsleepUnspecified || isStagedCategory(category);
}

bool isStagedCategory(SleepCategory category) {
  return category == SleepCategory::AsleepCore || category == SleepCategory::AsleepDeep ||
         category == SleepCategory::AsleepREM;
}

const char* sleepCategoryToString(SleepCategory category) {
  switch (category) {
    case SleepCategory::InBed:             return "in_bed";
    case SleepCategory::AsleepUnspecified: return "asleep_unspecified";
    case SleepCategory::Awake:             return "awake";
    case SleepCategory::AsleepCore:        return "asleep_core";
    case SleepCategory::AsleepDeep:        return "asleep_deep";
    case SleepCategory::AsleepREM:         return "asleep_rem";
  }
  return "unknown";
}

const char* sourceQualityToString(SourceQuality source) {
  switch (source) {
    case SourceQuality::Detailed: return "detailed";
    case SourceQuality::Basic:    return "basic";
  }
  return "unknown";
}

}  // namespace vitals
