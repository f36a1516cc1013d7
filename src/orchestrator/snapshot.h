// Daily score snapshot and the sink that receives it.

#ifndef VITALS_ORCHESTRATOR_SNAPSHOT_H
#define VITALS_ORCHESTRATOR_SNAPSHOT_H

#include <array>

#include "core/time_types.h"
#include "scoring/score_types.h"

namespace vitals {

/// All four score states captured once per calendar day.
struct DailyScoreSnapshot {
  DayIndex day = 0;
  Timestamp captured_at = 0;
  std::array<ScoreState, kScoreCategoryCount> scores{};

  const ScoreState& score(ScoreCategory category) const { return scores[scoreIndex(category)]; }
};

/// @brief Receives daily snapshots from the orchestrator.
class SnapshotSink {
 public:
  virtual ~SnapshotSink() = default;

  virtual void recordSnapshot(const DailyScoreSnapshot& snapshot) = 0;
};

}  // namespace vitals

#endif  // VITALS_ORCHESTRATOR_SNAPSHOT_H
