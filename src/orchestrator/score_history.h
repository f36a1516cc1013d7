// Bounded per-day score history; the default snapshot sink.

#ifndef VITALS_ORCHESTRATOR_SCORE_HISTORY_H
#define VITALS_ORCHESTRATOR_SCORE_HISTORY_H

#include <cstddef>
#include <deque>
#include <optional>
#include <vector>

#include "orchestrator/snapshot.h"

namespace vitals {

/// @brief Keeps at most one snapshot per day for the last max_days days.
///
/// Snapshots are expected in chronological order. A second snapshot for a
/// day already held, or one older than the newest, is ignored.
class ScoreHistory : public SnapshotSink {
 public:
  explicit ScoreHistory(size_t max_days = 30);

  void recordSnapshot(const DailyScoreSnapshot& snapshot) override;

  /// @brief Computed values of the last `days` snapshots, oldest first.
  ///
  /// Days on which the category was not Computed are skipped.
  std::vector<double> trend(ScoreCategory category, size_t days) const;

  /// @brief Snapshot for a given day, if held.
  std::optional<DailyScoreSnapshot> snapshotFor(DayIndex day) const;

  std::optional<DailyScoreSnapshot> latest() const;

  size_t size() const { return snapshots_.size(); }
  size_t maxDays() const { return max_days_; }

 private:
  size_t max_days_;
  std::deque<DailyScoreSnapshot> snapshots_;
};

}  // namespace vitals

#endif  // VITALS_ORCHESTRATOR_SCORE_HISTORY_H
