// Score history.

#include "orchestrator/score_history.h"

namespace vitals {

ScoreHistory::ScoreHistory(size_t max_days) : max_days_(max_days == 0 ? 1 : max_days) {}

void ScoreHistory::recordSnapshot(const DailyScoreSnapshot& snapshot) {
  if (!snapshots_.empty() && snapshot.day <= snapshots_.back().day) return;
  snapshots_.push_back(snapshot);
  while (snapshots_.size() > max_days_) snapshots_.pop_front();
}

std::vector<double> ScoreHistory::trend(ScoreCategory category, size_t days) const {
  std::vector<double> values;
  const size_t first = snapshots_.size() > days ? snapshots_.size() - days : 0;
  for (size_t idx = first; idx < snapshots_.size(); ++idx) {
    std::optional<double> value = snapshots_[idx].score(category).value();
    if (value.has_value()) values.push_back(*value);
  }
  return values;
}

std::optional<DailyScoreSnapshot> ScoreHistory::snapshotFor(DayIndex day) const {
  for (const auto& snapshot : snapshots_) {
    if (snapshot.day == day) return snapshot;
  }
  return std::nullopt;
}

std::optional<DailyScoreSnapshot> ScoreHistory::latest() const {
  if (snapshots_.empty()) return std::nullopt;
  return snapshots_.back();
}

}  // namespace vitals
