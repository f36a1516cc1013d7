// Score type names and state factories.

#include "scoring/score_types.h"

#include <utility>

namespace vitals {

const char* scoreCategoryToString(ScoreCategory category) {
  switch (category) {
    case ScoreCategory::Recovery: return "recovery";
    case ScoreCategory::Sleep:    return "sleep";
    case ScoreCategory::Strain:   return "strain";
    case ScoreCategory::Stress:   return "stress";
  }
  return "unknown";
}

const char* scoreStatusToString(ScoreStatus status) {
  switch (status) {
    case ScoreStatus::Optimal:     return "optimal";
    case ScoreStatus::Moderate:    return "moderate";
    case ScoreStatus::Poor:        return "poor";
    case ScoreStatus::Unavailable: return "unavailable";
  }
  return "unknown";
}

const char* scorePhaseToString(ScorePhase phase) {
  switch (phase) {
    case ScorePhase::Pending:     return "pending";
    case ScorePhase::Unavailable: return "unavailable";
    case ScorePhase::Computed:    return "computed";
  }
  return "unknown";
}

ScoreState ScoreState::unavailable(std::string reason) {
  ScoreState state;
  state.phase_ = ScorePhase::Unavailable;
  state.reason_ = std::move(reason);
  return state;
}

ScoreState ScoreState::computed(double value, ScoreStatus status) {
  ScoreState state;
  state.phase_ = ScorePhase::Computed;
  state.value_ = value;
  state.status_ = status;
  return state;
}

ScoreState ScoreState::fromResult(const ScoreResult& result) {
  if (!result.isAvailable()) return unavailable(result.unavailable_reason);
  return computed(result.value, result.status);
}

std::optional<double> ScoreState::value() const {
  if (phase_ != ScorePhase::Computed) return std::nullopt;
  return value_;
}

}  // namespace vitals
