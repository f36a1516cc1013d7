// Score categories, results and published score states.

#ifndef VITALS_SCORING_SCORE_TYPES_H
#define VITALS_SCORING_SCORE_TYPES_H

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace vitals {

enum class ScoreCategory : uint8_t { Recovery, Sleep, Strain, Stress };

constexpr size_t kScoreCategoryCount = 4;

constexpr std::array<ScoreCategory, kScoreCategoryCount> kAllScoreCategories = {
    ScoreCategory::Recovery, ScoreCategory::Sleep, ScoreCategory::Strain,
    ScoreCategory::Stress};

inline constexpr size_t scoreIndex(ScoreCategory category) {
  return static_cast<size_t>(category);
}

const char* scoreCategoryToString(ScoreCategory category);

/// Qualitative reading of a score value.
enum class ScoreStatus : uint8_t { Optimal, Moderate, Poor, Unavailable };

const char* scoreStatusToString(ScoreStatus status);

/// Output of a score function.
struct ScoreResult {
  double value = 0.0;  ///< 0-100; meaningless when unavailable.
  ScoreStatus status = ScoreStatus::Unavailable;
  std::string unavailable_reason;

  bool isAvailable() const { return status != ScoreStatus::Unavailable; }

  static ScoreResult computed(double value, ScoreStatus status) {
    ScoreResult result;
    result.value = value;
    result.status = status;
    return result;
  }

  static ScoreResult unavailable(std::string reason) {
    ScoreResult result;
    result.unavailable_reason = std::move(reason);
    return result;
  }
};

/// Lifecycle of a published score.
enum class ScorePhase : uint8_t { Pending, Unavailable, Computed };

const char* scorePhaseToString(ScorePhase phase);

/// @brief Published state of one score category.
///
/// Pending until the first evaluation, then Unavailable(reason) or
/// Computed(value, status) on every re-evaluation.
class ScoreState {
 public:
  ScoreState() = default;

  static ScoreState pending() { return ScoreState(); }
  static ScoreState unavailable(std::string reason);
  static ScoreState computed(double value, ScoreStatus status);
  static ScoreState fromResult(const ScoreResult& result);

  ScorePhase phase() const { return phase_; }
  bool isPending() const { return phase_ == ScorePhase::Pending; }
  bool isComputed() const { return phase_ == ScorePhase::Computed; }
  bool isUnavailable() const { return phase_ == ScorePhase::Unavailable; }

  /// @brief Score value; present only when Computed.
  std::optional<double> value() const;

  /// @brief Status; Unavailable unless Computed.
  ScoreStatus status() const { return status_; }

  /// @brief Reason text; empty unless Unavailable.
  const std::string& reason() const { return reason_; }

  bool operator==(const ScoreState& other) const {
    return phase_ == other.phase_ && value_ == other.value_ && status_ == other.status_ &&
           reason_ == other.reason_;
  }
  bool operator!=(const ScoreState& other) const { return !(*this == other); }

 private:
  ScorePhase phase_ = ScorePhase::Pending;
  double value_ = 0.0;
  ScoreStatus status_ = ScoreStatus::Unavailable;
  std::string reason_;
};

}  // namespace vitals

#endif  // VITALS_SCORING_SCORE_TYPES_H
