// Score orchestration.

#include "orchestrator/score_orchestrator.h"

#include <cctype>
#include <cstdio>
#include <string>

#include "scoring/score_engine.h"

namespace vitals {

namespace {

/// Recovery runs last so a snapshot it takes sees the others' fresh states.
constexpr std::array<ScoreCategory, kScoreCategoryCount> kEvaluationOrder = {
    ScoreCategory::Sleep, ScoreCategory::Strain, ScoreCategory::Stress,
    ScoreCategory::Recovery};

std::string missingReason(MetricKind metric) {
  return std::string("No ") + metricDisplayName(metric) + " data";
}

std::string staleReason(MetricKind metric) {
  std::string reason = std::string(metricDisplayName(metric)) + " data is stale";
  reason[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(reason[0])));
  return reason;
}

}  // namespace

std::vector<MetricKind> ScoreOrchestrator::readySet(ScoreCategory category) {
  switch (category) {
    case ScoreCategory::Recovery:
      return {MetricKind::Hrv, MetricKind::RestingHeartRate};
    case ScoreCategory::Sleep:
      return {MetricKind::SleepDuration};
    case ScoreCategory::Strain:
      return {MetricKind::Steps, MetricKind::ActiveEnergy};
    case ScoreCategory::Stress:
      return {MetricKind::Hrv};
  }
  return {};
}

std::vector<MetricKind> ScoreOrchestrator::triggerSet(ScoreCategory category) {
  // Sleep is additionally triggered by publishSleep().
  return readySet(category);
}

ScoreOrchestrator::ScoreOrchestrator(MetricValidityTracker& tracker,
                                     const BaselineCache& baselines, TaskScheduler& scheduler,
                                     const Clock& clock, SnapshotSink* sink,
                                     const OrchestratorConfig& config)
    : tracker_(tracker), baselines_(baselines), clock_(clock), sink_(sink), config_(config) {
  for (ScoreCategory category : kAllScoreCategories) {
    debouncers_[scoreIndex(category)] = std::make_unique<Debouncer>(
        scheduler, config_.debounce_ms, [this, category]() { evaluate(category); });
  }

  for (ScoreCategory category : kAllScoreCategories) {
    for (MetricKind metric : triggerSet(category)) {
      Debouncer* debouncer = debouncers_[scoreIndex(category)].get();
      SubscriptionId id = tracker_.channel(metric).subscribe(
          [debouncer](const MetricState&) { debouncer->trigger(); });
      subscriptions_.emplace_back(metric, id);
    }
  }
}

ScoreOrchestrator::~ScoreOrchestrator() {
  for (const auto& [metric, id] : subscriptions_) {
    tracker_.channel(metric).unsubscribe(id);
  }
  for (auto& debouncer : debouncers_) debouncer->cancel();
}

void ScoreOrchestrator::publishSleep(std::vector<SleepSession> sessions,
                                     const DailySleepSummary& summary) {
  sessions_ = std::move(sessions);
  summary_ = summary;
  debouncers_[scoreIndex(ScoreCategory::Sleep)]->trigger();
}

void ScoreOrchestrator::flush() {
  for (ScoreCategory category : kEvaluationOrder) {
    debouncers_[scoreIndex(category)]->flush();
  }
}

void ScoreOrchestrator::recomputeAll() {
  for (ScoreCategory category : kEvaluationOrder) {
    debouncers_[scoreIndex(category)]->cancel();
    evaluate(category);
  }
}

const ScoreState& ScoreOrchestrator::scoreState(ScoreCategory category) const {
  return states_[scoreIndex(category)].get();
}

Observable<ScoreState>& ScoreOrchestrator::scoreChannel(ScoreCategory category) {
  return states_[scoreIndex(category)];
}

std::optional<ScoreState> ScoreOrchestrator::gate(ScoreCategory category) const {
  for (MetricKind metric : readySet(category)) {
    const MetricState& state = tracker_.state(metric);
    if (state.isMissing()) return ScoreState::unavailable(missingReason(metric));
    if (state.isStale()) return ScoreState::unavailable(staleReason(metric));
  }
  return std::nullopt;
}

DailyMetrics ScoreOrchestrator::collectMetrics() const {
  DailyMetrics metrics;
  metrics.hrv = tracker_.state(MetricKind::Hrv).value();
  metrics.resting_heart_rate = tracker_.state(MetricKind::RestingHeartRate).value();
  metrics.steps = tracker_.state(MetricKind::Steps).value();
  metrics.active_energy = tracker_.state(MetricKind::ActiveEnergy).value();
  metrics.sleep_duration_hours = tracker_.state(MetricKind::SleepDuration).value();
  metrics.applySleepSummary(summary_);
  return metrics;
}

void ScoreOrchestrator::evaluate(ScoreCategory category) {
  const size_t idx = scoreIndex(category);
  ++evaluation_counts_[idx];

  std::optional<ScoreState> blocked = gate(category);
  ScoreState next = blocked.has_value()
                        ? *blocked
                        : ScoreState::fromResult(computeScore(category, collectMetrics(),
                                                              baselines_.personalBaselines()));

  if (config_.verbose) {
    if (next.isComputed()) {
      std::fprintf(stderr, "[ScoreOrchestrator] %s: %.1f (%s)\n",
                   scoreCategoryToString(category), *next.value(),
                   scoreStatusToString(next.status()));
    } else {
      std::fprintf(stderr, "[ScoreOrchestrator] %s: unavailable (%s)\n",
                   scoreCategoryToString(category), next.reason().c_str());
    }
  }
  states_[idx].set(next);

  if (category == ScoreCategory::Recovery && next.isComputed()) maybeSnapshot();
}

void ScoreOrchestrator::maybeSnapshot() {
  const Timestamp now = clock_.now();
  const DayIndex today = dayIndexOf(now, config_.utc_offset_seconds);
  if (last_snapshot_day_.has_value() && *last_snapshot_day_ == today) return;

  last_snapshot_day_ = today;
  DailyScoreSnapshot snapshot;
  snapshot.day = today;
  snapshot.captured_at = now;
  for (ScoreCategory category : kAllScoreCategories) {
    snapshot.scores[scoreIndex(category)] = scoreState(category);
  }
  if (config_.verbose) {
    std::fprintf(stderr, "[ScoreOrchestrator] snapshot for day %lld\n",
                 static_cast<long long>(today));
  }
  if (sink_ != nullptr) sink_->recordSnapshot(snapshot);
}

}  // namespace vitals
