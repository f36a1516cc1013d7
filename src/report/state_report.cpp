// State report capture and JSON serialization.

#include "report/state_report.h"

#include "core/json_helpers.h"

namespace vitals {

namespace {

void writeSession(JsonWriter& writer, const SleepSession& session) {
  writer.beginObject();
  writer.field("start", session.start);
  writer.field("end", session.end);
  writer.field("duration_hours", session.durationHours());
  writer.field("efficiency", session.efficiency);
  writer.field("source", sourceQualityToString(session.source));
  writer.field("wake_events", session.wake_events);

  writer.key("stages_minutes");
  writer.beginObject();
  writer.field("core", toMinutes(session.stages.core));
  writer.field("deep", toMinutes(session.stages.deep));
  writer.field("rem", toMinutes(session.stages.rem));
  writer.field("awake", toMinutes(session.stages.awake));
  writer.endObject();

  writer.key("metrics");
  writer.beginObject();
  writer.field("waso_minutes", toMinutes(session.metrics.waso));
  writer.field("fragmentation_index", session.metrics.fragmentation_index);
  writer.field("sleep_latency_minutes", toMinutes(session.metrics.sleep_latency));
  writer.field("consistency", session.metrics.consistency);
  writer.endObject();

  writer.endObject();
}

void writeMetricState(JsonWriter& writer, MetricKind kind, const MetricState& state) {
  writer.beginObject();
  writer.field("metric", metricKindToString(kind));
  writer.field("validity", metricValidityToString(state.validity()));
  writer.optionalField("value", state.value());
  writer.optionalField("last_seen", state.lastSeen());
  writer.endObject();
}

void writeScoreState(JsonWriter& writer, ScoreCategory category, const ScoreState& state) {
  writer.beginObject();
  writer.field("category", scoreCategoryToString(category));
  writer.field("phase", scorePhaseToString(state.phase()));
  writer.optionalField("value", state.value());
  if (state.isComputed()) writer.field("status", scoreStatusToString(state.status()));
  if (state.isUnavailable()) writer.field("reason", state.reason());
  writer.endObject();
}

}  // namespace

HealthState captureHealthState(const MetricValidityTracker& tracker,
                               const ScoreOrchestrator& orchestrator,
                               const BaselineCache& baselines, Timestamp captured_at) {
  HealthState state;
  state.captured_at = captured_at;
  for (MetricKind kind : kAllMetricKinds) {
    state.metrics[metricIndex(kind)] = tracker.state(kind);
    state.baselines[metricIndex(kind)] = baselines.lookup(kind);
  }
  for (ScoreCategory category : kAllScoreCategories) {
    state.scores[scoreIndex(category)] = orchestrator.scoreState(category);
  }
  state.sessions = orchestrator.sessions();
  state.daily_summary = orchestrator.dailySummary();
  state.last_snapshot_day = orchestrator.lastSnapshotDay();
  return state;
}

std::string healthStateToJson(const HealthState& state, bool pretty) {
  JsonWriter writer;
  writer.beginObject();
  writer.field("captured_at", state.captured_at);

  writer.key("metrics");
  writer.beginArray();
  for (MetricKind kind : kAllMetricKinds) {
    writeMetricState(writer, kind, state.metrics[metricIndex(kind)]);
  }
  writer.endArray();

  writer.key("scores");
  writer.beginArray();
  for (ScoreCategory category : kAllScoreCategories) {
    writeScoreState(writer, category, state.scores[scoreIndex(category)]);
  }
  writer.endArray();

  writer.key("baselines");
  writer.beginArray();
  for (MetricKind kind : kAllMetricKinds) {
    const BaselineLookup& lookup = state.baselines[metricIndex(kind)];
    if (!lookup.stats.has_value() && !lookup.recent_average.has_value()) continue;
    writer.beginObject();
    writer.field("metric", metricKindToString(kind));
    if (lookup.stats.has_value()) {
      writer.field("mean", lookup.stats->mean);
      writer.field("std_dev", lookup.stats->std_dev);
      writer.field("count", static_cast<int64_t>(lookup.stats->count));
    }
    writer.field("from_history", lookup.from_history);
    writer.optionalField("recent_average", lookup.recent_average);
    writer.endObject();
  }
  writer.endArray();

  writer.key("sessions");
  writer.beginArray();
  for (const auto& session : state.sessions) writeSession(writer, session);
  writer.endArray();

  const DailySleepSummary& summary = state.daily_summary;
  writer.key("daily_summary");
  writer.beginObject();
  writer.field("date", summary.date);
  writer.field("has_data", summary.hasData());
  writer.field("total_hours", summary.durationHours());
  writer.field("average_efficiency", summary.average_efficiency);
  writer.field("total_wake_events", summary.total_wake_events);
  writer.optionalField("bedtime", summary.bedtime);
  writer.optionalField("wake_time", summary.wake_time);
  writer.endObject();

  writer.optionalField("last_snapshot_day", state.last_snapshot_day);
  writer.endObject();

  return pretty ? writer.toPrettyString() : writer.toString();
}

}  // namespace vitals
