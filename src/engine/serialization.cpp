/// @file serialization.cpp
/// @brief JSON encoding implementation

#include "engine/serialization.h"

#include <vector>

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>

namespace kpiwatch::engine {

json ToJson(const Alert& alert) {
    json j;
    j["id"] = alert.id;
    j["entity_id"] = alert.entity_id;
    j["metric_name"] = alert.metric_name;
    j["severity"] = SeverityToString(alert.severity);
    j["deviation_pct"] = alert.deviation_pct;
    j["current_value"] = alert.current_value;
    j["baseline_value"] = alert.baseline_value;
    j["timestamp_ms"] = ToUnixMillis(alert.timestamp);
    j["acknowledged"] = alert.acknowledged;
    return j;
}

json ToJson(const AggregatedBucket& bucket) {
    json j;
    j["entity_id"] = bucket.entity_id;
    j["metric_name"] = bucket.metric_name;
    j["tier"] = TierToString(bucket.tier);
    j["window_start_ms"] = ToUnixMillis(bucket.window_start);
    j["window_end_ms"] = ToUnixMillis(bucket.window_end);
    j["mean"] = bucket.mean;
    j["sample_count"] = bucket.sample_count;
    return j;
}

json ToJson(const TrendResult& result) {
    json j;
    j["entity_id"] = result.entity_id;
    j["slope"] = result.slope;
    j["direction"] = TrendDirectionToString(result.direction);
    j["confidence"] = result.confidence;
    j["sample_count"] = result.sample_count;
    return j;
}

json ToJson(const TrendEvent& event) {
    json j;
    j["type"] = "trend_changed";
    j["entity_id"] = event.entity_id;
    j["previous_direction"] = TrendDirectionToString(event.previous_direction);
    j["result"] = ToJson(event.result);
    j["timestamp_ms"] = ToUnixMillis(event.timestamp);
    return j;
}

json ToJson(const ScoreBreakdown& breakdown) {
    json j;
    j["entity_id"] = breakdown.entity_id;
    j["score"] = breakdown.score;
    j["metrics"] = json::array();
    for (const auto& term : breakdown.metrics) {
        j["metrics"].push_back({
            {"metric_name", term.metric_name},
            {"raw_value", term.raw_value},
            {"normalized", term.normalized},
            {"weight", term.weight},
            {"contribution", term.contribution},
        });
    }
    return j;
}

json ToJson(const ImprovementReport& report) {
    json j;
    j["entity_id"] = report.entity_id;
    j["measured_at_ms"] = ToUnixMillis(report.measured_at);
    j["overall_pct"] = report.overall_pct;
    j["metrics"] = json::array();
    for (const auto& item : report.metrics) {
        j["metrics"].push_back({
            {"metric_name", item.metric_name},
            {"baseline", item.baseline},
            {"current", item.current},
            {"improvement_pct", item.improvement_pct},
        });
    }
    return j;
}

json ToJson(const KpiTrendReport& report) {
    json j;
    j["entity_id"] = report.entity_id;
    j["analyzed_at_ms"] = ToUnixMillis(report.analyzed_at);
    j["overall"] = ToJson(report.overall);
    j["metrics"] = json::array();
    for (const auto& trend : report.metrics) {
        json item = ToJson(trend.result);
        item.erase("entity_id");
        item["metric_name"] = trend.metric_name;
        item["weight"] = trend.weight;
        j["metrics"].push_back(std::move(item));
    }
    return j;
}

json ToJson(const GlobalSnapshot& snapshot) {
    json j;
    j["taken_at_ms"] = ToUnixMillis(snapshot.taken_at);
    j["entity_count"] = snapshot.entity_count;
    j["scored_entities"] = snapshot.scored_entities;
    j["mean_score"] = snapshot.mean_score;
    j["metric_means"] = snapshot.metric_means;
    j["active_alerts"] = snapshot.active_alerts;
    return j;
}

json ToJson(const TierStatus& status) {
    json j;
    j["tier"] = TierToString(status.tier);
    j["state"] = AggregationStateToString(status.state);
    j["runs"] = status.runs;
    j["buckets_written"] = status.buckets_written;
    j["records_purged"] = status.records_purged;
    j["consecutive_failures"] = status.consecutive_failures;
    j["last_error"] = status.last_error;
    if (status.last_committed_window) {
        j["last_window_start_ms"] = ToUnixMillis(status.last_committed_window->from);
        j["last_window_end_ms"] = ToUnixMillis(status.last_committed_window->to);
    }
    if (status.pending_from) {
        j["pending_from_ms"] = ToUnixMillis(*status.pending_from);
    }
    return j;
}

json ToJson(const EngineStats& stats) {
    json j;
    j["running"] = stats.running;
    j["entities"] = stats.entities;
    j["baselines"] = stats.baselines;
    j["records"] = {
        {"realtime", stats.realtime_records},
        {"hourly", stats.hourly_records},
        {"daily", stats.daily_records},
        {"weekly", stats.weekly_records},
    };
    j["alerts_retained"] = stats.alerts_retained;
    j["active_alerts"] = stats.active_alerts;
    j["subscribers"] = stats.subscribers;
    j["samples_recorded"] = stats.samples_recorded;
    j["samples_rejected"] = stats.samples_rejected;
    j["alerts_emitted"] = stats.alerts_emitted;
    j["trend_events"] = stats.trend_events;
    j["monitoring_cycles"] = stats.monitoring_cycles;
    j["events_dropped"] = stats.events_dropped;
    j["aggregation"] = json::array();
    for (const auto& tier : stats.aggregation) {
        j["aggregation"].push_back(ToJson(tier));
    }
    j["instruments"] = stats.instruments;
    return j;
}

std::string SerializeAlert(const Alert& alert) {
    return ToJson(alert).dump();
}

absl::StatusOr<Alert> DeserializeAlert(const std::string& json_str) {
    try {
        json j = json::parse(json_str);

        Alert alert;
        alert.id = j.value("id", "");
        alert.entity_id = j.value("entity_id", "");
        alert.metric_name = j.value("metric_name", "");

        auto severity = StringToSeverity(j.value("severity", "info"));
        if (!severity.ok()) {
            return severity.status();
        }
        alert.severity = *severity;

        alert.deviation_pct = j.value("deviation_pct", 0.0);
        alert.current_value = j.value("current_value", 0.0);
        alert.baseline_value = j.value("baseline_value", 0.0);
        alert.timestamp = FromUnixMillis(j.value("timestamp_ms", int64_t{0}));
        alert.acknowledged = j.value("acknowledged", false);
        return alert;
    } catch (const json::exception& e) {
        return absl::InvalidArgumentError(
            absl::StrCat("Failed to parse alert JSON: ", e.what()));
    }
}

absl::StatusOr<MetricSample> ParseSampleLine(std::string_view line, Timestamp default_ts) {
    std::vector<absl::string_view> fields = absl::StrSplit(
        absl::string_view(line.data(), line.size()), absl::ByAnyChar(" \t"), absl::SkipEmpty());
    if (fields.size() < 3 || fields.size() > 4) {
        return absl::InvalidArgumentError(
            absl::StrCat("Expected '<entity> <metric> <value> [timestamp_ms]', got '",
                         absl::string_view(line.data(), line.size()), "'"));
    }

    MetricSample sample;
    sample.entity_id = std::string(fields[0]);
    sample.metric_name = std::string(fields[1]);
    if (!absl::SimpleAtod(fields[2], &sample.value)) {
        return absl::InvalidArgumentError(absl::StrCat("Invalid value: ", fields[2]));
    }

    sample.timestamp = default_ts;
    if (fields.size() == 4) {
        int64_t millis = 0;
        if (!absl::SimpleAtoi(fields[3], &millis)) {
            return absl::InvalidArgumentError(absl::StrCat("Invalid timestamp: ", fields[3]));
        }
        sample.timestamp = FromUnixMillis(millis);
    }
    return sample;
}

}  // namespace kpiwatch::engine
