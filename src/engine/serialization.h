#pragma once

/// @file serialization.h
/// @brief JSON encoding of engine records and the sample line format

#include <string>
#include <string_view>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "engine/metrics_engine.h"
#include "engine/types.h"

namespace kpiwatch::engine {

using json = nlohmann::json;

json ToJson(const Alert& alert);
json ToJson(const AggregatedBucket& bucket);
json ToJson(const TrendResult& result);
json ToJson(const TrendEvent& event);
json ToJson(const ScoreBreakdown& breakdown);
json ToJson(const ImprovementReport& report);
json ToJson(const KpiTrendReport& report);
json ToJson(const GlobalSnapshot& snapshot);
json ToJson(const TierStatus& status);
json ToJson(const EngineStats& stats);

std::string SerializeAlert(const Alert& alert);
absl::StatusOr<Alert> DeserializeAlert(const std::string& json_str);

/// @brief Parse "<entity> <metric> <value> [timestamp_ms]"
///
/// Fields are separated by whitespace. Without a timestamp the sample is
/// stamped with `default_ts`.
absl::StatusOr<MetricSample> ParseSampleLine(std::string_view line, Timestamp default_ts);

}  // namespace kpiwatch::engine
