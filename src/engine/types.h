#pragma once

/// @file types.h
/// @brief Core data model of the metrics engine

#include <array>
#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>

#include <absl/status/statusor.h>

namespace kpiwatch::engine {

/// Wall-clock instant; all windows and horizons are measured in UTC
using Timestamp = std::chrono::system_clock::time_point;

/// @brief Kind of monitored entity
enum class EntityKind {
    kTeam,
    kWorkflow
};

/// @brief Retention/resolution level of the time-series store
enum class Tier {
    kRealtime,  ///< Raw samples
    kHourly,
    kDaily,
    kWeekly
};

inline constexpr std::array<Tier, 4> kAllTiers = {
    Tier::kRealtime, Tier::kHourly, Tier::kDaily, Tier::kWeekly
};

/// @brief Alert severity levels
enum class Severity {
    kInfo,
    kWarning,
    kCritical
};

/// @brief Direction of a score trend
enum class TrendDirection {
    kImproving,
    kDeclining,
    kStable
};

/// @brief Which way a metric moves when performance improves
enum class MetricPolarity {
    kHigherIsBetter,  ///< efficiency, quality, satisfaction
    kLowerIsBetter    ///< response time, error rate
};

/// @brief A single measurement; immutable once recorded
struct MetricSample {
    std::string entity_id;
    std::string metric_name;
    double value = 0.0;
    Timestamp timestamp;
};

/// @brief A team or workflow whose metrics are tracked
struct MonitoredEntity {
    std::string id;
    EntityKind kind = EntityKind::kTeam;

    /// Composite-score weights; expected to sum to 1
    std::unordered_map<std::string, double> weights;

    /// Target values, used to normalize unbounded higher-is-better metrics
    std::unordered_map<std::string, double> targets;
};

/// @brief Reference "normal" value for one entity/metric
struct Baseline {
    std::string entity_id;
    std::string metric_name;
    double value = 0.0;
    Timestamp established_at;
};

/// @brief Half-open time interval [from, to)
struct TimeRange {
    Timestamp from;
    Timestamp to;

    bool Contains(Timestamp ts) const { return ts >= from && ts < to; }

    /// @brief Range covering every representable instant
    static TimeRange All() { return {Timestamp::min(), Timestamp::max()}; }
};

/// @brief Mean of the samples of one entity/metric over a window
///
/// Realtime queries return one bucket per raw sample with
/// window_start == window_end == sample timestamp and sample_count == 1.
struct AggregatedBucket {
    std::string entity_id;
    std::string metric_name;
    Tier tier = Tier::kHourly;
    Timestamp window_start;
    Timestamp window_end;
    double mean = 0.0;
    uint64_t sample_count = 0;
};

/// @brief Raised when a metric deviates from its baseline
struct Alert {
    std::string id;
    std::string entity_id;
    std::string metric_name;
    Severity severity = Severity::kInfo;

    /// Directional deviation from baseline, in percent (15.0 == 15%)
    double deviation_pct = 0.0;

    double current_value = 0.0;
    double baseline_value = 0.0;
    Timestamp timestamp;
    bool acknowledged = false;
};

/// @brief Composite score of an entity at one point in time
struct ScoreSnapshot {
    std::string entity_id;
    Timestamp timestamp;
    double score = 0.0;  ///< In [0, 1]
};

/// @brief Regression over the recent score window
struct TrendResult {
    std::string entity_id;
    double slope = 0.0;
    TrendDirection direction = TrendDirection::kStable;
    double confidence = 0.0;
    size_t sample_count = 0;
};

/// @brief Published when an entity's trend changes
struct TrendEvent {
    std::string entity_id;
    TrendDirection previous_direction = TrendDirection::kStable;
    TrendResult result;
    Timestamp timestamp;
};

/// @brief Deviation thresholds, checked from most to least severe
struct AlertThresholds {
    double info = 0.05;
    double warning = 0.10;
    double critical = 0.15;
};

/// @brief Per-tier retention horizons
struct RetentionPolicy {
    std::chrono::milliseconds realtime = std::chrono::hours(1);
    std::chrono::milliseconds hourly = std::chrono::hours(24);
    std::chrono::milliseconds daily = std::chrono::hours(24 * 7);
    std::chrono::milliseconds weekly = std::chrono::hours(24 * 30);

    /// How long alerts stay in the alert index
    std::chrono::milliseconds alerts = std::chrono::hours(24);

    std::chrono::milliseconds Horizon(Tier tier) const;
};

// Conversions

std::string EntityKindToString(EntityKind kind);
absl::StatusOr<EntityKind> StringToEntityKind(const std::string& str);

std::string TierToString(Tier tier);
absl::StatusOr<Tier> StringToTier(const std::string& str);

std::string SeverityToString(Severity severity);
absl::StatusOr<Severity> StringToSeverity(const std::string& str);

std::string TrendDirectionToString(TrendDirection direction);

std::string MetricPolarityToString(MetricPolarity polarity);
absl::StatusOr<MetricPolarity> StringToMetricPolarity(const std::string& str);

/// @brief Milliseconds since the Unix epoch
int64_t ToUnixMillis(Timestamp ts);

/// @brief Inverse of ToUnixMillis
Timestamp FromUnixMillis(int64_t millis);

}  // namespace kpiwatch::engine
