#pragma once

/// @file scoring_engine.h
/// @brief Weighted composite performance score

#include <string>
#include <unordered_map>
#include <vector>

#include <absl/status/statusor.h>

#include "engine/metric_catalog.h"
#include "engine/types.h"

namespace kpiwatch::engine {

/// @brief One metric's share of a composite score
struct MetricContribution {
    std::string metric_name;
    double raw_value = 0.0;
    double normalized = 0.0;    ///< In [0, 1]
    double weight = 0.0;
    double contribution = 0.0;  ///< normalized * weight
};

/// @brief Composite score with its per-metric terms
struct ScoreBreakdown {
    std::string entity_id;
    double score = 0.0;
    std::vector<MetricContribution> metrics;  ///< Ordered by metric name
};

/// @brief Computes composite scores from an entity's latest metric values
///
/// Each metric is normalized into [0, 1]:
/// - lower-is-better: (cap - min(value, cap)) / cap
/// - higher-is-better within [0, 1]: the value itself
/// - higher-is-better above 1: min(value / target, 1), or 1 without a target
///
/// The score is the weighted sum of the normalized values. Weights are used
/// as registered; they are not rescaled.
class ScoringEngine {
public:
    explicit ScoringEngine(const MetricCatalog& catalog);

    /// @brief Normalize one metric value for an entity
    double Normalize(const MonitoredEntity& entity,
                     const std::string& metric,
                     double value) const;

    /// @brief Metrics in `values` the entity has no weight for, sorted
    static std::vector<std::string> UnweightedMetrics(
        const MonitoredEntity& entity,
        const std::unordered_map<std::string, double>& values);

    /// @brief Composite score in [0, 1]
    /// @return MissingWeight if a value has no weight, MissingSample if a
    ///         positively weighted metric has no value
    absl::StatusOr<double> Score(const MonitoredEntity& entity,
                                 const std::unordered_map<std::string, double>& values) const;

    /// @brief Composite score with per-metric contributions
    absl::StatusOr<ScoreBreakdown> Breakdown(
        const MonitoredEntity& entity,
        const std::unordered_map<std::string, double>& values) const;

private:
    const MetricCatalog& catalog_;
};

}  // namespace kpiwatch::engine
