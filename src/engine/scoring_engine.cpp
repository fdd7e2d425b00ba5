/// @file scoring_engine.cpp
/// @brief Scoring engine implementation

#include "engine/scoring_engine.h"

#include <algorithm>
#include <map>

#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace kpiwatch::engine {

ScoringEngine::ScoringEngine(const MetricCatalog& catalog)
    : catalog_(catalog) {}

double ScoringEngine::Normalize(const MonitoredEntity& entity,
                                const std::string& metric,
                                double value) const {
    MetricDescriptor descriptor = catalog_.Describe(metric);

    if (descriptor.polarity == MetricPolarity::kLowerIsBetter) {
        double cap = descriptor.cap.value_or(1.0);
        if (cap <= 0.0) {
            return 0.0;
        }
        return std::clamp((cap - std::min(value, cap)) / cap, 0.0, 1.0);
    }

    if (value > 1.0) {
        auto target = entity.targets.find(metric);
        if (target != entity.targets.end() && target->second > 0.0) {
            return std::min(value / target->second, 1.0);
        }
    }
    return std::clamp(value, 0.0, 1.0);
}

std::vector<std::string> ScoringEngine::UnweightedMetrics(
    const MonitoredEntity& entity,
    const std::unordered_map<std::string, double>& values) {
    std::vector<std::string> unweighted;
    for (const auto& [metric, value] : values) {
        if (entity.weights.count(metric) == 0) {
            unweighted.push_back(metric);
        }
    }
    std::sort(unweighted.begin(), unweighted.end());
    return unweighted;
}

absl::StatusOr<ScoreBreakdown> ScoringEngine::Breakdown(
    const MonitoredEntity& entity,
    const std::unordered_map<std::string, double>& values) const {
    std::map<std::string, double> ordered(values.begin(), values.end());

    for (const auto& [metric, value] : ordered) {
        if (entity.weights.count(metric) == 0) {
            return MissingWeightError(entity.id, metric);
        }
    }
    for (const auto& [metric, weight] : entity.weights) {
        if (weight > 0.0 && ordered.count(metric) == 0) {
            return MakeError(ErrorCode::kMissingSample,
                             absl::StrCat("No sample for weighted metric ", entity.id,
                                          "/", metric));
        }
    }

    ScoreBreakdown breakdown;
    breakdown.entity_id = entity.id;

    double total = 0.0;
    for (const auto& [metric, value] : ordered) {
        MetricContribution term;
        term.metric_name = metric;
        term.raw_value = value;
        term.normalized = Normalize(entity, metric, value);
        term.weight = entity.weights.at(metric);
        term.contribution = term.normalized * term.weight;
        total += term.contribution;
        breakdown.metrics.push_back(std::move(term));
    }

    breakdown.score = std::clamp(total, 0.0, 1.0);
    return breakdown;
}

absl::StatusOr<double> ScoringEngine::Score(
    const MonitoredEntity& entity,
    const std::unordered_map<std::string, double>& values) const {
    KPIWATCH_ASSIGN_OR_RETURN(ScoreBreakdown breakdown, Breakdown(entity, values));
    return breakdown.score;
}

}  // namespace kpiwatch::engine
