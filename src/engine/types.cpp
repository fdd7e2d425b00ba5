/// @file types.cpp
/// @brief String conversions for the engine data model

#include "engine/types.h"

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

namespace kpiwatch::engine {

std::chrono::milliseconds RetentionPolicy::Horizon(Tier tier) const {
    switch (tier) {
        case Tier::kRealtime: return realtime;
        case Tier::kHourly: return hourly;
        case Tier::kDaily: return daily;
        case Tier::kWeekly: return weekly;
    }
    return realtime;
}

std::string EntityKindToString(EntityKind kind) {
    switch (kind) {
        case EntityKind::kTeam: return "team";
        case EntityKind::kWorkflow: return "workflow";
    }
    return "team";
}

absl::StatusOr<EntityKind> StringToEntityKind(const std::string& str) {
    std::string lower = absl::AsciiStrToLower(str);
    if (lower == "team") return EntityKind::kTeam;
    if (lower == "workflow") return EntityKind::kWorkflow;
    return absl::InvalidArgumentError(absl::StrCat("Unknown entity kind: ", str));
}

std::string TierToString(Tier tier) {
    switch (tier) {
        case Tier::kRealtime: return "realtime";
        case Tier::kHourly: return "hourly";
        case Tier::kDaily: return "daily";
        case Tier::kWeekly: return "weekly";
    }
    return "realtime";
}

absl::StatusOr<Tier> StringToTier(const std::string& str) {
    std::string lower = absl::AsciiStrToLower(str);
    if (lower == "realtime") return Tier::kRealtime;
    if (lower == "hourly") return Tier::kHourly;
    if (lower == "daily") return Tier::kDaily;
    if (lower == "weekly") return Tier::kWeekly;
    return absl::InvalidArgumentError(absl::StrCat("Unknown tier: ", str));
}

std::string SeverityToString(Severity severity) {
    switch (severity) {
        case Severity::kInfo: return "info";
        case Severity::kWarning: return "warning";
        case Severity::kCritical: return "critical";
    }
    return "info";
}

absl::StatusOr<Severity> StringToSeverity(const std::string& str) {
    std::string lower = absl::AsciiStrToLower(str);
    if (lower == "info") return Severity::kInfo;
    if (lower == "warning") return Severity::kWarning;
    if (lower == "critical") return Severity::kCritical;
    return absl::InvalidArgumentError(absl::StrCat("Unknown severity: ", str));
}

std::string TrendDirectionToString(TrendDirection direction) {
    switch (direction) {
        case TrendDirection::kImproving: return "improving";
        case TrendDirection::kDeclining: return "declining";
        case TrendDirection::kStable: return "stable";
    }
    return "stable";
}

std::string MetricPolarityToString(MetricPolarity polarity) {
    return polarity == MetricPolarity::kLowerIsBetter ? "lower_is_better"
                                                      : "higher_is_better";
}

absl::StatusOr<MetricPolarity> StringToMetricPolarity(const std::string& str) {
    std::string lower = absl::AsciiStrToLower(str);
    if (lower == "higher_is_better" || lower == "higher") {
        return MetricPolarity::kHigherIsBetter;
    }
    if (lower == "lower_is_better" || lower == "lower") {
        return MetricPolarity::kLowerIsBetter;
    }
    return absl::InvalidArgumentError(absl::StrCat("Unknown metric polarity: ", str));
}

int64_t ToUnixMillis(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        ts.time_since_epoch()).count();
}

Timestamp FromUnixMillis(int64_t millis) {
    return Timestamp(std::chrono::milliseconds(millis));
}

}  // namespace kpiwatch::engine
