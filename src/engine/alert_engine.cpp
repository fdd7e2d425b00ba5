/// @file alert_engine.cpp
/// @brief Alert engine implementation

#include "engine/alert_engine.h"

#include <algorithm>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"

namespace kpiwatch::engine {

namespace {

/// Absorbs rounding in (baseline - current) / baseline at exact thresholds
constexpr double kDeviationTolerance = 1e-9;

}  // namespace

AlertEngine::AlertEngine(const MetricCatalog& catalog,
                         const BaselineManager& baselines,
                         AlertThresholds thresholds,
                         std::chrono::milliseconds alert_retention)
    : catalog_(catalog),
      baselines_(baselines),
      alert_retention_(alert_retention),
      thresholds_(thresholds) {}

double AlertEngine::ComputeDeviation(MetricPolarity polarity, double baseline, double current) {
    if (polarity == MetricPolarity::kLowerIsBetter) {
        return (current - baseline) / baseline;
    }
    return (baseline - current) / baseline;
}

std::optional<Severity> AlertEngine::ClassifyDeviation(double deviation,
                                                       const AlertThresholds& thresholds) {
    if (deviation + kDeviationTolerance >= thresholds.critical) {
        return Severity::kCritical;
    }
    if (deviation + kDeviationTolerance >= thresholds.warning) {
        return Severity::kWarning;
    }
    if (deviation + kDeviationTolerance >= thresholds.info) {
        return Severity::kInfo;
    }
    return std::nullopt;
}

absl::StatusOr<std::optional<Alert>> AlertEngine::Evaluate(const std::string& entity_id,
                                                           const std::string& metric,
                                                           double current_value,
                                                           Timestamp now) {
    auto baseline = baselines_.GetBaseline(entity_id, metric);
    if (!baseline) {
        return MissingBaselineError(entity_id, metric);
    }
    if (baseline->value == 0.0) {
        KPIWATCH_LOG_DEBUG("Zero baseline for {}/{}, deviation undefined", entity_id, metric);
        return std::optional<Alert>();
    }

    double deviation = ComputeDeviation(catalog_.PolarityOf(metric), baseline->value,
                                        current_value);
    auto severity = ClassifyDeviation(deviation, Thresholds());
    if (!severity) {
        return std::optional<Alert>();
    }

    Alert alert;
    alert.id = NextAlertId(entity_id, now);
    alert.entity_id = entity_id;
    alert.metric_name = metric;
    alert.severity = *severity;
    alert.deviation_pct = deviation * 100.0;
    alert.current_value = current_value;
    alert.baseline_value = baseline->value;
    alert.timestamp = now;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        alerts_.push_back(alert);
    }

    KPIWATCH_LOG_INFO("{} alert for {}/{}: {:.1f}% from baseline {} (current {})",
                      SeverityToString(alert.severity), entity_id, metric,
                      alert.deviation_pct, baseline->value, current_value);
    return std::optional<Alert>(std::move(alert));
}

absl::Status AlertEngine::Acknowledge(const std::string& alert_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(alerts_.begin(), alerts_.end(),
                           [&](const Alert& a) { return a.id == alert_id; });
    if (it == alerts_.end()) {
        return absl::NotFoundError(absl::StrCat("Alert not found: ", alert_id));
    }
    it->acknowledged = true;
    return absl::OkStatus();
}

std::vector<Alert> AlertEngine::ListAlerts(const AlertFilter& filter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Alert> result;
    for (const auto& alert : alerts_) {
        if (filter.entity_id && alert.entity_id != *filter.entity_id) {
            continue;
        }
        if (filter.min_severity &&
            static_cast<int>(alert.severity) < static_cast<int>(*filter.min_severity)) {
            continue;
        }
        if (filter.unacknowledged_only && alert.acknowledged) {
            continue;
        }
        result.push_back(alert);
    }
    return result;
}

size_t AlertEngine::ActiveAlertCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(alerts_.begin(), alerts_.end(),
                                             [](const Alert& a) { return !a.acknowledged; }));
}

size_t AlertEngine::AlertCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return alerts_.size();
}

size_t AlertEngine::PurgeAlerts(Timestamp now) {
    const Timestamp cutoff = now - alert_retention_;

    std::lock_guard<std::mutex> lock(mutex_);
    size_t before = alerts_.size();
    alerts_.erase(std::remove_if(alerts_.begin(), alerts_.end(),
                                 [&](const Alert& a) { return a.timestamp < cutoff; }),
                  alerts_.end());
    return before - alerts_.size();
}

AlertThresholds AlertEngine::Thresholds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return thresholds_;
}

void AlertEngine::SetThresholds(AlertThresholds thresholds) {
    std::lock_guard<std::mutex> lock(mutex_);
    thresholds_ = thresholds;
}

std::string AlertEngine::NextAlertId(const std::string& entity_id, Timestamp now) {
    return absl::StrCat("alert_", ToUnixMillis(now), "_", entity_id, "_",
                        sequence_.fetch_add(1) + 1);
}

}  // namespace kpiwatch::engine
