#pragma once

/// @file alert_engine.h
/// @brief Baseline deviation detection and tiered alerts
///
/// Deviation is directional: for higher-is-better metrics a drop below the
/// baseline counts, for lower-is-better metrics a rise above it does.
/// Thresholds are checked from critical down to info; the first match wins.
/// A new alert is created on every evaluation that crosses a threshold;
/// suppression of repeats is left to subscribers.

#include <atomic>
#include <chrono>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "engine/baseline_manager.h"
#include "engine/metric_catalog.h"
#include "engine/types.h"

namespace kpiwatch::engine {

/// @brief Filter for ListAlerts()
struct AlertFilter {
    std::optional<std::string> entity_id;
    std::optional<Severity> min_severity;
    bool unacknowledged_only = false;
};

/// @brief Evaluates metrics against baselines and keeps the alert index
class AlertEngine {
public:
    AlertEngine(const MetricCatalog& catalog,
                const BaselineManager& baselines,
                AlertThresholds thresholds = {},
                std::chrono::milliseconds alert_retention = std::chrono::hours(24));

    AlertEngine(const AlertEngine&) = delete;
    AlertEngine& operator=(const AlertEngine&) = delete;

    /// @brief Signed deviation of `current` from `baseline`; positive is worse
    static double ComputeDeviation(MetricPolarity polarity, double baseline, double current);

    /// @brief Most severe tier whose threshold the deviation reaches
    static std::optional<Severity> ClassifyDeviation(double deviation,
                                                     const AlertThresholds& thresholds);

    /// @brief Evaluate one metric value against its baseline
    /// @return The created alert, or nullopt if no threshold was crossed.
    ///         MissingBaseline if no baseline exists for the metric.
    absl::StatusOr<std::optional<Alert>> Evaluate(const std::string& entity_id,
                                                  const std::string& metric,
                                                  double current_value,
                                                  Timestamp now);

    /// @brief Mark an alert as acknowledged
    absl::Status Acknowledge(const std::string& alert_id);

    /// @brief Alerts in the index, oldest first
    std::vector<Alert> ListAlerts(const AlertFilter& filter = {}) const;

    /// @brief Number of unacknowledged alerts in the index
    size_t ActiveAlertCount() const;

    size_t AlertCount() const;

    /// @brief Drop alerts older than the alert retention horizon
    /// @return Number of alerts removed
    size_t PurgeAlerts(Timestamp now);

    AlertThresholds Thresholds() const;
    void SetThresholds(AlertThresholds thresholds);

private:
    std::string NextAlertId(const std::string& entity_id, Timestamp now);

    const MetricCatalog& catalog_;
    const BaselineManager& baselines_;
    std::chrono::milliseconds alert_retention_;

    mutable std::mutex mutex_;
    AlertThresholds thresholds_;
    std::deque<Alert> alerts_;

    std::atomic<uint64_t> sequence_{0};
};

}  // namespace kpiwatch::engine
