#pragma once

/// @file engine_config.h
/// @brief Typed configuration of the metrics engine

#include <chrono>
#include <string>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "common/config.h"
#include "common/logging.h"
#include "engine/metric_catalog.h"
#include "engine/types.h"

namespace kpiwatch::engine {

/// @brief Engine configuration
///
/// YAML layout:
/// @code
///   engine:
///     update_interval_ms: 5000
///     trend_interval_ms: 300000
///     retention_sweep_interval_ms: 300000
///     worker_threads: 0
///     dispatch_queue_capacity: 10000
///   retention: {realtime_ms: 3600000, hourly_ms: ..., alerts_ms: 86400000}
///   alert_thresholds: {info: 0.05, warning: 0.10, critical: 0.15}
///   trend: {window_size: 10, emit_epsilon: 0.01}
///   metrics:
///     latency_p99: {polarity: lower_is_better, cap: 500}
///   entities:
///     marketing:
///       kind: team
///       weights: {efficiency: 0.25, quality: 0.30, responseTime: 0.20,
///                 customerSatisfaction: 0.25}
///   logging: {level: info, file: ""}
/// @endcode
struct EngineConfig {
    /// Monitoring cycle (alert evaluation and scoring)
    std::chrono::milliseconds update_interval{5000};

    /// Trend analysis cycle
    std::chrono::milliseconds trend_interval{300000};

    /// Retention sweep across all tiers and the alert index
    std::chrono::milliseconds retention_sweep_interval{300000};

    /// Workers for per-entity cycles (0 = hardware concurrency)
    size_t worker_threads = 0;

    /// Events buffered for subscribers before new ones are dropped
    size_t dispatch_queue_capacity = 10000;

    RetentionPolicy retention;
    AlertThresholds alert_thresholds;

    size_t trend_window_size = 10;
    double trend_emit_epsilon = 0.01;

    MetricCatalog metrics = MetricCatalog::Default();

    /// Entities registered at startup
    std::vector<MonitoredEntity> entities;

    LogConfig logging;

    /// Create default configuration
    static EngineConfig Default();

    /// Build from a generic configuration tree
    static absl::StatusOr<EngineConfig> FromConfig(const Config& config);

    /// Load configuration from YAML file
    static absl::StatusOr<EngineConfig> LoadFromFile(const std::string& path);

    /// Load configuration with environment variable overrides
    /// @param path YAML file, or empty for defaults plus environment
    static absl::StatusOr<EngineConfig> LoadWithEnv(
        const std::string& path,
        const std::string& env_prefix = "KPIWATCH_");

    /// Reject inconsistent settings with a ConfigurationError
    absl::Status Validate() const;
};

}  // namespace kpiwatch::engine
