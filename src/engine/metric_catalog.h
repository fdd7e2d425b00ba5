#pragma once

/// @file metric_catalog.h
/// @brief Per-metric polarity and normalization ceilings

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "common/config.h"
#include "engine/types.h"

namespace kpiwatch::engine {

/// @brief How a metric is interpreted by alerting and scoring
struct MetricDescriptor {
    std::string name;
    MetricPolarity polarity = MetricPolarity::kHigherIsBetter;

    /// Normalization ceiling; required for lower-is-better metrics
    std::optional<double> cap;
};

/// @brief Registry of metric descriptors
///
/// Metrics that are not registered are treated as higher-is-better ratios.
class MetricCatalog {
public:
    MetricCatalog() = default;

    MetricCatalog(const MetricCatalog& other);
    MetricCatalog& operator=(const MetricCatalog& other);

    /// @brief Catalog with the built-in latency and error-rate descriptors
    static MetricCatalog Default();

    /// @brief Default() overlaid with the `metrics.<name>` section of a config
    static absl::StatusOr<MetricCatalog> FromConfig(const Config& config);

    /// @brief Add or replace a descriptor
    absl::Status Register(MetricDescriptor descriptor);

    /// @brief Descriptor for a metric (a higher-is-better default if unknown)
    MetricDescriptor Describe(const std::string& metric) const;

    MetricPolarity PolarityOf(const std::string& metric) const;

    bool Contains(const std::string& metric) const;

    std::vector<MetricDescriptor> List() const;

    /// @brief Check that every lower-is-better metric has a positive cap
    absl::Status Validate() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, MetricDescriptor> descriptors_;
};

}  // namespace kpiwatch::engine
