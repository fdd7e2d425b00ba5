/// @file metric_catalog.cpp
/// @brief Metric catalog implementation

#include "engine/metric_catalog.h"

#include <algorithm>

#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace kpiwatch::engine {

MetricCatalog::MetricCatalog(const MetricCatalog& other) {
    std::lock_guard<std::mutex> lock(other.mutex_);
    descriptors_ = other.descriptors_;
}

MetricCatalog& MetricCatalog::operator=(const MetricCatalog& other) {
    if (this != &other) {
        std::scoped_lock lock(mutex_, other.mutex_);
        descriptors_ = other.descriptors_;
    }
    return *this;
}

MetricCatalog MetricCatalog::Default() {
    MetricCatalog catalog;
    // Latency in milliseconds, capped at two seconds
    for (const char* name : {"responseTime", "response_time"}) {
        catalog.descriptors_[name] = {name, MetricPolarity::kLowerIsBetter, 2000.0};
    }
    for (const char* name : {"errorRate", "error_rate"}) {
        catalog.descriptors_[name] = {name, MetricPolarity::kLowerIsBetter, 0.1};
    }
    return catalog;
}

absl::StatusOr<MetricCatalog> MetricCatalog::FromConfig(const Config& config) {
    MetricCatalog catalog = Default();

    for (const auto& name : config.GetChildKeys("metrics")) {
        std::string prefix = absl::StrCat("metrics.", name, ".");
        MetricDescriptor descriptor = catalog.Describe(name);

        std::string polarity = config.GetString(prefix + "polarity");
        if (!polarity.empty()) {
            auto parsed = StringToMetricPolarity(polarity);
            if (!parsed.ok()) {
                return MakeError(ErrorCode::kConfigurationError,
                                 absl::StrCat("metrics.", name, ": ",
                                              parsed.status().message()));
            }
            descriptor.polarity = *parsed;
        }
        if (config.HasKey(prefix + "cap")) {
            descriptor.cap = config.GetDouble(prefix + "cap");
        }

        KPIWATCH_RETURN_IF_ERROR(catalog.Register(std::move(descriptor)));
    }

    KPIWATCH_RETURN_IF_ERROR(catalog.Validate());
    return catalog;
}

absl::Status MetricCatalog::Register(MetricDescriptor descriptor) {
    if (descriptor.name.empty()) {
        return absl::InvalidArgumentError("Metric name cannot be empty");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    descriptors_[descriptor.name] = std::move(descriptor);
    return absl::OkStatus();
}

MetricDescriptor MetricCatalog::Describe(const std::string& metric) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = descriptors_.find(metric);
    if (it == descriptors_.end()) {
        return {metric, MetricPolarity::kHigherIsBetter, std::nullopt};
    }
    return it->second;
}

MetricPolarity MetricCatalog::PolarityOf(const std::string& metric) const {
    return Describe(metric).polarity;
}

bool MetricCatalog::Contains(const std::string& metric) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return descriptors_.count(metric) > 0;
}

std::vector<MetricDescriptor> MetricCatalog::List() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<MetricDescriptor> result;
    result.reserve(descriptors_.size());
    for (const auto& [name, descriptor] : descriptors_) {
        result.push_back(descriptor);
    }
    std::sort(result.begin(), result.end(),
              [](const auto& a, const auto& b) { return a.name < b.name; });
    return result;
}

absl::Status MetricCatalog::Validate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [name, descriptor] : descriptors_) {
        if (descriptor.polarity == MetricPolarity::kLowerIsBetter &&
            (!descriptor.cap || *descriptor.cap <= 0.0)) {
            return MakeError(ErrorCode::kConfigurationError,
                             absl::StrCat("Lower-is-better metric '", name,
                                          "' needs a positive cap"));
        }
    }
    return absl::OkStatus();
}

}  // namespace kpiwatch::engine
