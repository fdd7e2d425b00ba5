#include "metrics.h"

#include <algorithm>
#include <cmath>
#include <limits>

#include <absl/strings/str_cat.h>

namespace kpiwatch {

namespace {

template <typename T>
T& GetOrCreate(std::map<std::string, std::unique_ptr<T>>& instruments,
               const std::string& name,
               const std::string& description) {
    auto& slot = instruments[name];
    if (!slot) {
        slot = std::make_unique<T>(name, description);
    }
    return *slot;
}

void AppendHeader(std::string& out, const Instrument& instrument, const char* type) {
    absl::StrAppend(&out, "# HELP ", instrument.Name(), " ", instrument.Description(), "\n",
                    "# TYPE ", instrument.Name(), " ", type, "\n");
}

std::string BoundLabel(double bound) {
    return std::isinf(bound) ? "+Inf" : absl::StrCat(bound);
}

}  // namespace

std::vector<double> DefaultLatencyBuckets() {
    return {0.001, 0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0, 10.0};
}

// =============================================================================
// Histogram
// =============================================================================

Histogram::Histogram(std::string name, std::string description, std::vector<double> bounds)
    : Instrument(std::move(name), std::move(description)),
      bounds_(std::move(bounds)) {
    std::sort(bounds_.begin(), bounds_.end());
    counts_.assign(bounds_.size() + 1, 0);
}

void Histogram::Observe(double value) {
    // Bucket of the first bound >= value; larger values go to +Inf
    size_t index = static_cast<size_t>(
        std::lower_bound(bounds_.begin(), bounds_.end(), value) - bounds_.begin());

    std::lock_guard<std::mutex> lock(mutex_);
    counts_[index]++;
    count_++;
    sum_ += value;
}

uint64_t Histogram::Count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
}

double Histogram::Sum() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sum_;
}

std::vector<std::pair<double, uint64_t>> Histogram::Buckets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::pair<double, uint64_t>> cumulative;
    cumulative.reserve(counts_.size());

    uint64_t running = 0;
    for (size_t i = 0; i < counts_.size(); ++i) {
        running += counts_[i];
        double bound = i < bounds_.size() ? bounds_[i]
                                          : std::numeric_limits<double>::infinity();
        cumulative.emplace_back(bound, running);
    }
    return cumulative;
}

ScopedTimer::~ScopedTimer() {
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_;
    histogram_.Observe(elapsed.count());
}

// =============================================================================
// Registry
// =============================================================================

Counter& MetricsRegistry::GetCounter(const std::string& name, const std::string& description) {
    std::lock_guard<std::mutex> lock(mutex_);
    return GetOrCreate(counters_, name, description);
}

Gauge& MetricsRegistry::GetGauge(const std::string& name, const std::string& description) {
    std::lock_guard<std::mutex> lock(mutex_);
    return GetOrCreate(gauges_, name, description);
}

Histogram& MetricsRegistry::GetHistogram(const std::string& name,
                                         const std::string& description) {
    std::lock_guard<std::mutex> lock(mutex_);
    return GetOrCreate(histograms_, name, description);
}

std::map<std::string, double> MetricsRegistry::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, double> values;
    for (const auto& [name, counter] : counters_) {
        values[name] = static_cast<double>(counter->Value());
    }
    for (const auto& [name, gauge] : gauges_) {
        values[name] = gauge->Value();
    }
    for (const auto& [name, histogram] : histograms_) {
        values[name + "_count"] = static_cast<double>(histogram->Count());
        values[name + "_sum"] = histogram->Sum();
    }
    return values;
}

std::string MetricsRegistry::ExportText() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string out;

    for (const auto& [name, counter] : counters_) {
        AppendHeader(out, *counter, "counter");
        absl::StrAppend(&out, name, " ", counter->Value(), "\n");
    }
    for (const auto& [name, gauge] : gauges_) {
        AppendHeader(out, *gauge, "gauge");
        absl::StrAppend(&out, name, " ", gauge->Value(), "\n");
    }
    for (const auto& [name, histogram] : histograms_) {
        AppendHeader(out, *histogram, "histogram");
        for (const auto& [bound, count] : histogram->Buckets()) {
            absl::StrAppend(&out, name, "_bucket{le=\"", BoundLabel(bound), "\"} ", count, "\n");
        }
        absl::StrAppend(&out, name, "_sum ", histogram->Sum(), "\n",
                        name, "_count ", histogram->Count(), "\n");
    }
    return out;
}

}  // namespace kpiwatch
