#pragma once

/// @file metrics.h
/// @brief Self-monitoring instruments (counters, gauges, histograms)
///
/// These track the engine's own health (samples ingested, alerts emitted,
/// cycle latency). They are unrelated to the business metrics the engine
/// stores; a registry is owned by whoever needs one, there is no global.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace kpiwatch {

/// @brief Name and help text shared by every instrument
class Instrument {
public:
    Instrument(std::string name, std::string description)
        : name_(std::move(name)), description_(std::move(description)) {}

    const std::string& Name() const { return name_; }
    const std::string& Description() const { return description_; }

private:
    std::string name_;
    std::string description_;
};

/// @brief Monotonic event count
class Counter : public Instrument {
public:
    using Instrument::Instrument;

    void Increment(uint64_t n = 1) { value_.fetch_add(n, std::memory_order_relaxed); }
    uint64_t Value() const { return value_.load(std::memory_order_relaxed); }

private:
    std::atomic<uint64_t> value_{0};
};

/// @brief Last observed level
class Gauge : public Instrument {
public:
    using Instrument::Instrument;

    void Set(double value) { value_.store(value, std::memory_order_relaxed); }
    double Value() const { return value_.load(std::memory_order_relaxed); }

private:
    std::atomic<double> value_{0.0};
};

/// @brief Upper bounds for cycle latencies, in seconds
std::vector<double> DefaultLatencyBuckets();

/// @brief Distribution with fixed upper bounds, exported cumulatively
class Histogram : public Instrument {
public:
    Histogram(std::string name,
              std::string description,
              std::vector<double> bounds = DefaultLatencyBuckets());

    void Observe(double value);

    uint64_t Count() const;
    double Sum() const;

    /// @brief (upper bound, cumulative count) pairs; the last bound is +Inf
    std::vector<std::pair<double, uint64_t>> Buckets() const;

private:
    std::vector<double> bounds_;

    mutable std::mutex mutex_;
    std::vector<uint64_t> counts_;  ///< bounds_.size() + 1, the last is +Inf
    uint64_t count_ = 0;
    double sum_ = 0.0;
};

/// @brief Records the scope's wall time into a histogram
class ScopedTimer {
public:
    explicit ScopedTimer(Histogram& histogram)
        : histogram_(histogram), start_(std::chrono::steady_clock::now()) {}
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// @brief Owns a set of named instruments
///
/// Returned references stay valid for the lifetime of the registry. A name
/// always resolves to the instrument first created under it.
class MetricsRegistry {
public:
    MetricsRegistry() = default;

    MetricsRegistry(const MetricsRegistry&) = delete;
    MetricsRegistry& operator=(const MetricsRegistry&) = delete;

    Counter& GetCounter(const std::string& name, const std::string& description = "");
    Gauge& GetGauge(const std::string& name, const std::string& description = "");
    Histogram& GetHistogram(const std::string& name, const std::string& description = "");

    /// @brief Value of every counter and gauge, and `<name>_count` and
    ///        `<name>_sum` of every histogram
    std::map<std::string, double> Snapshot() const;

    /// @brief Prometheus text exposition, instruments sorted by name
    std::string ExportText() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<Counter>> counters_;
    std::map<std::string, std::unique_ptr<Gauge>> gauges_;
    std::map<std::string, std::unique_ptr<Histogram>> histograms_;
};

}  // namespace kpiwatch
