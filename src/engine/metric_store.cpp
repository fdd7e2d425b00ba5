/// @file metric_store.cpp
/// @brief Time-series store implementation

#include "engine/metric_store.h"

#include <algorithm>
#include <cmath>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"

namespace kpiwatch::engine {

namespace {

AggregatedBucket SampleAsBucket(const std::string& entity_id,
                                const std::string& metric,
                                Timestamp ts,
                                double value) {
    AggregatedBucket bucket;
    bucket.entity_id = entity_id;
    bucket.metric_name = metric;
    bucket.tier = Tier::kRealtime;
    bucket.window_start = ts;
    bucket.window_end = ts;
    bucket.mean = value;
    bucket.sample_count = 1;
    return bucket;
}

}  // namespace

MetricStore::MetricStore(RetentionPolicy retention)
    : retention_(retention) {}

void MetricStore::AddEntity(const std::string& entity_id) {
    std::lock_guard<std::mutex> lock(entities_mutex_);
    if (entities_.count(entity_id) == 0) {
        entities_.emplace(entity_id, std::make_shared<EntitySeries>());
    }
}

void MetricStore::RemoveEntity(const std::string& entity_id) {
    std::lock_guard<std::mutex> lock(entities_mutex_);
    entities_.erase(entity_id);
}

bool MetricStore::HasEntity(const std::string& entity_id) const {
    return FindSeries(entity_id) != nullptr;
}

std::shared_ptr<MetricStore::EntitySeries> MetricStore::FindSeries(
    const std::string& entity_id) const {
    std::lock_guard<std::mutex> lock(entities_mutex_);
    auto it = entities_.find(entity_id);
    return it == entities_.end() ? nullptr : it->second;
}

// =============================================================================
// Writes
// =============================================================================

absl::Status MetricStore::RecordSample(const MetricSample& sample) {
    if (sample.metric_name.empty()) {
        return absl::InvalidArgumentError("Metric name cannot be empty");
    }
    if (!std::isfinite(sample.value)) {
        return absl::InvalidArgumentError(
            absl::StrCat("Non-finite value for ", sample.entity_id, "/",
                         sample.metric_name));
    }

    auto series = FindSeries(sample.entity_id);
    if (!series) {
        return InvalidEntityError(sample.entity_id);
    }

    std::lock_guard<std::mutex> lock(series->mutex);
    series->samples[sample.metric_name][sample.timestamp] = sample.value;
    return absl::OkStatus();
}

absl::Status MetricStore::WriteBucket(const AggregatedBucket& bucket) {
    if (bucket.tier == Tier::kRealtime) {
        return absl::InvalidArgumentError("Buckets cannot be written to the realtime tier");
    }

    auto series = FindSeries(bucket.entity_id);
    if (!series) {
        return InvalidEntityError(bucket.entity_id);
    }

    std::lock_guard<std::mutex> lock(series->mutex);
    series->buckets[BucketIndex(bucket.tier)][bucket.metric_name][bucket.window_start] = bucket;
    return absl::OkStatus();
}

// =============================================================================
// Reads
// =============================================================================

absl::StatusOr<std::vector<AggregatedBucket>> MetricStore::Query(
    const std::string& entity_id,
    const std::string& metric,
    Tier tier,
    TimeRange range) const {
    auto series = FindSeries(entity_id);
    if (!series) {
        return InvalidEntityError(entity_id);
    }

    std::vector<AggregatedBucket> result;
    if (!(range.from < range.to)) {
        return result;
    }
    std::lock_guard<std::mutex> lock(series->mutex);

    if (tier == Tier::kRealtime) {
        auto it = series->samples.find(metric);
        if (it == series->samples.end()) {
            return result;
        }
        auto begin = it->second.lower_bound(range.from);
        auto end = it->second.lower_bound(range.to);
        for (auto s = begin; s != end; ++s) {
            result.push_back(SampleAsBucket(entity_id, metric, s->first, s->second));
        }
        return result;
    }

    const auto& tier_buckets = series->buckets[BucketIndex(tier)];
    auto it = tier_buckets.find(metric);
    if (it == tier_buckets.end()) {
        return result;
    }
    auto begin = it->second.lower_bound(range.from);
    auto end = it->second.lower_bound(range.to);
    for (auto b = begin; b != end; ++b) {
        result.push_back(b->second);
    }
    return result;
}

absl::StatusOr<std::vector<MetricSample>> MetricStore::QuerySamples(
    const std::string& entity_id,
    const std::string& metric,
    TimeRange range) const {
    auto series = FindSeries(entity_id);
    if (!series) {
        return InvalidEntityError(entity_id);
    }

    std::vector<MetricSample> result;
    if (!(range.from < range.to)) {
        return result;
    }
    std::lock_guard<std::mutex> lock(series->mutex);
    auto it = series->samples.find(metric);
    if (it == series->samples.end()) {
        return result;
    }
    auto begin = it->second.lower_bound(range.from);
    auto end = it->second.lower_bound(range.to);
    for (auto s = begin; s != end; ++s) {
        result.push_back({entity_id, metric, s->second, s->first});
    }
    return result;
}

absl::StatusOr<std::unordered_map<std::string, double>> MetricStore::LatestValues(
    const std::string& entity_id) const {
    auto series = FindSeries(entity_id);
    if (!series) {
        return InvalidEntityError(entity_id);
    }

    std::unordered_map<std::string, double> latest;
    std::lock_guard<std::mutex> lock(series->mutex);
    for (const auto& [metric, samples] : series->samples) {
        if (!samples.empty()) {
            latest[metric] = samples.rbegin()->second;
        }
    }
    return latest;
}

absl::StatusOr<std::vector<AggregatedBucket>> MetricStore::ComputeRollup(
    const std::string& entity_id, Tier source, Tier target, TimeRange window) const {
    if (target == Tier::kRealtime || static_cast<int>(source) >= static_cast<int>(target)) {
        return absl::InvalidArgumentError(
            absl::StrCat("Cannot roll ", TierToString(source), " into ",
                         TierToString(target)));
    }
    if (!(window.from < window.to)) {
        return absl::InvalidArgumentError("Rollup window must not be empty");
    }

    auto series = FindSeries(entity_id);
    if (!series) {
        return InvalidEntityError(entity_id);
    }

    auto make_bucket = [&](const std::string& metric, double sum, uint64_t count) {
        AggregatedBucket bucket;
        bucket.entity_id = entity_id;
        bucket.metric_name = metric;
        bucket.tier = target;
        bucket.window_start = window.from;
        bucket.window_end = window.to;
        bucket.mean = sum / static_cast<double>(count);
        bucket.sample_count = count;
        return bucket;
    };

    std::vector<AggregatedBucket> result;
    std::lock_guard<std::mutex> lock(series->mutex);

    if (source == Tier::kRealtime) {
        for (const auto& [metric, samples] : series->samples) {
            double sum = 0.0;
            uint64_t count = 0;
            auto end = samples.lower_bound(window.to);
            for (auto s = samples.lower_bound(window.from); s != end; ++s) {
                sum += s->second;
                ++count;
            }
            if (count > 0) {
                result.push_back(make_bucket(metric, sum, count));
            }
        }
        return result;
    }

    for (const auto& [metric, buckets] : series->buckets[BucketIndex(source)]) {
        double sum = 0.0;
        uint64_t count = 0;
        auto end = buckets.lower_bound(window.to);
        for (auto b = buckets.lower_bound(window.from); b != end; ++b) {
            sum += b->second.mean * static_cast<double>(b->second.sample_count);
            count += b->second.sample_count;
        }
        if (count > 0) {
            result.push_back(make_bucket(metric, sum, count));
        }
    }
    return result;
}

std::vector<std::string> MetricStore::ListEntities() const {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(entities_mutex_);
        ids.reserve(entities_.size());
        for (const auto& [id, series] : entities_) {
            ids.push_back(id);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

absl::StatusOr<std::vector<std::string>> MetricStore::ListMetrics(
    const std::string& entity_id) const {
    auto series = FindSeries(entity_id);
    if (!series) {
        return InvalidEntityError(entity_id);
    }

    std::vector<std::string> metrics;
    std::lock_guard<std::mutex> lock(series->mutex);
    for (const auto& [metric, samples] : series->samples) {
        metrics.push_back(metric);
    }
    return metrics;
}

size_t MetricStore::RecordCount(Tier tier) const {
    std::vector<std::shared_ptr<EntitySeries>> snapshot;
    {
        std::lock_guard<std::mutex> lock(entities_mutex_);
        for (const auto& [id, series] : entities_) {
            snapshot.push_back(series);
        }
    }

    size_t total = 0;
    for (const auto& series : snapshot) {
        std::lock_guard<std::mutex> lock(series->mutex);
        if (tier == Tier::kRealtime) {
            for (const auto& [metric, samples] : series->samples) {
                total += samples.size();
            }
        } else {
            for (const auto& [metric, buckets] : series->buckets[BucketIndex(tier)]) {
                total += buckets.size();
            }
        }
    }
    return total;
}

// =============================================================================
// Retention
// =============================================================================

void MetricStore::HoldFrom(Tier tier, std::optional<Timestamp> from) {
    std::lock_guard<std::mutex> lock(holds_mutex_);
    holds_[static_cast<size_t>(tier)] = from;
}

std::optional<Timestamp> MetricStore::HoldPoint(Tier tier) const {
    std::lock_guard<std::mutex> lock(holds_mutex_);
    return holds_[static_cast<size_t>(tier)];
}

size_t MetricStore::Purge(Tier tier, Timestamp now) {
    Timestamp cutoff = now - retention_.Horizon(tier);
    if (auto hold = HoldPoint(tier); hold && *hold < cutoff) {
        // A bucket starting at the hold point ends after it, so it is kept too
        cutoff = *hold;
    }

    std::vector<std::shared_ptr<EntitySeries>> snapshot;
    {
        std::lock_guard<std::mutex> lock(entities_mutex_);
        for (const auto& [id, series] : entities_) {
            snapshot.push_back(series);
        }
    }

    size_t removed = 0;
    for (const auto& series : snapshot) {
        std::lock_guard<std::mutex> lock(series->mutex);

        if (tier == Tier::kRealtime) {
            for (auto it = series->samples.begin(); it != series->samples.end();) {
                auto& samples = it->second;
                auto keep = samples.lower_bound(cutoff);
                removed += static_cast<size_t>(std::distance(samples.begin(), keep));
                samples.erase(samples.begin(), keep);
                it = samples.empty() ? series->samples.erase(it) : std::next(it);
            }
            continue;
        }

        auto& tier_buckets = series->buckets[BucketIndex(tier)];
        for (auto it = tier_buckets.begin(); it != tier_buckets.end();) {
            auto& buckets = it->second;
            for (auto b = buckets.begin(); b != buckets.end();) {
                if (b->second.window_end < cutoff) {
                    b = buckets.erase(b);
                    ++removed;
                } else {
                    ++b;
                }
            }
            it = buckets.empty() ? tier_buckets.erase(it) : std::next(it);
        }
    }

    if (removed > 0) {
        KPIWATCH_LOG_DEBUG("Purged {} {} records older than the retention horizon",
                           removed, TierToString(tier));
    }
    return removed;
}

}  // namespace kpiwatch::engine
