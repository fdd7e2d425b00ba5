#pragma once

/// @file metric_store.h
/// @brief Multi-tier, retention-bounded time-series storage
///
/// Holds raw samples (realtime tier) and aggregated buckets (hourly, daily
/// and weekly tiers) per entity. Each entity's series has its own lock so
/// writers to different entities never contend; queries copy the matching
/// records out before returning.

#include <array>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "engine/types.h"

namespace kpiwatch::engine {

/// @brief In-memory time-series store
class MetricStore {
public:
    explicit MetricStore(RetentionPolicy retention = {});
    virtual ~MetricStore() = default;

    MetricStore(const MetricStore&) = delete;
    MetricStore& operator=(const MetricStore&) = delete;

    /// @brief Create the (empty) series of an entity; no-op if it exists
    void AddEntity(const std::string& entity_id);

    /// @brief Drop an entity and every record it owns
    void RemoveEntity(const std::string& entity_id);

    bool HasEntity(const std::string& entity_id) const;

    // =========================================================================
    // Writes
    // =========================================================================

    /// @brief Append a raw sample to the realtime tier
    ///
    /// A sample with the same (entity, metric, timestamp) as an existing one
    /// replaces it.
    /// @return InvalidEntity if the entity was never added
    absl::Status RecordSample(const MetricSample& sample);

    /// @brief Store an aggregated bucket, replacing one with the same window
    virtual absl::Status WriteBucket(const AggregatedBucket& bucket);

    // =========================================================================
    // Reads
    // =========================================================================

    /// @brief Records of one entity/metric in a tier, ascending by time
    ///
    /// Realtime records are returned as single-sample buckets. For the other
    /// tiers a bucket matches when its window_start lies in `range`.
    absl::StatusOr<std::vector<AggregatedBucket>> Query(const std::string& entity_id,
                                                        const std::string& metric,
                                                        Tier tier,
                                                        TimeRange range) const;

    /// @brief Raw samples of one entity/metric, ascending by time
    absl::StatusOr<std::vector<MetricSample>> QuerySamples(const std::string& entity_id,
                                                           const std::string& metric,
                                                           TimeRange range) const;

    /// @brief Most recent realtime value of every metric of an entity
    absl::StatusOr<std::unordered_map<std::string, double>> LatestValues(
        const std::string& entity_id) const;

    /// @brief Buckets of `target` tier computed from `source` records in `window`
    ///
    /// Realtime samples contribute one each; coarser sources are combined as
    /// sample-count-weighted means. Metrics without records are omitted.
    virtual absl::StatusOr<std::vector<AggregatedBucket>> ComputeRollup(
        const std::string& entity_id, Tier source, Tier target, TimeRange window) const;

    std::vector<std::string> ListEntities() const;

    absl::StatusOr<std::vector<std::string>> ListMetrics(const std::string& entity_id) const;

    /// @brief Number of records held in a tier across all entities
    size_t RecordCount(Tier tier) const;

    // =========================================================================
    // Retention
    // =========================================================================

    /// @brief Remove records of a tier older than its horizon
    ///
    /// A record's age is measured from its window_end (the sample timestamp
    /// for realtime records). Records older than `now - horizon` are removed,
    /// except those at or after the tier's hold point.
    /// @return Number of records removed
    size_t Purge(Tier tier, Timestamp now);

    /// @brief Keep records of `tier` starting at or after `from` on purge
    ///
    /// Set by the aggregation job reading `tier`, so the source records of a
    /// window that has not been rolled up yet survive until it commits.
    /// std::nullopt releases the hold.
    void HoldFrom(Tier tier, std::optional<Timestamp> from);

    std::optional<Timestamp> HoldPoint(Tier tier) const;

    const RetentionPolicy& Retention() const { return retention_; }

private:
    using SampleSeries = std::map<Timestamp, double>;
    using BucketSeries = std::map<Timestamp, AggregatedBucket>;

    struct EntitySeries {
        mutable std::mutex mutex;
        std::map<std::string, SampleSeries> samples;

        /// Hourly, daily, weekly
        std::array<std::map<std::string, BucketSeries>, 3> buckets;
    };

    static size_t BucketIndex(Tier tier) { return static_cast<size_t>(tier) - 1; }

    std::shared_ptr<EntitySeries> FindSeries(const std::string& entity_id) const;

    RetentionPolicy retention_;

    mutable std::mutex holds_mutex_;
    std::array<std::optional<Timestamp>, 4> holds_;

    mutable std::mutex entities_mutex_;
    std::unordered_map<std::string, std::shared_ptr<EntitySeries>> entities_;
};

}  // namespace kpiwatch::engine
