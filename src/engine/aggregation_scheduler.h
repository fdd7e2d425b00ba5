#pragma once

/// @file aggregation_scheduler.h
/// @brief Rollup of finer tiers into hourly, daily and weekly buckets
///
/// Tier chain: realtime -> hourly -> daily -> weekly. Each run aggregates
/// every closed window from the first uncommitted one up to `now`, writing
/// one bucket per (entity, metric) into the target tier, then purges the
/// source and target tiers. A failed window stays pending and is retried
/// first on the next run; until then the store holds its source records
/// back from purge. Purge of everything else runs whether or not the
/// aggregation succeeded.
///
/// A coarser window is aggregated only once every finer window inside it
/// has committed. Windows whose buckets would already be past the target
/// tier's horizon are not caught up.
///
/// Windows are aligned to UTC: hours, days, and ISO weeks starting Monday.

#include <array>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <absl/status/status.h>

#include "common/periodic_scheduler.h"
#include "engine/metric_store.h"
#include "engine/types.h"

namespace kpiwatch::engine {

/// @brief Job state of one tier
///
/// Idle -> Aggregating -> Committed on success; a failed run returns to
/// Idle. Committed lasts until the next run starts.
enum class AggregationState {
    kIdle,
    kAggregating,
    kCommitted
};

std::string AggregationStateToString(AggregationState state);

/// @brief Observable status of one tier's aggregation job
struct TierStatus {
    Tier tier = Tier::kHourly;
    AggregationState state = AggregationState::kIdle;

    /// Most recently committed window
    std::optional<TimeRange> last_committed_window;

    /// Start of the first window not yet committed; unset before the first run
    std::optional<Timestamp> pending_from;

    uint64_t runs = 0;
    uint64_t buckets_written = 0;       ///< Over all runs
    uint64_t consecutive_failures = 0;
    uint64_t records_purged = 0;        ///< Over all runs, both tiers
    std::string last_error;
};

/// @brief Runs the per-tier rollup jobs against a MetricStore
class AggregationScheduler {
public:
    explicit AggregationScheduler(MetricStore& store);

    AggregationScheduler(const AggregationScheduler&) = delete;
    AggregationScheduler& operator=(const AggregationScheduler&) = delete;

    /// @brief Aggregate the pending and newly closed windows of `target`
    ///
    /// The first run only aggregates the window that most recently closed.
    /// Windows are processed oldest first; the first failing window stops
    /// the run and becomes the start of the next one.
    /// @return AggregationFailure if any entity could not be rolled up
    absl::Status RunTier(Tier target, Timestamp now);

    TierStatus GetStatus(Tier target) const;

    /// @brief Status of the hourly, daily and weekly jobs
    std::vector<TierStatus> GetAllStatus() const;

    // =========================================================================
    // Window arithmetic
    // =========================================================================

    /// @brief Length of one window of a tier
    static std::chrono::milliseconds Period(Tier tier);

    /// @brief Tier whose records feed `target`
    static Tier SourceTier(Tier target);

    /// @brief Start of the window containing `ts`
    static Timestamp AlignDown(Tier tier, Timestamp ts);

    /// @brief First window boundary strictly after `ts`
    static Timestamp NextBoundary(Tier tier, Timestamp ts);

    /// @brief The most recent complete window before `now`
    static TimeRange ClosedWindow(Tier tier, Timestamp now);

    /// @brief Firing schedule for a tier's job
    ///
    /// Fires just after each boundary; coarser tiers wait a little longer so
    /// the finer tier has committed the same boundary first.
    static PeriodicScheduler::NextFireFn FireSchedule(Tier tier);

private:
    struct Job {
        std::mutex run_mutex;  ///< Serializes runs of one tier
        mutable std::mutex status_mutex;
        TierStatus status;
    };

    Job& JobFor(Tier target);
    const Job& JobFor(Tier target) const;

    /// @brief Roll one window of every entity into `target`
    /// @return One message per failed entity or bucket
    std::vector<std::string> AggregateWindow(Tier source, Tier target, TimeRange window,
                                             uint64_t& written);

    MetricStore& store_;
    std::array<Job, 3> jobs_;
};

}  // namespace kpiwatch::engine
