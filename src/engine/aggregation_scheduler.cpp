/// @file aggregation_scheduler.cpp
/// @brief Aggregation scheduler implementation

#include "engine/aggregation_scheduler.h"

#include <algorithm>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "common/error.h"
#include "common/logging.h"

namespace kpiwatch::engine {

namespace {

constexpr int64_t kHourMs = 3600 * 1000LL;
constexpr int64_t kDayMs = 24 * kHourMs;
constexpr int64_t kWeekMs = 7 * kDayMs;

/// 1970-01-01 was a Thursday; ISO weeks start four days later
constexpr int64_t kWeekOriginMs = 4 * kDayMs;

/// Delay after a boundary per step down the tier chain
constexpr std::chrono::seconds kSettleDelay(30);

int64_t FloorTo(int64_t value, int64_t period, int64_t origin = 0) {
    int64_t shifted = value - origin;
    int64_t q = shifted / period;
    if (shifted % period < 0) {
        --q;
    }
    return q * period + origin;
}

}  // namespace

std::string AggregationStateToString(AggregationState state) {
    switch (state) {
        case AggregationState::kIdle: return "idle";
        case AggregationState::kAggregating: return "aggregating";
        case AggregationState::kCommitted: return "committed";
    }
    return "idle";
}

AggregationScheduler::AggregationScheduler(MetricStore& store)
    : store_(store) {
    jobs_[0].status.tier = Tier::kHourly;
    jobs_[1].status.tier = Tier::kDaily;
    jobs_[2].status.tier = Tier::kWeekly;
}

AggregationScheduler::Job& AggregationScheduler::JobFor(Tier target) {
    return jobs_[static_cast<size_t>(target) - 1];
}

const AggregationScheduler::Job& AggregationScheduler::JobFor(Tier target) const {
    return jobs_[static_cast<size_t>(target) - 1];
}

// =============================================================================
// Window arithmetic
// =============================================================================

std::chrono::milliseconds AggregationScheduler::Period(Tier tier) {
    switch (tier) {
        case Tier::kRealtime: return std::chrono::milliseconds(0);
        case Tier::kHourly: return std::chrono::milliseconds(kHourMs);
        case Tier::kDaily: return std::chrono::milliseconds(kDayMs);
        case Tier::kWeekly: return std::chrono::milliseconds(kWeekMs);
    }
    return std::chrono::milliseconds(0);
}

Tier AggregationScheduler::SourceTier(Tier target) {
    switch (target) {
        case Tier::kHourly: return Tier::kRealtime;
        case Tier::kDaily: return Tier::kHourly;
        case Tier::kWeekly: return Tier::kDaily;
        case Tier::kRealtime: break;
    }
    return Tier::kRealtime;
}

Timestamp AggregationScheduler::AlignDown(Tier tier, Timestamp ts) {
    int64_t ms = ToUnixMillis(ts);
    switch (tier) {
        case Tier::kRealtime: return ts;
        case Tier::kHourly: return FromUnixMillis(FloorTo(ms, kHourMs));
        case Tier::kDaily: return FromUnixMillis(FloorTo(ms, kDayMs));
        case Tier::kWeekly: return FromUnixMillis(FloorTo(ms, kWeekMs, kWeekOriginMs));
    }
    return ts;
}

Timestamp AggregationScheduler::NextBoundary(Tier tier, Timestamp ts) {
    return AlignDown(tier, ts) + Period(tier);
}

TimeRange AggregationScheduler::ClosedWindow(Tier tier, Timestamp now) {
    Timestamp end = AlignDown(tier, now);
    return {end - Period(tier), end};
}

PeriodicScheduler::NextFireFn AggregationScheduler::FireSchedule(Tier tier) {
    const auto delay = kSettleDelay * (static_cast<int>(tier) - 1);
    return [tier, delay](PeriodicScheduler::TimePoint now) {
        return NextBoundary(tier, now - delay) + delay;
    };
}

// =============================================================================
// Jobs
// =============================================================================

std::vector<std::string> AggregationScheduler::AggregateWindow(Tier source, Tier target,
                                                               TimeRange window,
                                                               uint64_t& written) {
    std::vector<std::string> failures;
    for (const auto& entity_id : store_.ListEntities()) {
        auto buckets = store_.ComputeRollup(entity_id, source, target, window);
        if (!buckets.ok()) {
            failures.push_back(absl::StrCat(entity_id, ": ", buckets.status().message()));
            continue;
        }
        for (const auto& bucket : *buckets) {
            auto status = store_.WriteBucket(bucket);
            if (!status.ok()) {
                failures.push_back(absl::StrCat(entity_id, "/", bucket.metric_name, ": ",
                                                status.message()));
                continue;
            }
            ++written;
        }
    }
    return failures;
}

absl::Status AggregationScheduler::RunTier(Tier target, Timestamp now) {
    if (target == Tier::kRealtime) {
        return absl::InvalidArgumentError("The realtime tier is not aggregated");
    }

    const Tier source = SourceTier(target);
    const auto period = Period(target);
    Job& job = JobFor(target);
    std::lock_guard<std::mutex> run_lock(job.run_mutex);

    const TimeRange closed = ClosedWindow(target, now);
    Timestamp from = closed.from;
    {
        std::lock_guard<std::mutex> lock(job.status_mutex);
        job.status.state = AggregationState::kAggregating;
        job.status.runs++;
        if (job.status.pending_from && *job.status.pending_from < closed.from) {
            from = *job.status.pending_from;
        }
    }

    const Timestamp oldest = AlignDown(target, now - store_.Retention().Horizon(target));
    if (from < oldest) {
        KPIWATCH_LOG_WARN("{} aggregation skipping windows before {} ms: past the {} horizon",
                          TierToString(target), ToUnixMillis(oldest), TierToString(target));
        from = std::min(oldest, closed.from);
    }

    // Finer windows still pending hold back the coarser windows containing them
    Timestamp ready_until = closed.to;
    if (source != Tier::kRealtime) {
        auto source_pending = GetStatus(source).pending_from;
        if (source_pending && *source_pending < ready_until) {
            ready_until = *source_pending;
        }
    }

    std::vector<std::string> failures;
    std::optional<TimeRange> committed;
    uint64_t written = 0;
    Timestamp next = from;
    for (; next + period <= ready_until; next += period) {
        TimeRange window{next, next + period};
        failures = AggregateWindow(source, target, window, written);
        if (!failures.empty()) {
            break;
        }
        committed = window;
    }
    if (next + period <= closed.to && failures.empty()) {
        KPIWATCH_LOG_DEBUG("{} aggregation waiting for {} windows from {} ms",
                           TierToString(target), TierToString(source), ToUnixMillis(next));
    }

    // Purge is independent of the rollup outcome, apart from the pending windows
    store_.HoldFrom(source, next);
    size_t purged = store_.Purge(source, now) + store_.Purge(target, now);

    std::lock_guard<std::mutex> lock(job.status_mutex);
    job.status.buckets_written += written;
    job.status.records_purged += purged;
    job.status.pending_from = next;
    if (committed) {
        job.status.last_committed_window = committed;
    }

    if (!failures.empty()) {
        job.status.state = AggregationState::kIdle;
        job.status.consecutive_failures++;
        job.status.last_error = absl::StrJoin(failures, "; ");
        KPIWATCH_LOG_WARN("{} aggregation of the window at {} ms failed for {} records "
                          "(attempt {}): {}",
                          TierToString(target), ToUnixMillis(next), failures.size(),
                          job.status.consecutive_failures, job.status.last_error);
        return MakeError(ErrorCode::kAggregationFailure,
                         absl::StrCat(TierToString(target), " aggregation failed: ",
                                      job.status.last_error));
    }

    job.status.state = committed ? AggregationState::kCommitted : AggregationState::kIdle;
    job.status.consecutive_failures = 0;
    job.status.last_error.clear();
    KPIWATCH_LOG_DEBUG("{} aggregation committed {} buckets", TierToString(target), written);
    return absl::OkStatus();
}

TierStatus AggregationScheduler::GetStatus(Tier target) const {
    if (target == Tier::kRealtime) {
        TierStatus status;
        status.tier = Tier::kRealtime;
        return status;
    }
    const Job& job = JobFor(target);
    std::lock_guard<std::mutex> lock(job.status_mutex);
    return job.status;
}

std::vector<TierStatus> AggregationScheduler::GetAllStatus() const {
    return {GetStatus(Tier::kHourly), GetStatus(Tier::kDaily), GetStatus(Tier::kWeekly)};
}

}  // namespace kpiwatch::engine
