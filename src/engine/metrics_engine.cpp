/// @file metrics_engine.cpp
/// @brief Metrics engine facade implementation

#include "engine/metrics_engine.h"

#include <algorithm>
#include <chrono>
#include <future>
#include <utility>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"

namespace kpiwatch::engine {

MetricsEngine::MetricsEngine(EngineConfig config)
    : config_(std::move(config)),
      samples_recorded_(registry_.GetCounter("kpiwatch_samples_recorded_total",
                                             "Samples accepted by RecordSample")),
      samples_rejected_(registry_.GetCounter("kpiwatch_samples_rejected_total",
                                             "Samples rejected by RecordSample")),
      alerts_emitted_(registry_.GetCounter("kpiwatch_alerts_emitted_total",
                                           "Alerts raised by the monitoring cycle")),
      trend_events_(registry_.GetCounter("kpiwatch_trend_events_total",
                                         "Trend changes published")),
      monitoring_cycles_(registry_.GetCounter("kpiwatch_monitoring_cycles_total",
                                              "Completed monitoring cycles")),
      aggregation_failures_(registry_.GetCounter("kpiwatch_aggregation_failures_total",
                                                 "Failed aggregation runs")),
      records_purged_(registry_.GetCounter("kpiwatch_records_purged_total",
                                           "Records and alerts removed by retention sweeps")),
      entities_gauge_(registry_.GetGauge("kpiwatch_entities", "Registered entities")),
      monitoring_duration_(registry_.GetHistogram("kpiwatch_monitoring_cycle_seconds",
                                                  "Monitoring cycle duration")),
      store_(config_.retention),
      alerts_(config_.metrics, baselines_, config_.alert_thresholds, config_.retention.alerts),
      scoring_(config_.metrics),
      trends_(config_.trend_window_size, config_.trend_emit_epsilon),
      aggregation_(store_),
      dispatcher_(config_.dispatch_queue_capacity),
      pool_(config_.worker_threads) {
    // Events published by directly driven cycles are delivered before Start()
    auto status = dispatcher_.Start();
    if (!status.ok()) {
        KPIWATCH_LOG_ERROR("Failed to start event dispatcher: {}", std::string(status.message()));
    }
}

MetricsEngine::~MetricsEngine() {
    Stop();
    dispatcher_.Stop();
}

absl::Status MetricsEngine::Initialize() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (initialized_) {
        return absl::OkStatus();
    }

    KPIWATCH_RETURN_IF_ERROR(config_.Validate());
    for (const auto& entity : config_.entities) {
        KPIWATCH_RETURN_IF_ERROR(RegisterEntity(entity));
    }

    initialized_ = true;
    KPIWATCH_LOG_INFO("Metrics engine initialized with {} entities", entities_.Size());
    return absl::OkStatus();
}

// =============================================================================
// Entities
// =============================================================================

absl::Status MetricsEngine::RegisterEntity(MonitoredEntity entity) {
    std::string id = entity.id;
    KPIWATCH_RETURN_IF_ERROR(entities_.Register(std::move(entity)));
    store_.AddEntity(id);
    entities_gauge_.Set(static_cast<double>(entities_.Size()));
    return absl::OkStatus();
}

absl::Status MetricsEngine::RegisterEntity(const std::string& id,
                                           EntityKind kind,
                                           std::unordered_map<std::string, double> weights,
                                           std::unordered_map<std::string, double> targets) {
    MonitoredEntity entity;
    entity.id = id;
    entity.kind = kind;
    entity.weights = std::move(weights);
    entity.targets = std::move(targets);
    return RegisterEntity(std::move(entity));
}

absl::Status MetricsEngine::UpdateEntity(MonitoredEntity entity) {
    return entities_.Update(std::move(entity));
}

absl::Status MetricsEngine::DeregisterEntity(const std::string& id) {
    KPIWATCH_RETURN_IF_ERROR(entities_.Deregister(id));

    // Wait out a cycle that is still working on this entity
    auto cycle_lock = EntityCycleLock(id);
    std::lock_guard<std::mutex> lock(*cycle_lock);

    store_.RemoveEntity(id);
    baselines_.Forget(id);
    trends_.Forget(id);
    {
        std::lock_guard<std::mutex> locks_guard(cycle_locks_mutex_);
        cycle_locks_.erase(id);
    }

    entities_gauge_.Set(static_cast<double>(entities_.Size()));
    KPIWATCH_LOG_INFO("Deregistered entity '{}'", id);
    return absl::OkStatus();
}

absl::StatusOr<MonitoredEntity> MetricsEngine::GetEntity(const std::string& id) const {
    return entities_.Get(id);
}

std::vector<MonitoredEntity> MetricsEngine::ListEntities() const {
    return entities_.List();
}

// =============================================================================
// Ingestion
// =============================================================================

absl::Status MetricsEngine::RecordSample(const std::string& entity_id,
                                         const std::string& metric,
                                         double value,
                                         Timestamp ts) {
    return RecordSample(MetricSample{entity_id, metric, value, ts});
}

absl::Status MetricsEngine::RecordSample(const MetricSample& sample) {
    if (!entities_.Contains(sample.entity_id)) {
        samples_rejected_.Increment();
        return InvalidEntityError(sample.entity_id);
    }

    // Single writer per entity; DeregisterEntity may have run since the check
    auto cycle_lock = EntityCycleLock(sample.entity_id);
    std::lock_guard<std::mutex> lock(*cycle_lock);
    if (!entities_.Contains(sample.entity_id)) {
        samples_rejected_.Increment();
        return InvalidEntityError(sample.entity_id);
    }

    auto status = store_.RecordSample(sample);
    if (!status.ok()) {
        samples_rejected_.Increment();
        return status;
    }

    baselines_.EstablishBaseline(sample.entity_id, sample.metric_name, sample.value,
                                 sample.timestamp);
    samples_recorded_.Increment();
    return absl::OkStatus();
}

absl::Status MetricsEngine::ResetBaseline(const std::string& entity_id,
                                          const std::string& metric,
                                          double value,
                                          Timestamp ts) {
    if (!entities_.Contains(entity_id)) {
        return InvalidEntityError(entity_id);
    }
    auto cycle_lock = EntityCycleLock(entity_id);
    std::lock_guard<std::mutex> lock(*cycle_lock);
    if (!entities_.Contains(entity_id)) {
        return InvalidEntityError(entity_id);
    }
    baselines_.EstablishBaseline(entity_id, metric, value, ts, /*force=*/true);
    return absl::OkStatus();
}

std::optional<Baseline> MetricsEngine::GetBaseline(const std::string& entity_id,
                                                   const std::string& metric) const {
    return baselines_.GetBaseline(entity_id, metric);
}

// =============================================================================
// Subscriptions
// =============================================================================

SubscriptionId MetricsEngine::Subscribe(AlertHandler handler) {
    return dispatcher_.Subscribe(std::move(handler));
}

SubscriptionId MetricsEngine::Subscribe(TrendHandler handler) {
    return dispatcher_.Subscribe(std::move(handler));
}

bool MetricsEngine::Unsubscribe(SubscriptionId id) {
    return dispatcher_.Unsubscribe(id);
}

void MetricsEngine::FlushEvents() {
    dispatcher_.Flush();
}

// =============================================================================
// Queries
// =============================================================================

absl::StatusOr<std::vector<AggregatedBucket>> MetricsEngine::Query(
    const std::string& entity_id,
    const std::string& metric,
    Tier tier,
    TimeRange range) const {
    return store_.Query(entity_id, metric, tier, range);
}

absl::StatusOr<ScoreBreakdown> MetricsEngine::CurrentBreakdown(
    const std::string& entity_id) const {
    KPIWATCH_ASSIGN_OR_RETURN(MonitoredEntity entity, entities_.Get(entity_id));
    KPIWATCH_ASSIGN_OR_RETURN(auto values, store_.LatestValues(entity_id));
    return scoring_.Breakdown(entity, WeightedValues(entity, std::move(values)));
}

absl::StatusOr<double> MetricsEngine::CurrentScore(const std::string& entity_id) const {
    KPIWATCH_ASSIGN_OR_RETURN(ScoreBreakdown breakdown, CurrentBreakdown(entity_id));
    return breakdown.score;
}

absl::StatusOr<TrendResult> MetricsEngine::GetTrend(const std::string& entity_id) const {
    if (!entities_.Contains(entity_id)) {
        return InvalidEntityError(entity_id);
    }
    return trends_.Analyze(entity_id);
}

absl::StatusOr<KpiTrendReport> MetricsEngine::AnalyzeMetricTrends(
    const std::string& entity_id, Timestamp now) const {
    KPIWATCH_ASSIGN_OR_RETURN(MonitoredEntity entity, entities_.Get(entity_id));
    KPIWATCH_ASSIGN_OR_RETURN(auto metrics, store_.ListMetrics(entity_id));
    std::sort(metrics.begin(), metrics.end());

    KpiTrendReport report;
    report.entity_id = entity_id;
    report.analyzed_at = now;

    const TimeRange range{now - config_.retention.Horizon(Tier::kRealtime),
                          now + std::chrono::milliseconds(1)};
    std::vector<std::pair<double, TrendResult>> weighted;
    for (const auto& metric : metrics) {
        KPIWATCH_ASSIGN_OR_RETURN(auto samples, store_.QuerySamples(entity_id, metric, range));
        size_t skip = samples.size() > config_.trend_window_size
                          ? samples.size() - config_.trend_window_size
                          : 0;

        std::vector<double> normalized;
        for (size_t i = skip; i < samples.size(); ++i) {
            normalized.push_back(scoring_.Normalize(entity, metric, samples[i].value));
        }

        MetricTrend trend;
        trend.metric_name = metric;
        auto weight = entity.weights.find(metric);
        if (weight != entity.weights.end()) {
            trend.weight = weight->second;
        }
        trend.result = TrendAnalyzer::Regress(normalized);
        trend.result.entity_id = entity_id;

        weighted.emplace_back(trend.weight, trend.result);
        report.metrics.push_back(std::move(trend));
    }

    report.overall = TrendAnalyzer::Combine(weighted);
    report.overall.entity_id = entity_id;
    return report;
}

std::vector<Alert> MetricsEngine::ListAlerts(const AlertFilter& filter) const {
    return alerts_.ListAlerts(filter);
}

absl::Status MetricsEngine::AcknowledgeAlert(const std::string& alert_id) {
    return alerts_.Acknowledge(alert_id);
}

absl::StatusOr<ImprovementReport> MetricsEngine::MeasureImprovement(
    const std::string& entity_id, Timestamp now) const {
    KPIWATCH_ASSIGN_OR_RETURN(MonitoredEntity entity, entities_.Get(entity_id));
    KPIWATCH_ASSIGN_OR_RETURN(auto values, store_.LatestValues(entity_id));

    ImprovementReport report;
    report.entity_id = entity_id;
    report.measured_at = now;

    double weighted_sum = 0.0;
    double weight_total = 0.0;
    for (const auto& baseline : baselines_.GetBaselines(entity_id)) {
        auto current = values.find(baseline.metric_name);
        if (current == values.end() || baseline.value == 0.0) {
            continue;
        }

        MetricImprovement item;
        item.metric_name = baseline.metric_name;
        item.baseline = baseline.value;
        item.current = current->second;
        // Opposite sign of the alerting deviation: positive is better
        item.improvement_pct = -AlertEngine::ComputeDeviation(
            config_.metrics.PolarityOf(baseline.metric_name), baseline.value,
            current->second) * 100.0;

        auto weight = entity.weights.find(baseline.metric_name);
        if (weight != entity.weights.end()) {
            weighted_sum += weight->second * item.improvement_pct;
            weight_total += weight->second;
        }
        report.metrics.push_back(std::move(item));
    }

    if (report.metrics.empty()) {
        return MakeError(ErrorCode::kMissingBaseline,
                         absl::StrCat("No baselined metrics with samples for ", entity_id));
    }
    if (weight_total > 0.0) {
        report.overall_pct = weighted_sum / weight_total;
    }
    return report;
}

GlobalSnapshot MetricsEngine::GetGlobalSnapshot(Timestamp now) const {
    GlobalSnapshot snapshot;
    snapshot.taken_at = now;

    std::map<std::string, std::pair<double, size_t>> metric_totals;
    double score_total = 0.0;

    for (const auto& entity : entities_.List()) {
        snapshot.entity_count++;

        auto values = store_.LatestValues(entity.id);
        if (!values.ok()) {
            // Deregistered since List()
            continue;
        }
        for (const auto& [metric, value] : *values) {
            auto& total = metric_totals[metric];
            total.first += value;
            total.second++;
        }

        auto score = scoring_.Score(entity, WeightedValues(entity, *values));
        if (score.ok()) {
            score_total += *score;
            snapshot.scored_entities++;
        }
    }

    for (const auto& [metric, total] : metric_totals) {
        snapshot.metric_means[metric] = total.first / static_cast<double>(total.second);
    }
    if (snapshot.scored_entities > 0) {
        snapshot.mean_score = score_total / static_cast<double>(snapshot.scored_entities);
    }
    snapshot.active_alerts = alerts_.ActiveAlertCount();
    return snapshot;
}

EngineStats MetricsEngine::GetStats() const {
    EngineStats stats;
    stats.running = running_.load();
    stats.entities = entities_.Size();
    stats.baselines = baselines_.Count();

    stats.realtime_records = store_.RecordCount(Tier::kRealtime);
    stats.hourly_records = store_.RecordCount(Tier::kHourly);
    stats.daily_records = store_.RecordCount(Tier::kDaily);
    stats.weekly_records = store_.RecordCount(Tier::kWeekly);

    stats.alerts_retained = alerts_.AlertCount();
    stats.active_alerts = alerts_.ActiveAlertCount();

    DispatcherStats dispatch = dispatcher_.GetStats();
    stats.subscribers = dispatch.subscribers;
    stats.events_dropped = dispatch.dropped;

    stats.samples_recorded = samples_recorded_.Value();
    stats.samples_rejected = samples_rejected_.Value();
    stats.alerts_emitted = alerts_emitted_.Value();
    stats.trend_events = trend_events_.Value();
    stats.monitoring_cycles = monitoring_cycles_.Value();

    stats.aggregation = aggregation_.GetAllStatus();
    stats.instruments = registry_.Snapshot();
    return stats;
}

std::string MetricsEngine::ExportMetrics() const {
    return registry_.ExportText();
}

// =============================================================================
// Cycles
// =============================================================================

std::shared_ptr<std::mutex> MetricsEngine::EntityCycleLock(const std::string& entity_id) {
    std::lock_guard<std::mutex> lock(cycle_locks_mutex_);
    auto& entry = cycle_locks_[entity_id];
    if (!entry) {
        entry = std::make_shared<std::mutex>();
    }
    return entry;
}

std::unordered_map<std::string, double> MetricsEngine::WeightedValues(
    const MonitoredEntity& entity,
    std::unordered_map<std::string, double> values) const {
    for (const auto& metric : ScoringEngine::UnweightedMetrics(entity, values)) {
        KPIWATCH_LOG_DEBUG("Scoring omits {}: {}", metric,
                           MissingWeightError(entity.id, metric).message());
        values.erase(metric);
    }
    return values;
}

MetricsEngine::EntityCycleResult MetricsEngine::RunEntityCycle(const MonitoredEntity& entity,
                                                               Timestamp now) {
    EntityCycleResult result;
    if (stopping_.load()) {
        return result;
    }

    auto cycle_lock = EntityCycleLock(entity.id);
    std::lock_guard<std::mutex> lock(*cycle_lock);
    if (!entities_.Contains(entity.id)) {
        return result;
    }

    auto values = store_.LatestValues(entity.id);
    if (!values.ok()) {
        KPIWATCH_LOG_DEBUG("Skipping {}: {}", entity.id, std::string(values.status().message()));
        return result;
    }

    std::map<std::string, double> ordered(values->begin(), values->end());
    for (const auto& [metric, value] : ordered) {
        auto alert = alerts_.Evaluate(entity.id, metric, value, now);
        if (!alert.ok()) {
            KPIWATCH_LOG_DEBUG("Alerting skipped for {}/{}: {}", entity.id, metric,
                               alert.status().message());
            result.skipped++;
            continue;
        }
        if (alert->has_value()) {
            dispatcher_.Publish(**alert);
            alerts_emitted_.Increment();
            result.alerts++;
        }
    }

    auto score = scoring_.Score(entity, WeightedValues(entity, *std::move(values)));
    if (!score.ok()) {
        KPIWATCH_LOG_DEBUG("Scoring skipped for {}: {}", entity.id, std::string(score.status().message()));
        return result;
    }
    trends_.RecordScore(entity.id, *score, now);
    result.scored = true;
    return result;
}

MonitoringReport MetricsEngine::RunMonitoringCycle(Timestamp now) {
    ScopedTimer timer(monitoring_duration_);
    MonitoringReport report;

    std::vector<std::future<EntityCycleResult>> pending;
    for (const auto& entity : entities_.List()) {
        pending.push_back(pool_.Submit([this, entity, now] {
            return RunEntityCycle(entity, now);
        }));
    }

    for (auto& future : pending) {
        EntityCycleResult result = future.get();
        report.entities_evaluated++;
        report.alerts_emitted += result.alerts;
        report.metrics_skipped += result.skipped;
        if (result.scored) {
            report.scores_recorded++;
        }
    }

    monitoring_cycles_.Increment();
    KPIWATCH_LOG_DEBUG("Monitoring cycle: {} entities, {} alerts, {} scores",
                       report.entities_evaluated, report.alerts_emitted,
                       report.scores_recorded);
    return report;
}

size_t MetricsEngine::RunTrendCycle(Timestamp now) {
    size_t published = 0;
    for (const auto& entity : entities_.List()) {
        if (stopping_.load()) {
            break;
        }

        auto cycle_lock = EntityCycleLock(entity.id);
        std::lock_guard<std::mutex> lock(*cycle_lock);
        if (!entities_.Contains(entity.id)) {
            continue;
        }

        auto event = trends_.Evaluate(entity.id, now);
        if (event) {
            dispatcher_.Publish(*event);
            trend_events_.Increment();
            published++;
        }
    }
    return published;
}

size_t MetricsEngine::RunRetentionSweep(Timestamp now) {
    size_t removed = 0;
    for (Tier tier : kAllTiers) {
        removed += store_.Purge(tier, now);
    }
    removed += alerts_.PurgeAlerts(now);

    records_purged_.Increment(removed);
    if (removed > 0) {
        KPIWATCH_LOG_DEBUG("Retention sweep removed {} records", removed);
    }
    return removed;
}

absl::Status MetricsEngine::RunAggregation(Tier tier, Timestamp now) {
    auto status = aggregation_.RunTier(tier, now);
    if (!status.ok()) {
        aggregation_failures_.Increment();
    }
    return status;
}

// =============================================================================
// Lifecycle
// =============================================================================

absl::Status MetricsEngine::Start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!initialized_) {
        return absl::FailedPreconditionError("Engine not initialized");
    }
    if (running_.load()) {
        return absl::OkStatus();
    }

    KPIWATCH_RETURN_IF_ERROR(dispatcher_.Start());

    auto scheduler = std::make_unique<PeriodicScheduler>();
    KPIWATCH_RETURN_IF_ERROR(scheduler->AddTask(
        "monitoring", config_.update_interval,
        [this](Timestamp now) { RunMonitoringCycle(now); }));
    KPIWATCH_RETURN_IF_ERROR(scheduler->AddTask(
        "trend_analysis", config_.trend_interval,
        [this](Timestamp now) { RunTrendCycle(now); }));
    KPIWATCH_RETURN_IF_ERROR(scheduler->AddTask(
        "retention_sweep", config_.retention_sweep_interval,
        [this](Timestamp now) { RunRetentionSweep(now); }));

    for (Tier tier : {Tier::kHourly, Tier::kDaily, Tier::kWeekly}) {
        KPIWATCH_RETURN_IF_ERROR(scheduler->AddAlignedTask(
            absl::StrCat("aggregate_", TierToString(tier)),
            AggregationScheduler::FireSchedule(tier),
            [this, tier](Timestamp now) {
                auto status = RunAggregation(tier, now);
                if (!status.ok()) {
                    KPIWATCH_LOG_WARN("Scheduled {} aggregation failed, retrying next window: {}",
                                      TierToString(tier), std::string(status.message()));
                }
            }));
    }

    KPIWATCH_RETURN_IF_ERROR(scheduler->Start());
    scheduler_ = std::move(scheduler);
    running_.store(true);

    KPIWATCH_LOG_INFO("Metrics engine started (update every {} ms, trend every {} ms)",
                      config_.update_interval.count(), config_.trend_interval.count());
    return absl::OkStatus();
}

void MetricsEngine::Stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!running_.load()) {
        return;
    }

    stopping_.store(true);
    if (scheduler_) {
        // Joins the timer threads; a cycle already running completes first
        scheduler_->Stop();
        scheduler_.reset();
    }
    dispatcher_.Stop();

    running_.store(false);
    stopping_.store(false);
    KPIWATCH_LOG_INFO("Metrics engine stopped");
}

}  // namespace kpiwatch::engine
