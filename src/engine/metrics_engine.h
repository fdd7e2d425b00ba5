#pragma once

/// @file metrics_engine.h
/// @brief Facade owning the metrics, alerting and trend pipeline
///
/// Data flow:
/// - RecordSample stores a raw sample and establishes the baseline on first
///   observation of a metric
/// - the monitoring cycle evaluates every entity's latest values against
///   their baselines, publishes alerts and records a composite score
/// - the trend cycle regresses recent scores and publishes trend changes
/// - aggregation jobs roll raw samples into hourly, daily and weekly buckets
/// - the retention sweep purges every tier and the alert index
///
/// Every cycle can be driven by the internal timers (Start/Stop) or called
/// directly with an explicit time.

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "common/metrics.h"
#include "common/periodic_scheduler.h"
#include "common/thread_pool.h"
#include "engine/aggregation_scheduler.h"
#include "engine/alert_engine.h"
#include "engine/baseline_manager.h"
#include "engine/engine_config.h"
#include "engine/entity_registry.h"
#include "engine/event_dispatcher.h"
#include "engine/metric_catalog.h"
#include "engine/metric_store.h"
#include "engine/scoring_engine.h"
#include "engine/trend_analyzer.h"
#include "engine/types.h"

namespace kpiwatch::engine {

/// @brief Change of one metric relative to its baseline
struct MetricImprovement {
    std::string metric_name;
    double baseline = 0.0;
    double current = 0.0;

    /// Percent change, sign-adjusted so that positive means better
    double improvement_pct = 0.0;
};

/// @brief Improvement of an entity over its baselines
struct ImprovementReport {
    std::string entity_id;
    Timestamp measured_at;
    std::vector<MetricImprovement> metrics;  ///< Ordered by metric name

    /// Weight-averaged improvement over the metrics above
    double overall_pct = 0.0;
};

/// @brief Trend of one metric over its most recent samples
struct MetricTrend {
    std::string metric_name;
    double weight = 0.0;  ///< Zero for metrics without a weight
    TrendResult result;   ///< Regressed on normalized values, so improving is always better
};

/// @brief Per-metric trends and their weighted rollup for one entity
struct KpiTrendReport {
    std::string entity_id;
    Timestamp analyzed_at;
    std::vector<MetricTrend> metrics;  ///< Ordered by metric name
    TrendResult overall;
};

/// @brief Rollup of all entities' latest state
struct GlobalSnapshot {
    Timestamp taken_at;
    size_t entity_count = 0;
    size_t scored_entities = 0;
    double mean_score = 0.0;

    /// Mean of each metric's latest value over the entities reporting it
    std::map<std::string, double> metric_means;

    size_t active_alerts = 0;
};

/// @brief Outcome of one monitoring cycle
struct MonitoringReport {
    size_t entities_evaluated = 0;
    size_t alerts_emitted = 0;
    size_t scores_recorded = 0;
    size_t metrics_skipped = 0;  ///< No baseline, or a zero baseline
};

/// @brief Engine statistics
struct EngineStats {
    bool running = false;
    size_t entities = 0;
    size_t baselines = 0;

    size_t realtime_records = 0;
    size_t hourly_records = 0;
    size_t daily_records = 0;
    size_t weekly_records = 0;

    size_t alerts_retained = 0;
    size_t active_alerts = 0;
    size_t subscribers = 0;

    uint64_t samples_recorded = 0;
    uint64_t samples_rejected = 0;
    uint64_t alerts_emitted = 0;
    uint64_t trend_events = 0;
    uint64_t monitoring_cycles = 0;
    uint64_t events_dropped = 0;

    std::vector<TierStatus> aggregation;

    /// Every internal instrument by name (see MetricsRegistry::Snapshot)
    std::map<std::string, double> instruments;
};

/// @brief Metrics and alerting engine
///
/// Example:
/// @code
///   auto config = EngineConfig::LoadWithEnv("kpiwatch.yaml");
///   MetricsEngine engine(*config);
///   engine.Initialize();
///   engine.Subscribe(AlertHandler([](const Alert& a) { Page(a); }));
///   engine.Start();
///
///   engine.RecordSample("marketing", "efficiency", 0.82, Now());
///   ...
///   engine.Stop();
/// @endcode
class MetricsEngine {
public:
    explicit MetricsEngine(EngineConfig config = EngineConfig::Default());
    ~MetricsEngine();

    MetricsEngine(const MetricsEngine&) = delete;
    MetricsEngine& operator=(const MetricsEngine&) = delete;

    /// @brief Register the entities listed in the configuration
    absl::Status Initialize();

    // =========================================================================
    // Entities
    // =========================================================================

    absl::Status RegisterEntity(MonitoredEntity entity);
    absl::Status RegisterEntity(const std::string& id,
                                EntityKind kind,
                                std::unordered_map<std::string, double> weights,
                                std::unordered_map<std::string, double> targets = {});

    /// @brief Replace weights and targets (configuration reload)
    absl::Status UpdateEntity(MonitoredEntity entity);

    /// @brief Remove an entity with its samples, baselines and score history
    ///
    /// Alerts already raised stay in the index until they age out.
    absl::Status DeregisterEntity(const std::string& id);

    absl::StatusOr<MonitoredEntity> GetEntity(const std::string& id) const;
    std::vector<MonitoredEntity> ListEntities() const;

    // =========================================================================
    // Ingestion
    // =========================================================================

    /// @brief Record a measurement
    /// @return InvalidEntity if the entity is not registered
    absl::Status RecordSample(const std::string& entity_id,
                              const std::string& metric,
                              double value,
                              Timestamp ts);
    absl::Status RecordSample(const MetricSample& sample);

    /// @brief Replace the baseline of a metric
    absl::Status ResetBaseline(const std::string& entity_id,
                               const std::string& metric,
                               double value,
                               Timestamp ts);

    std::optional<Baseline> GetBaseline(const std::string& entity_id,
                                        const std::string& metric) const;

    // =========================================================================
    // Subscriptions
    // =========================================================================

    SubscriptionId Subscribe(AlertHandler handler);
    SubscriptionId Subscribe(TrendHandler handler);
    bool Unsubscribe(SubscriptionId id);

    /// @brief Wait until every published event has been delivered
    void FlushEvents();

    // =========================================================================
    // Queries
    // =========================================================================

    absl::StatusOr<std::vector<AggregatedBucket>> Query(const std::string& entity_id,
                                                        const std::string& metric,
                                                        Tier tier,
                                                        TimeRange range) const;

    /// @brief Composite score from the entity's latest values
    ///
    /// Metrics without a weight are left out of the score (logged at debug).
    /// @return MissingSample if a weighted metric has no value yet
    absl::StatusOr<double> CurrentScore(const std::string& entity_id) const;

    absl::StatusOr<ScoreBreakdown> CurrentBreakdown(const std::string& entity_id) const;

    /// @brief Trend over the entity's current score window
    absl::StatusOr<TrendResult> GetTrend(const std::string& entity_id) const;

    /// @brief Trend of each metric over its last trend-window samples
    ///
    /// Samples are normalized as for scoring before the regression, so a
    /// falling error rate reads as improving. The overall direction is the
    /// weight-averaged slope of the weighted metrics.
    absl::StatusOr<KpiTrendReport> AnalyzeMetricTrends(const std::string& entity_id,
                                                       Timestamp now) const;

    std::vector<Alert> ListAlerts(const AlertFilter& filter = {}) const;
    absl::Status AcknowledgeAlert(const std::string& alert_id);

    /// @brief Change of each baselined metric relative to its baseline
    absl::StatusOr<ImprovementReport> MeasureImprovement(const std::string& entity_id,
                                                         Timestamp now) const;

    GlobalSnapshot GetGlobalSnapshot(Timestamp now) const;

    EngineStats GetStats() const;

    /// @brief Internal instruments in Prometheus text format
    std::string ExportMetrics() const;

    const EngineConfig& GetConfig() const { return config_; }

    // =========================================================================
    // Cycles
    // =========================================================================

    /// @brief Evaluate alerts and record scores for every entity
    MonitoringReport RunMonitoringCycle(Timestamp now);

    /// @brief Analyze score trends and publish changes
    /// @return Number of trend events published
    size_t RunTrendCycle(Timestamp now);

    /// @brief Purge every tier and the alert index
    /// @return Number of records and alerts removed
    size_t RunRetentionSweep(Timestamp now);

    /// @brief Roll the most recently closed window into `tier`
    absl::Status RunAggregation(Tier tier, Timestamp now);

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// @brief Start the monitoring, trend, retention and aggregation timers
    absl::Status Start();

    /// @brief Stop all timers, let in-flight cycles finish, drain the event queue
    void Stop();

    bool IsRunning() const { return running_.load(); }

private:
    struct EntityCycleResult {
        size_t alerts = 0;
        size_t skipped = 0;
        bool scored = false;
    };

    EntityCycleResult RunEntityCycle(const MonitoredEntity& entity, Timestamp now);

    std::shared_ptr<std::mutex> EntityCycleLock(const std::string& entity_id);

    /// @brief `values` without the metrics the entity has no weight for
    std::unordered_map<std::string, double> WeightedValues(
        const MonitoredEntity& entity,
        std::unordered_map<std::string, double> values) const;

    EngineConfig config_;

    MetricsRegistry registry_;
    Counter& samples_recorded_;
    Counter& samples_rejected_;
    Counter& alerts_emitted_;
    Counter& trend_events_;
    Counter& monitoring_cycles_;
    Counter& aggregation_failures_;
    Counter& records_purged_;
    Gauge& entities_gauge_;
    Histogram& monitoring_duration_;

    EntityRegistry entities_;
    MetricStore store_;
    BaselineManager baselines_;
    AlertEngine alerts_;
    ScoringEngine scoring_;
    TrendAnalyzer trends_;
    AggregationScheduler aggregation_;
    EventDispatcher dispatcher_;

    ThreadPool pool_;
    std::unique_ptr<PeriodicScheduler> scheduler_;

    std::mutex cycle_locks_mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> cycle_locks_;

    std::mutex lifecycle_mutex_;
    bool initialized_ = false;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
};

}  // namespace kpiwatch::engine
