/// @file engine_test.cpp
/// @brief Integration tests for the metrics engine facade

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

#include "common/error.h"
#include "engine/metrics_engine.h"

namespace kpiwatch::engine {
namespace {

using namespace std::chrono_literals;

// Monday 2026-01-05 10:00:00 UTC
const Timestamp kBase = FromUnixMillis(1767607200000);

// =============================================================================
// Fixtures
// =============================================================================

/// @brief Collects delivered events
class EventRecorder {
public:
    AlertHandler OnAlert() {
        return [this](const Alert& alert) {
            std::lock_guard<std::mutex> lock(mutex_);
            alerts_.push_back(alert);
        };
    }

    TrendHandler OnTrend() {
        return [this](const TrendEvent& event) {
            std::lock_guard<std::mutex> lock(mutex_);
            trends_.push_back(event);
        };
    }

    std::vector<Alert> Alerts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return alerts_;
    }

    std::vector<TrendEvent> Trends() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return trends_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<Alert> alerts_;
    std::vector<TrendEvent> trends_;
};

EngineConfig TestConfig() {
    EngineConfig config = EngineConfig::Default();
    config.worker_threads = 2;

    MonitoredEntity marketing;
    marketing.id = "marketing";
    marketing.kind = EntityKind::kTeam;
    marketing.weights = {{"efficiency", 0.5}, {"quality", 0.5}};

    MonitoredEntity workflow;
    workflow.id = "lead_qualification";
    workflow.kind = EntityKind::kWorkflow;
    workflow.weights = {{"efficiency", 0.4}, {"errorRate", 0.3}, {"throughput", 0.3}};
    workflow.targets = {{"throughput", 120.0}};

    config.entities = {marketing, workflow};
    return config;
}

class MetricsEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        engine_ = std::make_unique<MetricsEngine>(TestConfig());
        ASSERT_TRUE(engine_->Initialize().ok());
        engine_->Subscribe(recorder_.OnAlert());
        engine_->Subscribe(recorder_.OnTrend());
    }

    void Record(const std::string& entity, const std::string& metric, double value,
                Timestamp ts) {
        auto status = engine_->RecordSample(entity, metric, value, ts);
        ASSERT_TRUE(status.ok()) << status.message();
    }

    EventRecorder recorder_;
    std::unique_ptr<MetricsEngine> engine_;
};

// =============================================================================
// Ingestion and baselines
// =============================================================================

TEST_F(MetricsEngineTest, ConfiguredEntitiesAreRegistered) {
    auto entities = engine_->ListEntities();
    ASSERT_EQ(entities.size(), 2u);
    EXPECT_EQ(entities[0].id, "lead_qualification");
    EXPECT_EQ(entities[0].kind, EntityKind::kWorkflow);
    EXPECT_EQ(entities[1].id, "marketing");
}

TEST_F(MetricsEngineTest, UnknownEntityIsRejected) {
    auto status = engine_->RecordSample("ghost", "efficiency", 0.5, kBase);
    EXPECT_TRUE(HasErrorCode(status, ErrorCode::kInvalidEntity));

    auto stats = engine_->GetStats();
    EXPECT_EQ(stats.samples_rejected, 1u);
    EXPECT_EQ(stats.samples_recorded, 0u);
}

TEST_F(MetricsEngineTest, FirstSampleEstablishesBaseline) {
    Record("marketing", "efficiency", 0.80, kBase);
    Record("marketing", "efficiency", 0.70, kBase + 1min);

    auto baseline = engine_->GetBaseline("marketing", "efficiency");
    ASSERT_TRUE(baseline.has_value());
    EXPECT_DOUBLE_EQ(baseline->value, 0.80);

    ASSERT_TRUE(engine_->ResetBaseline("marketing", "efficiency", 0.70, kBase + 2min).ok());
    EXPECT_DOUBLE_EQ(engine_->GetBaseline("marketing", "efficiency")->value, 0.70);
}

TEST_F(MetricsEngineTest, QueryRealtimeSamples) {
    Record("marketing", "quality", 0.9, kBase);
    Record("marketing", "quality", 0.8, kBase + 1min);

    auto samples = engine_->Query("marketing", "quality", Tier::kRealtime, TimeRange::All());
    ASSERT_TRUE(samples.ok());
    ASSERT_EQ(samples->size(), 2u);
    EXPECT_DOUBLE_EQ((*samples)[1].mean, 0.8);

    auto reversed = engine_->Query("marketing", "quality", Tier::kRealtime,
                                   {kBase + 5min, kBase - 5min});
    ASSERT_TRUE(reversed.ok());
    EXPECT_TRUE(reversed->empty());

    auto unknown = engine_->Query("ghost", "quality", Tier::kRealtime, TimeRange::All());
    EXPECT_TRUE(HasErrorCode(unknown.status(), ErrorCode::kInvalidEntity));
}

// =============================================================================
// Monitoring cycle
// =============================================================================

TEST_F(MetricsEngineTest, CriticalAlertIsPublished) {
    Record("marketing", "efficiency", 0.80, kBase);
    Record("marketing", "quality", 0.90, kBase);

    auto quiet = engine_->RunMonitoringCycle(kBase + 1min);
    EXPECT_EQ(quiet.entities_evaluated, 2u);
    EXPECT_EQ(quiet.alerts_emitted, 0u);
    EXPECT_EQ(quiet.scores_recorded, 1u);  // the workflow has no samples yet

    Record("marketing", "efficiency", 0.68, kBase + 2min);
    auto report = engine_->RunMonitoringCycle(kBase + 3min);
    EXPECT_EQ(report.alerts_emitted, 1u);
    engine_->FlushEvents();

    auto delivered = recorder_.Alerts();
    ASSERT_EQ(delivered.size(), 1u);
    EXPECT_EQ(delivered[0].entity_id, "marketing");
    EXPECT_EQ(delivered[0].metric_name, "efficiency");
    EXPECT_EQ(delivered[0].severity, Severity::kCritical);
    EXPECT_NEAR(delivered[0].deviation_pct, 15.0, 1e-9);
    EXPECT_EQ(delivered[0].timestamp, kBase + 3min);

    EXPECT_EQ(engine_->ListAlerts().size(), 1u);
    EXPECT_EQ(engine_->GetStats().alerts_emitted, 1u);
}

TEST_F(MetricsEngineTest, LowerIsBetterMetricAlertsOnRise) {
    Record("lead_qualification", "efficiency", 0.9, kBase);
    Record("lead_qualification", "errorRate", 0.02, kBase);
    Record("lead_qualification", "throughput", 60.0, kBase);

    auto score = engine_->CurrentScore("lead_qualification");
    ASSERT_TRUE(score.ok()) << score.status().message();
    EXPECT_NEAR(*score, 0.4 * 0.9 + 0.3 * 0.8 + 0.3 * 0.5, 1e-9);

    Record("lead_qualification", "errorRate", 0.03, kBase + 1min);
    engine_->RunMonitoringCycle(kBase + 2min);
    engine_->FlushEvents();

    auto delivered = recorder_.Alerts();
    ASSERT_EQ(delivered.size(), 1u);
    EXPECT_EQ(delivered[0].metric_name, "errorRate");
    EXPECT_EQ(delivered[0].severity, Severity::kCritical);
    EXPECT_NEAR(delivered[0].deviation_pct, 50.0, 1e-6);
}

TEST_F(MetricsEngineTest, AcknowledgeAlert) {
    Record("marketing", "efficiency", 0.80, kBase);
    Record("marketing", "efficiency", 0.50, kBase + 1min);
    engine_->RunMonitoringCycle(kBase + 2min);

    auto alerts = engine_->ListAlerts();
    ASSERT_EQ(alerts.size(), 1u);
    ASSERT_TRUE(engine_->AcknowledgeAlert(alerts[0].id).ok());

    AlertFilter open;
    open.unacknowledged_only = true;
    EXPECT_TRUE(engine_->ListAlerts(open).empty());
    EXPECT_EQ(engine_->GetStats().active_alerts, 0u);
    EXPECT_TRUE(absl::IsNotFound(engine_->AcknowledgeAlert("missing")));
}

TEST_F(MetricsEngineTest, UnweightedMetricIsLeftOutOfScore) {
    Record("marketing", "efficiency", 0.8, kBase);
    Record("marketing", "quality", 0.9, kBase);
    Record("marketing", "velocity", 10.0, kBase);
    Record("marketing", "velocity", 5.0, kBase + 1min);

    auto report = engine_->RunMonitoringCycle(kBase + 2min);
    EXPECT_EQ(report.scores_recorded, 1u);
    EXPECT_EQ(report.alerts_emitted, 1u);  // velocity still alerts

    auto score = engine_->CurrentScore("marketing");
    ASSERT_TRUE(score.ok()) << score.status().message();
    EXPECT_NEAR(*score, 0.85, 1e-9);

    auto breakdown = engine_->CurrentBreakdown("marketing");
    ASSERT_TRUE(breakdown.ok());
    ASSERT_EQ(breakdown->metrics.size(), 2u);
    EXPECT_EQ(breakdown->metrics[0].metric_name, "efficiency");
    EXPECT_EQ(breakdown->metrics[1].metric_name, "quality");

    // The score window keeps growing, so trend analysis stays alive
    engine_->RunMonitoringCycle(kBase + 3min);
    auto trend = engine_->GetTrend("marketing");
    ASSERT_TRUE(trend.ok());
    EXPECT_EQ(trend->sample_count, 2u);
}

// =============================================================================
// Trends
// =============================================================================

TEST_F(MetricsEngineTest, DecliningScoresPublishTrendChange) {
    Record("marketing", "quality", 0.90, kBase);

    const double efficiencies[] = {0.80, 0.68, 0.60, 0.50};
    Timestamp ts = kBase;
    for (double efficiency : efficiencies) {
        Record("marketing", "efficiency", efficiency, ts);
        engine_->RunMonitoringCycle(ts + 30s);
        ts += 5min;
    }

    auto trend = engine_->GetTrend("marketing");
    ASSERT_TRUE(trend.ok());
    EXPECT_EQ(trend->direction, TrendDirection::kDeclining);
    EXPECT_LT(trend->slope, 0.0);
    EXPECT_EQ(trend->sample_count, 4u);

    EXPECT_EQ(engine_->RunTrendCycle(ts), 1u);
    EXPECT_EQ(engine_->RunTrendCycle(ts + 5min), 0u);
    engine_->FlushEvents();

    auto events = recorder_.Trends();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].entity_id, "marketing");
    EXPECT_EQ(events[0].previous_direction, TrendDirection::kStable);
    EXPECT_EQ(events[0].result.direction, TrendDirection::kDeclining);

    EXPECT_TRUE(HasErrorCode(engine_->GetTrend("ghost").status(), ErrorCode::kInvalidEntity));
}

TEST_F(MetricsEngineTest, MetricTrendsRollUpByWeight) {
    for (int i = 0; i < 4; ++i) {
        Timestamp ts = kBase + std::chrono::minutes(5 * i);
        Record("lead_qualification", "efficiency", 0.60 + 0.02 * i, ts);
        Record("lead_qualification", "errorRate", 0.01 * (i + 1), ts);
        Record("lead_qualification", "throughput", 60.0, ts);
        Record("lead_qualification", "quality", 0.5 + 0.1 * i, ts);
    }

    auto report = engine_->AnalyzeMetricTrends("lead_qualification", kBase + 20min);
    ASSERT_TRUE(report.ok()) << report.status().message();
    ASSERT_EQ(report->metrics.size(), 4u);

    const auto& efficiency = report->metrics[0];
    EXPECT_EQ(efficiency.metric_name, "efficiency");
    EXPECT_DOUBLE_EQ(efficiency.weight, 0.4);
    EXPECT_NEAR(efficiency.result.slope, 0.02, 1e-9);
    EXPECT_EQ(efficiency.result.direction, TrendDirection::kImproving);

    // A rising error rate is a declining KPI
    const auto& error_rate = report->metrics[1];
    EXPECT_EQ(error_rate.metric_name, "errorRate");
    EXPECT_NEAR(error_rate.result.slope, -0.1, 1e-9);
    EXPECT_EQ(error_rate.result.direction, TrendDirection::kDeclining);

    EXPECT_EQ(report->metrics[2].metric_name, "quality");
    EXPECT_DOUBLE_EQ(report->metrics[2].weight, 0.0);
    EXPECT_EQ(report->metrics[2].result.direction, TrendDirection::kImproving);
    EXPECT_EQ(report->metrics[3].result.direction, TrendDirection::kStable);

    // The unweighted improving metric does not pull the rollup up
    EXPECT_NEAR(report->overall.slope, 0.4 * 0.02 + 0.3 * -0.1, 1e-9);
    EXPECT_EQ(report->overall.direction, TrendDirection::kDeclining);
    EXPECT_EQ(report->overall.sample_count, 4u);
    EXPECT_EQ(report->overall.entity_id, "lead_qualification");

    EXPECT_TRUE(HasErrorCode(engine_->AnalyzeMetricTrends("ghost", kBase).status(),
                             ErrorCode::kInvalidEntity));
}

TEST_F(MetricsEngineTest, MetricTrendsUseRecentSamplesOnly) {
    // Falling for ten samples, then rising for the last ten
    for (int i = 0; i < 20; ++i) {
        double value = i < 10 ? 0.9 - 0.05 * i : 0.45 + 0.05 * (i - 10);
        Record("marketing", "efficiency", value, kBase + std::chrono::minutes(i));
    }
    Record("marketing", "quality", 0.8, kBase);

    auto report = engine_->AnalyzeMetricTrends("marketing", kBase + 20min);
    ASSERT_TRUE(report.ok());
    ASSERT_EQ(report->metrics.size(), 2u);
    EXPECT_EQ(report->metrics[0].result.sample_count, 10u);
    EXPECT_EQ(report->metrics[0].result.direction, TrendDirection::kImproving);

    // One quality sample is too few to contribute
    EXPECT_EQ(report->metrics[1].result.sample_count, 1u);
    EXPECT_NEAR(report->overall.slope, report->metrics[0].result.slope, 1e-12);

    // Samples beyond the realtime horizon are not considered
    auto later = engine_->AnalyzeMetricTrends("marketing", kBase + 3h);
    ASSERT_TRUE(later.ok());
    EXPECT_EQ(later->metrics[0].result.sample_count, 0u);
    EXPECT_EQ(later->overall.direction, TrendDirection::kStable);
}

// =============================================================================
// Reports
// =============================================================================

TEST_F(MetricsEngineTest, MeasureImprovement) {
    Record("marketing", "efficiency", 0.80, kBase);
    Record("marketing", "quality", 0.90, kBase);
    Record("marketing", "efficiency", 0.50, kBase + 1h);

    auto report = engine_->MeasureImprovement("marketing", kBase + 2h);
    ASSERT_TRUE(report.ok()) << report.status().message();
    ASSERT_EQ(report->metrics.size(), 2u);
    EXPECT_EQ(report->metrics[0].metric_name, "efficiency");
    EXPECT_NEAR(report->metrics[0].improvement_pct, -37.5, 1e-9);
    EXPECT_NEAR(report->metrics[1].improvement_pct, 0.0, 1e-9);
    EXPECT_NEAR(report->overall_pct, -18.75, 1e-9);

    auto empty = engine_->MeasureImprovement("lead_qualification", kBase);
    EXPECT_TRUE(HasErrorCode(empty.status(), ErrorCode::kMissingBaseline));
}

TEST_F(MetricsEngineTest, GlobalSnapshot) {
    Record("marketing", "efficiency", 0.8, kBase);
    Record("marketing", "quality", 0.6, kBase);
    Record("lead_qualification", "efficiency", 0.4, kBase);

    auto snapshot = engine_->GetGlobalSnapshot(kBase + 1min);
    EXPECT_EQ(snapshot.entity_count, 2u);
    EXPECT_EQ(snapshot.scored_entities, 1u);
    EXPECT_NEAR(snapshot.mean_score, 0.7, 1e-9);
    EXPECT_NEAR(snapshot.metric_means.at("efficiency"), 0.6, 1e-9);
    EXPECT_EQ(snapshot.taken_at, kBase + 1min);
}

// =============================================================================
// Aggregation and retention
// =============================================================================

TEST_F(MetricsEngineTest, HourlyAggregationThroughFacade) {
    for (int minute = 0; minute < 60; ++minute) {
        Record("marketing", "quality", 10.0, kBase + std::chrono::minutes(minute));
    }

    ASSERT_TRUE(engine_->RunAggregation(Tier::kHourly, kBase + 1h).ok());

    auto hourly = engine_->Query("marketing", "quality", Tier::kHourly, TimeRange::All());
    ASSERT_TRUE(hourly.ok());
    ASSERT_EQ(hourly->size(), 1u);
    EXPECT_DOUBLE_EQ((*hourly)[0].mean, 10.0);
    EXPECT_EQ((*hourly)[0].sample_count, 60u);

    auto stats = engine_->GetStats();
    EXPECT_EQ(stats.hourly_records, 1u);
    ASSERT_EQ(stats.aggregation.size(), 3u);
    EXPECT_EQ(stats.aggregation[0].state, AggregationState::kCommitted);
}

TEST_F(MetricsEngineTest, RetentionSweepPurgesSamplesAndAlerts) {
    Record("marketing", "efficiency", 0.8, kBase);
    Record("marketing", "efficiency", 0.4, kBase + 1min);
    engine_->RunMonitoringCycle(kBase + 2min);
    ASSERT_EQ(engine_->ListAlerts().size(), 1u);

    size_t removed = engine_->RunRetentionSweep(kBase + 48h);
    EXPECT_EQ(removed, 3u);  // two samples and one alert
    EXPECT_DOUBLE_EQ(engine_->GetStats().instruments.at("kpiwatch_records_purged_total"), 3.0);

    EXPECT_TRUE(engine_->ListAlerts().empty());
    EXPECT_EQ(engine_->GetStats().realtime_records, 0u);
}

TEST_F(MetricsEngineTest, DeregisterKeepsAlertsButDropsData) {
    Record("marketing", "efficiency", 0.8, kBase);
    Record("marketing", "efficiency", 0.4, kBase + 1min);
    engine_->RunMonitoringCycle(kBase + 2min);

    ASSERT_TRUE(engine_->DeregisterEntity("marketing").ok());

    EXPECT_EQ(engine_->ListAlerts().size(), 1u);
    EXPECT_FALSE(engine_->GetBaseline("marketing", "efficiency").has_value());
    EXPECT_TRUE(HasErrorCode(
        engine_->Query("marketing", "efficiency", Tier::kRealtime, TimeRange::All()).status(),
        ErrorCode::kInvalidEntity));
    EXPECT_TRUE(HasErrorCode(engine_->DeregisterEntity("marketing"), ErrorCode::kInvalidEntity));

    auto report = engine_->RunMonitoringCycle(kBase + 3min);
    EXPECT_EQ(report.entities_evaluated, 1u);
}

TEST_F(MetricsEngineTest, ExportMetricsNamesInstruments) {
    Record("marketing", "efficiency", 0.8, kBase);
    engine_->RunMonitoringCycle(kBase + 1min);

    std::string text = engine_->ExportMetrics();
    EXPECT_NE(text.find("kpiwatch_samples_recorded_total 1"), std::string::npos);
    EXPECT_NE(text.find("kpiwatch_monitoring_cycles_total 1"), std::string::npos);

    auto instruments = engine_->GetStats().instruments;
    EXPECT_DOUBLE_EQ(instruments.at("kpiwatch_samples_recorded_total"), 1.0);
    EXPECT_DOUBLE_EQ(instruments.at("kpiwatch_entities"), 2.0);
    EXPECT_DOUBLE_EQ(instruments.at("kpiwatch_monitoring_cycle_seconds_count"), 1.0);
}

// =============================================================================
// Concurrency
// =============================================================================

TEST_F(MetricsEngineTest, ConcurrentWritersCyclesAndChurnStayConsistent) {
    Record("marketing", "efficiency", 0.80, kBase);
    Record("marketing", "quality", 0.90, kBase);

    constexpr int kIterations = 200;
    std::atomic<bool> churn_done{false};
    std::atomic<int> churn_rejected{0};

    std::thread writer([&] {
        for (int i = 1; i <= kIterations; ++i) {
            Timestamp ts = kBase + std::chrono::seconds(i);
            double efficiency = 0.60 + 0.001 * (i % 100);
            EXPECT_TRUE(engine_->RecordSample("marketing", "efficiency", efficiency, ts).ok());
            EXPECT_TRUE(engine_->RecordSample("lead_qualification", "throughput", 60.0, ts).ok());
        }
    });

    std::thread cycles([&] {
        for (int i = 1; i <= kIterations / 4; ++i) {
            Timestamp now = kBase + std::chrono::seconds(4 * i);
            engine_->RunMonitoringCycle(now);
            engine_->RunTrendCycle(now);
        }
    });

    std::thread churn([&] {
        for (int i = 0; i < kIterations / 2; ++i) {
            MonitoredEntity entity;
            entity.id = "churn";
            entity.weights = {{"efficiency", 1.0}};
            EXPECT_TRUE(engine_->RegisterEntity(entity).ok());
            EXPECT_TRUE(engine_->RecordSample("churn", "efficiency", 0.5, kBase).ok());
            EXPECT_TRUE(engine_->DeregisterEntity("churn").ok());
        }
        churn_done.store(true);
    });

    std::thread churn_writer([&] {
        int i = 0;
        while (!churn_done.load()) {
            auto status = engine_->RecordSample("churn", "efficiency", 0.7,
                                                kBase + std::chrono::milliseconds(++i));
            if (!status.ok()) {
                EXPECT_TRUE(HasErrorCode(status, ErrorCode::kInvalidEntity));
                churn_rejected.fetch_add(1);
            }
        }
    });

    writer.join();
    cycles.join();
    churn.join();
    churn_writer.join();
    engine_->FlushEvents();

    // Nothing of the churned entity survives its last deregistration
    EXPECT_FALSE(engine_->GetEntity("churn").ok());
    EXPECT_FALSE(engine_->GetBaseline("churn", "efficiency").has_value());
    EXPECT_TRUE(HasErrorCode(engine_->GetTrend("churn").status(), ErrorCode::kInvalidEntity));

    // Baselines keep their first observation
    auto baseline = engine_->GetBaseline("marketing", "efficiency");
    ASSERT_TRUE(baseline.has_value());
    EXPECT_DOUBLE_EQ(baseline->value, 0.80);
    EXPECT_EQ(baseline->established_at, kBase);

    // Every sample landed, and the score window never exceeds its capacity
    auto samples = engine_->Query("marketing", "efficiency", Tier::kRealtime,
                                  TimeRange::All());
    ASSERT_TRUE(samples.ok());
    EXPECT_EQ(samples->size(), static_cast<size_t>(kIterations) + 1);

    auto trend = engine_->GetTrend("marketing");
    ASSERT_TRUE(trend.ok());
    EXPECT_EQ(trend->sample_count, engine_->GetConfig().trend_window_size);

    auto stats = engine_->GetStats();
    EXPECT_EQ(stats.monitoring_cycles, static_cast<uint64_t>(kIterations / 4));
    EXPECT_EQ(stats.entities, 2u);
    EXPECT_EQ(stats.baselines, 3u);
}

// =============================================================================
// Lifecycle
// =============================================================================

TEST(MetricsEngineLifecycleTest, StartRequiresInitialize) {
    MetricsEngine engine(TestConfig());
    EXPECT_TRUE(absl::IsFailedPrecondition(engine.Start()));
    EXPECT_FALSE(engine.IsRunning());
}

TEST(MetricsEngineLifecycleTest, InvalidConfigFailsInitialize) {
    EngineConfig config = TestConfig();
    config.alert_thresholds.info = 0.5;
    MetricsEngine engine(config);

    EXPECT_TRUE(HasErrorCode(engine.Initialize(), ErrorCode::kConfigurationError));
}

TEST(MetricsEngineLifecycleTest, TimersDriveMonitoringCycles) {
    EngineConfig config = TestConfig();
    config.update_interval = 20ms;
    config.trend_interval = 50ms;
    MetricsEngine engine(config);
    ASSERT_TRUE(engine.Initialize().ok());

    std::atomic<int> alerts{0};
    engine.Subscribe(AlertHandler([&alerts](const Alert&) { alerts.fetch_add(1); }));

    auto now = std::chrono::system_clock::now();
    ASSERT_TRUE(engine.RecordSample("marketing", "efficiency", 0.8, now - 1s).ok());
    ASSERT_TRUE(engine.RecordSample("marketing", "efficiency", 0.4, now).ok());

    ASSERT_TRUE(engine.Start().ok());
    EXPECT_TRUE(engine.IsRunning());

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (engine.GetStats().monitoring_cycles < 2 &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    engine.FlushEvents();
    engine.Stop();

    EXPECT_FALSE(engine.IsRunning());
    EXPECT_GE(engine.GetStats().monitoring_cycles, 2u);
    EXPECT_GE(alerts.load(), 2);

    // Stop is idempotent, and the engine can be restarted
    engine.Stop();
    ASSERT_TRUE(engine.Start().ok());
    engine.Stop();
}

}  // namespace
}  // namespace kpiwatch::engine
