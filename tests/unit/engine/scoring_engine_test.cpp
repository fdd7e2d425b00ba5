/// @file scoring_engine_test.cpp
/// @brief Unit tests for composite scoring

#include <gtest/gtest.h>

#include "common/error.h"
#include "engine/scoring_engine.h"

namespace kpiwatch::engine {
namespace {

class ScoringEngineTest : public ::testing::Test {
protected:
    ScoringEngineTest()
        : catalog_(MetricCatalog::Default()),
          scoring_(catalog_) {
        team_.id = "marketing";
        team_.weights = {{"efficiency", 0.25}, {"quality", 0.30},
                         {"satisfaction", 0.25}, {"innovation", 0.20}};

        workflow_.id = "lead_qualification";
        workflow_.kind = EntityKind::kWorkflow;
        workflow_.weights = {{"efficiency", 0.4}, {"errorRate", 0.3}, {"throughput", 0.3}};
        workflow_.targets = {{"throughput", 120.0}};
    }

    MetricCatalog catalog_;
    ScoringEngine scoring_;
    MonitoredEntity team_;
    MonitoredEntity workflow_;
};

// ============================================================================
// Normalization
// ============================================================================

TEST_F(ScoringEngineTest, LowerIsBetterUsesCap) {
    EXPECT_DOUBLE_EQ(scoring_.Normalize(workflow_, "responseTime", 500.0), 0.75);
    EXPECT_DOUBLE_EQ(scoring_.Normalize(workflow_, "responseTime", 0.0), 1.0);
    EXPECT_DOUBLE_EQ(scoring_.Normalize(workflow_, "responseTime", 2000.0), 0.0);
    EXPECT_DOUBLE_EQ(scoring_.Normalize(workflow_, "responseTime", 9000.0), 0.0);
    EXPECT_NEAR(scoring_.Normalize(workflow_, "errorRate", 0.02), 0.8, 1e-12);
}

TEST_F(ScoringEngineTest, RatiosAreClamped) {
    EXPECT_DOUBLE_EQ(scoring_.Normalize(team_, "quality", 0.9), 0.9);
    EXPECT_DOUBLE_EQ(scoring_.Normalize(team_, "quality", -0.2), 0.0);
    EXPECT_DOUBLE_EQ(scoring_.Normalize(team_, "quality", 1.7), 1.0);
}

TEST_F(ScoringEngineTest, UnboundedMetricUsesTarget) {
    EXPECT_DOUBLE_EQ(scoring_.Normalize(workflow_, "throughput", 60.0), 0.5);
    EXPECT_DOUBLE_EQ(scoring_.Normalize(workflow_, "throughput", 240.0), 1.0);
}

// ============================================================================
// Composite score
// ============================================================================

TEST_F(ScoringEngineTest, WeightedSum) {
    std::unordered_map<std::string, double> values = {
        {"efficiency", 0.8}, {"quality", 0.9}, {"satisfaction", 0.7}, {"innovation", 0.5}};

    auto score = scoring_.Score(team_, values);
    ASSERT_TRUE(score.ok()) << score.status().message();
    EXPECT_NEAR(*score, 0.25 * 0.8 + 0.30 * 0.9 + 0.25 * 0.7 + 0.20 * 0.5, 1e-12);
}

TEST_F(ScoringEngineTest, ScoreStaysInUnitInterval) {
    std::unordered_map<std::string, double> best = {
        {"efficiency", 5.0}, {"quality", 3.0}, {"satisfaction", 2.0}, {"innovation", 9.0}};
    std::unordered_map<std::string, double> worst = {
        {"efficiency", -1.0}, {"quality", -3.0}, {"satisfaction", 0.0}, {"innovation", -9.0}};

    auto high = scoring_.Score(team_, best);
    auto low = scoring_.Score(team_, worst);
    ASSERT_TRUE(high.ok());
    ASSERT_TRUE(low.ok());
    EXPECT_LE(*high, 1.0);
    EXPECT_GE(*low, 0.0);
}

TEST_F(ScoringEngineTest, MixedPolarityWorkflow) {
    std::unordered_map<std::string, double> values = {
        {"efficiency", 0.9}, {"errorRate", 0.05}, {"throughput", 90.0}};

    auto breakdown = scoring_.Breakdown(workflow_, values);
    ASSERT_TRUE(breakdown.ok());
    ASSERT_EQ(breakdown->metrics.size(), 3u);

    EXPECT_EQ(breakdown->metrics[0].metric_name, "efficiency");
    EXPECT_EQ(breakdown->metrics[1].metric_name, "errorRate");
    EXPECT_NEAR(breakdown->metrics[1].normalized, 0.5, 1e-12);
    EXPECT_EQ(breakdown->metrics[2].metric_name, "throughput");
    EXPECT_NEAR(breakdown->metrics[2].normalized, 0.75, 1e-12);

    EXPECT_NEAR(breakdown->score, 0.4 * 0.9 + 0.3 * 0.5 + 0.3 * 0.75, 1e-12);
    double total = 0.0;
    for (const auto& term : breakdown->metrics) {
        total += term.contribution;
    }
    EXPECT_NEAR(total, breakdown->score, 1e-12);
}

TEST_F(ScoringEngineTest, UnweightedMetricIsMissingWeight) {
    std::unordered_map<std::string, double> values = {
        {"efficiency", 0.8}, {"quality", 0.9}, {"satisfaction", 0.7},
        {"innovation", 0.5}, {"velocity", 0.9}};

    auto score = scoring_.Score(team_, values);
    EXPECT_TRUE(HasErrorCode(score.status(), ErrorCode::kMissingWeight));
}

TEST_F(ScoringEngineTest, ListsUnweightedMetrics) {
    std::unordered_map<std::string, double> values = {
        {"velocity", 0.9}, {"efficiency", 0.8}, {"availability", 0.99}};

    auto unweighted = ScoringEngine::UnweightedMetrics(team_, values);
    ASSERT_EQ(unweighted.size(), 2u);
    EXPECT_EQ(unweighted[0], "availability");
    EXPECT_EQ(unweighted[1], "velocity");
}

TEST_F(ScoringEngineTest, WeightedMetricWithoutValueIsMissingSample) {
    std::unordered_map<std::string, double> values = {{"efficiency", 0.8}, {"quality", 0.9}};

    auto score = scoring_.Score(team_, values);
    EXPECT_TRUE(HasErrorCode(score.status(), ErrorCode::kMissingSample));
}

TEST_F(ScoringEngineTest, ZeroWeightMetricMayBeAbsent) {
    MonitoredEntity entity;
    entity.id = "research";
    entity.weights = {{"quality", 1.0}, {"innovation", 0.0}};

    auto score = scoring_.Score(entity, {{"quality", 0.6}});
    ASSERT_TRUE(score.ok());
    EXPECT_DOUBLE_EQ(*score, 0.6);
}

}  // namespace
}  // namespace kpiwatch::engine
