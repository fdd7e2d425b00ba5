/// @file metric_catalog_test.cpp
/// @brief Unit tests for the metric catalog

#include <gtest/gtest.h>

#include "common/error.h"
#include "engine/metric_catalog.h"

namespace kpiwatch::engine {
namespace {

TEST(MetricCatalogTest, DefaultKnowsLatencyAndErrorRate) {
    MetricCatalog catalog = MetricCatalog::Default();

    auto response = catalog.Describe("responseTime");
    EXPECT_EQ(response.polarity, MetricPolarity::kLowerIsBetter);
    ASSERT_TRUE(response.cap.has_value());
    EXPECT_DOUBLE_EQ(*response.cap, 2000.0);

    auto errors = catalog.Describe("error_rate");
    EXPECT_EQ(errors.polarity, MetricPolarity::kLowerIsBetter);
    ASSERT_TRUE(errors.cap.has_value());
    EXPECT_DOUBLE_EQ(*errors.cap, 0.1);

    EXPECT_TRUE(catalog.Validate().ok());
}

TEST(MetricCatalogTest, UnknownMetricIsHigherIsBetter) {
    MetricCatalog catalog = MetricCatalog::Default();

    EXPECT_FALSE(catalog.Contains("efficiency"));
    EXPECT_EQ(catalog.PolarityOf("efficiency"), MetricPolarity::kHigherIsBetter);
    EXPECT_FALSE(catalog.Describe("efficiency").cap.has_value());
}

TEST(MetricCatalogTest, RegisterReplacesDescriptor) {
    MetricCatalog catalog;
    ASSERT_TRUE(catalog.Register({"latency", MetricPolarity::kLowerIsBetter, 500.0}).ok());
    ASSERT_TRUE(catalog.Register({"latency", MetricPolarity::kLowerIsBetter, 800.0}).ok());

    EXPECT_DOUBLE_EQ(*catalog.Describe("latency").cap, 800.0);
    EXPECT_EQ(catalog.List().size(), 1u);
}

TEST(MetricCatalogTest, RegisterRejectsEmptyName) {
    MetricCatalog catalog;
    EXPECT_TRUE(absl::IsInvalidArgument(catalog.Register({})));
}

TEST(MetricCatalogTest, ListIsSortedByName) {
    MetricCatalog catalog = MetricCatalog::Default();
    auto list = catalog.List();

    ASSERT_EQ(list.size(), 4u);
    EXPECT_EQ(list[0].name, "errorRate");
    EXPECT_EQ(list[1].name, "error_rate");
    EXPECT_EQ(list[2].name, "responseTime");
    EXPECT_EQ(list[3].name, "response_time");
}

TEST(MetricCatalogTest, ValidateRequiresCapForLowerIsBetter) {
    MetricCatalog catalog;
    ASSERT_TRUE(catalog.Register({"queue_depth", MetricPolarity::kLowerIsBetter, std::nullopt}).ok());

    EXPECT_TRUE(HasErrorCode(catalog.Validate(), ErrorCode::kConfigurationError));
}

TEST(MetricCatalogTest, FromConfigOverlaysDefaults) {
    auto config = Config::LoadFromString(R"(
metrics:
  responseTime:
    cap: 5000
  queue_depth:
    polarity: lower
    cap: 100
  throughput:
    polarity: higher_is_better
)");
    ASSERT_TRUE(config.ok());

    auto catalog = MetricCatalog::FromConfig(*config);
    ASSERT_TRUE(catalog.ok()) << catalog.status().message();

    EXPECT_DOUBLE_EQ(*catalog->Describe("responseTime").cap, 5000.0);
    EXPECT_EQ(catalog->PolarityOf("responseTime"), MetricPolarity::kLowerIsBetter);
    EXPECT_EQ(catalog->PolarityOf("queue_depth"), MetricPolarity::kLowerIsBetter);
    EXPECT_TRUE(catalog->Contains("throughput"));
    EXPECT_TRUE(catalog->Contains("error_rate"));
}

TEST(MetricCatalogTest, FromConfigRejectsUnknownPolarity) {
    auto config = Config::LoadFromString("metrics:\n  quality:\n    polarity: sideways\n");
    ASSERT_TRUE(config.ok());

    auto catalog = MetricCatalog::FromConfig(*config);
    EXPECT_TRUE(HasErrorCode(catalog.status(), ErrorCode::kConfigurationError));
}

TEST(MetricCatalogTest, FromConfigRejectsLowerIsBetterWithoutCap) {
    auto config = Config::LoadFromString("metrics:\n  backlog:\n    polarity: lower\n");
    ASSERT_TRUE(config.ok());

    EXPECT_FALSE(MetricCatalog::FromConfig(*config).ok());
}

TEST(MetricCatalogTest, CopyIsIndependent) {
    MetricCatalog original = MetricCatalog::Default();
    MetricCatalog copy = original;
    ASSERT_TRUE(copy.Register({"backlog", MetricPolarity::kLowerIsBetter, 50.0}).ok());

    EXPECT_TRUE(copy.Contains("backlog"));
    EXPECT_FALSE(original.Contains("backlog"));
}

}  // namespace
}  // namespace kpiwatch::engine
