/// @file metric_store_test.cpp
/// @brief Unit tests for the multi-tier metric store

#include <cmath>
#include <limits>

#include <gtest/gtest.h>

#include "common/error.h"
#include "engine/metric_store.h"

namespace kpiwatch::engine {
namespace {

using namespace std::chrono_literals;

// 2026-01-05 10:00:00 UTC
const Timestamp kBase = FromUnixMillis(1767607200000);

class MetricStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_.AddEntity("marketing");
    }

    void Record(const std::string& metric, double value, Timestamp ts) {
        ASSERT_TRUE(store_.RecordSample({"marketing", metric, value, ts}).ok());
    }

    AggregatedBucket HourlyBucket(Timestamp start, double mean, uint64_t count) {
        AggregatedBucket bucket;
        bucket.entity_id = "marketing";
        bucket.metric_name = "efficiency";
        bucket.tier = Tier::kHourly;
        bucket.window_start = start;
        bucket.window_end = start + 1h;
        bucket.mean = mean;
        bucket.sample_count = count;
        return bucket;
    }

    MetricStore store_;
};

// ============================================================================
// Writes
// ============================================================================

TEST_F(MetricStoreTest, RecordAndQueryRealtime) {
    Record("efficiency", 0.80, kBase);
    Record("efficiency", 0.82, kBase + 1min);
    Record("quality", 0.90, kBase);

    auto result = store_.Query("marketing", "efficiency", Tier::kRealtime, TimeRange::All());
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result->size(), 2u);

    EXPECT_DOUBLE_EQ((*result)[0].mean, 0.80);
    EXPECT_EQ((*result)[0].window_start, kBase);
    EXPECT_EQ((*result)[0].window_end, kBase);
    EXPECT_EQ((*result)[0].sample_count, 1u);
    EXPECT_EQ((*result)[0].tier, Tier::kRealtime);
    EXPECT_DOUBLE_EQ((*result)[1].mean, 0.82);
}

TEST_F(MetricStoreTest, DuplicateTimestampReplacesSample) {
    Record("efficiency", 0.80, kBase);
    Record("efficiency", 0.85, kBase);

    auto result = store_.QuerySamples("marketing", "efficiency", TimeRange::All());
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result->size(), 1u);
    EXPECT_DOUBLE_EQ((*result)[0].value, 0.85);
    EXPECT_EQ(store_.RecordCount(Tier::kRealtime), 1u);
}

TEST_F(MetricStoreTest, RejectsUnknownEntity) {
    auto status = store_.RecordSample({"ghost", "efficiency", 0.5, kBase});
    EXPECT_TRUE(HasErrorCode(status, ErrorCode::kInvalidEntity));

    auto query = store_.Query("ghost", "efficiency", Tier::kRealtime, TimeRange::All());
    EXPECT_TRUE(HasErrorCode(query.status(), ErrorCode::kInvalidEntity));
}

TEST_F(MetricStoreTest, RejectsNonFiniteAndUnnamedSamples) {
    EXPECT_TRUE(absl::IsInvalidArgument(store_.RecordSample(
        {"marketing", "efficiency", std::numeric_limits<double>::quiet_NaN(), kBase})));
    EXPECT_TRUE(absl::IsInvalidArgument(store_.RecordSample(
        {"marketing", "efficiency", std::numeric_limits<double>::infinity(), kBase})));
    EXPECT_TRUE(absl::IsInvalidArgument(store_.RecordSample({"marketing", "", 1.0, kBase})));
    EXPECT_EQ(store_.RecordCount(Tier::kRealtime), 0u);
}

TEST_F(MetricStoreTest, AddEntityIsIdempotent) {
    Record("efficiency", 0.80, kBase);
    store_.AddEntity("marketing");

    EXPECT_EQ(store_.RecordCount(Tier::kRealtime), 1u);
}

TEST_F(MetricStoreTest, WriteBucketRejectsRealtimeTier) {
    auto bucket = HourlyBucket(kBase, 0.8, 10);
    bucket.tier = Tier::kRealtime;
    EXPECT_TRUE(absl::IsInvalidArgument(store_.WriteBucket(bucket)));
}

TEST_F(MetricStoreTest, WriteBucketReplacesSameWindow) {
    ASSERT_TRUE(store_.WriteBucket(HourlyBucket(kBase, 0.8, 10)).ok());
    ASSERT_TRUE(store_.WriteBucket(HourlyBucket(kBase, 0.9, 12)).ok());

    auto result = store_.Query("marketing", "efficiency", Tier::kHourly, TimeRange::All());
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result->size(), 1u);
    EXPECT_DOUBLE_EQ((*result)[0].mean, 0.9);
    EXPECT_EQ((*result)[0].sample_count, 12u);
}

// ============================================================================
// Reads
// ============================================================================

TEST_F(MetricStoreTest, QueryRangeIsHalfOpen) {
    Record("efficiency", 0.1, kBase);
    Record("efficiency", 0.2, kBase + 10min);
    Record("efficiency", 0.3, kBase + 20min);

    auto result = store_.Query("marketing", "efficiency", Tier::kRealtime,
                               {kBase, kBase + 20min});
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result->size(), 2u);
    EXPECT_DOUBLE_EQ((*result)[1].mean, 0.2);
}

TEST_F(MetricStoreTest, QueryIsRepeatable) {
    Record("efficiency", 0.1, kBase);
    Record("efficiency", 0.2, kBase + 1min);

    auto first = store_.Query("marketing", "efficiency", Tier::kRealtime, TimeRange::All());
    auto second = store_.Query("marketing", "efficiency", Tier::kRealtime, TimeRange::All());
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(first->size(), second->size());
}

TEST_F(MetricStoreTest, ReversedOrEmptyRangeIsEmpty) {
    Record("efficiency", 0.1, kBase + 10s);
    Record("efficiency", 0.2, kBase + 20s);
    ASSERT_TRUE(store_.WriteBucket(HourlyBucket(kBase, 0.8, 10)).ok());

    TimeRange reversed{kBase + 25s, kBase + 5s};
    auto realtime = store_.Query("marketing", "efficiency", Tier::kRealtime, reversed);
    ASSERT_TRUE(realtime.ok());
    EXPECT_TRUE(realtime->empty());

    auto hourly = store_.Query("marketing", "efficiency", Tier::kHourly,
                               {kBase + 2h, kBase - 2h});
    ASSERT_TRUE(hourly.ok());
    EXPECT_TRUE(hourly->empty());

    auto samples = store_.QuerySamples("marketing", "efficiency", reversed);
    ASSERT_TRUE(samples.ok());
    EXPECT_TRUE(samples->empty());

    auto empty = store_.Query("marketing", "efficiency", Tier::kRealtime,
                              {kBase + 10s, kBase + 10s});
    ASSERT_TRUE(empty.ok());
    EXPECT_TRUE(empty->empty());
}

TEST_F(MetricStoreTest, UnknownMetricIsEmpty) {
    auto result = store_.Query("marketing", "innovation", Tier::kDaily, TimeRange::All());
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result->empty());
}

TEST_F(MetricStoreTest, LatestValuesPicksNewestSample) {
    Record("efficiency", 0.80, kBase + 5min);
    Record("efficiency", 0.70, kBase);
    Record("quality", 0.90, kBase);

    auto latest = store_.LatestValues("marketing");
    ASSERT_TRUE(latest.ok());
    EXPECT_EQ(latest->size(), 2u);
    EXPECT_DOUBLE_EQ(latest->at("efficiency"), 0.80);
    EXPECT_DOUBLE_EQ(latest->at("quality"), 0.90);
}

TEST_F(MetricStoreTest, ListEntitiesAndMetrics) {
    store_.AddEntity("sales");
    Record("quality", 0.9, kBase);
    Record("efficiency", 0.8, kBase);

    auto entities = store_.ListEntities();
    ASSERT_EQ(entities.size(), 2u);
    EXPECT_EQ(entities[0], "marketing");
    EXPECT_EQ(entities[1], "sales");

    auto metrics = store_.ListMetrics("marketing");
    ASSERT_TRUE(metrics.ok());
    ASSERT_EQ(metrics->size(), 2u);
    EXPECT_EQ((*metrics)[0], "efficiency");
}

TEST_F(MetricStoreTest, RemoveEntityDropsRecords) {
    Record("efficiency", 0.8, kBase);
    store_.RemoveEntity("marketing");

    EXPECT_FALSE(store_.HasEntity("marketing"));
    EXPECT_EQ(store_.RecordCount(Tier::kRealtime), 0u);
}

// ============================================================================
// Rollups
// ============================================================================

TEST_F(MetricStoreTest, RollupOfRealtimeSamples) {
    for (int minute = 0; minute < 60; ++minute) {
        Record("efficiency", 10.0, kBase + std::chrono::minutes(minute));
    }
    Record("efficiency", 99.0, kBase + 1h);  // next window

    auto buckets = store_.ComputeRollup("marketing", Tier::kRealtime, Tier::kHourly,
                                        {kBase, kBase + 1h});
    ASSERT_TRUE(buckets.ok());
    ASSERT_EQ(buckets->size(), 1u);
    EXPECT_DOUBLE_EQ((*buckets)[0].mean, 10.0);
    EXPECT_EQ((*buckets)[0].sample_count, 60u);
    EXPECT_EQ((*buckets)[0].tier, Tier::kHourly);
    EXPECT_EQ((*buckets)[0].window_start, kBase);
    EXPECT_EQ((*buckets)[0].window_end, kBase + 1h);
}

TEST_F(MetricStoreTest, RollupOfBucketsIsCountWeighted) {
    ASSERT_TRUE(store_.WriteBucket(HourlyBucket(kBase, 1.0, 30)).ok());
    ASSERT_TRUE(store_.WriteBucket(HourlyBucket(kBase + 1h, 4.0, 10)).ok());

    auto buckets = store_.ComputeRollup("marketing", Tier::kHourly, Tier::kDaily,
                                        {kBase - 10h, kBase + 14h});
    ASSERT_TRUE(buckets.ok());
    ASSERT_EQ(buckets->size(), 1u);
    EXPECT_DOUBLE_EQ((*buckets)[0].mean, (1.0 * 30 + 4.0 * 10) / 40.0);
    EXPECT_EQ((*buckets)[0].sample_count, 40u);
}

TEST_F(MetricStoreTest, RollupWithoutRecordsIsEmpty) {
    auto buckets = store_.ComputeRollup("marketing", Tier::kRealtime, Tier::kHourly,
                                        {kBase, kBase + 1h});
    ASSERT_TRUE(buckets.ok());
    EXPECT_TRUE(buckets->empty());
}

TEST_F(MetricStoreTest, RollupMustGoToCoarserTier) {
    auto same = store_.ComputeRollup("marketing", Tier::kHourly, Tier::kHourly,
                                     {kBase, kBase + 1h});
    EXPECT_TRUE(absl::IsInvalidArgument(same.status()));

    auto backwards = store_.ComputeRollup("marketing", Tier::kDaily, Tier::kHourly,
                                          {kBase, kBase + 1h});
    EXPECT_TRUE(absl::IsInvalidArgument(backwards.status()));
}

TEST_F(MetricStoreTest, RollupRejectsEmptyWindow) {
    Record("efficiency", 0.1, kBase);

    auto reversed = store_.ComputeRollup("marketing", Tier::kRealtime, Tier::kHourly,
                                         {kBase + 1h, kBase});
    EXPECT_TRUE(absl::IsInvalidArgument(reversed.status()));
}

// ============================================================================
// Retention
// ============================================================================

TEST_F(MetricStoreTest, PurgeRemovesRealtimeOlderThanHorizon) {
    Record("efficiency", 0.1, kBase);
    Record("efficiency", 0.2, kBase + 30min);
    Record("efficiency", 0.3, kBase + 61min);

    size_t removed = store_.Purge(Tier::kRealtime, kBase + 90min);
    EXPECT_EQ(removed, 1u);

    auto remaining = store_.QuerySamples("marketing", "efficiency", TimeRange::All());
    ASSERT_TRUE(remaining.ok());
    ASSERT_EQ(remaining->size(), 2u);
    EXPECT_EQ((*remaining)[0].timestamp, kBase + 30min);
}

TEST_F(MetricStoreTest, PurgeMeasuresBucketAgeFromWindowEnd) {
    ASSERT_TRUE(store_.WriteBucket(HourlyBucket(kBase, 0.8, 10)).ok());

    // Window ends at kBase + 1h, hourly horizon is 24h
    EXPECT_EQ(store_.Purge(Tier::kHourly, kBase + 25h), 0u);
    EXPECT_EQ(store_.Purge(Tier::kHourly, kBase + 25h + 1ms), 1u);
    EXPECT_EQ(store_.RecordCount(Tier::kHourly), 0u);
}

TEST_F(MetricStoreTest, PurgeOnlyTouchesRequestedTier) {
    Record("efficiency", 0.1, kBase);
    ASSERT_TRUE(store_.WriteBucket(HourlyBucket(kBase, 0.8, 10)).ok());

    store_.Purge(Tier::kRealtime, kBase + 10h);

    EXPECT_EQ(store_.RecordCount(Tier::kRealtime), 0u);
    EXPECT_EQ(store_.RecordCount(Tier::kHourly), 1u);
}

TEST_F(MetricStoreTest, HoldKeepsRecordsPastTheHorizon) {
    Record("efficiency", 0.1, kBase - 2h);
    Record("efficiency", 0.2, kBase);
    Record("efficiency", 0.3, kBase + 30min);
    ASSERT_TRUE(store_.WriteBucket(HourlyBucket(kBase - 30h, 0.8, 10)).ok());

    store_.HoldFrom(Tier::kRealtime, kBase);
    ASSERT_TRUE(store_.HoldPoint(Tier::kRealtime).has_value());
    EXPECT_FALSE(store_.HoldPoint(Tier::kHourly).has_value());

    // Only the sample before the hold point goes
    EXPECT_EQ(store_.Purge(Tier::kRealtime, kBase + 5h), 1u);
    EXPECT_EQ(store_.RecordCount(Tier::kRealtime), 2u);

    // The hold is per tier
    EXPECT_EQ(store_.Purge(Tier::kHourly, kBase + 5h), 1u);

    // A hold newer than the horizon cutoff does not purge younger records
    store_.HoldFrom(Tier::kRealtime, kBase + 5h);
    EXPECT_EQ(store_.Purge(Tier::kRealtime, kBase + 50min), 0u);

    store_.HoldFrom(Tier::kRealtime, std::nullopt);
    EXPECT_EQ(store_.Purge(Tier::kRealtime, kBase + 5h), 2u);
}

TEST(MetricStoreRetentionTest, CustomHorizon) {
    RetentionPolicy policy;
    policy.realtime = 10min;
    MetricStore store(policy);
    store.AddEntity("sales");

    ASSERT_TRUE(store.RecordSample({"sales", "quality", 0.9, kBase}).ok());
    EXPECT_EQ(store.Purge(Tier::kRealtime, kBase + 11min), 1u);
    EXPECT_EQ(store.Retention().realtime, 10min);
}

}  // namespace
}  // namespace kpiwatch::engine
