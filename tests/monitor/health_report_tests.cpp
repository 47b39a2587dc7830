/**
 * @file health_report_tests.cpp
 * @brief Unit tests for health classification and recommendations
 */

#include <gtest/gtest.h>
#include "crdtperf/monitor/health_report.h"
#include <algorithm>

using namespace crdtperf;
using namespace crdtperf::monitor;

namespace {

const std::string kOptimal = "System operating optimally - no immediate actions required";

bool contains(const std::vector<std::string>& list, const std::string& prefix) {
    return std::any_of(list.begin(), list.end(), [&prefix](const std::string& entry) {
        return entry.rfind(prefix, 0) == 0;
    });
}

SyncPerformanceTrend make_trend(Real success_rate, Real duration_ms, Real bandwidth_mb) {
    SyncPerformanceTrend trend;
    trend.has_data = true;
    trend.total_syncs = 10;
    trend.success_rate = success_rate;
    trend.average_duration_ms = duration_ms;
    trend.total_bandwidth_mb = bandwidth_mb;
    return trend;
}

ConflictAnalysis make_conflicts(Real resolution_rate, UInt64 manual) {
    ConflictAnalysis analysis;
    analysis.has_data = true;
    analysis.total_conflicts = 10;
    analysis.resolution_rate = resolution_rate;
    analysis.manual_interventions = manual;
    return analysis;
}

} // anonymous namespace

// ============================================================================
// Classification Tests
// ============================================================================

TEST(HealthClassificationTest, Bands) {
    EXPECT_EQ(classify_health(100.0), HealthStatus::Excellent);
    EXPECT_EQ(classify_health(95.0), HealthStatus::Excellent);
    EXPECT_EQ(classify_health(94.9), HealthStatus::Good);
    EXPECT_EQ(classify_health(85.0), HealthStatus::Good);
    EXPECT_EQ(classify_health(84.9), HealthStatus::Warning);
    EXPECT_EQ(classify_health(70.0), HealthStatus::Warning);
    EXPECT_EQ(classify_health(69.9), HealthStatus::Critical);
    EXPECT_EQ(classify_health(0.0), HealthStatus::Critical);
}

TEST(HealthClassificationTest, Names) {
    EXPECT_STREQ(health_status_to_string(HealthStatus::Excellent), "EXCELLENT");
    EXPECT_STREQ(health_status_to_string(HealthStatus::Critical), "CRITICAL");
}

// ============================================================================
// Recommendation Tests
// ============================================================================

TEST(RecommendationTest, HealthySystem) {
    auto recs = generate_recommendations(99.0, make_trend(1.0, 20.0, 1.0), make_conflicts(1.0, 0));
    EXPECT_EQ(recs, std::vector<std::string>{kOptimal});
}

TEST(RecommendationTest, NoDataProducesOnlyOptimal) {
    auto recs = generate_recommendations(100.0, SyncPerformanceTrend{}, ConflictAnalysis{});
    EXPECT_EQ(recs, std::vector<std::string>{kOptimal});
}

TEST(RecommendationTest, LowHealth) {
    auto recs = generate_recommendations(80.0, SyncPerformanceTrend{}, ConflictAnalysis{});
    ASSERT_EQ(recs.size(), 1u);
    EXPECT_TRUE(contains(recs, "Overall health below optimal"));
}

TEST(RecommendationTest, SyncProblems) {
    auto recs = generate_recommendations(90.0, make_trend(0.5, 1500.0, 150.0), ConflictAnalysis{});
    EXPECT_TRUE(contains(recs, "Sync success rate low"));
    EXPECT_TRUE(contains(recs, "Sync operations slow"));
    EXPECT_TRUE(contains(recs, "High bandwidth usage"));
    EXPECT_FALSE(contains(recs, "System operating optimally"));
}

TEST(RecommendationTest, ConflictProblems) {
    auto recs = generate_recommendations(90.0, SyncPerformanceTrend{}, make_conflicts(0.5, 6));
    EXPECT_EQ(recs.size(), 2u);
    EXPECT_TRUE(contains(recs, "Conflict resolution rate low"));
    EXPECT_TRUE(contains(recs, "High manual interventions"));
}

TEST(RecommendationTest, ThresholdsAreStrict) {
    auto recs = generate_recommendations(85.0, make_trend(0.9, 1000.0, 100.0), make_conflicts(0.8, 5));
    EXPECT_EQ(recs, std::vector<std::string>{kOptimal});
}

// ============================================================================
// Report Tests
// ============================================================================

TEST(HealthReportTest, JsonLayout) {
    HealthReport report;
    report.timestamp = WallClock::from_time_t(1714564800);
    report.overall_health_score = 72.5;
    report.health_status = classify_health(72.5);
    report.recommendations = {"Overall health below optimal - investigate sync and conflict issues"};

    auto j = report.to_json();
    std::vector<std::string> keys;
    for (auto it = j.begin(); it != j.end(); ++it) {
        keys.push_back(it.key());
    }
    EXPECT_EQ(keys, (std::vector<std::string>{"timestamp", "overall_health_score", "health_status",
                                              "health_breakdown", "sync_performance",
                                              "conflict_analysis", "recommendations", "alerting"}));

    EXPECT_EQ(j["health_status"], "WARNING");
    EXPECT_EQ(j["timestamp"].get<std::string>().rfind("2024-05-01T12:00:00", 0), 0u);
    EXPECT_EQ(j["sync_performance"]["error"], "No sync data available");
    EXPECT_EQ(j["conflict_analysis"]["total_conflicts"], 0);
}
