/**
 * @file performance_monitor_tests.cpp
 * @brief Unit tests for operation timing and resource instrumentation
 */

#include <gtest/gtest.h>
#include "crdtperf/optimize/performance_monitor.h"
#include "crdtperf/core/process_stats.h"
#include <stdexcept>
#include <thread>
#include <vector>

using namespace crdtperf;
using namespace crdtperf::optimize;
using namespace std::chrono_literals;

namespace {

PerformanceSample make_sample(const std::string& type, Real latency, bool success = true) {
    PerformanceSample sample;
    sample.operation_type = type;
    sample.latency_ms = latency;
    sample.success = success;
    sample.timestamp = WallClock::now();
    return sample;
}

} // anonymous namespace

// ============================================================================
// Measurement Tests
// ============================================================================

TEST(PerformanceMonitorTest, MeasureRecordsSuccess) {
    PerformanceMonitor monitor;

    int value = monitor.measure("compute", []() {
        std::this_thread::sleep_for(5ms);
        return 42;
    }, 128);

    EXPECT_EQ(value, 42);
    ASSERT_EQ(monitor.sample_count(), 1u);

    auto sample = monitor.history().front();
    EXPECT_EQ(sample.operation_type, "compute");
    EXPECT_TRUE(sample.success);
    EXPECT_GE(sample.latency_ms, 4.0);
    EXPECT_EQ(sample.payload_size_bytes, 128u);
}

TEST(PerformanceMonitorTest, MeasureVoidOperation) {
    PerformanceMonitor monitor;
    bool ran = false;

    monitor.measure("side_effect", [&ran]() { ran = true; });

    EXPECT_TRUE(ran);
    EXPECT_EQ(monitor.sample_count(), 1u);
}

TEST(PerformanceMonitorTest, MeasureRethrowsAndRecordsFailure) {
    PerformanceMonitor monitor;

    EXPECT_THROW(monitor.measure("failing", []() -> int {
        throw std::runtime_error("boom");
    }), std::runtime_error);

    ASSERT_EQ(monitor.sample_count(), 1u);
    EXPECT_FALSE(monitor.history().front().success);

    auto summary = monitor.summary();
    EXPECT_DOUBLE_EQ(summary.success_rate, 0.0);
}

TEST(PerformanceMonitorTest, ReleasingMemoryRecordsZeroGrowth) {
    PerformanceMonitor monitor;
    std::vector<char> buffer(64 * 1024 * 1024, 'x');

    monitor.measure("release", [&buffer]() {
        buffer.clear();
        buffer.shrink_to_fit();
    });

    ASSERT_EQ(monitor.sample_count(), 1u);
    EXPECT_GE(monitor.history().front().memory_usage_mb, 0.0);
    EXPECT_GE(monitor.summary().memory_usage_mb.average, 0.0);
}

TEST(ResourceReadingTest, MemoryGrowthClampedAtZero) {
    core::ResourceReading start;
    core::ResourceReading end;
    start.resident_memory_mb = 120.0;
    end.resident_memory_mb = 80.0;
    EXPECT_DOUBLE_EQ(core::memory_growth_mb(start, end), 0.0);

    end.resident_memory_mb = 150.5;
    EXPECT_DOUBLE_EQ(core::memory_growth_mb(start, end), 30.5);
}

// ============================================================================
// Summary Tests
// ============================================================================

TEST(PerformanceMonitorTest, EmptySummary) {
    PerformanceMonitor monitor;
    auto summary = monitor.summary();

    EXPECT_FALSE(summary.has_data);
    EXPECT_EQ(summary.to_json(), (nlohmann::json{{"error", "No performance data available"}}));
}

TEST(PerformanceMonitorTest, SummaryStatistics) {
    PerformanceMonitor monitor;
    for (int i = 1; i <= 20; ++i) {
        monitor.record_sample(make_sample("sync", static_cast<Real>(i), i != 20));
    }

    auto summary = monitor.summary();
    ASSERT_TRUE(summary.has_data);
    EXPECT_EQ(summary.total_operations, 20u);
    EXPECT_DOUBLE_EQ(summary.success_rate, 0.95);
    EXPECT_DOUBLE_EQ(summary.latency_ms.average, 10.5);
    EXPECT_DOUBLE_EQ(summary.latency_ms.min, 1.0);
    EXPECT_DOUBLE_EQ(summary.latency_ms.max, 20.0);
    // sorted[int(20 * 0.95)] = sorted[19]
    EXPECT_DOUBLE_EQ(summary.latency_ms.p95, 20.0);

    auto j = summary.to_json();
    EXPECT_EQ(j["total_operations"], 20);
    EXPECT_TRUE(j["latency_ms"].contains("p95"));
    EXPECT_TRUE(j["memory_usage_mb"].contains("peak"));
}

TEST(PerformanceMonitorTest, SingleSamplePercentile) {
    auto summary = summarize_samples({make_sample("op", 7.0)});
    EXPECT_DOUBLE_EQ(summary.latency_ms.p95, 7.0);
}

TEST(PerformanceMonitorTest, SummaryFilteredByOperation) {
    PerformanceMonitor monitor;
    monitor.record_sample(make_sample("compress", 1.0));
    monitor.record_sample(make_sample("compress", 3.0));
    monitor.record_sample(make_sample("sync", 100.0));

    auto summary = monitor.summary(std::string("compress"));
    ASSERT_TRUE(summary.has_data);
    EXPECT_EQ(summary.total_operations, 2u);
    EXPECT_DOUBLE_EQ(summary.latency_ms.average, 2.0);
    EXPECT_EQ(summary.to_json()["operation_type"], "compress");

    EXPECT_FALSE(monitor.summary(std::string("missing")).has_data);
}

TEST(PerformanceMonitorTest, HistoryBounded) {
    PerformanceMonitorConfig config;
    config.history_capacity = 5;
    PerformanceMonitor monitor(config);

    for (int i = 0; i < 12; ++i) {
        monitor.record_sample(make_sample("op", static_cast<Real>(i)));
    }
    EXPECT_EQ(monitor.sample_count(), 5u);
    EXPECT_DOUBLE_EQ(monitor.history().front().latency_ms, 7.0);
}

// ============================================================================
// Sampler Tests
// ============================================================================

TEST(PerformanceMonitorTest, SamplerLifecycle) {
    PerformanceMonitorConfig config;
    config.sampling_interval = 10ms;
    PerformanceMonitor monitor(config);

    EXPECT_EQ(monitor.start(), Status::Success);
    EXPECT_TRUE(monitor.is_running());
    std::this_thread::sleep_for(50ms);
    EXPECT_GE(monitor.last_reading().resident_memory_mb, 0.0);
    EXPECT_GE(monitor.last_cpu_percent(), 0.0);
    EXPECT_EQ(monitor.stop(), Status::Success);
    EXPECT_FALSE(monitor.is_running());
}
