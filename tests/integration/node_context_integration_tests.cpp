/**
 * @file node_context_integration_tests.cpp
 * @brief Integration tests: optimizer activity flowing into monitoring
 */

#include <gtest/gtest.h>
#include "crdtperf/crdtperf.h"
#include <stdexcept>
#include <thread>

using namespace crdtperf;
using namespace std::chrono_literals;

namespace {

config::NodeConfig test_config() {
    auto config = config::NodeConfig::defaults();
    config.node_id = "node-a";
    config.logging.console = false;
    config.monitoring.alerting = monitor::AlertingConfig::empty();
    config.optimizer.conflict_batch.batch_size = 3;
    return config;
}

ConflictRecord make_conflict(const std::string& id, const std::string& type) {
    ConflictRecord conflict;
    conflict.conflict_id = id;
    conflict.conflict_type = type;
    conflict.detected_at = WallClock::now();
    conflict.involved_peers = {"node-a", "peer-b"};
    return conflict;
}

nlohmann::json make_delta(int operations) {
    nlohmann::json ops = nlohmann::json::array();
    for (int i = 0; i < operations; ++i) {
        ops.push_back({{"op", "set"}, {"key", "k" + std::to_string(i)}, {"value", i}});
    }
    return nlohmann::json{{"operations", ops}};
}

} // anonymous namespace

// ============================================================================
// Activity Flow Tests
// ============================================================================

class NodeContextTest : public ::testing::Test {
protected:
    void SetUp() override {
        node_ = std::make_unique<NodeContext>(test_config());
        node_->optimizer().set_delta_provider([](const PeerId&) {
            return std::optional<nlohmann::json>(make_delta(80));
        });
        node_->optimizer().set_transport([this](const PeerId& peer, const std::vector<UInt8>&,
                                                optimize::CompressionAlgorithm) {
            return peer != rejecting_peer_;
        });
    }

    std::unique_ptr<NodeContext> node_;
    PeerId rejecting_peer_{"peer-down"};
};

TEST_F(NodeContextTest, SyncAttemptsReachCollector) {
    node_->optimizer().schedule_optimized_sync("peer-b", "high");
    node_->optimizer().schedule_optimized_sync("peer-down", "low");
    ASSERT_EQ(node_->optimizer().synchronizer().process_due(SteadyClock::now() + 1h), 2u);

    auto trend = node_->monitoring().metrics().sync_performance_trend();
    EXPECT_EQ(trend.total_syncs, 2u);
    EXPECT_EQ(trend.successful_syncs, 1u);
    EXPECT_GT(trend.average_compression_ratio, 1.0);

    auto sample = node_->metrics_source().collect_health_sample();
    ASSERT_TRUE(sample.has_value());
    EXPECT_EQ(sample->active_peers, 2u);
    EXPECT_EQ(sample->successful_syncs, 1u);
    EXPECT_EQ(sample->failed_syncs, 1u);
    EXPECT_EQ(sample->total_operations, 80u);
    EXPECT_EQ(sample->sync_status, "idle");

    // Counters reset after each sample
    auto next = node_->metrics_source().collect_health_sample();
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->successful_syncs + next->failed_syncs, 0u);
    EXPECT_EQ(next->active_peers, 0u);
}

TEST_F(NodeContextTest, ConflictsReachCollector) {
    node_->optimizer().set_default_conflict_resolver([](const std::string&,
                                                        std::vector<ConflictRecord>& group) {
        for (auto& conflict : group) {
            conflict.mark_resolved("last_writer_wins", true);
        }
    });

    node_->report_conflict(make_conflict("c1", "concurrent_update"));
    node_->report_conflict(make_conflict("c2", "delete_update"));
    EXPECT_EQ(node_->monitoring().metrics().conflict_count(), 0u);

    node_->report_conflict(make_conflict("c3", "concurrent_update"));
    EXPECT_EQ(node_->monitoring().metrics().conflict_count(), 3u);

    auto analysis = node_->monitoring().metrics().conflict_analysis();
    EXPECT_EQ(analysis.resolved_conflicts, 3u);
    EXPECT_EQ(analysis.conflict_types.at("concurrent_update"), 2u);
    EXPECT_EQ(analysis.resolution_strategies.at("last_writer_wins"), 3u);

    auto sample = node_->metrics_source().collect_health_sample();
    ASSERT_TRUE(sample.has_value());
    EXPECT_EQ(sample->conflicts_detected, 3u);
    EXPECT_EQ(sample->conflicts_resolved, 3u);
}

TEST_F(NodeContextTest, EngineProbeFeedsSample) {
    node_->set_engine_probe([]() {
        EngineHealth health;
        health.data_consistency_score = 0.75;
        health.partition_resilience = 0.5;
        health.total_operations = 1234;
        return health;
    });

    ASSERT_EQ(node_->monitoring().sample_now(), Status::Success);
    auto samples = node_->monitoring().metrics().health_samples_since(WallClock::now() - 1h);
    ASSERT_EQ(samples.size(), 1u);
    EXPECT_DOUBLE_EQ(samples[0].data_consistency_score, 0.75);
    EXPECT_DOUBLE_EQ(samples[0].partition_resilience, 0.5);
    EXPECT_EQ(samples[0].total_operations, 1234u);
}

TEST_F(NodeContextTest, ThrowingProbeSkipsSample) {
    node_->set_engine_probe([]() -> EngineHealth { throw std::runtime_error("engine busy"); });
    EXPECT_EQ(node_->monitoring().sample_now(), Status::CollectionFailed);
    EXPECT_EQ(node_->monitoring().metrics().health_sample_count(), 0u);
}

// ============================================================================
// Lifecycle Tests
// ============================================================================

TEST_F(NodeContextTest, StartAndShutdown) {
    EXPECT_EQ(node_->shutdown(), Status::NotRunning);
    ASSERT_EQ(node_->start(), Status::Success);
    EXPECT_TRUE(node_->is_running());
    EXPECT_TRUE(node_->optimizer().is_running());
    EXPECT_TRUE(node_->monitoring().is_running());
    EXPECT_EQ(node_->start(), Status::AlreadyRunning);

    auto sample = node_->metrics_source().collect_health_sample();
    ASSERT_TRUE(sample.has_value());
    EXPECT_EQ(sample->sync_status, "active");

    EXPECT_EQ(node_->shutdown(), Status::Success);
    EXPECT_FALSE(node_->is_running());
    EXPECT_FALSE(node_->optimizer().is_running());
    EXPECT_FALSE(node_->monitoring().is_running());
}

TEST_F(NodeContextTest, ShutdownDrainsPendingConflicts) {
    ASSERT_EQ(node_->start(), Status::Success);
    node_->report_conflict(make_conflict("c1", "concurrent_update"));
    EXPECT_EQ(node_->monitoring().metrics().conflict_count(), 0u);

    ASSERT_EQ(node_->shutdown(), Status::Success);
    EXPECT_EQ(node_->monitoring().metrics().conflict_count(), 1u);
    EXPECT_EQ(node_->optimizer().get_optimization_status().pending_conflict_count, 0u);
}

TEST_F(NodeContextTest, DegradedStatusUnderFailures) {
    ASSERT_EQ(node_->start(), Status::Success);
    node_->metrics_source().collect_health_sample();

    for (int i = 0; i < 3; ++i) {
        node_->optimizer().schedule_optimized_sync("peer-down");
        node_->optimizer().synchronizer().process_due(SteadyClock::now() + 24h);
    }

    auto sample = node_->metrics_source().collect_health_sample();
    ASSERT_TRUE(sample.has_value());
    EXPECT_EQ(sample->sync_status, "degraded");
    EXPECT_EQ(node_->shutdown(), Status::Success);
}

TEST_F(NodeContextTest, HealthReportAndExport) {
    node_->optimizer().schedule_optimized_sync("peer-b");
    node_->optimizer().synchronizer().process_due(SteadyClock::now() + 1h);
    ASSERT_EQ(node_->monitoring().sample_now(), Status::Success);

    auto report = node_->monitoring().get_comprehensive_health_report();
    EXPECT_GE(report.overall_health_score, 0.0);
    EXPECT_LE(report.overall_health_score, 100.0);
    EXPECT_TRUE(report.sync_performance.has_data);
    EXPECT_FALSE(report.recommendations.empty());

    auto j = nlohmann::json::parse(node_->monitoring().export_metrics());
    EXPECT_EQ(j["summary"]["total_sync_records"], 1);
    EXPECT_EQ(j["summary"]["total_health_records"], 1);
    EXPECT_EQ(j["time_range_hours"], 24);
}

TEST(NodeContextConfigTest, DisabledOptimizerStillMonitors) {
    auto config = test_config();
    config.optimizer.enabled = false;
    config.monitoring.sampling_interval = 10ms;
    NodeContext node(config);

    ASSERT_EQ(node.start(), Status::Success);
    EXPECT_FALSE(node.optimizer().is_running());
    EXPECT_TRUE(node.monitoring().is_running());

    const auto deadline = SteadyClock::now() + 2s;
    while (node.monitoring().metrics().health_sample_count() == 0 && SteadyClock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_GE(node.monitoring().metrics().health_sample_count(), 1u);
    EXPECT_EQ(node.shutdown(), Status::Success);
}
