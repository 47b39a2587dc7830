#pragma once
/**
 * @file node_context.h
 * @brief Per-node context owning the optimizer and the monitoring coordinator
 *
 * A NodeContext is built once by the host process from a NodeConfig. It
 * feeds every sync attempt and every flushed conflict batch of the optimizer
 * into the metrics collector, and attaches a NodeMetricsSource that turns the
 * activity since the previous sample into a HealthSample.
 *
 * @code
 * auto config = config::NodeConfig::load("sync_node.xml");
 * NodeContext node(config);
 * node.optimizer().set_delta_provider(provider);
 * node.optimizer().set_transport(transport);
 * node.start();
 * node.optimizer().schedule_optimized_sync("peer-b", "high");
 * ...
 * node.shutdown();
 * @endcode
 */

#include "crdtperf/core/types.h"
#include "crdtperf/core/status.h"
#include "crdtperf/core/records.h"
#include "crdtperf/core/process_stats.h"
#include "crdtperf/config/config.h"
#include "crdtperf/optimize/performance_optimizer.h"
#include "crdtperf/monitor/monitoring_coordinator.h"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace crdtperf {

/**
 * @brief Replication engine view of data health
 */
struct EngineHealth {
    Real data_consistency_score{1.0};       ///< [0, 1]
    Real partition_resilience{1.0};         ///< [0, 1]
    std::optional<UInt64> total_operations; ///< Overrides the counted operations
};

/// Queried once per health sample, optional
using EngineHealthProbe = std::function<EngineHealth()>;

// ============================================================================
// Node Metrics Source
// ============================================================================

/**
 * @brief Health samples built from the node's own activity
 *
 * Counters accumulate between samples and are reset by each
 * collect_health_sample() call. CPU usage of the process over the same
 * interval becomes performance_impact_percent.
 */
class NodeMetricsSource : public monitor::IMetricsSource {
public:
    NodeMetricsSource();

    void record_sync(const SyncAttempt& attempt);
    void record_conflict_detected(UInt64 count = 1);
    void record_conflicts_resolved(UInt64 count);

    void set_engine_probe(EngineHealthProbe probe);
    void set_sync_active(bool active);

    std::optional<HealthSample> collect_health_sample() override;

private:
    std::mutex mutex_;
    EngineHealthProbe probe_;
    bool sync_active_{false};

    std::set<PeerId> peers_;
    UInt64 operations_{0};
    UInt64 successful_syncs_{0};
    UInt64 failed_syncs_{0};
    UInt64 conflicts_detected_{0};
    UInt64 conflicts_resolved_{0};
    Real sync_time_total_ms_{0.0};
    core::ResourceReading last_reading_;
};

// ============================================================================
// Node Context
// ============================================================================

/**
 * @brief Explicit per-node composition root
 */
class NodeContext {
public:
    explicit NodeContext(config::NodeConfig config);
    ~NodeContext();

    // Non-copyable
    NodeContext(const NodeContext&) = delete;
    NodeContext& operator=(const NodeContext&) = delete;

    /**
     * @brief Start optimizer loops and monitoring sampler
     */
    Status start();

    /**
     * @brief Stop everything, draining pending conflicts
     * @return Timeout if any worker had to be abandoned
     */
    Status shutdown();

    bool is_running() const;

    /**
     * @brief Report a conflict detected by the replication engine
     *
     * Counts it for health sampling and hands it to the conflict batcher.
     */
    void report_conflict(ConflictRecord conflict);

    void set_engine_probe(EngineHealthProbe probe);

    optimize::PerformanceOptimizer& optimizer();
    monitor::MonitoringCoordinator& monitoring();
    const monitor::MonitoringCoordinator& monitoring() const;
    NodeMetricsSource& metrics_source();

    const config::NodeConfig& config() const;

private:
    config::NodeConfig config_;
    std::shared_ptr<NodeMetricsSource> source_;
    std::shared_ptr<monitor::MonitoringCoordinator> monitoring_;
    std::unique_ptr<optimize::PerformanceOptimizer> optimizer_;
    bool running_{false};
};

} // namespace crdtperf
