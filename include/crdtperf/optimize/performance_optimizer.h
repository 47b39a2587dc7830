#pragma once
/**
 * @file performance_optimizer.h
 * @brief Facade over compression, sync scheduling, conflict batching and
 *        performance instrumentation
 *
 * The replication engine talks to this class only. It owns exactly one of
 * each optimization component and drives scheduled syncs through two
 * callbacks supplied by the engine:
 * - a delta provider returning the delta to send to a peer
 * - a transport sending the (compressed) bytes to a peer
 *
 * Example:
 * @code
 * PerformanceOptimizer optimizer("node-a");
 * optimizer.set_delta_provider([&](const PeerId& peer) { return engine.delta_for(peer); });
 * optimizer.set_transport([&](const PeerId& peer, const std::vector<UInt8>& bytes,
 *                             CompressionAlgorithm algorithm) {
 *     return network.send(peer, bytes, compression_algorithm_to_string(algorithm));
 * });
 * optimizer.start();
 * optimizer.record_peer_activity("node-b", 42);
 * optimizer.schedule_optimized_sync("node-b", "high");
 * @endcode
 */

#include "crdtperf/optimize/delta_compressor.h"
#include "crdtperf/optimize/lazy_synchronizer.h"
#include "crdtperf/optimize/conflict_batcher.h"
#include "crdtperf/optimize/performance_monitor.h"
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace crdtperf::optimize {

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Optimizer configuration
 */
struct OptimizerConfig {
    bool enabled{true};                             ///< start() is a no-op when false
    UInt64 compression_threshold_bytes{1024};       ///< Smaller deltas are sent as is
    CompressionConfig compression;
    LazySyncConfig lazy_sync;
    ConflictBatchConfig conflict_batch;
    PerformanceMonitorConfig performance;

    /**
     * @brief Default configuration
     */
    static OptimizerConfig default_config() noexcept {
        return OptimizerConfig{};
    }

    /**
     * @brief Configuration with optimization disabled
     */
    static OptimizerConfig disabled() noexcept {
        OptimizerConfig config;
        config.enabled = false;
        return config;
    }
};

// ============================================================================
// Engine Callbacks
// ============================================================================

/// Delta to send to a peer, std::nullopt when there is nothing to send
using DeltaProvider = std::function<std::optional<nlohmann::json>(const PeerId& peer)>;

/// Sends bytes to a peer, returns whether the peer accepted them
using TransmitFunction = std::function<bool(const PeerId& peer,
                                            const std::vector<UInt8>& bytes,
                                            CompressionAlgorithm algorithm)>;

// ============================================================================
// Results
// ============================================================================

/**
 * @brief Bytes ready for the wire
 */
struct TransmissionPayload {
    std::vector<UInt8> bytes;
    CompressionAlgorithm algorithm{CompressionAlgorithm::None};
    UInt64 original_size{0};
    Real compression_ratio{1.0};
};

/**
 * @brief Snapshot returned by get_optimization_status()
 */
struct OptimizationStatus {
    bool enabled{false};
    bool scheduler_active{false};
    bool monitor_active{false};
    PerformanceSummary performance_summary;
    SizeT queue_depth{0};
    SizeT pending_conflict_count{0};

    nlohmann::json to_json() const;
};

/**
 * @brief Map an activity level name to a priority
 *
 * "high" -> High, "low" -> Low, anything else -> Normal.
 */
SyncPriority activity_level_to_priority(std::string_view activity_level) noexcept;

// ============================================================================
// Performance Optimizer
// ============================================================================

class PerformanceOptimizer {
public:
    explicit PerformanceOptimizer(std::string node_id,
                                  OptimizerConfig config = OptimizerConfig::default_config());
    ~PerformanceOptimizer();

    // Non-copyable
    PerformanceOptimizer(const PerformanceOptimizer&) = delete;
    PerformanceOptimizer& operator=(const PerformanceOptimizer&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Start the scheduler and the performance sampler
     * @return Success (also when disabled), AlreadyRunning or InvalidConfiguration
     */
    Status start();

    /**
     * @brief Stop all background activity and drain pending conflicts
     */
    Status stop();

    bool is_running() const;
    bool is_enabled() const;

    // ========================================================================
    // Engine Callbacks
    // ========================================================================

    void set_delta_provider(DeltaProvider provider);
    void set_transport(TransmitFunction transmit);

    /**
     * @brief Observer notified after every scheduled sync
     */
    void set_sync_observer(SyncObserver observer);

    /**
     * @brief Observer notified with every flushed conflict batch
     */
    void set_conflict_observer(BatchObserver observer);

    void register_conflict_resolver(const std::string& conflict_type, ConflictGroupResolver resolver);
    void set_default_conflict_resolver(ConflictGroupResolver resolver);

    // ========================================================================
    // Operations
    // ========================================================================

    /**
     * @brief Serialize and compress a delta for sending
     *
     * Deltas below compression_threshold_bytes, and deltas the selected
     * codec does not shrink, are sent uncompressed with algorithm none.
     *
     * @return Success or SerializationFailed
     */
    Status optimize_delta_for_transmission(const nlohmann::json& delta, TransmissionPayload& payload);

    /**
     * @brief Decode bytes received from a peer
     */
    Status decode_received_delta(const std::vector<UInt8>& bytes, CompressionAlgorithm algorithm,
                                 nlohmann::json& delta);

    /**
     * @brief Schedule a sync with a peer
     * @param activity_level "high", "normal" or "low" (unknown values mean normal)
     */
    void schedule_optimized_sync(const PeerId& peer, std::string_view activity_level = "normal");

    /**
     * @brief Count operations exchanged with a peer
     */
    void record_peer_activity(const PeerId& peer, UInt64 count = 1);

    /**
     * @brief Queue a conflict for batched resolution
     */
    void batch_conflict_resolution(ConflictRecord conflict);

    /**
     * @brief Current state of the optimizer
     */
    OptimizationStatus get_optimization_status() const;

    // ========================================================================
    // Components
    // ========================================================================

    DeltaCompressor& compressor();
    LazySynchronizer& synchronizer();
    ConflictBatcher& conflict_batcher();
    PerformanceMonitor& performance_monitor();
    const PerformanceMonitor& performance_monitor() const;

    const std::string& node_id() const;
    const OptimizerConfig& config() const;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;   ///< Shared with background ticks that outlive a stop timeout
};

} // namespace crdtperf::optimize
