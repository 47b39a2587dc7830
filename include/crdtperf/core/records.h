#pragma once
/**
 * @file records.h
 * @brief Sample and record types exchanged between the replication engine,
 *        the optimizer and the monitoring components
 *
 * All records are plain values. Once handed to a history they are only
 * copied, never mutated, with the exception of ConflictRecord which is
 * resolved exactly once through mark_resolved().
 */

#include "crdtperf/core/types.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace crdtperf {

// ============================================================================
// Performance Sample
// ============================================================================

/**
 * @brief One instrumented operation
 */
struct PerformanceSample {
    std::string operation_type;             ///< e.g. "delta_compression", "peer_sync"
    Real latency_ms{0.0};                   ///< Wall time of the operation
    Real memory_usage_mb{0.0};              ///< Resident memory growth during the operation
    Real cpu_usage_percent{0.0};            ///< CPU utilisation during the operation
    WallClockTime timestamp;                ///< When the operation completed
    bool success{false};                    ///< Whether the operation returned normally
    UInt64 payload_size_bytes{0};           ///< Bytes handled by the operation
};

// ============================================================================
// Health Sample
// ============================================================================

/**
 * @brief Node health snapshot, one per monitoring tick
 */
struct HealthSample {
    WallClockTime timestamp;
    std::string sync_status{"active"};
    UInt32 active_peers{0};
    UInt64 total_operations{0};
    UInt64 successful_syncs{0};
    UInt64 failed_syncs{0};
    UInt64 conflicts_detected{0};
    UInt64 conflicts_resolved{0};
    Real average_sync_time_ms{0.0};
    Real partition_resilience{1.0};         ///< [0, 1]
    Real data_consistency_score{1.0};       ///< [0, 1]
    Real performance_impact_percent{0.0};

    /**
     * @brief Failed syncs over all syncs in this sample (0 when no syncs)
     */
    Real sync_failure_rate() const noexcept {
        const UInt64 total = successful_syncs + failed_syncs;
        if (total == 0) return 0.0;
        return static_cast<Real>(failed_syncs) / static_cast<Real>(total);
    }
};

// ============================================================================
// Sync Attempt
// ============================================================================

/**
 * @brief Outcome of one synchronization with a peer
 */
struct SyncAttempt {
    PeerId peer_id;
    Real duration_ms{0.0};
    UInt64 ops_sent{0};
    UInt64 ops_received{0};
    UInt64 bandwidth_bytes{0};
    Real compression_ratio{1.0};
    bool success{false};
    WallClockTime timestamp;
    std::optional<std::string> error;
};

// ============================================================================
// Conflict Record
// ============================================================================

/**
 * @brief A conflict reported by the replication engine
 *
 * Created at detection. Resolution fields are written once by
 * mark_resolved(); later calls are ignored.
 */
struct ConflictRecord {
    ConflictId conflict_id;
    std::string conflict_type{"unknown"};
    WallClockTime detected_at;
    std::optional<WallClockTime> resolved_at;
    std::string resolution_strategy;
    std::vector<PeerId> involved_peers;
    std::optional<Real> resolution_duration_ms;
    bool success{false};
    bool manual_intervention{false};

    bool is_resolved() const noexcept { return resolved_at.has_value(); }

    /**
     * @brief Record the resolution of this conflict
     * @return false if the conflict was already resolved
     */
    bool mark_resolved(std::string strategy, bool resolved_ok,
                       bool manual = false,
                       WallClockTime at = WallClock::now());
};

// ============================================================================
// Timestamp Formatting
// ============================================================================

/**
 * @brief Format as "YYYY-MM-DD HH:MM:SS[.ffffff]" (UTC)
 *
 * Fractional seconds are omitted when the microsecond part is zero.
 */
std::string format_timestamp(WallClockTime time);

/**
 * @brief Format as ISO-8601 "YYYY-MM-DDTHH:MM:SS[.ffffff]" (UTC)
 */
std::string format_iso8601(WallClockTime time);

// ============================================================================
// JSON Views
// ============================================================================

nlohmann::ordered_json to_json(const PerformanceSample& sample);
nlohmann::ordered_json to_json(const HealthSample& sample);
nlohmann::ordered_json to_json(const SyncAttempt& attempt);
nlohmann::ordered_json to_json(const ConflictRecord& record);

} // namespace crdtperf
