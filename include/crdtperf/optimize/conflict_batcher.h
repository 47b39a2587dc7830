#pragma once
/**
 * @file conflict_batcher.h
 * @brief Batched conflict resolution
 *
 * Conflicts reported by the replication engine are accumulated and
 * resolved in groups. A batch is flushed when it reaches batch_size or
 * when `timeout` has passed since its first conflict, whichever comes
 * first. Every batch is flushed exactly once: each batch carries a
 * generation number and a deadline for an already flushed generation is
 * ignored.
 */

#include "crdtperf/core/types.h"
#include "crdtperf/core/status.h"
#include "crdtperf/core/records.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace crdtperf::optimize {

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Conflict batcher configuration
 */
struct ConflictBatchConfig {
    SizeT batch_size{10};                               ///< Flush when this many are pending
    Duration timeout{std::chrono::seconds(5)};          ///< Flush this long after the first conflict
    bool flush_on_stop{true};                           ///< Drain pending conflicts in stop()
    Duration stop_timeout{std::chrono::seconds(5)};

    /**
     * @brief Default configuration
     */
    static ConflictBatchConfig default_config() noexcept {
        return ConflictBatchConfig{};
    }

    bool is_valid() const noexcept {
        return batch_size > 0 && timeout.count() > 0;
    }
};

/**
 * @brief What caused a flush
 */
enum class FlushTrigger : UInt8 {
    Size = 0,       ///< batch_size reached
    Timeout,        ///< Deadline passed
    Manual,         ///< flush() called
    Shutdown        ///< stop() drained the batch
};

/**
 * @brief Convert FlushTrigger to string
 */
const char* flush_trigger_to_string(FlushTrigger trigger);

// ============================================================================
// Callbacks
// ============================================================================

/**
 * @brief Resolves one group of conflicts of the same type
 *
 * The group is sorted by detection time. Resolvers record the outcome on
 * each record with ConflictRecord::mark_resolved().
 */
using ConflictGroupResolver =
    std::function<void(const std::string& conflict_type, std::vector<ConflictRecord>& group)>;

/**
 * @brief Notified with every flushed batch after resolution
 */
using BatchObserver =
    std::function<void(FlushTrigger trigger, const std::vector<ConflictRecord>& batch)>;

/**
 * @brief Batcher statistics
 */
struct ConflictBatchStats {
    UInt64 conflicts_received{0};
    UInt64 conflicts_processed{0};
    UInt64 flushes{0};
    UInt64 size_flushes{0};
    UInt64 timeout_flushes{0};
    UInt64 manual_flushes{0};
    UInt64 shutdown_flushes{0};
    UInt64 groups_resolved{0};
    UInt64 resolver_failures{0};
    UInt64 unhandled_groups{0};     ///< Groups with no resolver registered
};

// ============================================================================
// Conflict Batcher
// ============================================================================

/**
 * @brief Accumulates conflicts and flushes them in grouped batches
 *
 * The deadline timer is started by the constructor. add_conflict() never
 * blocks on the timer; a size-triggered flush runs on the calling thread
 * before add_conflict() returns. A timeout flush runs on the timer thread.
 * Resolvers and the observer are invoked without the batch lock held.
 */
class ConflictBatcher {
public:
    explicit ConflictBatcher(ConflictBatchConfig config = ConflictBatchConfig::default_config());
    ~ConflictBatcher();

    // Non-copyable
    ConflictBatcher(const ConflictBatcher&) = delete;
    ConflictBatcher& operator=(const ConflictBatcher&) = delete;

    /**
     * @brief Restart the deadline timer after stop()
     */
    Status start();

    /**
     * @brief Stop the deadline timer, draining pending conflicts if configured
     */
    Status stop();

    bool is_running() const;

    /**
     * @brief Register the resolver for a conflict type (replaces any previous one)
     */
    void register_resolver(const std::string& conflict_type, ConflictGroupResolver resolver);

    /**
     * @brief Resolver for types without a registered resolver
     */
    void set_default_resolver(ConflictGroupResolver resolver);

    /**
     * @brief Set the observer notified with every flushed batch
     */
    void set_batch_observer(BatchObserver observer);

    /**
     * @brief Add a conflict to the current batch
     *
     * Arms the deadline when the batch goes from empty to non-empty and
     * flushes synchronously when batch_size is reached.
     */
    void add_conflict(ConflictRecord conflict);

    /**
     * @brief Flush the current batch
     * @return Number of conflicts processed (0 if the batch was empty)
     */
    SizeT flush(FlushTrigger trigger = FlushTrigger::Manual);

    /**
     * @brief Number of conflicts waiting in the current batch
     */
    SizeT pending_count() const;

    /**
     * @brief Get statistics
     */
    ConflictBatchStats get_statistics() const;

    const ConflictBatchConfig& config() const;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;   ///< Shared with background ticks that outlive a stop timeout
};

} // namespace crdtperf::optimize
