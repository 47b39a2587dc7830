#pragma once
/**
 * @file lazy_synchronizer.h
 * @brief Adaptive per-peer sync scheduling
 *
 * Each peer accumulates an activity counter. When a sync is scheduled the
 * delay until it runs is derived from that counter and the requested
 * priority: busy peers and urgent requests sync sooner, idle peers later.
 * A background loop pops every due entry and runs the sync callback.
 */

#include "crdtperf/core/types.h"
#include "crdtperf/core/status.h"
#include "crdtperf/core/records.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace crdtperf::optimize {

// ============================================================================
// Sync Priority
// ============================================================================

/**
 * @brief Sync urgency, scales the adaptive interval
 */
enum class SyncPriority : UInt8 {
    Critical = 0,   ///< x0.1
    High,           ///< x0.5
    Normal,         ///< x1.0
    Low             ///< x2.0
};

/**
 * @brief Convert SyncPriority to string
 */
const char* sync_priority_to_string(SyncPriority priority);

/**
 * @brief Parse a priority name ("critical", "high", "normal", "low")
 */
std::optional<SyncPriority> parse_sync_priority(std::string_view name);

/**
 * @brief Interval multiplier of a priority
 */
Real priority_factor(SyncPriority priority) noexcept;

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Lazy synchronizer configuration
 */
struct LazySyncConfig {
    Seconds base_interval{60.0};            ///< Interval for moderately active peers
    Seconds min_interval{1.0};              ///< Lower clamp
    Seconds max_interval{3600.0};           ///< Upper clamp
    UInt64 high_activity_threshold{100};    ///< Above: interval / 4
    UInt64 medium_activity_threshold{10};   ///< Above: interval / 2
    UInt64 low_activity_threshold{5};       ///< Below: interval * 2
    Duration poll_interval{std::chrono::seconds(1)};  ///< Scheduler loop sleep
    bool reschedule_on_failure{true};       ///< Re-queue peers whose sync failed
    Duration stop_timeout{std::chrono::seconds(5)};

    /**
     * @brief Default configuration
     */
    static LazySyncConfig default_config() noexcept {
        return LazySyncConfig{};
    }

    /**
     * @brief Short intervals, suited to tests and local clusters
     */
    static LazySyncConfig responsive() noexcept {
        LazySyncConfig config;
        config.base_interval = Seconds(5.0);
        config.max_interval = Seconds(60.0);
        config.poll_interval = std::chrono::milliseconds(50);
        return config;
    }

    /**
     * @brief Validate the configuration
     */
    bool is_valid() const noexcept {
        return min_interval.count() > 0.0 &&
               max_interval >= min_interval &&
               base_interval.count() > 0.0 &&
               poll_interval.count() > 0;
    }
};

// ============================================================================
// Sync Execution
// ============================================================================

/**
 * @brief Result reported by the sync callback
 */
struct SyncOutcome {
    bool success{false};
    UInt64 ops_sent{0};
    UInt64 ops_received{0};
    UInt64 bandwidth_bytes{0};
    Real compression_ratio{1.0};
    std::optional<std::string> error;

    SyncOutcome() = default;
    SyncOutcome(bool ok) : success(ok) {}   ///< Implicit, callbacks may return bool

    static SyncOutcome failure(std::string message) {
        SyncOutcome outcome;
        outcome.error = std::move(message);
        return outcome;
    }
};

/// Performs the sync with one peer
using SyncCallback = std::function<SyncOutcome(const PeerId& peer, SyncPriority priority)>;

/// Notified after every sync attempt, successful or not
using SyncObserver = std::function<void(const SyncAttempt& attempt)>;

/**
 * @brief Scheduler statistics
 */
struct LazySyncStats {
    UInt64 scheduled{0};        ///< schedule_sync() calls
    UInt64 attempted{0};        ///< Syncs executed
    UInt64 succeeded{0};
    UInt64 failed{0};
    UInt64 rescheduled{0};      ///< Failed syncs put back in the queue
};

// ============================================================================
// Lazy Synchronizer
// ============================================================================

/**
 * @brief Time-ordered sync queue with an adaptive interval per peer
 *
 * Thread-safe. The sync callback and the observer run on the scheduler
 * thread (or on the caller of process_due()) without any lock held.
 */
class LazySynchronizer {
public:
    explicit LazySynchronizer(std::string node_id,
                              LazySyncConfig config = LazySyncConfig::default_config());
    ~LazySynchronizer();

    // Non-copyable
    LazySynchronizer(const LazySynchronizer&) = delete;
    LazySynchronizer& operator=(const LazySynchronizer&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Start the scheduler loop
     * @return Success, AlreadyRunning or InvalidConfiguration
     */
    Status start();

    /**
     * @brief Stop the scheduler loop, waiting up to stop_timeout
     */
    Status stop();

    bool is_running() const;

    // ========================================================================
    // Scheduling
    // ========================================================================

    /**
     * @brief Set the function that performs a sync
     */
    void set_sync_callback(SyncCallback callback);

    /**
     * @brief Set the observer notified after each attempt
     */
    void set_sync_observer(SyncObserver observer);

    /**
     * @brief Add to a peer's activity counter
     */
    void record_activity(const PeerId& peer, UInt64 count = 1);

    /**
     * @brief Current activity counter of a peer (0 if unknown)
     */
    UInt64 activity_count(const PeerId& peer) const;

    /**
     * @brief Adaptive interval for an activity level and priority
     *
     * base, divided by 4 above the high threshold, by 2 above the medium
     * threshold, doubled below the low threshold; then scaled by the
     * priority factor and clamped to [min_interval, max_interval].
     */
    Seconds compute_interval(UInt64 activity, SyncPriority priority) const noexcept;

    /**
     * @brief Queue a sync with a peer
     * @return Time at which the sync becomes due
     */
    SteadyTime schedule_sync(const PeerId& peer, SyncPriority priority = SyncPriority::Normal);

    /**
     * @brief Run every sync due at `now`
     * @return Number of syncs executed
     */
    SizeT process_due(SteadyTime now = SteadyClock::now());

    /**
     * @brief Number of queued syncs
     */
    SizeT queue_depth() const;

    /**
     * @brief Due time of the earliest queued sync
     */
    std::optional<SteadyTime> next_due() const;

    /**
     * @brief Completion time of the last sync with a peer
     */
    std::optional<WallClockTime> last_sync_time(const PeerId& peer) const;

    /**
     * @brief Get statistics
     */
    LazySyncStats get_statistics() const;

    const std::string& node_id() const;
    const LazySyncConfig& config() const;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;   ///< Shared with background ticks that outlive a stop timeout
};

} // namespace crdtperf::optimize
