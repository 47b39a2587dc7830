#pragma once
/**
 * @file background_worker.h
 * @brief Background execution primitives shared by all long-lived loops
 *
 * Two primitives cover every background activity in the library:
 * - BackgroundWorker: a named thread that runs a tick function, then sleeps
 *   for a fixed interval until stopped (scheduler poll loop, performance
 *   sampler, monitoring sampler).
 * - DeadlineTimer: a named thread that fires a callback once when an armed
 *   deadline passes (conflict batch timeout). Re-arming replaces the
 *   previous deadline and cancel() disarms it.
 *
 * stop() never blocks longer than the supplied timeout. A thread that does
 * not exit in time is detached and abandoned; the owner gets Status::Timeout.
 * The state shared with the thread lives as long as the thread does, and an
 * abandoned thread never runs again once it sees that a later start() began.
 */

#include "crdtperf/core/types.h"
#include "crdtperf/core/status.h"
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace crdtperf::core {

/// Default bounded wait for stop()
inline constexpr Duration DEFAULT_STOP_TIMEOUT = std::chrono::seconds(5);

// ============================================================================
// BackgroundWorker
// ============================================================================

/**
 * @brief Periodic loop running on its own thread
 *
 * Exceptions escaping the tick function are logged and the loop continues
 * with the next tick.
 */
class BackgroundWorker {
public:
    using TickFunction = std::function<void()>;

    /**
     * @brief Construct a stopped worker
     * @param name Name used in log messages
     * @param interval Sleep between two ticks
     * @param tick Function executed on every iteration
     */
    BackgroundWorker(std::string name, Duration interval, TickFunction tick);

    /**
     * @brief Destructor - stops the loop with the default timeout
     */
    ~BackgroundWorker();

    // Non-copyable, non-moveable
    BackgroundWorker(const BackgroundWorker&) = delete;
    BackgroundWorker& operator=(const BackgroundWorker&) = delete;

    /**
     * @brief Start the loop
     * @return AlreadyRunning if the loop is active
     */
    Status start();

    /**
     * @brief Signal the loop to exit and wait for it
     * @param timeout Maximum time to wait for the thread
     * @return NotRunning, Timeout (thread abandoned) or Success
     */
    Status stop(Duration timeout = DEFAULT_STOP_TIMEOUT);

    /**
     * @brief Check if the loop is active
     */
    bool is_running() const;

    /**
     * @brief Wake the loop so the next tick runs without waiting
     */
    void wake();

    /**
     * @brief Change the sleep interval (applies from the next sleep)
     */
    void set_interval(Duration interval);

    /**
     * @brief Number of ticks executed since the last start()
     */
    UInt64 tick_count() const;

    const std::string& name() const { return name_; }

private:
    struct Shared;

    std::string name_;
    TickFunction tick_;
    const std::shared_ptr<Shared> shared_;
    std::thread thread_;
};

// ============================================================================
// DeadlineTimer
// ============================================================================

/**
 * @brief One-shot deadline running on its own thread
 *
 * The callback receives the token passed to arm(), which lets the owner
 * ignore a deadline that belongs to work it has already completed.
 */
class DeadlineTimer {
public:
    using Callback = std::function<void(UInt64 token)>;

    DeadlineTimer(std::string name, Callback callback);
    ~DeadlineTimer();

    // Non-copyable, non-moveable
    DeadlineTimer(const DeadlineTimer&) = delete;
    DeadlineTimer& operator=(const DeadlineTimer&) = delete;

    /**
     * @brief Start the timer thread
     */
    Status start();

    /**
     * @brief Stop the timer thread, dropping any armed deadline
     */
    Status stop(Duration timeout = DEFAULT_STOP_TIMEOUT);

    bool is_running() const;

    /**
     * @brief Arm (or re-arm) the deadline
     * @param delay Time until the callback fires
     * @param token Value handed back to the callback
     */
    void arm(Duration delay, UInt64 token);

    /**
     * @brief Disarm the deadline if armed
     */
    void cancel();

    /**
     * @brief Check if a deadline is pending
     */
    bool is_armed() const;

    /**
     * @brief Number of times the callback fired since the last start()
     */
    UInt64 fire_count() const;

    const std::string& name() const { return name_; }

private:
    struct Shared;

    std::string name_;
    Callback callback_;
    const std::shared_ptr<Shared> shared_;
    std::thread thread_;
};

} // namespace crdtperf::core
