/**
 * @file background_worker.cpp
 * @brief Periodic loop and one-shot deadline threads
 */

#include "crdtperf/core/background_worker.h"
#include "crdtperf/core/logging.h"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>

namespace crdtperf::core {

namespace {

template<typename Fn>
void run_guarded(const std::string& name, spdlog::logger& log, Fn&& fn) {
    try {
        fn();
    } catch (const std::exception& e) {
        log.error("{}: iteration failed: {}", name, e.what());
    } catch (...) {
        log.error("{}: iteration failed with a non-standard exception", name);
    }
}

} // anonymous namespace

// ============================================================================
// BackgroundWorker Implementation
// ============================================================================

struct BackgroundWorker::Shared {
    std::mutex mutex;
    std::condition_variable cv;
    std::condition_variable exit_cv;
    bool running{false};
    bool wake_requested{false};
    UInt64 run{0};              ///< Bumped on every start()
    UInt64 exited_run{0};       ///< Latest run whose thread has exited
    Duration interval{std::chrono::seconds(1)};
    std::atomic<UInt64> ticks{0};

    // Caller holds `mutex`
    bool live(UInt64 own_run) const { return running && run == own_run; }
};

BackgroundWorker::BackgroundWorker(std::string name, Duration interval, TickFunction tick)
    : name_(std::move(name))
    , tick_(std::move(tick))
    , shared_(std::make_shared<Shared>()) {
    shared_->interval = interval;
}

BackgroundWorker::~BackgroundWorker() {
    stop();
}

Status BackgroundWorker::start() {
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        if (shared_->running) {
            return Status::AlreadyRunning;
        }
    }
    if (thread_.joinable()) {
        thread_.join();
    }

    UInt64 run = 0;
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        shared_->running = true;
        shared_->wake_requested = false;
        shared_->ticks = 0;
        run = ++shared_->run;
    }

    auto log = logging::get_logger("worker");
    thread_ = std::thread([shared = shared_, run, tick = tick_, name = name_, log]() {
        std::unique_lock<std::mutex> lock(shared->mutex);
        while (shared->live(run)) {
            lock.unlock();
            run_guarded(name, *log, tick);
            lock.lock();
            if (shared->run == run) {
                shared->ticks.fetch_add(1, std::memory_order_relaxed);
            }

            if (!shared->live(run)) break;
            shared->cv.wait_for(lock, shared->interval, [&shared, run]() {
                return !shared->live(run) || shared->wake_requested;
            });
            shared->wake_requested = false;
        }
        shared->exited_run = std::max(shared->exited_run, run);
        shared->exit_cv.notify_all();
    });

    log->debug("{}: started", name_);
    return Status::Success;
}

Status BackgroundWorker::stop(Duration timeout) {
    UInt64 run = 0;
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        if (!shared_->running) {
            return Status::NotRunning;
        }
        shared_->running = false;
        run = shared_->run;
    }
    shared_->cv.notify_all();

    auto log = logging::get_logger("worker");

    // Stopped from inside the tick: the loop exits on its own
    if (thread_.get_id() == std::this_thread::get_id()) {
        thread_.detach();
        return Status::Success;
    }

    bool exited = false;
    {
        std::unique_lock<std::mutex> lock(shared_->mutex);
        exited = shared_->exit_cv.wait_for(lock, timeout, [this, run]() {
            return shared_->exited_run >= run;
        });
    }

    if (!exited) {
        log->warn("{}: did not stop within {:.1f}s, abandoning thread",
                  name_, to_seconds(timeout));
        thread_.detach();
        return Status::Timeout;
    }

    if (thread_.joinable()) {
        thread_.join();
    }
    log->debug("{}: stopped", name_);
    return Status::Success;
}

bool BackgroundWorker::is_running() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->running;
}

void BackgroundWorker::wake() {
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        shared_->wake_requested = true;
    }
    shared_->cv.notify_all();
}

void BackgroundWorker::set_interval(Duration interval) {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    shared_->interval = interval;
}

UInt64 BackgroundWorker::tick_count() const {
    return shared_->ticks.load(std::memory_order_relaxed);
}

// ============================================================================
// DeadlineTimer Implementation
// ============================================================================

struct DeadlineTimer::Shared {
    std::mutex mutex;
    std::condition_variable cv;
    std::condition_variable exit_cv;
    bool running{false};
    UInt64 run{0};              ///< Bumped on every start()
    UInt64 exited_run{0};       ///< Latest run whose thread has exited

    bool armed{false};
    SteadyTime deadline;
    UInt64 token{0};
    UInt64 epoch{0};            ///< Bumped on every arm/cancel

    std::atomic<UInt64> fires{0};

    // Caller holds `mutex`
    bool live(UInt64 own_run) const { return running && run == own_run; }
};

DeadlineTimer::DeadlineTimer(std::string name, Callback callback)
    : name_(std::move(name))
    , callback_(std::move(callback))
    , shared_(std::make_shared<Shared>()) {}

DeadlineTimer::~DeadlineTimer() {
    stop();
}

Status DeadlineTimer::start() {
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        if (shared_->running) {
            return Status::AlreadyRunning;
        }
    }
    if (thread_.joinable()) {
        thread_.join();
    }

    UInt64 run = 0;
    {
        // Deadlines armed while stopped are kept and fire once the thread runs
        std::lock_guard<std::mutex> lock(shared_->mutex);
        shared_->running = true;
        shared_->fires = 0;
        run = ++shared_->run;
    }

    auto log = logging::get_logger("worker");
    thread_ = std::thread([shared = shared_, run, callback = callback_, name = name_, log]() {
        std::unique_lock<std::mutex> lock(shared->mutex);
        while (shared->live(run)) {
            if (!shared->armed) {
                shared->cv.wait(lock, [&shared, run]() {
                    return !shared->live(run) || shared->armed;
                });
                continue;
            }

            const UInt64 epoch = shared->epoch;
            const SteadyTime deadline = shared->deadline;
            bool interrupted = shared->cv.wait_until(lock, deadline, [&shared, run, epoch]() {
                return !shared->live(run) || shared->epoch != epoch;
            });
            if (interrupted) continue;

            const UInt64 token = shared->token;
            shared->armed = false;
            ++shared->epoch;
            lock.unlock();

            run_guarded(name, *log, [&callback, token]() { callback(token); });
            shared->fires.fetch_add(1, std::memory_order_relaxed);

            lock.lock();
        }
        shared->exited_run = std::max(shared->exited_run, run);
        shared->exit_cv.notify_all();
    });

    return Status::Success;
}

Status DeadlineTimer::stop(Duration timeout) {
    UInt64 run = 0;
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        if (!shared_->running) {
            return Status::NotRunning;
        }
        shared_->running = false;
        shared_->armed = false;
        ++shared_->epoch;
        run = shared_->run;
    }
    shared_->cv.notify_all();

    if (thread_.get_id() == std::this_thread::get_id()) {
        thread_.detach();
        return Status::Success;
    }

    bool exited = false;
    {
        std::unique_lock<std::mutex> lock(shared_->mutex);
        exited = shared_->exit_cv.wait_for(lock, timeout, [this, run]() {
            return shared_->exited_run >= run;
        });
    }

    if (!exited) {
        logging::get_logger("worker")->warn(
            "{}: did not stop within {:.1f}s, abandoning thread", name_, to_seconds(timeout));
        thread_.detach();
        return Status::Timeout;
    }

    if (thread_.joinable()) {
        thread_.join();
    }
    return Status::Success;
}

bool DeadlineTimer::is_running() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->running;
}

void DeadlineTimer::arm(Duration delay, UInt64 token) {
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        shared_->armed = true;
        shared_->deadline = SteadyClock::now() + delay;
        shared_->token = token;
        ++shared_->epoch;
    }
    shared_->cv.notify_all();
}

void DeadlineTimer::cancel() {
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        if (!shared_->armed) return;
        shared_->armed = false;
        ++shared_->epoch;
    }
    shared_->cv.notify_all();
}

bool DeadlineTimer::is_armed() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->armed;
}

UInt64 DeadlineTimer::fire_count() const {
    return shared_->fires.load(std::memory_order_relaxed);
}

} // namespace crdtperf::core
