#pragma once
/**
 * @file performance_monitor.h
 * @brief Operation timing and process resource instrumentation
 *
 * measure() wraps an operation, records wall time, resident memory growth
 * and CPU utilisation in a PerformanceSample and re-throws whatever the
 * operation threw. A background sampler periodically logs the process
 * resource usage.
 */

#include "crdtperf/core/types.h"
#include "crdtperf/core/status.h"
#include "crdtperf/core/records.h"
#include "crdtperf/core/process_stats.h"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace crdtperf::optimize {

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Performance monitor configuration
 */
struct PerformanceMonitorConfig {
    SizeT history_capacity{1000};                       ///< Samples kept
    Duration sampling_interval{std::chrono::seconds(10)};  ///< Resource sampler period
    Duration stop_timeout{std::chrono::seconds(5)};

    /**
     * @brief Default configuration
     */
    static PerformanceMonitorConfig default_config() noexcept {
        return PerformanceMonitorConfig{};
    }
};

// ============================================================================
// Summary
// ============================================================================

/**
 * @brief Min / max / average / p95 of a series
 */
struct LatencyStats {
    Real average{0.0};
    Real min{0.0};
    Real max{0.0};
    Real p95{0.0};
};

/**
 * @brief Average and peak of a series
 */
struct UsageStats {
    Real average{0.0};
    Real peak{0.0};
};

/**
 * @brief Aggregate of the recorded samples
 *
 * `has_data` is false when no sample matched; all other fields are then
 * zero.
 */
struct PerformanceSummary {
    bool has_data{false};
    std::optional<std::string> operation_type;  ///< Filter applied, if any
    UInt64 total_operations{0};
    Real success_rate{0.0};
    LatencyStats latency_ms;
    UsageStats memory_usage_mb;
    UsageStats cpu_usage_percent;

    /**
     * @brief JSON view; `{"error": "No performance data available"}` without data
     */
    nlohmann::json to_json() const;
};

// ============================================================================
// Performance Monitor
// ============================================================================

/**
 * @brief Bounded history of operation samples
 *
 * Thread-safe. measure() may be called concurrently from any thread.
 */
class PerformanceMonitor {
public:
    explicit PerformanceMonitor(
        PerformanceMonitorConfig config = PerformanceMonitorConfig::default_config());
    ~PerformanceMonitor();

    // Non-copyable
    PerformanceMonitor(const PerformanceMonitor&) = delete;
    PerformanceMonitor& operator=(const PerformanceMonitor&) = delete;

    /**
     * @brief Run an operation and record a sample for it
     *
     * The sample is recorded with success=false if `fn` throws; the
     * exception is then re-thrown unchanged.
     *
     * @param operation_type Label of the sample
     * @param fn Operation to run
     * @param payload_size_bytes Bytes handled by the operation
     * @return Whatever `fn` returns
     */
    template<typename Fn>
    auto measure(std::string_view operation_type, Fn&& fn, UInt64 payload_size_bytes = 0)
        -> std::invoke_result_t<Fn&> {
        const core::ResourceReading start = core::read_process_resources();
        try {
            if constexpr (std::is_void_v<std::invoke_result_t<Fn&>>) {
                fn();
                finish_operation(operation_type, start, true, payload_size_bytes);
            } else {
                auto result = fn();
                finish_operation(operation_type, start, true, payload_size_bytes);
                return result;
            }
        } catch (...) {
            finish_operation(operation_type, start, false, payload_size_bytes);
            throw;
        }
    }

    /**
     * @brief Record an externally measured operation
     */
    void record_sample(PerformanceSample sample);

    /**
     * @brief Aggregate all samples, or those of one operation type
     */
    PerformanceSummary summary(const std::optional<std::string>& operation_type = std::nullopt) const;

    /**
     * @brief Copy of the sample history, oldest first
     */
    std::vector<PerformanceSample> history() const;

    SizeT sample_count() const;

    // ========================================================================
    // Resource Sampler
    // ========================================================================

    /**
     * @brief Start the background resource sampler
     */
    Status start();

    /**
     * @brief Stop the background resource sampler
     */
    Status stop();

    bool is_running() const;

    /**
     * @brief Latest reading taken by the sampler
     */
    core::ResourceReading last_reading() const;

    /**
     * @brief CPU utilisation between the two latest sampler readings
     */
    Real last_cpu_percent() const;

private:
    void finish_operation(std::string_view operation_type,
                          const core::ResourceReading& start,
                          bool success, UInt64 payload_size_bytes);

    struct Impl;
    std::shared_ptr<Impl> impl_;   ///< Shared with background ticks that outlive a stop timeout
};

/**
 * @brief Aggregate a set of samples
 */
PerformanceSummary summarize_samples(const std::vector<PerformanceSample>& samples);

} // namespace crdtperf::optimize
