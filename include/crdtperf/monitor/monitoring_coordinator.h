#pragma once
/**
 * @file monitoring_coordinator.h
 * @brief Lifecycle owner of metrics collection and alerting
 *
 * The coordinator owns one MetricsCollector and one AlertingEngine. While
 * running it periodically pulls a HealthSample from the attached metrics
 * source, records it, evaluates the alert rules and logs the health score.
 */

#include "crdtperf/core/types.h"
#include "crdtperf/core/status.h"
#include "crdtperf/monitor/metrics_collector.h"
#include "crdtperf/monitor/alerting.h"
#include "crdtperf/monitor/health_report.h"
#include <memory>
#include <string>

namespace crdtperf::monitor {

/**
 * @brief Monitoring configuration
 */
struct MonitoringConfig {
    MetricsConfig metrics;
    AlertingConfig alerting;
    Duration sampling_interval{std::chrono::seconds(30)};   ///< Health sampling period
    Duration stop_timeout{std::chrono::seconds(5)};
    Real export_window_hours{24.0};                         ///< Default export window

    /**
     * @brief Default configuration
     */
    static MonitoringConfig default_config() noexcept {
        return MonitoringConfig{};
    }
};

/**
 * @brief Periodic health sampling, alerting and reporting
 *
 * Thread-safe. A sample source that throws or returns no sample skips the
 * tick; the loop keeps running.
 */
class MonitoringCoordinator {
public:
    explicit MonitoringCoordinator(MonitoringConfig config = MonitoringConfig::default_config());
    ~MonitoringCoordinator();

    // Non-copyable
    MonitoringCoordinator(const MonitoringCoordinator&) = delete;
    MonitoringCoordinator& operator=(const MonitoringCoordinator&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Start the sampling loop
     */
    Status start();

    /**
     * @brief Stop the sampling loop, waiting up to stop_timeout
     */
    Status stop();

    bool is_running() const;

    /**
     * @brief Attach the source of live health samples
     */
    void set_metrics_source(std::shared_ptr<IMetricsSource> source);

    /**
     * @brief Run one sampling tick on the calling thread
     * @return Success, NoData (no source attached) or CollectionFailed
     */
    Status sample_now(WallClockTime now = WallClock::now());

    // ========================================================================
    // Reporting
    // ========================================================================

    /**
     * @brief Health score, status, trends, recommendations and alerting state
     */
    HealthReport get_comprehensive_health_report(WallClockTime now = WallClock::now()) const;

    /**
     * @brief Export the metrics of the last `window_hours` as JSON
     */
    std::string export_metrics(Real window_hours, WallClockTime now = WallClock::now()) const;

    /**
     * @brief Export with the configured default window
     */
    std::string export_metrics() const;

    // ========================================================================
    // Components
    // ========================================================================

    MetricsCollector& metrics();
    const MetricsCollector& metrics() const;
    AlertingEngine& alerting();
    const AlertingEngine& alerting() const;

    const MonitoringConfig& config() const;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;   ///< Shared with background ticks that outlive a stop timeout
};

} // namespace crdtperf::monitor
