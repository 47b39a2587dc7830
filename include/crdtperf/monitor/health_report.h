#pragma once
/**
 * @file health_report.h
 * @brief Comprehensive health report and recommendations
 */

#include "crdtperf/monitor/metrics_collector.h"
#include "crdtperf/monitor/alerting.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace crdtperf::monitor {

/**
 * @brief Health status bands of the overall score
 */
enum class HealthStatus : UInt8 {
    Excellent = 0,  ///< >= 95
    Good,           ///< >= 85
    Warning,        ///< >= 70
    Critical        ///< < 70
};

/**
 * @brief Convert HealthStatus to string ("EXCELLENT", "GOOD", ...)
 */
const char* health_status_to_string(HealthStatus status);

/**
 * @brief Map a health score to its status band
 */
HealthStatus classify_health(Real score) noexcept;

/**
 * @brief Actionable recommendations for a health state
 *
 * Always returns at least one entry; "System operating optimally - no
 * immediate actions required" when nothing needs attention. Aggregations
 * without data produce no recommendation.
 */
std::vector<std::string> generate_recommendations(Real health_score,
                                                  const SyncPerformanceTrend& sync_trend,
                                                  const ConflictAnalysis& conflicts);

/**
 * @brief Snapshot returned by MonitoringCoordinator::get_comprehensive_health_report()
 */
struct HealthReport {
    WallClockTime timestamp;
    Real overall_health_score{100.0};
    HealthStatus health_status{HealthStatus::Excellent};
    HealthBreakdown breakdown;
    SyncPerformanceTrend sync_performance;
    ConflictAnalysis conflict_analysis;
    std::vector<std::string> recommendations;
    AlertingSummary alerting;

    nlohmann::ordered_json to_json() const;
};

} // namespace crdtperf::monitor
