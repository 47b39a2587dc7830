/**
 * @file health_report.cpp
 * @brief Health report implementation
 */

#include "crdtperf/monitor/health_report.h"

namespace crdtperf::monitor {

const char* health_status_to_string(HealthStatus status) {
    switch (status) {
        case HealthStatus::Excellent: return "EXCELLENT";
        case HealthStatus::Good: return "GOOD";
        case HealthStatus::Warning: return "WARNING";
        case HealthStatus::Critical: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

HealthStatus classify_health(Real score) noexcept {
    if (score >= 95.0) return HealthStatus::Excellent;
    if (score >= 85.0) return HealthStatus::Good;
    if (score >= 70.0) return HealthStatus::Warning;
    return HealthStatus::Critical;
}

std::vector<std::string> generate_recommendations(Real health_score,
                                                  const SyncPerformanceTrend& sync_trend,
                                                  const ConflictAnalysis& conflicts) {
    std::vector<std::string> recommendations;

    if (health_score < 85.0) {
        recommendations.emplace_back(
            "Overall health below optimal - investigate sync and conflict issues");
    }

    if (sync_trend.has_data) {
        if (sync_trend.success_rate < 0.9) {
            recommendations.emplace_back(
                "Sync success rate low - check network connectivity and peer health");
        }
        if (sync_trend.average_duration_ms > 1000.0) {
            recommendations.emplace_back(
                "Sync operations slow - consider enabling compression or reducing batch sizes");
        }
    }

    if (conflicts.has_data) {
        if (conflicts.resolution_rate < 0.8) {
            recommendations.emplace_back(
                "Conflict resolution rate low - review resolution strategies");
        }
        if (conflicts.manual_interventions > 5) {
            recommendations.emplace_back(
                "High manual interventions - consider updating automatic resolution rules");
        }
    }

    if (sync_trend.has_data && sync_trend.total_bandwidth_mb > 100.0) {
        recommendations.emplace_back("High bandwidth usage - enable delta compression");
    }

    if (recommendations.empty()) {
        recommendations.emplace_back("System operating optimally - no immediate actions required");
    }
    return recommendations;
}

nlohmann::ordered_json HealthReport::to_json() const {
    nlohmann::ordered_json j;
    j["timestamp"] = format_iso8601(timestamp);
    j["overall_health_score"] = overall_health_score;
    j["health_status"] = health_status_to_string(health_status);
    j["health_breakdown"] = breakdown.to_json();
    j["sync_performance"] = sync_performance.to_json();
    j["conflict_analysis"] = conflict_analysis.to_json();
    j["recommendations"] = recommendations;
    j["alerting"] = alerting.to_json();
    return j;
}

} // namespace crdtperf::monitor
