#pragma once
/**
 * @file metrics_export.h
 * @brief JSON export of the recorded metrics
 *
 * Layout (keys in this order, two-space indent):
 * @code
 * {
 *   "export_timestamp": "2024-05-01T12:00:00.123456",
 *   "time_range_hours": 24,
 *   "health_metrics": [ ... ],
 *   "sync_metrics": [ ... ],
 *   "conflict_metrics": [ ... ],
 *   "summary": {
 *     "total_health_records": 0,
 *     "total_sync_records": 0,
 *     "total_conflict_records": 0
 *   }
 * }
 * @endcode
 */

#include "crdtperf/monitor/metrics_collector.h"
#include <nlohmann/json.hpp>
#include <string>

namespace crdtperf::monitor {

/**
 * @brief Build the export document for the last `window_hours`
 */
nlohmann::ordered_json build_metrics_export(const MetricsCollector& collector,
                                            Real window_hours,
                                            WallClockTime now = WallClock::now());

/**
 * @brief Serialized export document (ASCII-escaped, indent 2)
 */
std::string export_metrics_json(const MetricsCollector& collector,
                                Real window_hours,
                                WallClockTime now = WallClock::now());

} // namespace crdtperf::monitor
