/**
 * @file metrics_export.cpp
 * @brief Metrics export implementation
 */

#include "crdtperf/monitor/metrics_export.h"
#include <cmath>

namespace crdtperf::monitor {

namespace {

template<typename T>
nlohmann::ordered_json to_json_array(const std::vector<T>& records) {
    nlohmann::ordered_json array = nlohmann::ordered_json::array();
    for (const auto& record : records) {
        array.push_back(crdtperf::to_json(record));
    }
    return array;
}

} // anonymous namespace

nlohmann::ordered_json build_metrics_export(const MetricsCollector& collector,
                                            Real window_hours,
                                            WallClockTime now) {
    const WallClockTime cutoff = window_start(window_hours, now);

    const auto health = collector.health_samples_since(cutoff);
    const auto syncs = collector.sync_attempts_since(cutoff);
    const auto conflicts = collector.conflicts_since(cutoff);

    nlohmann::ordered_json document;
    document["export_timestamp"] = format_iso8601(now);
    if (std::floor(window_hours) == window_hours) {
        document["time_range_hours"] = static_cast<Int64>(window_hours);
    } else {
        document["time_range_hours"] = window_hours;
    }
    document["health_metrics"] = to_json_array(health);
    document["sync_metrics"] = to_json_array(syncs);
    document["conflict_metrics"] = to_json_array(conflicts);
    document["summary"] = {
        {"total_health_records", health.size()},
        {"total_sync_records", syncs.size()},
        {"total_conflict_records", conflicts.size()}
    };
    return document;
}

std::string export_metrics_json(const MetricsCollector& collector,
                                Real window_hours,
                                WallClockTime now) {
    return build_metrics_export(collector, window_hours, now)
        .dump(2, ' ', true, nlohmann::ordered_json::error_handler_t::replace);
}

} // namespace crdtperf::monitor
