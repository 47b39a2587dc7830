/**
 * @file records.cpp
 * @brief Record helpers and JSON views
 */

#include "crdtperf/core/records.h"
#include <algorithm>
#include <cstdio>
#include <ctime>

namespace crdtperf {

// ============================================================================
// ConflictRecord
// ============================================================================

bool ConflictRecord::mark_resolved(std::string strategy, bool resolved_ok,
                                   bool manual, WallClockTime at) {
    if (resolved_at.has_value()) {
        return false;
    }

    resolved_at = at;
    resolution_strategy = std::move(strategy);
    resolution_duration_ms = std::max(0.0, to_milliseconds(at - detected_at));
    success = resolved_ok;
    manual_intervention = manual_intervention || manual;
    return true;
}

// ============================================================================
// Timestamp Formatting
// ============================================================================

namespace {

std::string format_with_separator(WallClockTime time, char separator) {
    const auto since_epoch = time.time_since_epoch();
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(since_epoch - secs).count();
    if (micros < 0) {
        secs -= std::chrono::seconds(1);
        micros += 1000000;
    }

    const std::time_t tt = static_cast<std::time_t>(secs.count());
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif

    char buf[48];
    if (micros == 0) {
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d%c%02d:%02d:%02d",
                      tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, separator,
                      tm.tm_hour, tm.tm_min, tm.tm_sec);
    } else {
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d%c%02d:%02d:%02d.%06lld",
                      tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, separator,
                      tm.tm_hour, tm.tm_min, tm.tm_sec,
                      static_cast<long long>(micros));
    }
    return std::string(buf);
}

template<typename T>
nlohmann::ordered_json optional_value(const std::optional<T>& value) {
    if (!value) return nullptr;
    return *value;
}

} // anonymous namespace

std::string format_timestamp(WallClockTime time) {
    return format_with_separator(time, ' ');
}

std::string format_iso8601(WallClockTime time) {
    return format_with_separator(time, 'T');
}

// ============================================================================
// JSON Views
// ============================================================================

nlohmann::ordered_json to_json(const PerformanceSample& sample) {
    nlohmann::ordered_json j;
    j["operation_type"] = sample.operation_type;
    j["latency_ms"] = sample.latency_ms;
    j["memory_usage_mb"] = sample.memory_usage_mb;
    j["cpu_usage_percent"] = sample.cpu_usage_percent;
    j["timestamp"] = format_timestamp(sample.timestamp);
    j["success"] = sample.success;
    j["payload_size_bytes"] = sample.payload_size_bytes;
    return j;
}

// Field names below are the dashboard export contract
nlohmann::ordered_json to_json(const HealthSample& sample) {
    nlohmann::ordered_json j;
    j["timestamp"] = format_timestamp(sample.timestamp);
    j["sync_status"] = sample.sync_status;
    j["active_peers"] = sample.active_peers;
    j["total_operations"] = sample.total_operations;
    j["successful_syncs"] = sample.successful_syncs;
    j["failed_syncs"] = sample.failed_syncs;
    j["conflicts_detected"] = sample.conflicts_detected;
    j["conflicts_resolved"] = sample.conflicts_resolved;
    j["average_sync_time_ms"] = sample.average_sync_time_ms;
    j["network_partition_resilience"] = sample.partition_resilience;
    j["data_consistency_score"] = sample.data_consistency_score;
    j["performance_impact_percent"] = sample.performance_impact_percent;
    return j;
}

nlohmann::ordered_json to_json(const SyncAttempt& attempt) {
    nlohmann::ordered_json j;
    j["peer_node"] = attempt.peer_id;
    j["sync_duration_ms"] = attempt.duration_ms;
    j["operations_sent"] = attempt.ops_sent;
    j["operations_received"] = attempt.ops_received;
    j["bandwidth_used_bytes"] = attempt.bandwidth_bytes;
    j["compression_ratio"] = attempt.compression_ratio;
    j["success"] = attempt.success;
    j["timestamp"] = format_timestamp(attempt.timestamp);
    j["error_message"] = optional_value(attempt.error);
    return j;
}

nlohmann::ordered_json to_json(const ConflictRecord& record) {
    nlohmann::ordered_json j;
    j["conflict_id"] = record.conflict_id;
    j["conflict_type"] = record.conflict_type;
    j["detection_time"] = format_timestamp(record.detected_at);
    if (record.resolved_at) {
        j["resolution_time"] = format_timestamp(*record.resolved_at);
    } else {
        j["resolution_time"] = nullptr;
    }
    j["resolution_strategy"] = record.resolution_strategy;
    j["involved_nodes"] = record.involved_peers;
    j["resolution_duration_ms"] = optional_value(record.resolution_duration_ms);
    j["success"] = record.success;
    j["manual_intervention"] = record.manual_intervention;
    return j;
}

} // namespace crdtperf
