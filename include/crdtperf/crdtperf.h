#pragma once
/**
 * @file crdtperf.h
 * @brief Main include file for crdtperf
 *
 * crdtperf - CRDT synchronization performance and observability library
 *
 * Include this single header to access all public crdtperf APIs.
 */

#include "crdtperf/core/types.h"
#include "crdtperf/core/status.h"
#include "crdtperf/core/logging.h"
#include "crdtperf/core/records.h"

#include "crdtperf/optimize/delta_compressor.h"
#include "crdtperf/optimize/lazy_synchronizer.h"
#include "crdtperf/optimize/conflict_batcher.h"
#include "crdtperf/optimize/performance_monitor.h"
#include "crdtperf/optimize/performance_optimizer.h"

#include "crdtperf/monitor/metrics_collector.h"
#include "crdtperf/monitor/alerting.h"
#include "crdtperf/monitor/health_report.h"
#include "crdtperf/monitor/metrics_export.h"
#include "crdtperf/monitor/monitoring_coordinator.h"

#include "crdtperf/config/config.h"
#include "crdtperf/node_context.h"

/**
 * @namespace crdtperf
 * @brief Root namespace for all crdtperf components
 */
namespace crdtperf {

/**
 * @brief Library version information
 */
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/**
 * @brief Get version string
 * @return Version string in format "major.minor.patch"
 */
constexpr const char* GetVersionString() noexcept {
    return "0.1.0";
}

} // namespace crdtperf
