#pragma once
/**
 * @file process_stats.h
 * @brief Resource usage probes for the current process
 */

#include "crdtperf/core/types.h"

namespace crdtperf::core {

/**
 * @brief Point-in-time resource reading
 */
struct ResourceReading {
    Real resident_memory_mb{0.0};   ///< Resident set size
    Real cpu_time_seconds{0.0};     ///< User + system CPU time consumed so far
    SteadyTime taken_at;            ///< When the reading was taken
};

/**
 * @brief Read resident memory and CPU time of this process
 *
 * Falls back to zeros for fields the platform cannot report.
 */
ResourceReading read_process_resources();

/**
 * @brief CPU utilisation between two readings, in percent of one core
 */
Real cpu_percent_between(const ResourceReading& start, const ResourceReading& end);

/**
 * @brief Resident memory growth between two readings in MB, never negative
 */
Real memory_growth_mb(const ResourceReading& start, const ResourceReading& end);

} // namespace crdtperf::core
