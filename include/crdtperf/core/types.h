#pragma once
/**
 * @file types.h
 * @brief Core type definitions for crdtperf
 *
 * This file defines fundamental types used throughout the library,
 * including numeric types, clock aliases and peer identifiers.
 */

#include <chrono>
#include <cstdint>
#include <cstddef>
#include <limits>
#include <string>

namespace crdtperf {

// ============================================================================
// Numeric Types
// ============================================================================

/**
 * @brief Primary floating-point type for scores, ratios and latencies
 */
using Real = double;

// Integer types
using Int32  = std::int32_t;
using Int64  = std::int64_t;
using UInt8  = std::uint8_t;
using UInt32 = std::uint32_t;
using UInt64 = std::uint64_t;
using SizeT  = std::size_t;

// ============================================================================
// Identifiers
// ============================================================================

/**
 * @brief Identifier of a replication peer
 */
using PeerId = std::string;

/**
 * @brief Identifier of a detected conflict
 */
using ConflictId = std::string;

// ============================================================================
// Time Types
// ============================================================================

/**
 * @brief Wall clock time used for recorded samples and exported metrics
 */
using WallClock = std::chrono::system_clock;
using WallClockTime = WallClock::time_point;

/**
 * @brief Monotonic clock used for scheduling and timing
 */
using SteadyClock = std::chrono::steady_clock;
using SteadyTime = SteadyClock::time_point;

/**
 * @brief Generic duration types
 */
using Duration = std::chrono::nanoseconds;
using Seconds = std::chrono::duration<Real>;
using Milliseconds = std::chrono::duration<Real, std::milli>;

/**
 * @brief Convert a duration to fractional milliseconds
 */
template<typename Rep, typename Period>
constexpr Real to_milliseconds(std::chrono::duration<Rep, Period> d) noexcept {
    return std::chrono::duration_cast<Milliseconds>(d).count();
}

/**
 * @brief Convert a duration to fractional seconds
 */
template<typename Rep, typename Period>
constexpr Real to_seconds(std::chrono::duration<Rep, Period> d) noexcept {
    return std::chrono::duration_cast<Seconds>(d).count();
}

} // namespace crdtperf
