/**
 * @file clock.h
 * @brief Wall-clock sources used by the time-based generators
 *
 * Clocks are plain callables so tests can substitute fixed or regressing
 * time sources.
 */

#pragma once

#include <cstdint>
#include <functional>

namespace uuidkit {

/// @brief Returns 100ns ticks since 1582-10-15 00:00:00 UTC (60 bits used)
using TickClock = std::function<uint64_t()>;

/// @brief Returns milliseconds since the Unix epoch (48 bits used)
using MillisClock = std::function<uint64_t()>;

/// @brief 100ns intervals between the Gregorian reform (1582-10-15) and 1970-01-01
constexpr uint64_t UUID_EPOCH_OFFSET = 122192928000000000ULL;

/**
 * @brief Current system time in UUID ticks
 */
uint64_t systemUuidTicks();

/**
 * @brief Current system time in Unix milliseconds
 */
uint64_t systemUnixMillis();

} // namespace uuidkit
