/**
 * @file v7_counter.h
 * @brief Lock-free sub-millisecond counter for v7 (RFC 9562 Section 6.2, Method 1)
 *
 * State is one 64-bit word: unix milliseconds in the upper bits, a 12-bit
 * sequence in the low bits. Updates use compare-and-swap only.
 */

#pragma once

#include "uuidkit/clock.h"

#include <atomic>
#include <cstdint>

namespace uuidkit {

/// @brief Width of the rand_a sequence field
constexpr unsigned V7_SEQUENCE_BITS = 12;
constexpr uint64_t V7_SEQUENCE_MASK = (1ULL << V7_SEQUENCE_BITS) - 1;

/// @brief One (milliseconds, sequence) pair handed to the v7 constructor
struct V7Moment {
    uint64_t milliseconds = 0;  ///< Unix milliseconds (48 bits)
    uint16_t sequence = 0;      ///< 12-bit counter within the millisecond
};

/**
 * @brief Strictly increasing (ms, seq) generator, never blocks on a lock
 *
 * If the wall clock has not advanced past the stored millisecond, the packed
 * word is incremented; sequence overflow carries into the millisecond field,
 * so logical time may briefly run ahead of the wall clock.
 */
class V7Counter {
private:
    MillisClock clock_;
    std::atomic<uint64_t> state_;

public:
    explicit V7Counter(MillisClock clock = systemUnixMillis);

    V7Counter(const V7Counter&) = delete;
    V7Counter& operator=(const V7Counter&) = delete;

    /**
     * @brief Claim the next (ms, seq) pair
     *
     * CAS retry loop; a failed swap means another caller advanced the state,
     * and the loser yields its time slice before retrying.
     */
    V7Moment next();

    /// @brief Raw packed state (diagnostics and tests)
    uint64_t packedState() const { return state_.load(std::memory_order_acquire); }
};

} // namespace uuidkit
