/**
 * @file clock_sequence.h
 * @brief Monotonic (timestamp, clock sequence) state for v1, v2 and v6
 */

#pragma once

#include "uuidkit/clock.h"
#include "uuidkit/random_source.h"

#include <cstdint>
#include <mutex>
#include <optional>

namespace uuidkit {

/// @brief Clock sequence is 14 bits wide
constexpr uint16_t CLOCK_SEQUENCE_MASK = 0x3FFF;

/// @brief One (timestamp, sequence) pair handed to a time-based constructor
struct ClockMoment {
    uint64_t timestamp = 0;  ///< 100ns ticks since 1582-10-15 (60 bits)
    uint16_t sequence = 0;   ///< 14-bit clock sequence
};

/**
 * @brief Clock-sequence state machine
 *
 * The recorded timestamp never decreases. When a sample does not exceed it
 * (same tick or clock regression) the sequence advances mod 2^14 and the
 * recorded timestamp is reused. All state access is serialized by one mutex.
 */
class ClockSequence {
private:
    TickClock clock_;
    IRandomSource& seedSource_;
    std::optional<uint16_t> fixedSeed_;

    std::once_flag seedFlag_;
    std::mutex mutex_;
    uint64_t lastTimestamp_;
    uint16_t sequence_;

    void seedOnce();

public:
    /**
     * @param clock Tick source
     * @param seedSource Secure source for the initial sequence (must outlive this)
     * @param seed Initial sequence instead of a random one (tests)
     */
    ClockSequence(TickClock clock, IRandomSource& seedSource,
                  std::optional<uint16_t> seed = std::nullopt);

    ClockSequence(const ClockSequence&) = delete;
    ClockSequence& operator=(const ClockSequence&) = delete;

    /**
     * @brief Sample the clock and advance the shared state
     * @throws RandomSourceException if seeding on first use fails
     */
    ClockMoment next();
};

} // namespace uuidkit
