/**
 * @file clock_sequence.cpp
 * @brief Clock-sequence state machine implementation
 */

#include "uuidkit/clock_sequence.h"

#include <spdlog/spdlog.h>

namespace uuidkit {

ClockSequence::ClockSequence(TickClock clock, IRandomSource& seedSource,
                             std::optional<uint16_t> seed)
    : clock_(std::move(clock)),
      seedSource_(seedSource),
      fixedSeed_(seed),
      lastTimestamp_(0),
      sequence_(0) {}

void ClockSequence::seedOnce() {
    std::call_once(seedFlag_, [this]() {
        uint16_t seed;
        if (fixedSeed_) {
            seed = *fixedSeed_;
        } else {
            uint8_t b[2];
            seedSource_.fill(b, sizeof(b));
            seed = static_cast<uint16_t>((b[0] << 8) | b[1]);
        }

        std::lock_guard<std::mutex> lock(mutex_);
        sequence_ = seed & CLOCK_SEQUENCE_MASK;
        spdlog::debug("Clock sequence seeded: {:#06x}", sequence_);
    });
}

ClockMoment ClockSequence::next() {
    seedOnce();

    uint64_t now = clock_() & 0x0FFFFFFFFFFFFFFFULL;

    std::lock_guard<std::mutex> lock(mutex_);
    if (now <= lastTimestamp_) {
        sequence_ = (sequence_ + 1) & CLOCK_SEQUENCE_MASK;
    } else {
        lastTimestamp_ = now;
    }

    return ClockMoment{lastTimestamp_, sequence_};
}

} // namespace uuidkit
