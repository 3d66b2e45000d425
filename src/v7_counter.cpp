/**
 * @file v7_counter.cpp
 * @brief Lock-free v7 counter implementation
 */

#include "uuidkit/v7_counter.h"

#include <thread>

namespace uuidkit {

V7Counter::V7Counter(MillisClock clock)
    : clock_(std::move(clock)),
      state_(0) {}

V7Moment V7Counter::next() {
    uint64_t current = state_.load(std::memory_order_acquire);
    while (true) {
        uint64_t nowMs = clock_() & 0xFFFFFFFFFFFFULL;
        uint64_t currentMs = current >> V7_SEQUENCE_BITS;

        uint64_t candidate;
        if (nowMs > currentMs) {
            candidate = nowMs << V7_SEQUENCE_BITS;
        } else {
            candidate = current + 1;
        }

        // On failure `current` is reloaded with the winning value
        if (state_.compare_exchange_weak(current, candidate,
                std::memory_order_acq_rel, std::memory_order_acquire)) {
            return V7Moment{
                candidate >> V7_SEQUENCE_BITS,
                static_cast<uint16_t>(candidate & V7_SEQUENCE_MASK)
            };
        }

        std::this_thread::yield();
    }
}

} // namespace uuidkit
