/**
 * @file clock.cpp
 * @brief System clock adapters
 */

#include "uuidkit/clock.h"

#include <chrono>

namespace uuidkit {

uint64_t systemUuidTicks() {
    auto sinceUnix = std::chrono::system_clock::now().time_since_epoch();
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(sinceUnix).count();
    return static_cast<uint64_t>(nanos / 100) + UUID_EPOCH_OFFSET;
}

uint64_t systemUnixMillis() {
    auto sinceUnix = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(sinceUnix).count());
}

} // namespace uuidkit
