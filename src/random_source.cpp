/**
 * @file random_source.cpp
 * @brief Direct secure and fast insecure randomness providers
 */

#include "uuidkit/random_source.h"
#include "uuidkit/exceptions.h"

#include <cerrno>
#include <cstring>
#include <random>
#include <string>
#include <sys/random.h>
#include <spdlog/spdlog.h>

namespace uuidkit {

// --- SecureRandomSource ---

void SecureRandomSource::fill(uint8_t* out, size_t length) {
    size_t filled = 0;
    while (filled < length) {
        ssize_t n = getrandom(out + filled, length - filled, 0);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            int err = errno;
            spdlog::critical("getrandom failed after {}/{} bytes: {}", filled, length, std::strerror(err));
            throw RandomSourceException(std::string("getrandom failed: ") + std::strerror(err));
        }
        if (n == 0) {
            spdlog::critical("getrandom returned no data after {}/{} bytes", filled, length);
            throw RandomSourceException("getrandom returned no data");
        }
        filled += static_cast<size_t>(n);
    }
}

// --- InsecureFastRandomSource ---

void InsecureFastRandomSource::fill(uint8_t* out, size_t length) {
    static thread_local std::mt19937_64 gen = [] {
        std::random_device rd;
        std::seed_seq seq{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
        return std::mt19937_64(seq);
    }();

    size_t pos = 0;
    while (pos < length) {
        uint64_t word = gen();
        size_t chunk = (length - pos < sizeof(word)) ? (length - pos) : sizeof(word);
        std::memcpy(out + pos, &word, chunk);
        pos += chunk;
    }
}

} // namespace uuidkit
