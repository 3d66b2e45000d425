/**
 * @file random_source.h
 * @brief Randomness provider interface and the direct providers
 *
 * Three interchangeable strategies implement IRandomSource:
 *   - SecureRandomSource: one getrandom(2) read per call
 *   - PooledRandomSource (random_pool.h): pre-fetched secure bytes, leased per call
 *   - InsecureFastRandomSource: per-thread Mersenne Twister, NOT for secrets
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace uuidkit {

/**
 * @brief Source of random bytes
 *
 * Implementations must either fill all @p length bytes or throw
 * RandomSourceException. Partially filled output is never returned.
 */
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    /**
     * @brief Fill a buffer with random bytes
     * @param out Destination (non-owning)
     * @param length Number of bytes to write
     * @throws RandomSourceException if the source fails
     */
    virtual void fill(uint8_t* out, size_t length) = 0;
};

/**
 * @brief Operating system CSPRNG, read directly on every call
 */
class SecureRandomSource : public IRandomSource {
public:
    void fill(uint8_t* out, size_t length) override;
};

/**
 * @brief Fast non-cryptographic stream generator
 *
 * Each thread owns an std::mt19937_64 seeded once from std::random_device.
 * Output is predictable to an observer of enough prior output: never use it
 * for tokens, secrets or externally visible identifiers.
 */
class InsecureFastRandomSource : public IRandomSource {
public:
    void fill(uint8_t* out, size_t length) override;
};

} // namespace uuidkit
