/**
 * @file random_pool.h
 * @brief Pooled secure randomness
 *
 * Thread-safe pool of pre-fetched secure random buffers.
 * Features:
 * - Buffers filled from an upstream secure source, refilled when exhausted
 * - Exclusive RAII checkout: a buffer and its cursor belong to one caller
 * - Pool grows on demand, idle retention capped by maxIdle
 */

#pragma once

#include "uuidkit/random_source.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace uuidkit {

/// @brief Default size of a pooled buffer in bytes
constexpr size_t DEFAULT_POOL_BUFFER_SIZE = 4096;

/// @brief Default number of idle buffers retained by the pool
constexpr size_t DEFAULT_POOL_MAX_IDLE = 64;

/**
 * @brief Cursor-advancing buffer of secure random bytes
 *
 * Not thread-safe. Ownership is transferred through RandomBufferLease.
 */
class RandomBuffer {
private:
    IRandomSource& upstream_;
    std::vector<uint8_t> buf_;
    size_t pos_;

public:
    /**
     * @brief Allocate and fill the buffer
     * @throws RandomSourceException if the initial fill fails
     */
    RandomBuffer(IRandomSource& upstream, size_t size);

    /**
     * @brief Copy the next @p length bytes out, refilling first if needed
     *
     * @p length must not exceed capacity().
     */
    void next(uint8_t* out, size_t length);

    size_t capacity() const { return buf_.size(); }
    size_t remaining() const { return buf_.size() - pos_; }
};

class PooledRandomSource;

/**
 * @brief RAII checkout of a pooled buffer
 *
 * Automatically returns the buffer to the pool when destroyed. Holds a
 * non-owning pointer back to the pool: every lease must be released or
 * destroyed before its PooledRandomSource.
 */
class RandomBufferLease {
private:
    std::unique_ptr<RandomBuffer> buffer_;
    PooledRandomSource* pool_;  // Non-owning pointer to pool

public:
    RandomBufferLease(std::unique_ptr<RandomBuffer> buffer, PooledRandomSource* pool)
        : buffer_(std::move(buffer)), pool_(pool) {}

    ~RandomBufferLease();

    RandomBufferLease(const RandomBufferLease&) = delete;
    RandomBufferLease& operator=(const RandomBufferLease&) = delete;

    RandomBufferLease(RandomBufferLease&& other) noexcept
        : buffer_(std::move(other.buffer_)), pool_(other.pool_) {}

    RandomBufferLease& operator=(RandomBufferLease&& other) noexcept {
        if (this != &other) {
            release();
            buffer_ = std::move(other.buffer_);
            pool_ = other.pool_;
        }
        return *this;
    }

    RandomBuffer* get() const { return buffer_.get(); }
    RandomBuffer* operator->() const { return buffer_.get(); }

    bool isValid() const { return buffer_ != nullptr; }

    /**
     * @brief Return the buffer to the pool before destruction
     */
    void release();
};

/**
 * @brief Secure random source backed by a pool of leased buffers
 *
 * All bytes originate from the upstream source; the pool only amortizes the
 * number of upstream reads. Concurrent callers always hold distinct buffers.
 */
class PooledRandomSource : public IRandomSource {
private:
    IRandomSource& upstream_;
    size_t bufferSize_;
    size_t maxIdle_;

    std::vector<std::unique_ptr<RandomBuffer>> idleBuffers_;
    std::atomic<size_t> createdBuffers_;
    mutable std::mutex mutex_;

    friend class RandomBufferLease;

public:
    /**
     * @param upstream Secure source used to fill buffers (must outlive the pool)
     * @param bufferSize Bytes per buffer
     * @param maxIdle Maximum idle buffers kept for reuse
     */
    explicit PooledRandomSource(
        IRandomSource& upstream,
        size_t bufferSize = DEFAULT_POOL_BUFFER_SIZE,
        size_t maxIdle = DEFAULT_POOL_MAX_IDLE
    );

    ~PooledRandomSource() override;

    PooledRandomSource(const PooledRandomSource&) = delete;
    PooledRandomSource& operator=(const PooledRandomSource&) = delete;

    /**
     * @brief Check out a buffer, creating one if none is idle
     *
     * The returned lease must not outlive this pool.
     *
     * @throws RandomSourceException if a new buffer cannot be filled
     */
    RandomBufferLease acquire();

    /**
     * @brief Fill from a leased buffer
     *
     * Requests larger than one buffer bypass the pool and read upstream.
     */
    void fill(uint8_t* out, size_t length) override;

    /**
     * @brief Get pool statistics
     */
    struct Stats {
        size_t idleBuffers;
        size_t createdBuffers;
        size_t maxIdle;
        size_t bufferSize;
    };

    Stats getStats() const;

private:
    /**
     * @brief Return buffer to pool (called by RandomBufferLease)
     */
    void releaseBuffer(std::unique_ptr<RandomBuffer> buffer);
};

} // namespace uuidkit
