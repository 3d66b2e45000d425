/**
 * @file random_pool.cpp
 * @brief Implementation of the pooled secure random source
 */

#include "uuidkit/random_pool.h"
#include "uuidkit/exceptions.h"

#include <cstring>
#include <spdlog/spdlog.h>

namespace uuidkit {

// --- RandomBuffer Implementation ---

RandomBuffer::RandomBuffer(IRandomSource& upstream, size_t size)
    : upstream_(upstream), buf_(size), pos_(0)
{
    upstream_.fill(buf_.data(), buf_.size());
}

void RandomBuffer::next(uint8_t* out, size_t length) {
    if (pos_ + length > buf_.size()) {
        upstream_.fill(buf_.data(), buf_.size());
        pos_ = 0;
    }
    std::memcpy(out, buf_.data() + pos_, length);
    pos_ += length;
}

// --- RandomBufferLease Implementation ---

RandomBufferLease::~RandomBufferLease() {
    release();
}

void RandomBufferLease::release() {
    if (buffer_ && pool_) {
        pool_->releaseBuffer(std::move(buffer_));
    }
    buffer_.reset();
}

// --- PooledRandomSource Implementation ---

PooledRandomSource::PooledRandomSource(IRandomSource& upstream, size_t bufferSize, size_t maxIdle)
    : upstream_(upstream),
      bufferSize_(bufferSize),
      maxIdle_(maxIdle),
      createdBuffers_(0)
{
    if (bufferSize_ == 0) {
        throw ConfigException("random pool buffer size must be positive");
    }
    spdlog::debug("PooledRandomSource created: bufferSize={}, maxIdle={}", bufferSize_, maxIdle_);
}

PooledRandomSource::~PooledRandomSource() {
    std::lock_guard<std::mutex> lock(mutex_);
    spdlog::debug("PooledRandomSource destroyed (idle={}, created={})",
                  idleBuffers_.size(), createdBuffers_.load());
    idleBuffers_.clear();
}

RandomBufferLease PooledRandomSource::acquire() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!idleBuffers_.empty()) {
            std::unique_ptr<RandomBuffer> buffer = std::move(idleBuffers_.back());
            idleBuffers_.pop_back();
            return RandomBufferLease(std::move(buffer), this);
        }
    }

    // Fill outside the lock: the upstream read is the slow part
    auto buffer = std::make_unique<RandomBuffer>(upstream_, bufferSize_);
    size_t created = ++createdBuffers_;
    spdlog::debug("Created new random buffer (created={})", created);
    return RandomBufferLease(std::move(buffer), this);
}

void PooledRandomSource::fill(uint8_t* out, size_t length) {
    if (length > bufferSize_) {
        upstream_.fill(out, length);
        return;
    }
    RandomBufferLease lease = acquire();
    lease->next(out, length);
}

PooledRandomSource::Stats PooledRandomSource::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Stats{
        idleBuffers_.size(),
        createdBuffers_.load(),
        maxIdle_,
        bufferSize_
    };
}

void PooledRandomSource::releaseBuffer(std::unique_ptr<RandomBuffer> buffer) {
    if (!buffer) return;

    std::lock_guard<std::mutex> lock(mutex_);
    if (idleBuffers_.size() >= maxIdle_) {
        // Over the idle cap: let the buffer go
        return;
    }
    idleBuffers_.push_back(std::move(buffer));
}

} // namespace uuidkit
