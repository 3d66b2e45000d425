/**
 * @file test_random_pool.cpp
 * @brief Unit tests for PooledRandomSource lease semantics, refill and idle cap
 */

#include <gtest/gtest.h>
#include <uuidkit/exceptions.h>
#include <uuidkit/random_pool.h>
#include "test_helpers.h"

#include <array>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace uuidkit;
using namespace test_helpers;

// ============================================================================
// RandomBuffer
// ============================================================================

TEST(RandomBufferTest, CursorAdvancesThenRefills) {
    SequentialRandomSource upstream;
    RandomBuffer buffer(upstream, 32);
    EXPECT_EQ(buffer.capacity(), 32u);
    EXPECT_EQ(buffer.remaining(), 32u);

    uint8_t out[16];
    buffer.next(out, 16);
    EXPECT_EQ(out[0], 0x00);
    EXPECT_EQ(out[15], 0x0F);
    EXPECT_EQ(buffer.remaining(), 16u);

    buffer.next(out, 16);
    EXPECT_EQ(out[0], 0x10);
    EXPECT_EQ(buffer.remaining(), 0u);

    // Exhausted: next call refills from upstream (bytes 0x20..)
    buffer.next(out, 16);
    EXPECT_EQ(out[0], 0x20);
    EXPECT_EQ(buffer.remaining(), 16u);
}

TEST(RandomBufferTest, RefillsWhenRequestDoesNotFit) {
    SequentialRandomSource upstream;
    RandomBuffer buffer(upstream, 20);

    uint8_t out[16];
    buffer.next(out, 16);
    buffer.next(out, 16);  // only 4 left: refill first
    EXPECT_EQ(out[0], 20);
    EXPECT_EQ(buffer.remaining(), 4u);
}

TEST(RandomBufferTest, InitialFillFailurePropagates) {
    FailingRandomSource upstream;
    EXPECT_THROW(RandomBuffer(upstream, 64), RandomSourceException);
}

// ============================================================================
// PooledRandomSource
// ============================================================================

TEST(PooledRandomSourceTest, Constructor_ZeroBufferSizeThrows) {
    SecureRandomSource upstream;
    EXPECT_THROW(PooledRandomSource(upstream, 0, 4), ConfigException);
}

TEST(PooledRandomSourceTest, LeaseReturnsBufferOnDestruction) {
    CountingRandomSource upstream;
    PooledRandomSource pool(upstream, 256, 4);

    {
        RandomBufferLease lease = pool.acquire();
        EXPECT_TRUE(lease.isValid());
        EXPECT_EQ(pool.getStats().idleBuffers, 0u);
    }

    auto stats = pool.getStats();
    EXPECT_EQ(stats.idleBuffers, 1u);
    EXPECT_EQ(stats.createdBuffers, 1u);
}

TEST(PooledRandomSourceTest, ManualReleaseAndMove) {
    SecureRandomSource upstream;
    PooledRandomSource pool(upstream, 64, 4);

    RandomBufferLease a = pool.acquire();
    RandomBufferLease b = std::move(a);
    EXPECT_FALSE(a.isValid());
    EXPECT_TRUE(b.isValid());

    b.release();
    EXPECT_FALSE(b.isValid());
    EXPECT_EQ(pool.getStats().idleBuffers, 1u);

    // Second release is a no-op
    b.release();
    EXPECT_EQ(pool.getStats().idleBuffers, 1u);
}

TEST(PooledRandomSourceTest, ReusesBufferAcrossCalls) {
    CountingRandomSource upstream;
    PooledRandomSource pool(upstream, 4096, 4);

    uint8_t out[16];
    for (int i = 0; i < 256; i++) {
        pool.fill(out, sizeof(out));
    }

    // 256 * 16 = 4096 bytes fit exactly in one buffer: a single upstream read
    EXPECT_EQ(upstream.fillCalls.load(), 1u);
    EXPECT_EQ(pool.getStats().createdBuffers, 1u);

    pool.fill(out, sizeof(out));
    EXPECT_EQ(upstream.fillCalls.load(), 2u);
}

TEST(PooledRandomSourceTest, OversizedRequestBypassesPool) {
    CountingRandomSource upstream;
    PooledRandomSource pool(upstream, 32, 4);

    std::vector<uint8_t> big(100);
    pool.fill(big.data(), big.size());

    EXPECT_EQ(upstream.fillCalls.load(), 1u);
    EXPECT_EQ(upstream.bytesServed.load(), 100u);
    EXPECT_EQ(pool.getStats().createdBuffers, 0u);
}

TEST(PooledRandomSourceTest, ConcurrentLeasesAreDistinct) {
    SecureRandomSource upstream;
    PooledRandomSource pool(upstream, 128, 8);

    RandomBufferLease a = pool.acquire();
    RandomBufferLease b = pool.acquire();
    RandomBufferLease c = pool.acquire();

    EXPECT_NE(a.get(), b.get());
    EXPECT_NE(b.get(), c.get());
    EXPECT_NE(a.get(), c.get());
    EXPECT_EQ(pool.getStats().createdBuffers, 3u);
}

TEST(PooledRandomSourceTest, IdleBuffersCappedAtMaxIdle) {
    SecureRandomSource upstream;
    PooledRandomSource pool(upstream, 64, 2);

    {
        std::vector<RandomBufferLease> leases;
        for (int i = 0; i < 5; i++) {
            leases.push_back(pool.acquire());
        }
    }

    auto stats = pool.getStats();
    EXPECT_EQ(stats.createdBuffers, 5u);
    EXPECT_EQ(stats.idleBuffers, 2u);
    EXPECT_EQ(stats.maxIdle, 2u);
    EXPECT_EQ(stats.bufferSize, 64u);
}

TEST(PooledRandomSourceTest, ConcurrentCallersNeverShareBytes) {
    SecureRandomSource upstream;
    PooledRandomSource pool(upstream, 1024, 16);

    constexpr int THREADS = 8;
    constexpr int PER_THREAD = 2000;

    std::mutex mu;
    std::set<std::array<uint8_t, 16>> seen;
    size_t total = 0;

    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; t++) {
        threads.emplace_back([&] {
            std::vector<std::array<uint8_t, 16>> local(PER_THREAD);
            for (auto& chunk : local) {
                pool.fill(chunk.data(), chunk.size());
            }
            std::lock_guard<std::mutex> lock(mu);
            for (const auto& chunk : local) {
                seen.insert(chunk);
                total++;
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(total, static_cast<size_t>(THREADS * PER_THREAD));
    EXPECT_EQ(seen.size(), total);
}

TEST(PooledRandomSourceTest, UpstreamFailurePropagates) {
    FailingRandomSource upstream;
    PooledRandomSource pool(upstream, 64, 2);
    uint8_t out[16];
    EXPECT_THROW(pool.fill(out, sizeof(out)), RandomSourceException);
    EXPECT_EQ(pool.getStats().createdBuffers, 0u);
}

TEST(PooledRandomSourceTest, LargeMaxIdleAllocatesNothingUpFront) {
    SecureRandomSource upstream;
    PooledRandomSource pool(upstream, 64, static_cast<size_t>(100000000000000ULL));

    uint8_t out[16];
    pool.fill(out, sizeof(out));
    auto stats = pool.getStats();
    EXPECT_EQ(stats.idleBuffers, 1u);
    EXPECT_EQ(stats.createdBuffers, 1u);
}

namespace {

/// Succeeds, then fails once on the call numbered @p failOn, then succeeds again
class FlakyRandomSource : public IRandomSource {
public:
    explicit FlakyRandomSource(int failOn) : failOn_(failOn) {}

    void fill(uint8_t* out, size_t length) override {
        if (++calls_ == failOn_) {
            throw RandomSourceException("transient failure");
        }
        inner_.fill(out, length);
    }

private:
    int failOn_;
    int calls_ = 0;
    SequentialRandomSource inner_;
};

} // anonymous namespace

TEST(PooledRandomSourceTest, FailedRefillLeavesBufferExhausted) {
    FlakyRandomSource upstream(2);
    PooledRandomSource pool(upstream, 16, 2);

    uint8_t out[16];
    pool.fill(out, sizeof(out));    // first fill of the new buffer
    EXPECT_THROW(pool.fill(out, sizeof(out)), RandomSourceException);

    // The buffer goes back idle with its cursor at the end
    auto stats = pool.getStats();
    EXPECT_EQ(stats.idleBuffers, 1u);
    EXPECT_EQ(stats.createdBuffers, 1u);
    {
        RandomBufferLease lease = pool.acquire();
        EXPECT_EQ(lease->remaining(), 0u);
    }

    // Next caller refills before reading: no byte is handed out twice
    pool.fill(out, sizeof(out));
    EXPECT_EQ(out[0], 16);
    EXPECT_EQ(pool.getStats().createdBuffers, 1u);
}
