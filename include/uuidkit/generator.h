/**
 * @file generator.h
 * @brief Versioned identifier constructors (v1-v7)
 *
 * A UuidGenerator owns all state shared between calls: clock sequence,
 * node identifier, v7 counter and the random buffer pool. Tests build
 * isolated instances with injected clocks and sources; applications normally
 * use the free functions, which forward to UuidGenerator::defaultInstance().
 *
 * All constructors are thread-safe.
 */

#pragma once

#include "uuidkit/clock.h"
#include "uuidkit/clock_sequence.h"
#include "uuidkit/config_manager.h"
#include "uuidkit/name_hasher.h"
#include "uuidkit/node_id.h"
#include "uuidkit/random_pool.h"
#include "uuidkit/random_source.h"
#include "uuidkit/uuid.h"
#include "uuidkit/v7_counter.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

namespace uuidkit {

/// @brief DCE Security domains for v2 (other values map to local id 0)
enum class DceDomain : uint8_t {
    PERSON = 0,  ///< Local id is the process uid
    GROUP = 1,   ///< Local id is the process gid
    ORG = 2      ///< Local id is 0
};

class UuidGenerator {
public:
    /**
     * @brief Collaborators of a generator; empty members use the system defaults
     *
     * Injected sources must outlive the generator.
     */
    struct Dependencies {
        TickClock tickClock;                   ///< v1/v2/v6 time source
        MillisClock millisClock;               ///< v7 time source
        IRandomSource* secureRandom = nullptr; ///< Direct secure source
        IRandomSource* fastRandom = nullptr;   ///< Insecure source for the *FastInsecure constructors
        NodeDiscovery nodeDiscovery;           ///< Hardware address lookup
        std::optional<uint16_t> clockSeed;     ///< Fixed initial clock sequence
    };

    explicit UuidGenerator(const GeneratorConfig& config = GeneratorConfig());
    UuidGenerator(const GeneratorConfig& config, Dependencies deps);

    UuidGenerator(const UuidGenerator&) = delete;
    UuidGenerator& operator=(const UuidGenerator&) = delete;

    /**
     * @brief Process-wide generator, configured from ConfigManager on first use
     */
    static UuidGenerator& defaultInstance();

    /// @name Time-based (Gregorian clock + node)
    /// @{

    /// @brief Version 1: time_low | time_mid | ver|time_high | var|clock_seq | node
    Uuid newV1();

    /**
     * @brief Version 2 (DCE Security)
     *
     * v1 with the low 32 time bits replaced by uid (domain 0), gid (domain 1)
     * or 0, and the clock_seq_low byte replaced by the domain byte.
     */
    Uuid newV2(uint8_t domain);
    Uuid newV2(DceDomain domain) { return newV2(static_cast<uint8_t>(domain)); }

    /// @brief Version 6: v1 fields reordered most significant first (sortable)
    Uuid newV6();

    /// @}

    /// @name Name-based
    /// @{

    /// @brief Version 3 (MD5)
    Uuid newV3(const Uuid& ns, std::string_view name) const;

    /// @brief Version 5 (SHA-1)
    Uuid newV5(const Uuid& ns, std::string_view name) const;

    /// @}

    /// @name Random
    /// @{

    /// @brief Version 4, one secure read per call
    Uuid newV4();

    /// @brief Version 4 from the pooled secure buffers
    Uuid newV4Pooled();

    /**
     * @brief Version 4 from the fast insecure generator
     * @warning Predictable. Internal identifiers only.
     */
    Uuid newV4FastInsecure();

    /// @}

    /// @name Unix-time ordered
    /// @{

    /// @brief Version 7: unix_ts_ms | ver|seq | var|rand_b (secure rand_b)
    Uuid newV7();

    /**
     * @brief Version 7 with rand_b from the fast insecure generator
     * @warning rand_b is predictable. Internal identifiers only.
     */
    Uuid newV7FastInsecure();

    /// @}

    /// @name State access (diagnostics and tests)
    /// @{
    ClockSequence& clockSequence() { return clockSequence_; }
    V7Counter& v7Counter() { return v7Counter_; }
    NodeIdResolver& nodeResolver() { return nodeResolver_; }
    PooledRandomSource& randomPool() { return randomPool_; }
    /// @}

private:
    // Owned defaults, used when Dependencies leaves a source empty
    std::unique_ptr<IRandomSource> ownedSecure_;
    std::unique_ptr<IRandomSource> ownedFast_;

    IRandomSource& secure_;
    IRandomSource& fast_;
    PooledRandomSource randomPool_;
    NodeIdResolver nodeResolver_;
    ClockSequence clockSequence_;
    V7Counter v7Counter_;

    Uuid newGregorian(uint8_t version);
    Uuid newUnixTime(IRandomSource& random);
    static Uuid newRandom(IRandomSource& random);
};

/// @name Free functions on the default generator
/// @{
Uuid newV1();
Uuid newV2(uint8_t domain);
inline Uuid newV2(DceDomain domain) { return newV2(static_cast<uint8_t>(domain)); }
Uuid newV3(const Uuid& ns, std::string_view name);
Uuid newV4();
Uuid newV4Pooled();
Uuid newV4FastInsecure();
Uuid newV5(const Uuid& ns, std::string_view name);
Uuid newV6();
Uuid newV7();
Uuid newV7FastInsecure();
/// @}

} // namespace uuidkit
