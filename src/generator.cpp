/**
 * @file generator.cpp
 * @brief Versioned identifier constructors
 */

#include "uuidkit/generator.h"

#include <algorithm>
#include <unistd.h>

namespace uuidkit {

namespace {

std::unique_ptr<IRandomSource> defaultSecureIfMissing(IRandomSource* injected) {
    if (injected) return nullptr;
    return std::make_unique<SecureRandomSource>();
}

std::unique_ptr<IRandomSource> defaultFastIfMissing(IRandomSource* injected) {
    if (injected) return nullptr;
    return std::make_unique<InsecureFastRandomSource>();
}

void putUint32(uint8_t* out, uint32_t v) {
    out[0] = static_cast<uint8_t>(v >> 24);
    out[1] = static_cast<uint8_t>(v >> 16);
    out[2] = static_cast<uint8_t>(v >> 8);
    out[3] = static_cast<uint8_t>(v);
}

void putUint16(uint8_t* out, uint16_t v) {
    out[0] = static_cast<uint8_t>(v >> 8);
    out[1] = static_cast<uint8_t>(v);
}

} // anonymous namespace

UuidGenerator::UuidGenerator(const GeneratorConfig& config)
    : UuidGenerator(config, Dependencies()) {}

UuidGenerator::UuidGenerator(const GeneratorConfig& config, Dependencies deps)
    : ownedSecure_(defaultSecureIfMissing(deps.secureRandom)),
      ownedFast_(defaultFastIfMissing(deps.fastRandom)),
      secure_(deps.secureRandom ? *deps.secureRandom : *ownedSecure_),
      fast_(deps.fastRandom ? *deps.fastRandom : *ownedFast_),
      randomPool_(secure_, config.randomPoolBufferSize, config.randomPoolMaxIdle),
      nodeResolver_(secure_, deps.nodeDiscovery ? std::move(deps.nodeDiscovery)
                                                : NodeDiscovery(discoverHardwareAddress)),
      clockSequence_(deps.tickClock ? std::move(deps.tickClock) : TickClock(systemUuidTicks),
                     secure_, deps.clockSeed),
      v7Counter_(deps.millisClock ? std::move(deps.millisClock) : MillisClock(systemUnixMillis))
{
}

UuidGenerator& UuidGenerator::defaultInstance() {
    static UuidGenerator instance(ConfigManager::getInstance().generatorConfig());
    return instance;
}

// --- Time-based ---

Uuid UuidGenerator::newGregorian(uint8_t version) {
    ClockMoment m = clockSequence_.next();
    NodeId node = nodeResolver_.resolve();

    Uuid id;
    uint8_t* b = id.data();
    uint64_t ts = m.timestamp;

    if (version == 6) {
        putUint32(b, static_cast<uint32_t>(ts >> 28));             // time_high
        putUint16(b + 4, static_cast<uint16_t>(ts >> 12));         // time_mid
        putUint16(b + 6, static_cast<uint16_t>(ts & 0x0FFF));      // time_low
    } else {
        putUint32(b, static_cast<uint32_t>(ts));                   // time_low
        putUint16(b + 4, static_cast<uint16_t>(ts >> 32));         // time_mid
        putUint16(b + 6, static_cast<uint16_t>((ts >> 48) & 0x0FFF)); // time_high
    }
    putUint16(b + 8, m.sequence);
    std::copy(node.begin(), node.end(), b + 10);

    id.stamp(version);
    return id;
}

Uuid UuidGenerator::newV1() {
    return newGregorian(1);
}

Uuid UuidGenerator::newV2(uint8_t domain) {
    Uuid id = newGregorian(1);

    uint32_t localId;
    switch (domain) {
        case static_cast<uint8_t>(DceDomain::PERSON):
            localId = static_cast<uint32_t>(getuid());
            break;
        case static_cast<uint8_t>(DceDomain::GROUP):
            localId = static_cast<uint32_t>(getgid());
            break;
        default:
            localId = 0;
            break;
    }

    putUint32(id.data(), localId);
    id.stamp(2);
    id.data()[9] = domain;
    return id;
}

Uuid UuidGenerator::newV6() {
    return newGregorian(6);
}

// --- Name-based ---

Uuid UuidGenerator::newV3(const Uuid& ns, std::string_view name) const {
    return nameBasedId(ns, name, HashAlgorithm::MD5);
}

Uuid UuidGenerator::newV5(const Uuid& ns, std::string_view name) const {
    return nameBasedId(ns, name, HashAlgorithm::SHA1);
}

// --- Random ---

Uuid UuidGenerator::newRandom(IRandomSource& random) {
    Uuid id;
    random.fill(id.data(), UUID_SIZE);
    id.stamp(4);
    return id;
}

Uuid UuidGenerator::newV4() {
    return newRandom(secure_);
}

Uuid UuidGenerator::newV4Pooled() {
    return newRandom(randomPool_);
}

Uuid UuidGenerator::newV4FastInsecure() {
    return newRandom(fast_);
}

// --- Unix-time ordered ---

Uuid UuidGenerator::newUnixTime(IRandomSource& random) {
    V7Moment m = v7Counter_.next();

    Uuid id;
    uint8_t* b = id.data();
    uint64_t ms = m.milliseconds & 0xFFFFFFFFFFFFULL;

    for (int i = 0; i < 6; i++) {
        b[i] = static_cast<uint8_t>(ms >> (40 - 8 * i));
    }
    putUint16(b + 6, static_cast<uint16_t>(m.sequence & V7_SEQUENCE_MASK));
    random.fill(b + 8, 8);

    id.stamp(7);
    return id;
}

Uuid UuidGenerator::newV7() {
    return newUnixTime(secure_);
}

Uuid UuidGenerator::newV7FastInsecure() {
    return newUnixTime(fast_);
}

// --- Free functions ---

Uuid newV1() { return UuidGenerator::defaultInstance().newV1(); }
Uuid newV2(uint8_t domain) { return UuidGenerator::defaultInstance().newV2(domain); }
Uuid newV3(const Uuid& ns, std::string_view name) { return nameBasedId(ns, name, HashAlgorithm::MD5); }
Uuid newV4() { return UuidGenerator::defaultInstance().newV4(); }
Uuid newV4Pooled() { return UuidGenerator::defaultInstance().newV4Pooled(); }
Uuid newV4FastInsecure() { return UuidGenerator::defaultInstance().newV4FastInsecure(); }
Uuid newV5(const Uuid& ns, std::string_view name) { return nameBasedId(ns, name, HashAlgorithm::SHA1); }
Uuid newV6() { return UuidGenerator::defaultInstance().newV6(); }
Uuid newV7() { return UuidGenerator::defaultInstance().newV7(); }
Uuid newV7FastInsecure() { return UuidGenerator::defaultInstance().newV7FastInsecure(); }

} // namespace uuidkit
