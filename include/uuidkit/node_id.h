/**
 * @file node_id.h
 * @brief Node identifier resolution for time-based identifiers (v1, v2, v6)
 *
 * The node field carries a 6-byte IEEE 802 address when one is available.
 * Hosts without one get random node bytes with the multicast bit set
 * (RFC 9562 Section 6.10), which can never collide with a real address.
 */

#pragma once

#include "uuidkit/random_source.h"

#include <array>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>

namespace uuidkit {

/// @brief 48-bit node identifier
using NodeId = std::array<uint8_t, 6>;

/// @brief Hardware address lookup, std::nullopt if none exists
using NodeDiscovery = std::function<std::optional<NodeId>()>;

/**
 * @brief First non-loopback, non-zero link-layer address of at least 6 bytes
 *
 * Linux: enumerates AF_PACKET entries returned by getifaddrs(3).
 *
 * @return Address, or std::nullopt if no interface qualifies
 */
std::optional<NodeId> discoverHardwareAddress();

/**
 * @brief Resolves the node identifier once per resolver instance
 *
 * Discovery runs exactly once, behind std::call_once, even with concurrent
 * first callers. A discovered address is cached and immutable afterwards.
 * Without one, every resolve() draws fresh random bytes.
 */
class NodeIdResolver {
private:
    IRandomSource& random_;
    NodeDiscovery discovery_;

    std::once_flag discoverFlag_;
    NodeId cachedNode_;
    bool hasHardwareAddress_;

    void discoverOnce();

public:
    /**
     * @param random Secure source for the fallback node (must outlive resolver)
     * @param discovery Hardware address lookup
     */
    explicit NodeIdResolver(IRandomSource& random,
                            NodeDiscovery discovery = discoverHardwareAddress);

    NodeIdResolver(const NodeIdResolver&) = delete;
    NodeIdResolver& operator=(const NodeIdResolver&) = delete;

    /**
     * @brief Node bytes for the next identifier
     * @throws RandomSourceException if the fallback bytes cannot be drawn
     */
    NodeId resolve();

    /**
     * @brief True if a hardware address was found (triggers discovery)
     */
    bool hasHardwareAddress();
};

} // namespace uuidkit
