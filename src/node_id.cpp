/**
 * @file node_id.cpp
 * @brief Node identifier discovery and fallback
 */

#include "uuidkit/node_id.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>
#include <ifaddrs.h>
#include <net/if.h>
#include <netpacket/packet.h>
#include <sys/socket.h>
#include <spdlog/spdlog.h>

namespace uuidkit {

namespace {

std::string formatNode(const NodeId& node) {
    char buf[18];
    std::snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x",
                  node[0], node[1], node[2], node[3], node[4], node[5]);
    return std::string(buf);
}

} // anonymous namespace

std::optional<NodeId> discoverHardwareAddress() {
    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) != 0) {
        spdlog::warn("getifaddrs failed: {}", std::strerror(errno));
        return std::nullopt;
    }

    std::optional<NodeId> result;
    for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_PACKET) continue;
        if (ifa->ifa_flags & IFF_LOOPBACK) continue;

        auto* ll = reinterpret_cast<struct sockaddr_ll*>(ifa->ifa_addr);
        if (ll->sll_halen < 6) continue;

        NodeId node;
        std::memcpy(node.data(), ll->sll_addr, node.size());

        bool allZero = true;
        for (uint8_t b : node) {
            if (b != 0) {
                allZero = false;
                break;
            }
        }
        if (allZero) continue;

        spdlog::debug("Using hardware address of interface {}", ifa->ifa_name);
        result = node;
        break;
    }

    freeifaddrs(ifaddr);
    return result;
}

NodeIdResolver::NodeIdResolver(IRandomSource& random, NodeDiscovery discovery)
    : random_(random),
      discovery_(std::move(discovery)),
      cachedNode_{},
      hasHardwareAddress_(false) {}

void NodeIdResolver::discoverOnce() {
    std::call_once(discoverFlag_, [this]() {
        std::optional<NodeId> node = discovery_ ? discovery_() : std::nullopt;
        if (node) {
            cachedNode_ = *node;
            hasHardwareAddress_ = true;
            spdlog::info("Node identifier resolved: {}", formatNode(cachedNode_));
        } else {
            spdlog::info("No hardware address available, using random node identifiers");
        }
    });
}

NodeId NodeIdResolver::resolve() {
    discoverOnce();
    if (hasHardwareAddress_) {
        return cachedNode_;
    }

    NodeId node;
    random_.fill(node.data(), node.size());
    node[0] |= 0x01;  // multicast bit marks a non-IEEE node
    return node;
}

bool NodeIdResolver::hasHardwareAddress() {
    discoverOnce();
    return hasHardwareAddress_;
}

} // namespace uuidkit
