#pragma once

#include "network/dht.hpp"
#include "network/transport.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace peerwatch {
namespace membership {

// Raw payload delivered on the membership topic
struct GossipMessage {
  std::string origin;
  std::vector<uint8_t> data;
};

// A peer reported by local-network discovery
struct DiscoveryEvent {
  std::string peer_id;
  network::Endpoint address;
};

// Completion of an anti-entropy DHT lookup
struct DhtLookupResult {
  network::LookupResult result;
};

struct HeartbeatTick {};
struct AntiEntropyTick {};

// Everything the membership loop reacts to
using Event = std::variant<GossipMessage, DiscoveryEvent, DhtLookupResult, HeartbeatTick,
                           AntiEntropyTick>;

} // namespace membership
} // namespace peerwatch
