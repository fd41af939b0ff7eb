#pragma once

#include "version.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace peerwatch {
namespace protocol {

// Wire protocol version carried in every datagram envelope
constexpr uint32_t PROTOCOL_VERSION = 1;

// Default gossip topic for heartbeats
constexpr const char *DEFAULT_TOPIC = "testdistributed/peers";

// DHT record keys are "peer:" + peer_id
constexpr const char *PEER_KEY_PREFIX = "peer:";

namespace ports {
constexpr uint16_t HTTP = 9090;
constexpr uint16_t DISCOVERY = 37020;
} // namespace ports

// Datagram envelope types
namespace types {
constexpr const char *GOSSIP = "gossip";
constexpr const char *DHT_STORE = "dht_store";
constexpr const char *DHT_FIND = "dht_find";
constexpr const char *DHT_FOUND = "dht_found";
} // namespace types

// Largest datagram we send or accept (UDP payload limit, rounded down)
constexpr size_t MAX_DATAGRAM_SIZE = 64 * 1024 - 1;

// ============================================================================
// GOSSIP
// ============================================================================

// Messages are relayed while their hop count is below this
constexpr uint32_t GOSSIP_MAX_HOPS = 4;

// How long a message id is remembered for de-duplication
constexpr std::chrono::seconds GOSSIP_SEEN_TTL{120};

// Upper bound on remembered message ids (oldest dropped first)
constexpr size_t GOSSIP_SEEN_CACHE_MAX = 8192;

// ============================================================================
// DHT
// ============================================================================

// Replication factor for STORE and size of closer-peer hints
constexpr size_t DHT_K = 20;

// Parallel FIND_VALUE requests at the start of a lookup
constexpr size_t DHT_ALPHA = 3;

// Maximum FIND_VALUE requests issued by a single lookup
constexpr size_t DHT_MAX_QUERIES = 16;

// A lookup stops once this many peers have answered with a value
constexpr size_t DHT_GET_QUORUM = 3;

// Routing table capacity (least recently seen evicted first)
constexpr size_t DHT_MAX_ROUTES = 256;

// A lookup completes as Timeout after this long without a value
constexpr std::chrono::seconds DHT_QUERY_TIMEOUT{5};

// Upper bound on locally stored records
constexpr size_t DHT_MAX_RECORDS = 4096;

// ============================================================================
// LOCAL DISCOVERY
// ============================================================================

constexpr const char *DEFAULT_DISCOVERY_GROUP = "239.255.70.77";
constexpr std::chrono::seconds DEFAULT_DISCOVERY_INTERVAL{5};

} // namespace protocol
} // namespace peerwatch
