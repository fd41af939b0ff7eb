#pragma once

#include "network/protocol.hpp"
#include "network/transport.hpp"
#include <array>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace peerwatch {
namespace network {

// 256-bit position in the DHT key space (SHA-256 of a peer id or record key)
using NodeKey = std::array<uint8_t, 32>;

NodeKey KeyFor(const std::string &id);

// True if a is strictly closer to target than b under the XOR metric
bool CloserTo(const NodeKey &target, const NodeKey &a, const NodeKey &b);

struct RouteEntry {
  std::string peer_id;
  NodeKey key{};
  Endpoint endpoint;
  int64_t last_seen{0};
};

/**
 * RoutingTable - the set of peers the DHT can reach
 *
 * Flat table bounded at DHT_MAX_ROUTES; when full, the least recently seen
 * entry makes room for a new one. Lookups order entries by XOR distance
 * between SHA-256 keys. Thread-safe.
 */
class RoutingTable {
public:
  explicit RoutingTable(std::string local_peer_id,
                        size_t capacity = protocol::DHT_MAX_ROUTES);

  // Insert or refresh a route; returns true if the peer was not known before.
  // The local peer is never stored.
  bool Upsert(const std::string &peer_id, const Endpoint &endpoint);

  bool Remove(const std::string &peer_id);

  std::optional<Endpoint> Lookup(const std::string &peer_id) const;
  bool Contains(const std::string &peer_id) const;

  // Up to `count` entries ordered by distance to target, closest first
  std::vector<RouteEntry> Closest(const NodeKey &target, size_t count) const;

  std::vector<RouteEntry> Entries() const;
  std::vector<std::string> PeerIds() const;
  size_t Size() const;

private:
  std::string local_peer_id_;
  size_t capacity_;

  mutable std::mutex mutex_;
  std::map<std::string, RouteEntry> routes_;
};

} // namespace network
} // namespace peerwatch
