#pragma once

#include "membership/events.hpp"
#include <cstdint>
#include <string>

namespace peerwatch {

namespace network {
class Dht;
} // namespace network

namespace membership {

class Directory;

/**
 * DiscoveryIngest - records peers found on the local network
 *
 * The peer's address is handed to the DHT so records can be routed to it,
 * and the directory entry is set to `now` without a last-writer-wins
 * comparison: a sighting on the local network counts as fresh liveness even
 * if gossip previously reported a later timestamp.
 */
class DiscoveryIngest {
public:
  DiscoveryIngest(std::string local_peer_id, network::Dht &dht, Directory &directory);

  // Returns true if the peer was not in the directory before
  bool Handle(const DiscoveryEvent &event, uint64_t now);

private:
  std::string local_peer_id_;
  network::Dht &dht_;
  Directory &directory_;
};

} // namespace membership
} // namespace peerwatch
