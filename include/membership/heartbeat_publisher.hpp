#pragma once

#include <cstdint>
#include <string>

namespace peerwatch {

namespace network {
class Dht;
class GossipChannel;
} // namespace network

namespace membership {

class Directory;

/**
 * HeartbeatPublisher - announces local liveness
 *
 * Each tick publishes {peer, ts} on the gossip topic, stores ts under
 * "peer:<id>" in the DHT and merges the local entry. Publish and store
 * failures are logged and otherwise ignored.
 */
class HeartbeatPublisher {
public:
  HeartbeatPublisher(std::string local_peer_id, std::string topic, network::GossipChannel &gossip,
                     network::Dht &dht, Directory &directory);

  // Publish a heartbeat stamped `now`
  void Publish(uint64_t now);

  const std::string &topic() const { return topic_; }

private:
  std::string local_peer_id_;
  std::string topic_;
  network::GossipChannel &gossip_;
  network::Dht &dht_;
  Directory &directory_;
};

} // namespace membership
} // namespace peerwatch
