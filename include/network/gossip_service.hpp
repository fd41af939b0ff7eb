#pragma once

#include "network/gossip.hpp"
#include "network/protocol.hpp"
#include "network/transport.hpp"
#include <deque>
#include <mutex>
#include <set>
#include <string>
#include <unordered_set>

namespace peerwatch {

namespace message {
class GossipMessage;
} // namespace message

namespace network {

class RoutingTable;

/**
 * GossipService - flooding implementation of GossipChannel over datagrams
 *
 * Publishing sends the message to every routable peer. A received message
 * is handled once per id: delivered if the topic is subscribed, then relayed
 * to every peer except the sender and origin while its hop count is below
 * GOSSIP_MAX_HOPS. Message ids are remembered for GOSSIP_SEEN_TTL.
 */
class GossipService : public GossipChannel {
public:
  GossipService(std::string local_peer_id, DatagramTransport &transport, RoutingTable &routes);

  GossipService(const GossipService &) = delete;
  GossipService &operator=(const GossipService &) = delete;

  bool subscribe(const std::string &topic) override;
  PublishResult publish(const std::string &topic, const std::vector<uint8_t> &data) override;
  void set_message_callback(GossipCallback callback) override;

  bool is_subscribed(const std::string &topic) const;

  // Dispatcher entry point for GOSSIP envelopes
  bool HandleGossip(const Endpoint &from, const message::GossipMessage &msg);

  // Number of remembered message ids (after expiring old ones)
  size_t SeenCount();

private:
  // Returns true if id was not seen before (and records it)
  bool MarkSeen(const std::string &id);
  void ExpireSeen(int64_t now);

  size_t Flood(const message::GossipMessage &msg, const std::string &skip_a,
               const std::string &skip_b);

  std::string local_peer_id_;
  DatagramTransport &transport_;
  RoutingTable &routes_;

  mutable std::mutex mutex_;
  std::set<std::string> topics_;
  GossipCallback callback_;
  uint64_t next_seqno_{1};

  // Seen cache: insertion-ordered for expiry
  std::unordered_set<std::string> seen_;
  std::deque<std::pair<int64_t, std::string>> seen_order_;
};

} // namespace network
} // namespace peerwatch
