#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace peerwatch {
namespace network {

// Outcome of a publish attempt
enum class PublishResult {
  Ok,
  NotSubscribed, // Local node has not joined the topic
  NoPeers        // Nobody to send to
};

const char *PublishResultName(PublishResult result);

// A message delivered from a subscribed topic
struct GossipDelivery {
  std::string topic;
  std::string origin; // Peer id of the original publisher
  std::vector<uint8_t> data;
};

using GossipCallback = std::function<void(const GossipDelivery &)>;

/**
 * GossipChannel - topic publish/subscribe with best-effort delivery
 *
 * No ordering or delivery guarantee. Messages published by the local node
 * are never delivered back to it.
 */
class GossipChannel {
public:
  virtual ~GossipChannel() = default;

  // Join a topic; returns false if already subscribed
  virtual bool subscribe(const std::string &topic) = 0;

  virtual PublishResult publish(const std::string &topic, const std::vector<uint8_t> &data) = 0;

  // Invoked on the reactor thread for every delivered message
  virtual void set_message_callback(GossipCallback callback) = 0;
};

} // namespace network
} // namespace peerwatch
