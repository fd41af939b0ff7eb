#include "network/gossip_service.hpp"
#include "network/message.hpp"
#include "network/routing_table.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

namespace peerwatch {
namespace network {

const char *PublishResultName(PublishResult result) {
  switch (result) {
  case PublishResult::Ok:
    return "ok";
  case PublishResult::NotSubscribed:
    return "not subscribed";
  case PublishResult::NoPeers:
    return "no peers";
  }
  return "unknown";
}

GossipService::GossipService(std::string local_peer_id, DatagramTransport &transport,
                             RoutingTable &routes)
    : local_peer_id_(std::move(local_peer_id)), transport_(transport), routes_(routes) {}

bool GossipService::subscribe(const std::string &topic) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!topics_.insert(topic).second) {
    return false;
  }
  LOG_GOSSIP_INFO("subscribed to topic {}", topic);
  return true;
}

bool GossipService::is_subscribed(const std::string &topic) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return topics_.count(topic) > 0;
}

void GossipService::set_message_callback(GossipCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  callback_ = std::move(callback);
}

PublishResult GossipService::publish(const std::string &topic, const std::vector<uint8_t> &data) {
  message::GossipMessage msg;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (topics_.count(topic) == 0) {
      return PublishResult::NotSubscribed;
    }
    msg.id = local_peer_id_ + ":" + std::to_string(next_seqno_++);
  }

  msg.from = local_peer_id_;
  msg.port = transport_.local_port();
  msg.topic = topic;
  msg.origin = local_peer_id_;
  msg.hops = 0;
  msg.data = data;

  // Remember our own id so an echo from a relaying peer is not re-flooded
  MarkSeen(msg.id);

  size_t sent = Flood(msg, "", "");
  if (sent == 0) {
    return PublishResult::NoPeers;
  }
  LOG_GOSSIP_TRACE("published {} on {} to {} peers", msg.id, topic, sent);
  return PublishResult::Ok;
}

bool GossipService::HandleGossip(const Endpoint &from, const message::GossipMessage &msg) {
  if (msg.origin == local_peer_id_) {
    return true;
  }
  if (!MarkSeen(msg.id)) {
    LOG_GOSSIP_TRACE("duplicate gossip {} from {}", msg.id, from.ToString());
    return true;
  }

  GossipCallback callback;
  bool deliver = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    deliver = topics_.count(msg.topic) > 0;
    callback = callback_;
  }

  if (deliver && callback) {
    callback(GossipDelivery{msg.topic, msg.origin, msg.data});
  } else if (!deliver) {
    LOG_GOSSIP_TRACE("gossip {} for unsubscribed topic {}", msg.id, msg.topic);
  }

  if (msg.hops < protocol::GOSSIP_MAX_HOPS) {
    message::GossipMessage relay = msg;
    relay.from = local_peer_id_;
    relay.port = transport_.local_port();
    relay.hops = msg.hops + 1;
    size_t sent = Flood(relay, msg.from, msg.origin);
    LOG_GOSSIP_TRACE("relayed {} (hops={}) to {} peers", msg.id, relay.hops, sent);
  }
  return true;
}

size_t GossipService::SeenCount() {
  std::lock_guard<std::mutex> lock(mutex_);
  ExpireSeen(util::GetTime());
  return seen_.size();
}

bool GossipService::MarkSeen(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const int64_t now = util::GetTime();
  ExpireSeen(now);
  if (!seen_.insert(id).second) {
    return false;
  }
  seen_order_.emplace_back(now, id);
  while (seen_order_.size() > protocol::GOSSIP_SEEN_CACHE_MAX) {
    seen_.erase(seen_order_.front().second);
    seen_order_.pop_front();
  }
  return true;
}

// Caller holds mutex_
void GossipService::ExpireSeen(int64_t now) {
  const int64_t ttl = protocol::GOSSIP_SEEN_TTL.count();
  while (!seen_order_.empty() && now - seen_order_.front().first > ttl) {
    seen_.erase(seen_order_.front().second);
    seen_order_.pop_front();
  }
}

size_t GossipService::Flood(const message::GossipMessage &msg, const std::string &skip_a,
                            const std::string &skip_b) {
  const std::vector<uint8_t> payload = msg.serialize();
  size_t sent = 0;
  for (const auto &route : routes_.Entries()) {
    if (route.peer_id == skip_a || route.peer_id == skip_b) {
      continue;
    }
    if (transport_.send(route.endpoint, payload)) {
      ++sent;
    } else {
      LOG_GOSSIP_TRACE("failed to send gossip to {} at {}", route.peer_id,
                       route.endpoint.ToString());
    }
  }
  return sent;
}

} // namespace network
} // namespace peerwatch
