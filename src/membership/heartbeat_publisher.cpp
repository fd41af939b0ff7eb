#include "membership/heartbeat_publisher.hpp"
#include "membership/directory.hpp"
#include "network/dht.hpp"
#include "network/gossip.hpp"
#include "network/heartbeat.hpp"
#include "util/logging.hpp"

namespace peerwatch {
namespace membership {

HeartbeatPublisher::HeartbeatPublisher(std::string local_peer_id, std::string topic,
                                       network::GossipChannel &gossip, network::Dht &dht,
                                       Directory &directory)
    : local_peer_id_(std::move(local_peer_id)), topic_(std::move(topic)), gossip_(gossip),
      dht_(dht), directory_(directory) {}

void HeartbeatPublisher::Publish(uint64_t now) {
  const auto payload = message::EncodeHeartbeat(message::Heartbeat{local_peer_id_, now});

  auto result = gossip_.publish(topic_, payload);
  if (result != network::PublishResult::Ok) {
    LOG_MEMBER_DEBUG("heartbeat: gossip publish failed: {}", network::PublishResultName(result));
  }

  if (!dht_.put_record(message::PeerRecordKey(local_peer_id_), message::EncodeTimestampValue(now))) {
    LOG_MEMBER_DEBUG("heartbeat: dht put failed for ts={}", now);
  }

  directory_.Merge(local_peer_id_, now);
  LOG_MEMBER_INFO("heartbeat: published ts={} local_peer={} peers_count={}", now, local_peer_id_,
                  directory_.Size());
}

} // namespace membership
} // namespace peerwatch
