#include "membership/discovery_ingest.hpp"
#include "membership/directory.hpp"
#include "network/dht.hpp"
#include "util/logging.hpp"

namespace peerwatch {
namespace membership {

DiscoveryIngest::DiscoveryIngest(std::string local_peer_id, network::Dht &dht, Directory &directory)
    : local_peer_id_(std::move(local_peer_id)), dht_(dht), directory_(directory) {}

bool DiscoveryIngest::Handle(const DiscoveryEvent &event, uint64_t now) {
  if (event.peer_id.empty() || event.peer_id == local_peer_id_) {
    return false;
  }

  dht_.add_address(event.peer_id, event.address);

  const bool is_new = directory_.InsertUnconditional(event.peer_id, now);
  if (is_new) {
    LOG_MEMBER_INFO("discovered via local network: peer={} addr={} peers_count={}", event.peer_id,
                    event.address.ToString(), directory_.Size());
  } else {
    LOG_MEMBER_DEBUG("seen via local network: peer={} addr={}", event.peer_id,
                     event.address.ToString());
  }
  return is_new;
}

} // namespace membership
} // namespace peerwatch
