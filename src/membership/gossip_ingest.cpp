#include "membership/gossip_ingest.hpp"
#include "membership/directory.hpp"
#include "network/heartbeat.hpp"
#include "util/logging.hpp"

namespace peerwatch {
namespace membership {

IngestOutcome GossipIngest::Handle(const GossipMessage &msg) {
  auto hb = message::DecodeHeartbeat(msg.data);
  if (!hb) {
    LOG_MEMBER_TRACE("gossip: ignoring {} byte payload from {} (not a heartbeat)", msg.data.size(),
                     msg.origin);
    return IngestOutcome::Dropped;
  }

  auto merged = directory_.Merge(hb->peer, hb->ts);
  if (!merged.previous) {
    LOG_MEMBER_INFO("gossip: discovered peer={} ts={} peers_count={}", hb->peer, hb->ts,
                    directory_.Size());
    return IngestOutcome::Discovered;
  }
  if (merged.changed) {
    LOG_MEMBER_INFO("gossip: updated peer={} ts={} peers_count={}", hb->peer, hb->ts,
                    directory_.Size());
    return IngestOutcome::Updated;
  }
  LOG_MEMBER_DEBUG("gossip: older heartbeat from {} (ts={} <= existing={})", hb->peer, hb->ts,
                   *merged.previous);
  return IngestOutcome::Stale;
}

} // namespace membership
} // namespace peerwatch
