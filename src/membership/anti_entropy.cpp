#include "membership/anti_entropy.hpp"
#include "network/dht.hpp"
#include "network/heartbeat.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

namespace peerwatch {
namespace membership {

AntiEntropyReconciler::AntiEntropyReconciler(Directory &directory, network::Dht &dht,
                                             uint64_t peer_ttl, ResultSink sink)
    : directory_(directory), dht_(dht), peer_ttl_(peer_ttl), sink_(std::move(sink)) {}

std::vector<PeerRecord> AntiEntropyReconciler::RunPass(uint64_t now) {
  const auto peer_ids = directory_.PeerIds();
  for (const auto &peer_id : peer_ids) {
    dht_.get_record(message::PeerRecordKey(peer_id), [sink = sink_](const network::LookupResult &r) {
      if (sink) {
        sink(DhtLookupResult{r});
      }
    });
  }
  LOG_MEMBER_DEBUG("anti-entropy: dispatched {} lookups", peer_ids.size());

  const size_t before = directory_.Size();
  auto removed = directory_.Prune(now, peer_ttl_);
  const size_t after = directory_.Size();
  for (const auto &record : removed) {
    LOG_MEMBER_INFO("peer lost: {} last_seen={} ({}) peers_count_after={}", record.peer_id,
                    record.last_seen, util::FormatTime(static_cast<int64_t>(record.last_seen)),
                    after);
  }
  if (before != after) {
    LOG_MEMBER_INFO("peers pruned: before={} after={}", before, after);
  }
  return removed;
}

bool AntiEntropyReconciler::HandleResult(const DhtLookupResult &event) {
  const auto &result = event.result;
  if (result.status != network::LookupStatus::Found || !result.value) {
    LOG_MEMBER_DEBUG("anti-entropy: get {} {}", result.key, network::LookupStatusName(result.status));
    return false;
  }

  auto peer_id = message::PeerIdFromRecordKey(result.key);
  if (!peer_id) {
    LOG_MEMBER_DEBUG("anti-entropy: ignoring record with unexpected key {}", result.key);
    return false;
  }

  auto ts = message::DecodeTimestampValue(*result.value);
  if (!ts) {
    LOG_MEMBER_DEBUG("anti-entropy: unparsable value for {}", result.key);
    return false;
  }

  auto merged = directory_.Merge(*peer_id, *ts);
  if (merged.changed) {
    LOG_MEMBER_INFO("anti-entropy: merged peer={} ts={} peers_count={}", *peer_id, *ts,
                    directory_.Size());
  }
  return merged.changed;
}

} // namespace membership
} // namespace peerwatch
