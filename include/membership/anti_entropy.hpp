#pragma once

#include "membership/directory.hpp"
#include "membership/events.hpp"
#include <cstdint>
#include <functional>
#include <vector>

namespace peerwatch {

namespace network {
class Dht;
} // namespace network

namespace membership {

/**
 * AntiEntropyReconciler - repairs missed heartbeats from the DHT and evicts
 * peers that have gone quiet
 *
 * A pass starts one lookup per known peer and then prunes immediately;
 * lookup results arrive later through `sink` and are merged by
 * HandleResult.
 */
class AntiEntropyReconciler {
public:
  using ResultSink = std::function<void(DhtLookupResult)>;

  AntiEntropyReconciler(Directory &directory, network::Dht &dht, uint64_t peer_ttl,
                        ResultSink sink);

  // Dispatch lookups for every known peer, then prune; returns removed peers
  std::vector<PeerRecord> RunPass(uint64_t now);

  // Merge a completed lookup; returns true if the directory changed
  bool HandleResult(const DhtLookupResult &event);

  uint64_t peer_ttl() const { return peer_ttl_; }

private:
  Directory &directory_;
  network::Dht &dht_;
  uint64_t peer_ttl_;
  ResultSink sink_;
};

} // namespace membership
} // namespace peerwatch
