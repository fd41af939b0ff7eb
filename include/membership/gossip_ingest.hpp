#pragma once

#include "membership/events.hpp"

namespace peerwatch {
namespace membership {

class Directory;

enum class IngestOutcome {
  Dropped,    // Payload was not a heartbeat
  Discovered, // First sighting of the peer
  Updated,    // Newer timestamp recorded
  Stale       // Timestamp not newer than what we have
};

/**
 * GossipIngest - merges heartbeats received on the membership topic
 */
class GossipIngest {
public:
  explicit GossipIngest(Directory &directory) : directory_(directory) {}

  IngestOutcome Handle(const GossipMessage &msg);

private:
  Directory &directory_;
};

} // namespace membership
} // namespace peerwatch
