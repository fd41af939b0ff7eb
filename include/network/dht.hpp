#pragma once

#include "network/transport.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace peerwatch {
namespace network {

enum class LookupStatus {
  Found,
  NotFound, // Every queried peer answered without the record
  Timeout   // The lookup ran out of time
};

const char *LookupStatusName(LookupStatus status);

struct LookupResult {
  std::string key;
  LookupStatus status{LookupStatus::NotFound};
  std::optional<std::vector<uint8_t>> value; // Set only when Found
};

using LookupCallback = std::function<void(const LookupResult &)>;

/**
 * Dht - key/value records stored across the peer set
 *
 * Operations are fire-and-forget; lookups complete asynchronously on the
 * reactor thread. Must be called from the reactor thread.
 */
class Dht {
public:
  virtual ~Dht() = default;

  // Make a peer routable at the given endpoint (idempotent)
  virtual void add_address(const std::string &peer_id, const Endpoint &endpoint) = 0;

  // Store locally and replicate; false if the record could not be
  // replicated to any peer
  virtual bool put_record(const std::string &key, const std::vector<uint8_t> &value) = 0;

  // Start a lookup. The callback gets one Found result per distinct value
  // (a local copy first, then values from the network), or exactly one
  // NotFound/Timeout result if no value turned up.
  virtual void get_record(const std::string &key, LookupCallback callback) = 0;

  virtual std::vector<std::string> routable_peers() const = 0;
};

} // namespace network
} // namespace peerwatch
