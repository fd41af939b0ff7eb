// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace peerwatch {
namespace message {

/**
 * Heartbeat - liveness announcement carried on the gossip topic
 *
 * Wire form is a flat JSON object: {"peer":"<peer id>","ts":<u64>}
 * Unknown fields are ignored on decode.
 */
struct Heartbeat {
  std::string peer;
  uint64_t ts{0};

  bool operator==(const Heartbeat &other) const {
    return peer == other.peer && ts == other.ts;
  }
  bool operator!=(const Heartbeat &other) const { return !(*this == other); }
};

// Serialize heartbeat to JSON bytes
std::vector<uint8_t> EncodeHeartbeat(const Heartbeat &hb);

// Parse heartbeat; std::nullopt for anything that is not a well-formed
// heartbeat (invalid JSON, missing fields, wrong types, negative/float ts)
std::optional<Heartbeat> DecodeHeartbeat(const std::vector<uint8_t> &data);

// DHT key under which a peer's last heartbeat timestamp is stored
std::string PeerRecordKey(const std::string &peer_id);

// Inverse of PeerRecordKey; std::nullopt if the key is not "peer:<id>"
// with a non-empty id
std::optional<std::string> PeerIdFromRecordKey(const std::string &key);

// DHT record value for a timestamp (decimal string)
std::vector<uint8_t> EncodeTimestampValue(uint64_t ts);

// Parse a DHT record value as a decimal u64 timestamp
std::optional<uint64_t> DecodeTimestampValue(const std::vector<uint8_t> &value);

} // namespace message
} // namespace peerwatch
