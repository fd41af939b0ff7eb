// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/heartbeat.hpp"
#include "network/protocol.hpp"
#include "util/string_parsing.hpp"
#include <cstring>
#include <nlohmann/json.hpp>

namespace peerwatch {
namespace message {

std::vector<uint8_t> EncodeHeartbeat(const Heartbeat &hb) {
  nlohmann::json j;
  j["peer"] = hb.peer;
  j["ts"] = hb.ts;
  // Peer ids are base58, so dump() cannot hit invalid UTF-8
  std::string text = j.dump();
  return std::vector<uint8_t>(text.begin(), text.end());
}

std::optional<Heartbeat> DecodeHeartbeat(const std::vector<uint8_t> &data) {
  // allow_exceptions = false: a parse error yields a "discarded" value
  nlohmann::json j = nlohmann::json::parse(data.begin(), data.end(), nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    return std::nullopt;
  }

  auto peer_it = j.find("peer");
  auto ts_it = j.find("ts");
  if (peer_it == j.end() || ts_it == j.end()) {
    return std::nullopt;
  }
  if (!peer_it->is_string() || !ts_it->is_number_unsigned()) {
    return std::nullopt;
  }

  Heartbeat hb;
  hb.peer = peer_it->get<std::string>();
  hb.ts = ts_it->get<uint64_t>();
  return hb;
}

std::string PeerRecordKey(const std::string &peer_id) {
  return std::string(protocol::PEER_KEY_PREFIX) + peer_id;
}

std::optional<std::string> PeerIdFromRecordKey(const std::string &key) {
  const size_t prefix_len = std::strlen(protocol::PEER_KEY_PREFIX);
  if (key.size() <= prefix_len || key.compare(0, prefix_len, protocol::PEER_KEY_PREFIX) != 0) {
    return std::nullopt;
  }
  return key.substr(prefix_len);
}

std::vector<uint8_t> EncodeTimestampValue(uint64_t ts) {
  std::string text = std::to_string(ts);
  return std::vector<uint8_t>(text.begin(), text.end());
}

std::optional<uint64_t> DecodeTimestampValue(const std::vector<uint8_t> &value) {
  return util::SafeParseUInt64(std::string(value.begin(), value.end()));
}

} // namespace message
} // namespace peerwatch
