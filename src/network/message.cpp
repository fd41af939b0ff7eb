#include "network/message.hpp"
#include <limits>
#include <nlohmann/json.hpp>

namespace peerwatch {
namespace message {

using json = nlohmann::json;

namespace {

bool ReadString(const json &j, const char *field, std::string &out) {
  auto it = j.find(field);
  if (it == j.end() || !it->is_string()) {
    return false;
  }
  out = it->get<std::string>();
  return true;
}

bool ReadUInt64(const json &j, const char *field, uint64_t &out) {
  auto it = j.find(field);
  if (it == j.end() || !it->is_number_unsigned()) {
    return false;
  }
  out = it->get<uint64_t>();
  return true;
}

bool ReadPort(const json &j, const char *field, uint16_t &out) {
  uint64_t value = 0;
  if (!ReadUInt64(j, field, value) || value > std::numeric_limits<uint16_t>::max()) {
    return false;
  }
  out = static_cast<uint16_t>(value);
  return true;
}

bool ReadBytes(const json &j, const char *field, std::vector<uint8_t> &out) {
  auto it = j.find(field);
  if (it == j.end() || !it->is_binary()) {
    return false;
  }
  const auto &bin = it->get_binary();
  out.assign(bin.begin(), bin.end());
  return true;
}

} // namespace

// ============================================================================
// Envelope
// ============================================================================

std::vector<uint8_t> Message::serialize() const {
  json j = json::object();
  j["v"] = protocol::PROTOCOL_VERSION;
  j["type"] = command();
  j["from"] = from;
  j["port"] = port;
  write_payload(j);
  return json::to_cbor(j);
}

bool Message::deserialize(const uint8_t *data, size_t size) {
  if (data == nullptr || size == 0 || size > protocol::MAX_DATAGRAM_SIZE) {
    return false;
  }
  json j = json::from_cbor(data, data + size, true, false);
  if (j.is_discarded() || !j.is_object()) {
    return false;
  }
  std::string type;
  if (!ReadString(j, "type", type) || type != command()) {
    return false;
  }
  return read_envelope(j);
}

bool Message::read_envelope(const json &j) {
  uint64_t version = 0;
  if (!ReadUInt64(j, "v", version) || version != protocol::PROTOCOL_VERSION) {
    return false;
  }
  if (!ReadString(j, "from", from) || from.empty()) {
    return false;
  }
  if (!ReadPort(j, "port", port)) {
    return false;
  }
  return read_payload(j);
}

// ============================================================================
// GOSSIP
// ============================================================================

void GossipMessage::write_payload(json &j) const {
  j["topic"] = topic;
  j["id"] = id;
  j["origin"] = origin;
  j["hops"] = hops;
  j["data"] = json::binary(data);
}

bool GossipMessage::read_payload(const json &j) {
  uint64_t h = 0;
  if (!ReadString(j, "topic", topic) || !ReadString(j, "id", id) ||
      !ReadString(j, "origin", origin) || !ReadUInt64(j, "hops", h) ||
      !ReadBytes(j, "data", data)) {
    return false;
  }
  if (id.empty() || origin.empty() || h > std::numeric_limits<uint32_t>::max()) {
    return false;
  }
  hops = static_cast<uint32_t>(h);
  return true;
}

// ============================================================================
// DHT
// ============================================================================

void DhtStoreMessage::write_payload(json &j) const {
  j["key"] = key;
  j["value"] = json::binary(value);
}

bool DhtStoreMessage::read_payload(const json &j) {
  return ReadString(j, "key", key) && !key.empty() && ReadBytes(j, "value", value);
}

void DhtFindMessage::write_payload(json &j) const {
  j["req"] = request_id;
  j["key"] = key;
}

bool DhtFindMessage::read_payload(const json &j) {
  return ReadUInt64(j, "req", request_id) && ReadString(j, "key", key) && !key.empty();
}

void DhtFoundMessage::write_payload(json &j) const {
  j["req"] = request_id;
  j["key"] = key;
  if (value) {
    j["value"] = json::binary(*value);
  }
  json peers = json::array();
  for (const auto &hint : closer) {
    peers.push_back({{"peer", hint.peer_id}, {"addr", hint.address}, {"port", hint.port}});
  }
  j["closer"] = std::move(peers);
}

bool DhtFoundMessage::read_payload(const json &j) {
  if (!ReadUInt64(j, "req", request_id) || !ReadString(j, "key", key)) {
    return false;
  }

  value.reset();
  if (j.contains("value")) {
    std::vector<uint8_t> v;
    if (!ReadBytes(j, "value", v)) {
      return false;
    }
    value = std::move(v);
  }

  closer.clear();
  auto it = j.find("closer");
  if (it == j.end() || !it->is_array() || it->size() > protocol::DHT_K) {
    return false;
  }
  for (const auto &entry : *it) {
    if (!entry.is_object()) {
      return false;
    }
    PeerHint hint;
    if (!ReadString(entry, "peer", hint.peer_id) || !ReadString(entry, "addr", hint.address) ||
        !ReadPort(entry, "port", hint.port)) {
      return false;
    }
    closer.push_back(std::move(hint));
  }
  return true;
}

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<Message> create_message(const std::string &command) {
  if (command == protocol::types::GOSSIP)
    return std::make_unique<GossipMessage>();
  if (command == protocol::types::DHT_STORE)
    return std::make_unique<DhtStoreMessage>();
  if (command == protocol::types::DHT_FIND)
    return std::make_unique<DhtFindMessage>();
  if (command == protocol::types::DHT_FOUND)
    return std::make_unique<DhtFoundMessage>();

  return nullptr;
}

std::unique_ptr<Message> decode_envelope(const uint8_t *data, size_t size) {
  if (data == nullptr || size == 0 || size > protocol::MAX_DATAGRAM_SIZE) {
    return nullptr;
  }
  json j = json::from_cbor(data, data + size, true, false);
  if (j.is_discarded() || !j.is_object()) {
    return nullptr;
  }
  std::string type;
  if (!ReadString(j, "type", type)) {
    return nullptr;
  }
  auto msg = create_message(type);
  if (!msg || !msg->read_envelope(j)) {
    return nullptr;
  }
  return msg;
}

} // namespace message
} // namespace peerwatch
