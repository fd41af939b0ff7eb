#pragma once

#include "network/protocol.hpp"
#include <cstdint>
#include <memory>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

namespace peerwatch {
namespace message {

/**
 * PeerHint - contact information for a peer, used in DHT replies
 */
struct PeerHint {
  std::string peer_id;
  std::string address;
  uint16_t port{0};
};

/**
 * Base class for all datagram envelopes
 *
 * Every envelope is a CBOR map carrying the protocol version, the message
 * type, the sender's peer id and the UDP port the sender listens on,
 * followed by type-specific payload fields.
 */
class Message {
public:
  virtual ~Message() = default;

  // Envelope type (protocol::types::*)
  virtual std::string command() const = 0;

  // Serialize the complete envelope to CBOR
  std::vector<uint8_t> serialize() const;

  // Parse the complete envelope; false on malformed input
  bool deserialize(const uint8_t *data, size_t size);

  // Fill common fields and payload from an already-decoded map
  bool read_envelope(const nlohmann::json &j);

  std::string from;
  uint16_t port{0};

protected:
  virtual void write_payload(nlohmann::json &j) const = 0;
  virtual bool read_payload(const nlohmann::json &j) = 0;
};

/**
 * GOSSIP - topic message relayed by flooding
 */
class GossipMessage : public Message {
public:
  std::string command() const override { return protocol::types::GOSSIP; }

  std::string topic;
  std::string id;     // "<origin>:<seqno>", unique per origin
  std::string origin; // peer id of the original publisher
  uint32_t hops{0};
  std::vector<uint8_t> data;

protected:
  void write_payload(nlohmann::json &j) const override;
  bool read_payload(const nlohmann::json &j) override;
};

/**
 * DHT_STORE - ask the receiver to hold a record
 */
class DhtStoreMessage : public Message {
public:
  std::string command() const override { return protocol::types::DHT_STORE; }

  std::string key;
  std::vector<uint8_t> value;

protected:
  void write_payload(nlohmann::json &j) const override;
  bool read_payload(const nlohmann::json &j) override;
};

/**
 * DHT_FIND - FIND_VALUE request
 */
class DhtFindMessage : public Message {
public:
  std::string command() const override { return protocol::types::DHT_FIND; }

  uint64_t request_id{0};
  std::string key;

protected:
  void write_payload(nlohmann::json &j) const override;
  bool read_payload(const nlohmann::json &j) override;
};

/**
 * DHT_FOUND - reply to DHT_FIND: the value if held, plus closer peers
 */
class DhtFoundMessage : public Message {
public:
  std::string command() const override { return protocol::types::DHT_FOUND; }

  uint64_t request_id{0};
  std::string key;
  std::optional<std::vector<uint8_t>> value;
  std::vector<PeerHint> closer;

protected:
  void write_payload(nlohmann::json &j) const override;
  bool read_payload(const nlohmann::json &j) override;
};

// Factory for creating messages by type
std::unique_ptr<Message> create_message(const std::string &command);

// Decode a received datagram into the matching message; nullptr for
// garbage, unknown types, version mismatch or malformed payload
std::unique_ptr<Message> decode_envelope(const uint8_t *data, size_t size);

} // namespace message
} // namespace peerwatch
