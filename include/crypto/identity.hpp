// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct evp_pkey_st;

namespace peerwatch {
namespace crypto {

constexpr size_t ED25519_PUBLIC_KEY_SIZE = 32;

/**
 * Identity - the node's Ed25519 key pair and the peer id derived from it
 *
 * The peer id is the base58btc encoding of an identity multihash over the
 * protobuf-encoded public key:
 *
 *   0x00 0x24            identity multihash, 36 byte digest
 *   0x08 0x01            KeyType = Ed25519
 *   0x12 0x20 <32 bytes> Data = raw public key
 *
 * which renders as the familiar 52 character "12D3KooW..." form. The id is
 * stable for the lifetime of the key and is never reused across restarts
 * (keys are not persisted).
 */
class Identity {
public:
  /**
   * Generate a fresh Ed25519 key pair
   * @throws std::runtime_error if OpenSSL key generation fails
   */
  static Identity Generate();

  ~Identity();
  Identity(Identity&&) noexcept;
  Identity& operator=(Identity&&) noexcept;
  Identity(const Identity&) = delete;
  Identity& operator=(const Identity&) = delete;

  const std::string& peer_id() const { return peer_id_; }
  const std::array<uint8_t, ED25519_PUBLIC_KEY_SIZE>& public_key() const { return public_key_; }

private:
  struct KeyDeleter {
    void operator()(evp_pkey_st* key) const;
  };

  Identity(std::unique_ptr<evp_pkey_st, KeyDeleter> key,
           const std::array<uint8_t, ED25519_PUBLIC_KEY_SIZE>& public_key);

  // Held only for the lifetime of the id; envelopes are not signed
  std::unique_ptr<evp_pkey_st, KeyDeleter> key_;
  std::array<uint8_t, ED25519_PUBLIC_KEY_SIZE> public_key_{};
  std::string peer_id_;
};

/**
 * Derive the textual peer id for an Ed25519 public key
 */
std::string PeerIdFromPublicKey(const std::array<uint8_t, ED25519_PUBLIC_KEY_SIZE>& public_key);

/**
 * SHA-256 digest of arbitrary bytes (used for routing distances)
 * @throws std::runtime_error if the digest cannot be computed
 */
std::array<uint8_t, 32> Sha256(const std::string& data);

} // namespace crypto
} // namespace peerwatch
