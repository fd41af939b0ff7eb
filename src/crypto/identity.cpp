// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "crypto/identity.hpp"
#include "util/base58.hpp"
#include "util/logging.hpp"
#include <openssl/err.h>
#include <openssl/evp.h>
#include <stdexcept>

namespace peerwatch {
namespace crypto {

namespace {

std::string LastOpenSSLError() {
  unsigned long code = ERR_get_error();
  if (code == 0) {
    return "unknown error";
  }
  char buf[256];
  ERR_error_string_n(code, buf, sizeof(buf));
  return buf;
}

// Multihash + protobuf PublicKey framing for an Ed25519 key
constexpr uint8_t kPeerIdPrefix[] = {0x00, 0x24, 0x08, 0x01, 0x12, 0x20};

} // namespace

void Identity::KeyDeleter::operator()(evp_pkey_st* key) const {
  EVP_PKEY_free(key);
}

Identity::Identity(std::unique_ptr<evp_pkey_st, KeyDeleter> key,
                   const std::array<uint8_t, ED25519_PUBLIC_KEY_SIZE>& public_key)
    : key_(std::move(key)), public_key_(public_key),
      peer_id_(PeerIdFromPublicKey(public_key)) {}

Identity::~Identity() = default;
Identity::Identity(Identity&&) noexcept = default;
Identity& Identity::operator=(Identity&&) noexcept = default;

Identity Identity::Generate() {
  std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx(
      EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr), &EVP_PKEY_CTX_free);
  if (!ctx) {
    throw std::runtime_error("EVP_PKEY_CTX_new_id failed: " + LastOpenSSLError());
  }

  if (EVP_PKEY_keygen_init(ctx.get()) != 1) {
    throw std::runtime_error("EVP_PKEY_keygen_init failed: " + LastOpenSSLError());
  }

  EVP_PKEY* raw_key = nullptr;
  if (EVP_PKEY_keygen(ctx.get(), &raw_key) != 1 || raw_key == nullptr) {
    throw std::runtime_error("Ed25519 key generation failed: " + LastOpenSSLError());
  }
  std::unique_ptr<evp_pkey_st, KeyDeleter> key(raw_key);

  std::array<uint8_t, ED25519_PUBLIC_KEY_SIZE> public_key{};
  size_t len = public_key.size();
  if (EVP_PKEY_get_raw_public_key(key.get(), public_key.data(), &len) != 1 ||
      len != ED25519_PUBLIC_KEY_SIZE) {
    throw std::runtime_error("failed to export Ed25519 public key: " + LastOpenSSLError());
  }

  Identity identity(std::move(key), public_key);
  LOG_CRYPTO_INFO("Generated Ed25519 identity {}", identity.peer_id());
  return identity;
}

std::string PeerIdFromPublicKey(const std::array<uint8_t, ED25519_PUBLIC_KEY_SIZE>& public_key) {
  std::vector<uint8_t> bytes(std::begin(kPeerIdPrefix), std::end(kPeerIdPrefix));
  bytes.insert(bytes.end(), public_key.begin(), public_key.end());
  return util::EncodeBase58(bytes);
}

std::array<uint8_t, 32> Sha256(const std::string& data) {
  std::array<uint8_t, 32> digest{};
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), digest.data(), &len, EVP_sha256(), nullptr) != 1 ||
      len != digest.size()) {
    throw std::runtime_error("SHA-256 digest failed: " + LastOpenSSLError());
  }
  return digest;
}

} // namespace crypto
} // namespace peerwatch
