// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace peerwatch {
namespace util {

/**
 * Base58 (Bitcoin alphabet) encoding, as used for textual peer ids
 *
 * Leading zero bytes are encoded as leading '1' characters.
 */
std::string EncodeBase58(const std::vector<uint8_t>& data);

/**
 * Decode a Base58 string
 * Returns std::nullopt if the string contains a character outside the
 * alphabet (including whitespace)
 */
std::optional<std::vector<uint8_t>> DecodeBase58(const std::string& str);

} // namespace util
} // namespace peerwatch
