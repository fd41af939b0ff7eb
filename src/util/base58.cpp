// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/base58.hpp"
#include <algorithm>

namespace peerwatch {
namespace util {

namespace {
constexpr const char* kAlphabet =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

int AlphabetIndex(char c) {
  for (int i = 0; i < 58; ++i) {
    if (kAlphabet[i] == c) {
      return i;
    }
  }
  return -1;
}
} // namespace

std::string EncodeBase58(const std::vector<uint8_t>& data) {
  size_t zeroes = 0;
  while (zeroes < data.size() && data[zeroes] == 0) {
    ++zeroes;
  }

  // log(256) / log(58) ~= 1.38, rounded up
  std::vector<uint8_t> b58((data.size() - zeroes) * 138 / 100 + 1, 0);
  size_t length = 0;

  for (size_t i = zeroes; i < data.size(); ++i) {
    int carry = data[i];
    size_t j = 0;
    for (auto it = b58.rbegin(); (carry != 0 || j < length) && it != b58.rend(); ++it, ++j) {
      carry += 256 * (*it);
      *it = static_cast<uint8_t>(carry % 58);
      carry /= 58;
    }
    length = j;
  }

  auto it = b58.begin() + static_cast<std::ptrdiff_t>(b58.size() - length);
  while (it != b58.end() && *it == 0) {
    ++it;
  }

  std::string result(zeroes, '1');
  result.reserve(zeroes + static_cast<size_t>(b58.end() - it));
  for (; it != b58.end(); ++it) {
    result.push_back(kAlphabet[*it]);
  }
  return result;
}

std::optional<std::vector<uint8_t>> DecodeBase58(const std::string& str) {
  size_t ones = 0;
  while (ones < str.size() && str[ones] == '1') {
    ++ones;
  }

  // log(58) / log(256) ~= 0.733, rounded up
  std::vector<uint8_t> b256((str.size() - ones) * 733 / 1000 + 1, 0);
  size_t length = 0;

  for (size_t i = ones; i < str.size(); ++i) {
    int carry = AlphabetIndex(str[i]);
    if (carry < 0) {
      return std::nullopt;
    }
    size_t j = 0;
    for (auto it = b256.rbegin(); (carry != 0 || j < length) && it != b256.rend(); ++it, ++j) {
      carry += 58 * (*it);
      *it = static_cast<uint8_t>(carry % 256);
      carry /= 256;
    }
    length = j;
  }

  auto it = b256.begin() + static_cast<std::ptrdiff_t>(b256.size() - length);
  while (it != b256.end() && *it == 0) {
    ++it;
  }

  std::vector<uint8_t> result(ones, 0);
  result.insert(result.end(), it, b256.end());
  return result;
}

} // namespace util
} // namespace peerwatch
