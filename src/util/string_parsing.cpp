#include "util/string_parsing.hpp"
#include <cctype>
#include <limits>

namespace peerwatch {
namespace util {

std::optional<int> SafeParseInt(const std::string& str, int min, int max) {
  auto value = SafeParseInt64(str, min, max);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<int>(*value);
}

std::optional<uint16_t> SafeParsePort(const std::string& str) {
  auto value = SafeParseInt64(str, 1, 65535);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*value);
}

std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max) {
  try {
    // Reject empty or whitespace-leading strings
    if (str.empty() || std::isspace(static_cast<unsigned char>(str[0]))) {
      return std::nullopt;
    }

    size_t pos = 0;
    long long value = std::stoll(str, &pos);

    // Check entire string was consumed
    if (pos != str.size()) {
      return std::nullopt;
    }

    if (value < min || value > max) {
      return std::nullopt;
    }

    return static_cast<int64_t>(value);
  } catch (const std::exception&) {
    // std::invalid_argument / std::out_of_range
    return std::nullopt;
  }
}

std::optional<uint64_t> SafeParseUInt64(const std::string& str) {
  if (str.empty()) {
    return std::nullopt;
  }

  constexpr uint64_t kMax = std::numeric_limits<uint64_t>::max();
  uint64_t value = 0;
  for (char c : str) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    uint64_t digit = static_cast<uint64_t>(c - '0');
    if (value > (kMax - digit) / 10) {
      return std::nullopt;
    }
    value = value * 10 + digit;
  }
  return value;
}

std::vector<std::string> SplitList(const std::string& str, char separator) {
  std::vector<std::string> items;
  size_t pos = 0;
  while (pos <= str.size()) {
    size_t next = str.find(separator, pos);
    if (next == std::string::npos) {
      next = str.size();
    }

    size_t begin = pos;
    size_t end = next;
    while (begin < end && std::isspace(static_cast<unsigned char>(str[begin]))) {
      ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
      --end;
    }
    if (end > begin) {
      items.push_back(str.substr(begin, end - begin));
    }

    pos = next + 1;
  }
  return items;
}

} // namespace util
} // namespace peerwatch
