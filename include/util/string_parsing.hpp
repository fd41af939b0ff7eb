#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of strings to numeric types with validation
 - Centralized input validation for environment configuration, command-line
   flags and values received from the network (DHT record values)

 Key functions:
 - SafeParseInt / SafeParseInt64: Parse signed integers with bounds checking
 - SafeParseUInt64: Parse an unsigned decimal (liveness timestamps)
 - SafeParsePort: Parse port number (1-65535)
 - SplitList: Split a comma-separated list, trimming blanks

 Security:
 - All functions validate entire input is consumed (no trailing garbage)
 - Bounds checking prevents overflow/underflow
 - Returns std::nullopt on any parsing error (no exceptions thrown)
*/

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace peerwatch {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 */
std::optional<int> SafeParseInt(const std::string& str, int min, int max);

/**
 * Parse port number string (1-65535)
 *
 * Examples:
 *   SafeParsePort("9090") -> 9090
 *   SafeParsePort("0") -> std::nullopt (port 0 invalid)
 */
std::optional<uint16_t> SafeParsePort(const std::string& str);

/**
 * Parse int64_t string with bounds checking
 */
std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max);

/**
 * Parse an unsigned 64-bit decimal
 *
 * Only ASCII digits are accepted: no sign, no whitespace, no hex prefix.
 *
 * Examples:
 *   SafeParseUInt64("1700000000") -> 1700000000
 *   SafeParseUInt64("18446744073709551616") -> std::nullopt (overflow)
 *   SafeParseUInt64("-1") -> std::nullopt
 */
std::optional<uint64_t> SafeParseUInt64(const std::string& str);

/**
 * Split a comma-separated list; surrounding whitespace is trimmed and empty
 * items are skipped
 *
 * Example:
 *   SplitList(" a, b,,c ") -> {"a", "b", "c"}
 */
std::vector<std::string> SplitList(const std::string& str, char separator = ',');

} // namespace util
} // namespace peerwatch
