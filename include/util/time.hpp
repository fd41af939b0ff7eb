// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <atomic>
#include <cstdint>
#include <string>

namespace peerwatch {
namespace util {

/**
 * Mockable wall clock
 *
 * Liveness timestamps are wall-clock seconds since the epoch. Production
 * code calls GetTime() instead of reading the system clock directly, so
 * tests can pin "now" with SetMockTime() and exercise TTL boundaries
 * without sleeping.
 */

/**
 * Get current time as Unix timestamp (seconds since epoch)
 * Returns mock time if set, otherwise returns real system time
 */
int64_t GetTime();

/**
 * Current time as an unsigned liveness timestamp
 * Clamps a (theoretical) pre-epoch clock to 0
 */
uint64_t GetUnixSeconds();

/**
 * Set mock time for testing
 *
 * @param time Unix timestamp in seconds (0 to disable mocking)
 */
void SetMockTime(int64_t time);

/**
 * Get current mock time setting
 * Returns 0 if mock time is disabled (using real time)
 */
int64_t GetMockTime();

/**
 * Format a Unix timestamp as a human-readable UTC string
 *
 * Example: FormatTime(1729868000) -> "2024-10-25 14:53:20 UTC"
 */
std::string FormatTime(int64_t unix_time);

/**
 * RAII helper to set mock time and restore it when scope exits
 */
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_time_(GetMockTime()) {
    SetMockTime(time);
  }

  ~MockTimeScope() { SetMockTime(previous_time_); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;
  MockTimeScope(MockTimeScope&&) = delete;
  MockTimeScope& operator=(MockTimeScope&&) = delete;

private:
  const int64_t previous_time_;
};

} // namespace util
} // namespace peerwatch
