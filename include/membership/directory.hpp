// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace peerwatch {
namespace membership {

// peer_id -> last_seen (seconds since epoch)
using PeerMap = std::map<std::string, uint64_t>;

struct PeerRecord {
  std::string peer_id;
  uint64_t last_seen{0};
};

struct MergeResult {
  bool changed{false};
  std::optional<uint64_t> previous; // Value before the merge; nullopt if the peer was unknown
};

/**
 * Directory - process-wide map of known peers to their last-seen time
 *
 * Merge is last-writer-wins by maximum timestamp, so the result is the same
 * whatever order updates arrive in. InsertUnconditional bypasses that rule
 * and is reserved for local-network discovery. Entries leave the map only
 * through Prune.
 *
 * Thread-safe: writers take the lock exclusively, readers share it. Every
 * operation is atomic with respect to every other.
 */
class Directory {
public:
  Directory() = default;

  Directory(const Directory &) = delete;
  Directory &operator=(const Directory &) = delete;

  // Insert if unknown, raise if ts is strictly newer; otherwise no-op
  MergeResult Merge(const std::string &peer_id, uint64_t ts);

  // Overwrite regardless of the current value; returns true if the peer was new
  bool InsertUnconditional(const std::string &peer_id, uint64_t ts);

  // Remove every entry with now - last_seen > ttl. A last_seen in the future
  // counts as zero elapsed and is never removed.
  std::vector<PeerRecord> Prune(uint64_t now, uint64_t ttl);

  PeerMap Snapshot() const;
  std::optional<uint64_t> Get(const std::string &peer_id) const;
  bool Contains(const std::string &peer_id) const;
  std::vector<std::string> PeerIds() const;
  size_t Size() const;

private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, uint64_t> peers_;
};

} // namespace membership
} // namespace peerwatch
