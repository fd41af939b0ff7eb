// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "membership/directory.hpp"
#include <mutex>

namespace peerwatch {
namespace membership {

MergeResult Directory::Merge(const std::string &peer_id, uint64_t ts) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto [it, inserted] = peers_.try_emplace(peer_id, ts);
  if (inserted) {
    return MergeResult{true, std::nullopt};
  }
  const uint64_t previous = it->second;
  if (ts > previous) {
    it->second = ts;
    return MergeResult{true, previous};
  }
  return MergeResult{false, previous};
}

bool Directory::InsertUnconditional(const std::string &peer_id, uint64_t ts) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  return peers_.insert_or_assign(peer_id, ts).second;
}

std::vector<PeerRecord> Directory::Prune(uint64_t now, uint64_t ttl) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  std::vector<PeerRecord> removed;
  for (auto it = peers_.begin(); it != peers_.end();) {
    const uint64_t elapsed = now > it->second ? now - it->second : 0;
    if (elapsed > ttl) {
      removed.push_back(PeerRecord{it->first, it->second});
      it = peers_.erase(it);
    } else {
      ++it;
    }
  }
  return removed;
}

PeerMap Directory::Snapshot() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return PeerMap(peers_.begin(), peers_.end());
}

std::optional<uint64_t> Directory::Get(const std::string &peer_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = peers_.find(peer_id);
  if (it == peers_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool Directory::Contains(const std::string &peer_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return peers_.count(peer_id) > 0;
}

std::vector<std::string> Directory::PeerIds() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(peers_.size());
  for (const auto &[id, ts] : peers_) {
    ids.push_back(id);
  }
  return ids;
}

size_t Directory::Size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return peers_.size();
}

} // namespace membership
} // namespace peerwatch
