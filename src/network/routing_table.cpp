#include "network/routing_table.hpp"
#include "crypto/identity.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <algorithm>

namespace peerwatch {
namespace network {

NodeKey KeyFor(const std::string &id) { return crypto::Sha256(id); }

bool CloserTo(const NodeKey &target, const NodeKey &a, const NodeKey &b) {
  for (size_t i = 0; i < target.size(); ++i) {
    uint8_t da = a[i] ^ target[i];
    uint8_t db = b[i] ^ target[i];
    if (da != db) {
      return da < db;
    }
  }
  return false;
}

RoutingTable::RoutingTable(std::string local_peer_id, size_t capacity)
    : local_peer_id_(std::move(local_peer_id)), capacity_(capacity) {}

bool RoutingTable::Upsert(const std::string &peer_id, const Endpoint &endpoint) {
  if (peer_id.empty() || peer_id == local_peer_id_) {
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  const int64_t now = util::GetTime();

  auto it = routes_.find(peer_id);
  if (it != routes_.end()) {
    if (it->second.endpoint != endpoint) {
      LOG_DHT_DEBUG("route for {} moved {} -> {}", peer_id, it->second.endpoint.ToString(),
                    endpoint.ToString());
      it->second.endpoint = endpoint;
    }
    it->second.last_seen = now;
    return false;
  }

  if (capacity_ == 0) {
    return false;
  }
  if (routes_.size() >= capacity_) {
    auto oldest = std::min_element(routes_.begin(), routes_.end(), [](const auto &a, const auto &b) {
      return a.second.last_seen < b.second.last_seen;
    });
    LOG_DHT_TRACE("routing table full, evicting {}", oldest->first);
    routes_.erase(oldest);
  }

  RouteEntry entry;
  entry.peer_id = peer_id;
  entry.key = KeyFor(peer_id);
  entry.endpoint = endpoint;
  entry.last_seen = now;
  routes_.emplace(peer_id, std::move(entry));
  LOG_DHT_DEBUG("added route {} at {}", peer_id, endpoint.ToString());
  return true;
}

bool RoutingTable::Remove(const std::string &peer_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return routes_.erase(peer_id) > 0;
}

std::optional<Endpoint> RoutingTable::Lookup(const std::string &peer_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = routes_.find(peer_id);
  if (it == routes_.end()) {
    return std::nullopt;
  }
  return it->second.endpoint;
}

bool RoutingTable::Contains(const std::string &peer_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return routes_.count(peer_id) > 0;
}

std::vector<RouteEntry> RoutingTable::Closest(const NodeKey &target, size_t count) const {
  std::vector<RouteEntry> result;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    result.reserve(routes_.size());
    for (const auto &[id, entry] : routes_) {
      result.push_back(entry);
    }
  }

  auto by_distance = [&target](const RouteEntry &a, const RouteEntry &b) {
    return CloserTo(target, a.key, b.key);
  };
  if (result.size() > count) {
    std::partial_sort(result.begin(), result.begin() + count, result.end(), by_distance);
    result.resize(count);
  } else {
    std::sort(result.begin(), result.end(), by_distance);
  }
  return result;
}

std::vector<RouteEntry> RoutingTable::Entries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<RouteEntry> entries;
  entries.reserve(routes_.size());
  for (const auto &[id, entry] : routes_) {
    entries.push_back(entry);
  }
  return entries;
}

std::vector<std::string> RoutingTable::PeerIds() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(routes_.size());
  for (const auto &[id, entry] : routes_) {
    ids.push_back(id);
  }
  return ids;
}

size_t RoutingTable::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return routes_.size();
}

} // namespace network
} // namespace peerwatch
