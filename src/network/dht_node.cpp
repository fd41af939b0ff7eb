#include "network/dht_node.hpp"
#include "network/message.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <algorithm>
#include <boost/asio/post.hpp>

namespace peerwatch {
namespace network {

const char *LookupStatusName(LookupStatus status) {
  switch (status) {
  case LookupStatus::Found:
    return "found";
  case LookupStatus::NotFound:
    return "not found";
  case LookupStatus::Timeout:
    return "timeout";
  }
  return "unknown";
}

DhtNode::DhtNode(boost::asio::io_context &io_context, std::string local_peer_id,
                 DatagramTransport &transport, RoutingTable &routes, const Config &config)
    : io_context_(io_context), local_peer_id_(std::move(local_peer_id)), transport_(transport),
      routes_(routes), config_(config) {}

DhtNode::~DhtNode() { Shutdown(); }

void DhtNode::Shutdown() {
  for (auto &[id, lookup] : lookups_) {
    if (lookup->timer) {
      lookup->timer->cancel();
    }
  }
  lookups_.clear();
}

void DhtNode::add_address(const std::string &peer_id, const Endpoint &endpoint) {
  routes_.Upsert(peer_id, endpoint);
}

std::vector<std::string> DhtNode::routable_peers() const { return routes_.PeerIds(); }

// ============================================================================
// Record store
// ============================================================================

void DhtNode::StoreLocal(const std::string &key, const std::vector<uint8_t> &value) {
  std::lock_guard<std::mutex> lock(records_mutex_);
  auto it = records_.find(key);
  if (it == records_.end() && config_.max_records > 0 && records_.size() >= config_.max_records) {
    auto oldest = std::min_element(records_.begin(), records_.end(), [](const auto &a, const auto &b) {
      return a.second.stored_at < b.second.stored_at;
    });
    LOG_DHT_TRACE("record store full, evicting {}", oldest->first);
    records_.erase(oldest);
  }
  StoredRecord &record = records_[key];
  record.value = value;
  record.stored_at = util::GetTime();
}

std::optional<std::vector<uint8_t>> DhtNode::GetLocal(const std::string &key) const {
  std::lock_guard<std::mutex> lock(records_mutex_);
  auto it = records_.find(key);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second.value;
}

size_t DhtNode::RecordCount() const {
  std::lock_guard<std::mutex> lock(records_mutex_);
  return records_.size();
}

bool DhtNode::put_record(const std::string &key, const std::vector<uint8_t> &value) {
  StoreLocal(key, value);

  auto closest = routes_.Closest(KeyFor(key), protocol::DHT_K);
  if (closest.empty()) {
    LOG_DHT_DEBUG("put {}: stored locally, no peers to replicate to", key);
    return false;
  }

  message::DhtStoreMessage msg;
  msg.from = local_peer_id_;
  msg.port = transport_.local_port();
  msg.key = key;
  msg.value = value;
  const auto payload = msg.serialize();

  size_t sent = 0;
  for (const auto &route : closest) {
    if (transport_.send(route.endpoint, payload)) {
      ++sent;
    }
  }
  if (sent == 0) {
    LOG_DHT_DEBUG("put {}: failed to reach any of {} peers", key, closest.size());
    return false;
  }
  LOG_DHT_TRACE("put {}: replicated to {} peers", key, sent);
  return true;
}

// ============================================================================
// Lookups
// ============================================================================

void DhtNode::get_record(const std::string &key, LookupCallback callback) {
  if (!callback) {
    return;
  }

  auto lookup = std::make_unique<Lookup>();
  lookup->id = next_lookup_id_++;
  lookup->key = key;
  lookup->target = KeyFor(key);
  lookup->callback = std::move(callback);

  if (auto local = GetLocal(key)) {
    Report(*lookup, *local);
  }

  for (auto &route : routes_.Closest(lookup->target, protocol::DHT_K)) {
    AddCandidate(*lookup, Candidate{route.peer_id, route.key, route.endpoint});
  }

  if (lookup->shortlist.empty()) {
    LOG_DHT_TRACE("get {}: no peers to ask", key);
    if (lookup->reported.empty()) {
      PostResult(std::move(lookup->callback), LookupResult{key, LookupStatus::NotFound, std::nullopt});
    }
    return;
  }

  const uint64_t id = lookup->id;
  lookup->timer = std::make_unique<boost::asio::steady_timer>(io_context_);
  lookup->timer->expires_after(config_.query_timeout);
  lookup->timer->async_wait([this, id](const boost::system::error_code &ec) {
    if (ec) {
      return;
    }
    Finish(id, LookupStatus::Timeout);
  });

  Lookup &ref = *lookup;
  lookups_.emplace(id, std::move(lookup));
  QueryMore(ref);

  // Every send failed
  if (ref.pending.empty()) {
    Finish(id, LookupStatus::NotFound);
  }
}

void DhtNode::AddCandidate(Lookup &lookup, Candidate candidate) {
  if (candidate.peer_id == local_peer_id_) {
    return;
  }
  for (const auto &existing : lookup.shortlist) {
    if (existing.peer_id == candidate.peer_id) {
      return;
    }
  }
  auto pos = std::find_if(lookup.shortlist.begin(), lookup.shortlist.end(),
                          [&](const Candidate &c) {
                            return CloserTo(lookup.target, candidate.key, c.key);
                          });
  lookup.shortlist.insert(pos, std::move(candidate));
}

void DhtNode::QueryMore(Lookup &lookup) {
  message::DhtFindMessage msg;
  msg.from = local_peer_id_;
  msg.port = transport_.local_port();
  msg.request_id = lookup.id;
  msg.key = lookup.key;
  const auto payload = msg.serialize();

  for (const auto &candidate : lookup.shortlist) {
    if (lookup.pending.size() >= protocol::DHT_ALPHA ||
        lookup.queries >= protocol::DHT_MAX_QUERIES) {
      break;
    }
    if (lookup.queried.count(candidate.peer_id)) {
      continue;
    }
    lookup.queried.insert(candidate.peer_id);
    ++lookup.queries;
    if (transport_.send(candidate.endpoint, payload)) {
      lookup.pending.insert(candidate.peer_id);
      LOG_DHT_TRACE("get {}: asked {} ({} queries)", lookup.key, candidate.peer_id, lookup.queries);
    } else {
      LOG_DHT_TRACE("get {}: failed to send to {}", lookup.key, candidate.peer_id);
    }
  }
}

void DhtNode::Report(Lookup &lookup, const std::vector<uint8_t> &value) {
  if (std::find(lookup.reported.begin(), lookup.reported.end(), value) != lookup.reported.end()) {
    return;
  }
  lookup.reported.push_back(value);
  PostResult(lookup.callback, LookupResult{lookup.key, LookupStatus::Found, value});
}

void DhtNode::Finish(uint64_t lookup_id, LookupStatus status) {
  auto it = lookups_.find(lookup_id);
  if (it == lookups_.end()) {
    return;
  }
  std::unique_ptr<Lookup> lookup = std::move(it->second);
  lookups_.erase(it);
  if (lookup->timer) {
    lookup->timer->cancel();
  }

  if (!lookup->reported.empty()) {
    LOG_DHT_DEBUG("get {}: {} distinct values after {} queries", lookup->key,
                  lookup->reported.size(), lookup->queries);
    return;
  }
  LOG_DHT_DEBUG("get {}: {} after {} queries", lookup->key, LookupStatusName(status),
                lookup->queries);
  PostResult(std::move(lookup->callback), LookupResult{lookup->key, status, std::nullopt});
}

void DhtNode::PostResult(LookupCallback callback, LookupResult result) {
  boost::asio::post(io_context_, [callback = std::move(callback), result = std::move(result)]() {
    callback(result);
  });
}

// ============================================================================
// Message handlers
// ============================================================================

bool DhtNode::HandleStore(const Endpoint &from, const message::DhtStoreMessage &msg) {
  StoreLocal(msg.key, msg.value);
  LOG_DHT_TRACE("stored {} for {} ({})", msg.key, msg.from, from.ToString());
  return true;
}

bool DhtNode::HandleFind(const Endpoint &from, const message::DhtFindMessage &msg) {
  message::DhtFoundMessage reply;
  reply.from = local_peer_id_;
  reply.port = transport_.local_port();
  reply.request_id = msg.request_id;
  reply.key = msg.key;
  reply.value = GetLocal(msg.key);

  if (!reply.value) {
    for (const auto &route : routes_.Closest(KeyFor(msg.key), protocol::DHT_K + 1)) {
      if (route.peer_id == msg.from || reply.closer.size() >= protocol::DHT_K) {
        continue;
      }
      reply.closer.push_back(
          message::PeerHint{route.peer_id, route.endpoint.address, route.endpoint.port});
    }
  }

  Endpoint reply_to{from.address, msg.port};
  if (!transport_.send(reply_to, reply.serialize())) {
    LOG_DHT_TRACE("failed to answer find {} from {}", msg.key, reply_to.ToString());
    return false;
  }
  return true;
}

bool DhtNode::HandleFound(const Endpoint &from, const message::DhtFoundMessage &msg) {
  auto it = lookups_.find(msg.request_id);
  if (it == lookups_.end()) {
    LOG_DHT_TRACE("late or unknown find reply {} from {}", msg.request_id, from.ToString());
    return true;
  }
  Lookup &lookup = *it->second;
  if (lookup.key != msg.key || lookup.pending.erase(msg.from) == 0) {
    LOG_DHT_TRACE("unexpected find reply for {} from {}", msg.key, msg.from);
    return false;
  }

  if (msg.value) {
    Report(lookup, *msg.value);
    if (++lookup.found >= protocol::DHT_GET_QUORUM) {
      Finish(lookup.id, LookupStatus::Found);
      return true;
    }
  } else {
    for (const auto &hint : msg.closer) {
      if (hint.peer_id.empty() || hint.port == 0) {
        continue;
      }
      AddCandidate(lookup, Candidate{hint.peer_id, KeyFor(hint.peer_id),
                                     Endpoint{hint.address, hint.port}});
    }
  }

  QueryMore(lookup);
  if (lookup.pending.empty()) {
    Finish(lookup.id, LookupStatus::NotFound);
  }
  return true;
}

} // namespace network
} // namespace peerwatch
