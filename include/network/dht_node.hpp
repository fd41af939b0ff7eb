#pragma once

#include "network/dht.hpp"
#include "network/protocol.hpp"
#include "network/routing_table.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace peerwatch {

namespace message {
class DhtStoreMessage;
class DhtFindMessage;
class DhtFoundMessage;
} // namespace message

namespace network {

/**
 * DhtNode - Kademlia-style DHT over datagrams
 *
 * Records live in a bounded in-memory store. put_record replicates to the
 * DHT_K closest routable peers. get_record reports the local copy, if any,
 * and always runs an iterative FIND_VALUE lookup while peers are routable:
 * DHT_ALPHA requests in flight, closer-peer hints followed, at most
 * DHT_MAX_QUERIES requests, bounded by the query timeout. A local copy may
 * be stale (a STORE can be lost), so every distinct value is reported and
 * the lookup ends after DHT_GET_QUORUM peers returned one.
 *
 * Lookup state is only touched on the reactor thread.
 */
class DhtNode : public Dht {
public:
  struct Config {
    std::chrono::milliseconds query_timeout{protocol::DHT_QUERY_TIMEOUT};
    size_t max_records{protocol::DHT_MAX_RECORDS};
  };

  DhtNode(boost::asio::io_context &io_context, std::string local_peer_id,
          DatagramTransport &transport, RoutingTable &routes, const Config &config);
  DhtNode(boost::asio::io_context &io_context, std::string local_peer_id,
          DatagramTransport &transport, RoutingTable &routes)
      : DhtNode(io_context, std::move(local_peer_id), transport, routes, Config{}) {}
  ~DhtNode() override;

  DhtNode(const DhtNode &) = delete;
  DhtNode &operator=(const DhtNode &) = delete;

  void add_address(const std::string &peer_id, const Endpoint &endpoint) override;
  bool put_record(const std::string &key, const std::vector<uint8_t> &value) override;
  void get_record(const std::string &key, LookupCallback callback) override;
  std::vector<std::string> routable_peers() const override;

  // Dispatcher entry points
  bool HandleStore(const Endpoint &from, const message::DhtStoreMessage &msg);
  bool HandleFind(const Endpoint &from, const message::DhtFindMessage &msg);
  bool HandleFound(const Endpoint &from, const message::DhtFoundMessage &msg);

  // Local record store access (diagnostics/tests)
  std::optional<std::vector<uint8_t>> GetLocal(const std::string &key) const;
  size_t RecordCount() const;
  size_t PendingLookups() const { return lookups_.size(); }

  // Abandon in-flight lookups without completing them
  void Shutdown();

private:
  struct Candidate {
    std::string peer_id;
    NodeKey key{};
    Endpoint endpoint;
  };

  struct Lookup {
    uint64_t id{0};
    std::string key;
    NodeKey target{};
    LookupCallback callback;
    std::vector<Candidate> shortlist; // Closest first
    std::set<std::string> queried;
    std::set<std::string> pending;
    std::vector<std::vector<uint8_t>> reported;
    size_t found{0};
    size_t queries{0};
    std::unique_ptr<boost::asio::steady_timer> timer;
  };

  void StoreLocal(const std::string &key, const std::vector<uint8_t> &value);

  void AddCandidate(Lookup &lookup, Candidate candidate);
  void QueryMore(Lookup &lookup);
  void Report(Lookup &lookup, const std::vector<uint8_t> &value);
  // Ends the lookup; `status` is reported only if no value was
  void Finish(uint64_t lookup_id, LookupStatus status);
  void PostResult(LookupCallback callback, LookupResult result);

  boost::asio::io_context &io_context_;
  std::string local_peer_id_;
  DatagramTransport &transport_;
  RoutingTable &routes_;
  Config config_;

  struct StoredRecord {
    std::vector<uint8_t> value;
    int64_t stored_at{0};
  };
  mutable std::mutex records_mutex_;
  std::map<std::string, StoredRecord> records_;

  uint64_t next_lookup_id_{1};
  std::map<uint64_t, std::unique_ptr<Lookup>> lookups_;
};

} // namespace network
} // namespace peerwatch
