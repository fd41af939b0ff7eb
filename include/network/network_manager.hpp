#pragma once

#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "network/dht_node.hpp"
#include "network/local_discovery.hpp"
#include "network/protocol.hpp"
#include "network/transport.hpp"

namespace peerwatch {

namespace message {
class Message;
}

namespace network {

class GossipChannel;
class GossipService;
class MessageDispatcher;
class RoutingTable;

/**
 * NetworkManager - owns the reactor and every network-facing component
 *
 * One datagram socket carries gossip and DHT traffic; the dispatcher routes
 * decoded envelopes to the gossip service and the DHT node. Every envelope
 * teaches the routing table where its sender listens. Local discovery runs
 * beside it on the multicast group.
 *
 * All components run on a single io_context, so handlers never overlap.
 */
class NetworkManager {
public:
  struct Config {
    uint16_t listen_port;   // UDP port for gossip + DHT (0 = ephemeral)
    size_t io_threads;      // Reactor threads; MUST be 1 in production (0 = external io_context for tests)
    bool discovery_enabled; // Run the multicast beacon
    LocalDiscovery::Config discovery;
    DhtNode::Config dht;

    Config() : listen_port(0), io_threads(1), discovery_enabled(true) {}
  };

  /**
   * Construct NetworkManager
   *
   * @param local_peer_id       Peer id of this node
   * @param config              Network configuration
   * @param transport           Optional transport (nullptr = create a UdpTransport on the reactor)
   * @param external_io_context Optional external io_context (nullptr = create owned io_context)
   *
   * With an external io_context no threads are spawned; the caller drives
   * event processing (run_one/poll in tests).
   */
  explicit NetworkManager(std::string local_peer_id, const Config &config = Config{},
                          std::shared_ptr<DatagramTransport> transport = nullptr,
                          std::shared_ptr<boost::asio::io_context> external_io_context = nullptr);
  ~NetworkManager();

  NetworkManager(const NetworkManager &) = delete;
  NetworkManager &operator=(const NetworkManager &) = delete;

  // Bind the datagram socket, join discovery, start the reactor thread.
  // Returns false if the listen port cannot be bound.
  bool start();

  // Idempotent; safe from destructors
  void stop();

  bool is_running() const { return running_.load(std::memory_order_acquire); }

  // Must be set before start(); invoked on the reactor thread
  void set_discovery_callback(DiscoveryCallback callback);

  boost::asio::io_context &io_context() { return *io_context_; }

  const std::string &local_peer_id() const { return local_peer_id_; }
  uint16_t local_port() const;

  GossipChannel &gossip();
  Dht &dht();

  GossipService &gossip_service() { return *gossip_; }
  DhtNode &dht_node() { return *dht_; }
  RoutingTable &routing_table() { return *routes_; }

private:
  void handle_datagram(const std::vector<uint8_t> &data, const Endpoint &from);
  void register_handlers();

  std::string local_peer_id_;
  Config config_;

  // Declared before transport_: the default transport is built on it
  std::shared_ptr<boost::asio::io_context> io_context_;
  bool external_io_context_;
  std::shared_ptr<DatagramTransport> transport_;

  std::unique_ptr<RoutingTable> routes_;
  std::unique_ptr<MessageDispatcher> dispatcher_;
  std::unique_ptr<GossipService> gossip_;
  std::unique_ptr<DhtNode> dht_;
  std::unique_ptr<LocalDiscovery> discovery_;
  DiscoveryCallback discovery_callback_;

  std::mutex start_stop_mutex_;
  std::atomic<bool> running_{false};
  std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::vector<std::thread> io_threads_;
};

} // namespace network
} // namespace peerwatch
