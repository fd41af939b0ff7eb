#pragma once

#include "network/protocol.hpp"
#include "network/transport.hpp"
#include <array>
#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace peerwatch {
namespace network {

// A peer seen on the local network, reachable at `endpoint`
struct DiscoveredPeer {
  std::string peer_id;
  Endpoint endpoint;
};

using DiscoveryCallback = std::function<void(const DiscoveredPeer &)>;

// Beacon payload: {"peer":"<id>","port":<listen port>,"agent":"/PeerWatch:x.y.z/"}
std::string EncodeBeacon(const std::string &peer_id, uint16_t port);

// Parse a beacon; std::nullopt unless it has a non-empty peer and a port in 1..65535
std::optional<std::pair<std::string, uint16_t>> DecodeBeacon(const std::string &payload);

/**
 * LocalDiscovery - multicast beacon for finding peers on the same network
 *
 * Joins the multicast group, announces the local peer id and listen port
 * every interval, and reports each beacon from another peer. Runs on the
 * caller's io_context.
 */
class LocalDiscovery {
public:
  struct Config {
    std::string group{protocol::DEFAULT_DISCOVERY_GROUP};
    uint16_t port{protocol::ports::DISCOVERY};
    std::chrono::seconds interval{protocol::DEFAULT_DISCOVERY_INTERVAL};
  };

  LocalDiscovery(boost::asio::io_context &io_context, std::string local_peer_id,
                 const Config &config);
  ~LocalDiscovery();

  LocalDiscovery(const LocalDiscovery &) = delete;
  LocalDiscovery &operator=(const LocalDiscovery &) = delete;

  // Join the group and start announcing `advertised_port`
  bool start(uint16_t advertised_port, DiscoveryCallback callback);
  void stop();

  bool is_running() const { return socket_ != nullptr; }

  // Feed a received beacon (exposed for tests)
  void HandleBeacon(const std::string &payload, const std::string &sender_address);

private:
  void schedule_announce(std::chrono::seconds delay);
  void announce();
  void start_receive();

  boost::asio::io_context &io_context_;
  std::string local_peer_id_;
  Config config_;

  std::unique_ptr<boost::asio::ip::udp::socket> socket_;
  std::unique_ptr<boost::asio::steady_timer> announce_timer_;
  boost::asio::ip::udp::endpoint group_endpoint_;
  boost::asio::ip::udp::endpoint sender_;
  std::array<char, 1024> recv_buffer_{};

  uint16_t advertised_port_{0};
  DiscoveryCallback callback_;
};

} // namespace network
} // namespace peerwatch
