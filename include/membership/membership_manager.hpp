// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "membership/anti_entropy.hpp"
#include "membership/directory.hpp"
#include "membership/discovery_ingest.hpp"
#include "membership/events.hpp"
#include "membership/gossip_ingest.hpp"
#include "membership/heartbeat_publisher.hpp"
#include "network/protocol.hpp"
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <memory>
#include <string>

namespace peerwatch {

namespace network {
class Dht;
class GossipChannel;
struct DiscoveredPeer;
} // namespace network

namespace membership {

/**
 * MembershipManager - the membership event loop
 *
 * Every input (gossip delivery, discovery report, DHT lookup completion,
 * heartbeat and anti-entropy ticks) becomes an Event posted to the reactor
 * and handled one at a time by HandleEvent. Both timers fire once
 * immediately at start and then on their period.
 *
 * The Directory is the only state shared outside the reactor thread.
 */
class MembershipManager {
public:
  struct Config {
    std::chrono::seconds heartbeat_interval;
    std::chrono::seconds anti_entropy_interval;
    uint64_t peer_ttl; // seconds
    std::string topic;

    Config()
        : heartbeat_interval(10), anti_entropy_interval(30), peer_ttl(30),
          topic(protocol::DEFAULT_TOPIC) {}
  };

  MembershipManager(boost::asio::io_context &io_context, std::string local_peer_id,
                    network::GossipChannel &gossip, network::Dht &dht, Directory &directory,
                    const Config &config = Config{});
  ~MembershipManager();

  MembershipManager(const MembershipManager &) = delete;
  MembershipManager &operator=(const MembershipManager &) = delete;

  // Subscribe to the topic and arm both timers
  bool start();
  void stop();
  bool is_running() const { return running_.load(); }

  // Queue an event for the reactor; safe from any thread
  void Post(Event event);

  // Discovery hook; queues a DiscoveryEvent
  void OnDiscovered(const network::DiscoveredPeer &peer);

  // Handle one event; reactor thread only
  void HandleEvent(const Event &event);

  const Config &config() const { return config_; }

private:
  void schedule_heartbeat(std::chrono::steady_clock::time_point when);
  void schedule_anti_entropy(std::chrono::steady_clock::time_point when);

  boost::asio::io_context &io_context_;
  std::string local_peer_id_;
  network::GossipChannel &gossip_;
  Config config_;

  HeartbeatPublisher heartbeat_;
  GossipIngest gossip_ingest_;
  DiscoveryIngest discovery_ingest_;
  AntiEntropyReconciler anti_entropy_;

  std::unique_ptr<boost::asio::steady_timer> heartbeat_timer_;
  std::unique_ptr<boost::asio::steady_timer> anti_entropy_timer_;
  std::atomic<bool> running_{false};
};

} // namespace membership
} // namespace peerwatch
