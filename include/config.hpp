// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "membership/membership_manager.hpp"
#include "network/network_manager.hpp"
#include "network/protocol.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace peerwatch {
namespace app {

// Application configuration
struct AppConfig {
  // Datagram transport, DHT and local discovery
  network::NetworkManager::Config network_config;

  // Heartbeat / anti-entropy periods, peer TTL, gossip topic
  membership::MembershipManager::Config membership_config;

  // Introspection endpoint (0 = ephemeral)
  uint16_t http_port = protocol::ports::HTTP;
  std::string http_bind_address = "0.0.0.0";

  // Reserved: accepted and logged, not dialed
  std::vector<std::string> bootstrap_peers;
};

// Environment lookup; std::nullopt when the variable is unset
using EnvLookup = std::function<std::optional<std::string>(const std::string &)>;

// Reads the process environment
std::optional<std::string> GetProcessEnv(const std::string &name);

/**
 * Build configuration from environment variables
 *
 *   INTERVAL_SECONDS            heartbeat period (default 10)
 *   ANTI_ENTROPY_SECONDS        reconciliation period (default 30)
 *   PEER_TTL_SECONDS            eviction threshold (default 3 x INTERVAL_SECONDS)
 *   TOPIC                       gossip topic (default testdistributed/peers)
 *   HTTP_PORT                   introspection port (default 9090)
 *   BOOTSTRAP_PEERS             comma-separated, reserved
 *   LISTEN_PORT                 UDP port for gossip + DHT (default 0 = ephemeral)
 *   DISCOVERY_GROUP             multicast group (default 239.255.70.77)
 *   DISCOVERY_PORT              multicast port (default 37020)
 *   DISCOVERY_INTERVAL_SECONDS  beacon period (default 5)
 *
 * Unparsable or out-of-range values are logged and replaced by the default.
 * Never throws.
 */
AppConfig LoadConfigFromEnv(const EnvLookup &lookup = GetProcessEnv);

} // namespace app
} // namespace peerwatch
