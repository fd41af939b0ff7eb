// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "config.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include <cstdlib>

namespace peerwatch {
namespace app {

namespace {

// Longest accepted period for any timer (one week)
constexpr int64_t MAX_INTERVAL_SECONDS = 7 * 24 * 60 * 60;

// Interval in seconds, at least 1
std::chrono::seconds ReadInterval(const EnvLookup &lookup, const std::string &name,
                                  std::chrono::seconds fallback) {
  auto raw = lookup(name);
  if (!raw) {
    return fallback;
  }
  auto parsed = util::SafeParseInt64(*raw, 1, MAX_INTERVAL_SECONDS);
  if (!parsed) {
    LOG_WARN("Invalid {}='{}' (expected 1-{} seconds), using default {}", name, *raw,
             MAX_INTERVAL_SECONDS, fallback.count());
    return fallback;
  }
  return std::chrono::seconds(*parsed);
}

uint16_t ReadPort(const EnvLookup &lookup, const std::string &name, uint16_t fallback,
                  bool allow_zero) {
  auto raw = lookup(name);
  if (!raw) {
    return fallback;
  }
  auto parsed = util::SafeParseInt(*raw, allow_zero ? 0 : 1, 65535);
  if (!parsed) {
    LOG_WARN("Invalid {}='{}' (expected port {}-65535), using default {}", name, *raw,
             allow_zero ? 0 : 1, fallback);
    return fallback;
  }
  return static_cast<uint16_t>(*parsed);
}

} // namespace

std::optional<std::string> GetProcessEnv(const std::string &name) {
  const char *value = std::getenv(name.c_str());
  if (value == nullptr) {
    return std::nullopt;
  }
  return std::string(value);
}

AppConfig LoadConfigFromEnv(const EnvLookup &lookup) {
  AppConfig config;
  auto &membership = config.membership_config;
  auto &network = config.network_config;

  membership.heartbeat_interval =
      ReadInterval(lookup, "INTERVAL_SECONDS", membership.heartbeat_interval);
  membership.anti_entropy_interval =
      ReadInterval(lookup, "ANTI_ENTROPY_SECONDS", membership.anti_entropy_interval);

  // TTL defaults to three missed heartbeats
  const uint64_t default_ttl = static_cast<uint64_t>(membership.heartbeat_interval.count()) * 3;
  membership.peer_ttl = default_ttl;
  if (auto raw = lookup("PEER_TTL_SECONDS")) {
    auto parsed = util::SafeParseUInt64(*raw);
    if (parsed) {
      membership.peer_ttl = *parsed;
    } else {
      LOG_WARN("Invalid PEER_TTL_SECONDS='{}', using default {}", *raw, default_ttl);
    }
  }

  if (auto topic = lookup("TOPIC")) {
    if (topic->empty()) {
      LOG_WARN("Empty TOPIC, using default {}", protocol::DEFAULT_TOPIC);
    } else {
      membership.topic = *topic;
    }
  }

  config.http_port = ReadPort(lookup, "HTTP_PORT", config.http_port, false);

  if (auto raw = lookup("BOOTSTRAP_PEERS")) {
    config.bootstrap_peers = util::SplitList(*raw);
  }

  network.listen_port = ReadPort(lookup, "LISTEN_PORT", network.listen_port, true);

  if (auto group = lookup("DISCOVERY_GROUP")) {
    if (group->empty()) {
      LOG_WARN("Empty DISCOVERY_GROUP, using default {}", network.discovery.group);
    } else {
      network.discovery.group = *group;
    }
  }
  network.discovery.port = ReadPort(lookup, "DISCOVERY_PORT", network.discovery.port, false);
  network.discovery.interval =
      ReadInterval(lookup, "DISCOVERY_INTERVAL_SECONDS", network.discovery.interval);

  return config;
}

} // namespace app
} // namespace peerwatch
