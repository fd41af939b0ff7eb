// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "config.hpp"
#include <catch2/catch_test_macros.hpp>
#include <map>

using namespace peerwatch::app;

namespace {
EnvLookup FakeEnv(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}
} // namespace

TEST_CASE("Config - defaults with an empty environment", "[config]") {
    AppConfig config = LoadConfigFromEnv(FakeEnv({}));

    REQUIRE(config.membership_config.heartbeat_interval == std::chrono::seconds(10));
    REQUIRE(config.membership_config.anti_entropy_interval == std::chrono::seconds(30));
    REQUIRE(config.membership_config.peer_ttl == 30);
    REQUIRE(config.membership_config.topic == "testdistributed/peers");
    REQUIRE(config.http_port == 9090);
    REQUIRE(config.bootstrap_peers.empty());
    REQUIRE(config.network_config.listen_port == 0);
    REQUIRE(config.network_config.discovery.group == "239.255.70.77");
    REQUIRE(config.network_config.discovery.port == 37020);
}

TEST_CASE("Config - values from the environment", "[config]") {
    AppConfig config = LoadConfigFromEnv(FakeEnv({
        {"INTERVAL_SECONDS", "2"},
        {"ANTI_ENTROPY_SECONDS", "7"},
        {"PEER_TTL_SECONDS", "11"},
        {"TOPIC", "lab/peers"},
        {"HTTP_PORT", "18080"},
        {"BOOTSTRAP_PEERS", "10.0.0.1:4000, 10.0.0.2:4000"},
        {"LISTEN_PORT", "4100"},
        {"DISCOVERY_GROUP", "239.1.2.3"},
        {"DISCOVERY_PORT", "5353"},
        {"DISCOVERY_INTERVAL_SECONDS", "1"},
    }));

    REQUIRE(config.membership_config.heartbeat_interval == std::chrono::seconds(2));
    REQUIRE(config.membership_config.anti_entropy_interval == std::chrono::seconds(7));
    REQUIRE(config.membership_config.peer_ttl == 11);
    REQUIRE(config.membership_config.topic == "lab/peers");
    REQUIRE(config.http_port == 18080);
    REQUIRE(config.bootstrap_peers == std::vector<std::string>{"10.0.0.1:4000", "10.0.0.2:4000"});
    REQUIRE(config.network_config.listen_port == 4100);
    REQUIRE(config.network_config.discovery.group == "239.1.2.3");
    REQUIRE(config.network_config.discovery.port == 5353);
    REQUIRE(config.network_config.discovery.interval == std::chrono::seconds(1));
}

TEST_CASE("Config - TTL follows the heartbeat interval unless set", "[config]") {
    AppConfig config = LoadConfigFromEnv(FakeEnv({{"INTERVAL_SECONDS", "4"}}));
    REQUIRE(config.membership_config.peer_ttl == 12);

    SECTION("Explicit zero TTL is honoured") {
        config = LoadConfigFromEnv(FakeEnv({{"INTERVAL_SECONDS", "4"}, {"PEER_TTL_SECONDS", "0"}}));
        REQUIRE(config.membership_config.peer_ttl == 0);
    }
}

TEST_CASE("Config - invalid values fall back to defaults", "[config]") {
    AppConfig config = LoadConfigFromEnv(FakeEnv({
        {"INTERVAL_SECONDS", "0"},
        {"ANTI_ENTROPY_SECONDS", "soon"},
        {"PEER_TTL_SECONDS", "-3"},
        {"TOPIC", ""},
        {"HTTP_PORT", "70000"},
        {"LISTEN_PORT", "-1"},
        {"DISCOVERY_GROUP", ""},
        {"DISCOVERY_PORT", "0"},
    }));

    REQUIRE(config.membership_config.heartbeat_interval == std::chrono::seconds(10));
    REQUIRE(config.membership_config.anti_entropy_interval == std::chrono::seconds(30));
    REQUIRE(config.membership_config.peer_ttl == 30);
    REQUIRE(config.membership_config.topic == "testdistributed/peers");
    REQUIRE(config.http_port == 9090);
    REQUIRE(config.network_config.listen_port == 0);
    REQUIRE(config.network_config.discovery.group == "239.255.70.77");
    REQUIRE(config.network_config.discovery.port == 37020);
}
