// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/local_discovery.hpp"
#include "version.hpp"
#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

using namespace peerwatch::network;

TEST_CASE("LocalDiscovery - beacon encoding", "[network][discovery]") {
    auto text = EncodeBeacon("12D3KooWexample", 4123);
    auto j = nlohmann::json::parse(text);
    REQUIRE(j["peer"] == "12D3KooWexample");
    REQUIRE(j["port"] == 4123);
    REQUIRE(j["agent"] == peerwatch::GetUserAgent());

    auto decoded = DecodeBeacon(text);
    REQUIRE(decoded.has_value());
    REQUIRE(decoded->first == "12D3KooWexample");
    REQUIRE(decoded->second == 4123);
}

TEST_CASE("LocalDiscovery - malformed beacons", "[network][discovery]") {
    REQUIRE_FALSE(DecodeBeacon("").has_value());
    REQUIRE_FALSE(DecodeBeacon("not json").has_value());
    REQUIRE_FALSE(DecodeBeacon(R"(["peer", 1])").has_value());
    REQUIRE_FALSE(DecodeBeacon(R"({"peer":"x"})").has_value());
    REQUIRE_FALSE(DecodeBeacon(R"({"port":1})").has_value());
    REQUIRE_FALSE(DecodeBeacon(R"({"peer":"","port":1})").has_value());
    REQUIRE_FALSE(DecodeBeacon(R"({"peer":"x","port":0})").has_value());
    REQUIRE_FALSE(DecodeBeacon(R"({"peer":"x","port":65536})").has_value());
    REQUIRE_FALSE(DecodeBeacon(R"({"peer":"x","port":-1})").has_value());
    REQUIRE_FALSE(DecodeBeacon(R"({"peer":7,"port":1})").has_value());
}

TEST_CASE("LocalDiscovery - start rejects a non-multicast group", "[network][discovery]") {
    boost::asio::io_context io;

    SECTION("Unicast address") {
        LocalDiscovery::Config config;
        config.group = "10.1.2.3";
        LocalDiscovery discovery(io, "self", config);
        REQUIRE_FALSE(discovery.start(4000, [](const DiscoveredPeer&) {}));
        REQUIRE_FALSE(discovery.is_running());
    }

    SECTION("Not an address") {
        LocalDiscovery::Config config;
        config.group = "multicast-please";
        LocalDiscovery discovery(io, "self", config);
        REQUIRE_FALSE(discovery.start(4000, [](const DiscoveredPeer&) {}));
        REQUIRE_FALSE(discovery.is_running());
    }
}
