// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/message.hpp"
#include "network/protocol.hpp"
#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

using namespace peerwatch::message;
using namespace peerwatch::protocol;

TEST_CASE("Message - create_message factory", "[network][message]") {
    REQUIRE(create_message(types::GOSSIP)->command() == types::GOSSIP);
    REQUIRE(create_message(types::DHT_STORE)->command() == types::DHT_STORE);
    REQUIRE(create_message(types::DHT_FIND)->command() == types::DHT_FIND);
    REQUIRE(create_message(types::DHT_FOUND)->command() == types::DHT_FOUND);
    REQUIRE(create_message("version") == nullptr);
}

TEST_CASE("Message - gossip envelope", "[network][message]") {
    GossipMessage msg;
    msg.from = "relay";
    msg.port = 4100;
    msg.topic = DEFAULT_TOPIC;
    msg.id = "origin:7";
    msg.origin = "origin";
    msg.hops = 2;
    msg.data = {0x7b, 0x7d, 0x00, 0xff};

    auto bytes = msg.serialize();
    auto decoded = decode_envelope(bytes.data(), bytes.size());
    REQUIRE(decoded);
    REQUIRE(decoded->command() == types::GOSSIP);

    auto* gossip = static_cast<GossipMessage*>(decoded.get());
    REQUIRE(gossip->from == "relay");
    REQUIRE(gossip->port == 4100);
    REQUIRE(gossip->topic == DEFAULT_TOPIC);
    REQUIRE(gossip->id == "origin:7");
    REQUIRE(gossip->origin == "origin");
    REQUIRE(gossip->hops == 2);
    REQUIRE(gossip->data == msg.data);

    SECTION("Typed deserialize rejects another type") {
        DhtStoreMessage store;
        REQUIRE_FALSE(store.deserialize(bytes.data(), bytes.size()));
        GossipMessage again;
        REQUIRE(again.deserialize(bytes.data(), bytes.size()));
        REQUIRE(again.id == "origin:7");
    }
}

TEST_CASE("Message - DHT found carries value or closer peers", "[network][message]") {
    DhtFoundMessage msg;
    msg.from = "responder";
    msg.port = 4000;
    msg.request_id = 99;
    msg.key = "peer:abc";

    SECTION("Without value") {
        msg.closer.push_back(PeerHint{"n1", "10.0.0.1", 4001});
        msg.closer.push_back(PeerHint{"n2", "::1", 4002});
        auto bytes = msg.serialize();
        auto decoded = decode_envelope(bytes.data(), bytes.size());
        REQUIRE(decoded);
        auto* found = static_cast<DhtFoundMessage*>(decoded.get());
        REQUIRE(found->request_id == 99);
        REQUIRE_FALSE(found->value.has_value());
        REQUIRE(found->closer.size() == 2);
        REQUIRE(found->closer[1].address == "::1");
        REQUIRE(found->closer[1].port == 4002);
    }

    SECTION("With value") {
        msg.value = std::vector<uint8_t>{'1', '2', '3'};
        auto bytes = msg.serialize();
        auto decoded = decode_envelope(bytes.data(), bytes.size());
        REQUIRE(decoded);
        auto* found = static_cast<DhtFoundMessage*>(decoded.get());
        REQUIRE(found->value == msg.value);
        REQUIRE(found->closer.empty());
    }

    SECTION("Too many closer peers") {
        for (size_t i = 0; i <= DHT_K; ++i) {
            msg.closer.push_back(PeerHint{"n" + std::to_string(i), "10.0.0.1", 4001});
        }
        auto bytes = msg.serialize();
        REQUIRE(decode_envelope(bytes.data(), bytes.size()) == nullptr);
    }
}

TEST_CASE("Message - garbage is rejected without throwing", "[network][message]") {
    SECTION("Random bytes") {
        std::vector<uint8_t> junk{0xde, 0xad, 0xbe, 0xef, 0x01};
        REQUIRE(decode_envelope(junk.data(), junk.size()) == nullptr);
    }

    SECTION("Empty and null input") {
        REQUIRE(decode_envelope(nullptr, 0) == nullptr);
        uint8_t one = 0;
        REQUIRE(decode_envelope(&one, 0) == nullptr);
    }

    SECTION("Heartbeat JSON sent straight to the UDP port") {
        std::string text = R"({"peer":"abc","ts":1})";
        std::vector<uint8_t> bytes(text.begin(), text.end());
        REQUIRE(decode_envelope(bytes.data(), bytes.size()) == nullptr);
    }

    SECTION("Unknown type") {
        nlohmann::json j = {{"v", PROTOCOL_VERSION}, {"type", "ping"}, {"from", "x"}, {"port", 1}};
        auto bytes = nlohmann::json::to_cbor(j);
        REQUIRE(decode_envelope(bytes.data(), bytes.size()) == nullptr);
    }

    SECTION("Wrong protocol version") {
        DhtFindMessage find;
        find.from = "x";
        find.port = 1;
        find.key = "peer:y";
        auto j = nlohmann::json::from_cbor(find.serialize());
        j["v"] = PROTOCOL_VERSION + 1;
        auto bytes = nlohmann::json::to_cbor(j);
        REQUIRE(decode_envelope(bytes.data(), bytes.size()) == nullptr);
    }

    SECTION("Missing sender") {
        DhtFindMessage find;
        find.port = 1;
        find.key = "peer:y";
        auto bytes = find.serialize();
        REQUIRE(decode_envelope(bytes.data(), bytes.size()) == nullptr);
    }

    SECTION("Port out of range") {
        DhtStoreMessage store;
        store.from = "x";
        store.key = "peer:y";
        store.value = {'1'};
        auto j = nlohmann::json::from_cbor(store.serialize());
        j["port"] = 70000;
        auto bytes = nlohmann::json::to_cbor(j);
        REQUIRE(decode_envelope(bytes.data(), bytes.size()) == nullptr);
    }

    SECTION("Oversized datagram") {
        std::vector<uint8_t> huge(MAX_DATAGRAM_SIZE + 1, 0xa0);
        REQUIRE(decode_envelope(huge.data(), huge.size()) == nullptr);
    }
}
