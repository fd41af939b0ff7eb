// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Anti-entropy reconciler: DHT-driven repair and TTL eviction

#include "membership/anti_entropy.hpp"
#include "membership/directory.hpp"
#include "network/heartbeat.hpp"
#include "network/infra/mock_dht.hpp"
#include <catch2/catch_test_macros.hpp>
#include <algorithm>

using namespace peerwatch;
using namespace peerwatch::membership;
using peerwatch::test::MockDht;

namespace {
std::vector<uint8_t> Value(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}
} // namespace

TEST_CASE("AntiEntropy - one lookup per known peer", "[membership][anti_entropy]") {
    Directory dir;
    MockDht dht;
    std::vector<DhtLookupResult> delivered;
    AntiEntropyReconciler reconciler(dir, dht, 30, [&](DhtLookupResult r) { delivered.push_back(r); });

    dir.Merge("p1", 100);
    dir.Merge("p2", 100);
    reconciler.RunPass(110);

    auto keys = dht.requested_keys();
    std::sort(keys.begin(), keys.end());
    REQUIRE(keys == std::vector<std::string>{"peer:p1", "peer:p2"});

    SECTION("Results reach the sink, not the directory") {
        dht.records()["peer:p1"] = Value("105");
        dht.ResolveAll();
        REQUIRE(delivered.size() == 2);
        REQUIRE(dir.Get("p1") == 100u);

        for (const auto& r : delivered) {
            reconciler.HandleResult(r);
        }
        REQUIRE(dir.Get("p1") == 105u);
        REQUIRE(dir.Get("p2") == 100u);
    }
}

TEST_CASE("AntiEntropy - stale DHT value does not regress gossip", "[membership][anti_entropy]") {
    Directory dir;
    MockDht dht;
    AntiEntropyReconciler reconciler(dir, dht, 30, nullptr);

    dir.Merge("p1", 100);
    network::LookupResult result{"peer:p1", network::LookupStatus::Found, Value("50")};
    REQUIRE_FALSE(reconciler.HandleResult(DhtLookupResult{result}));
    REQUIRE(dir.Get("p1") == 100u);
}

TEST_CASE("AntiEntropy - unusable results are ignored", "[membership][anti_entropy]") {
    Directory dir;
    MockDht dht;
    AntiEntropyReconciler reconciler(dir, dht, 30, nullptr);
    dir.Merge("p1", 100);

    SECTION("Record never written") {
        REQUIRE_FALSE(reconciler.HandleResult(
            DhtLookupResult{{"peer:p1", network::LookupStatus::NotFound, std::nullopt}}));
    }

    SECTION("Lookup timed out") {
        REQUIRE_FALSE(reconciler.HandleResult(
            DhtLookupResult{{"peer:p1", network::LookupStatus::Timeout, std::nullopt}}));
    }

    SECTION("Value is not a number") {
        REQUIRE_FALSE(reconciler.HandleResult(
            DhtLookupResult{{"peer:p1", network::LookupStatus::Found, Value("yesterday")}}));
    }

    SECTION("Key without the peer prefix") {
        REQUIRE_FALSE(reconciler.HandleResult(
            DhtLookupResult{{"p1", network::LookupStatus::Found, Value("500")}}));
    }

    REQUIRE(dir.Snapshot() == PeerMap{{"p1", 100}});
}

TEST_CASE("AntiEntropy - prune after dispatch", "[membership][anti_entropy]") {
    Directory dir;
    MockDht dht;
    AntiEntropyReconciler reconciler(dir, dht, 30, nullptr);

    dir.Merge("fresh", 1000);
    dir.Merge("edge", 970);
    dir.Merge("gone", 969);

    auto removed = reconciler.RunPass(1000);
    REQUIRE(removed.size() == 1);
    REQUIRE(removed[0].peer_id == "gone");
    REQUIRE(removed[0].last_seen == 969);
    REQUIRE(dir.Contains("edge"));
    REQUIRE(dir.Contains("fresh"));

    // Lookups were issued for every peer, including the one about to be pruned
    REQUIRE(dht.requested_keys().size() == 3);

    SECTION("A late result brings a pruned peer back") {
        reconciler.HandleResult(DhtLookupResult{{"peer:gone", network::LookupStatus::Found, Value("995")}});
        REQUIRE(dir.Get("gone") == 995u);
    }
}

TEST_CASE("AntiEntropy - found record for an unknown peer is merged", "[membership][anti_entropy]") {
    Directory dir;
    MockDht dht;
    AntiEntropyReconciler reconciler(dir, dht, 30, nullptr);

    REQUIRE(reconciler.HandleResult(
        DhtLookupResult{{message::PeerRecordKey("p9"), network::LookupStatus::Found, Value("42")}}));
    REQUIRE(dir.Get("p9") == 42u);
}

TEST_CASE("AntiEntropy - several values for one key converge on the newest", "[membership][anti_entropy]") {
    Directory dir;
    MockDht dht;
    AntiEntropyReconciler reconciler(dir, dht, 30, nullptr);
    dir.Merge("p1", 90);

    // A stale local copy is reported before the network's newer value
    network::LookupResult local{"peer:p1", network::LookupStatus::Found, Value("100")};
    network::LookupResult remote{"peer:p1", network::LookupStatus::Found, Value("200")};
    REQUIRE(reconciler.HandleResult(DhtLookupResult{local}));
    REQUIRE(reconciler.HandleResult(DhtLookupResult{remote}));
    REQUIRE(dir.Get("p1") == 200u);

    // The stale value arriving again changes nothing
    REQUIRE_FALSE(reconciler.HandleResult(DhtLookupResult{local}));
    REQUIRE(dir.Get("p1") == 200u);
}
