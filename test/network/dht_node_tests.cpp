// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// DhtNode: record store, STORE replication and iterative FIND lookups

#include "network/infra/sim_node.hpp"
#include "network/message.hpp"
#include "util/time.hpp"
#include <catch2/catch_test_macros.hpp>
#include <optional>

using namespace peerwatch;
using namespace peerwatch::network;
using peerwatch::test::SimNode;
using peerwatch::test::SimulatedHub;

namespace {

std::vector<uint8_t> Value(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

void Drain(boost::asio::io_context& io) {
    io.poll();
    io.restart();
}

// Issue a lookup and keep its result
struct PendingGet {
    PendingGet(Dht& dht, const std::string& key) {
        dht.get_record(key, [this](const LookupResult& r) { result = r; });
    }
    std::optional<LookupResult> result;
};

// Issue a lookup and keep every result it reports
struct CollectingGet {
    CollectingGet(Dht& dht, const std::string& key) {
        dht.get_record(key, [this](const LookupResult& r) { results.push_back(r); });
    }
    std::vector<LookupResult> results;
};

} // namespace

TEST_CASE("DhtNode - lone node keeps its own records", "[network][dht]") {
    auto io = std::make_shared<boost::asio::io_context>();
    SimulatedHub hub(*io);
    SimNode node(hub, io, "solo");

    // Nobody to replicate to
    REQUIRE_FALSE(node.dht().put_record("peer:solo", Value("100")));
    REQUIRE(node.dht().GetLocal("peer:solo") == Value("100"));

    PendingGet hit(node.dht(), "peer:solo");
    PendingGet miss(node.dht(), "peer:other");

    // Results are always delivered asynchronously
    REQUIRE_FALSE(hit.result.has_value());
    Drain(*io);

    REQUIRE(hit.result.has_value());
    REQUIRE(hit.result->status == LookupStatus::Found);
    REQUIRE(hit.result->value == Value("100"));

    REQUIRE(miss.result.has_value());
    REQUIRE(miss.result->status == LookupStatus::NotFound);
    REQUIRE_FALSE(miss.result->value.has_value());

    SECTION("Overwrite") {
        node.dht().put_record("peer:solo", Value("101"));
        REQUIRE(node.dht().GetLocal("peer:solo") == Value("101"));
        REQUIRE(node.dht().RecordCount() == 1);
    }
}

TEST_CASE("DhtNode - put replicates to known peers", "[network][dht]") {
    auto io = std::make_shared<boost::asio::io_context>();
    SimulatedHub hub(*io);
    std::vector<std::unique_ptr<SimNode>> nodes;
    for (const char* id : {"a", "b", "c"}) {
        nodes.push_back(std::make_unique<SimNode>(hub, io, id));
    }
    test::ConnectAll(nodes);

    REQUIRE(nodes[0]->dht().put_record("peer:a", Value("1234")));
    Drain(*io);

    REQUIRE(nodes[1]->dht().GetLocal("peer:a") == Value("1234"));
    REQUIRE(nodes[2]->dht().GetLocal("peer:a") == Value("1234"));

    SECTION("Another node finds it locally") {
        PendingGet get(nodes[2]->dht(), "peer:a");
        Drain(*io);
        REQUIRE(get.result->status == LookupStatus::Found);
        REQUIRE(get.result->value == Value("1234"));
    }
}

TEST_CASE("DhtNode - iterative lookup follows closer peers", "[network][dht]") {
    auto io = std::make_shared<boost::asio::io_context>();
    SimulatedHub hub(*io);
    SimNode asker(hub, io, "asker");
    SimNode middle(hub, io, "middle");
    SimNode holder(hub, io, "holder");

    holder.dht().put_record("peer:holder", Value("777"));

    // asker -> middle -> holder; asker has never heard of holder
    asker.Connect(middle);
    middle.Connect(holder);

    PendingGet get(asker.dht(), "peer:holder");
    REQUIRE(asker.dht().PendingLookups() == 1);
    Drain(*io);

    REQUIRE(get.result.has_value());
    REQUIRE(get.result->key == "peer:holder");
    REQUIRE(get.result->status == LookupStatus::Found);
    REQUIRE(get.result->value == Value("777"));
    REQUIRE(asker.dht().PendingLookups() == 0);

    // Hints were added to the routing table as the replies arrived
    REQUIRE(asker.routes().Contains("holder"));
}

TEST_CASE("DhtNode - lookup ends NotFound when every peer is exhausted", "[network][dht]") {
    auto io = std::make_shared<boost::asio::io_context>();
    SimulatedHub hub(*io);
    SimNode asker(hub, io, "asker");
    SimNode b(hub, io, "b");
    SimNode c(hub, io, "c");
    asker.Connect(b);
    b.Connect(c);

    PendingGet get(asker.dht(), "peer:nobody");
    Drain(*io);

    REQUIRE(get.result.has_value());
    REQUIRE(get.result->status == LookupStatus::NotFound);
    REQUIRE(asker.dht().PendingLookups() == 0);
}

TEST_CASE("DhtNode - silent peers make the lookup time out", "[network][dht][timing]") {
    auto io = std::make_shared<boost::asio::io_context>();
    SimulatedHub hub(*io);
    SimNode asker(hub, io, "asker", std::chrono::milliseconds(50));
    SimNode silent(hub, io, "silent");
    asker.Connect(silent);
    hub.Blackhole(silent.endpoint());

    PendingGet get(asker.dht(), "peer:silent");
    Drain(*io);
    REQUIRE_FALSE(get.result.has_value());

    io->run_for(std::chrono::milliseconds(300));

    REQUIRE(get.result.has_value());
    REQUIRE(get.result->status == LookupStatus::Timeout);
    REQUIRE(std::string(LookupStatusName(LookupStatus::Timeout)) == "timeout");
}

TEST_CASE("DhtNode - every send failing ends the lookup", "[network][dht]") {
    auto io = std::make_shared<boost::asio::io_context>();
    SimulatedHub hub(*io);
    SimNode asker(hub, io, "asker");
    SimNode b(hub, io, "b");
    asker.Connect(b);
    asker.transport().set_fail_sends(true);

    REQUIRE_FALSE(asker.dht().put_record("peer:asker", Value("1")));

    PendingGet get(asker.dht(), "peer:x");
    Drain(*io);
    REQUIRE(get.result->status == LookupStatus::NotFound);
}

TEST_CASE("DhtNode - FIND reply excludes the requester", "[network][dht]") {
    auto io = std::make_shared<boost::asio::io_context>();
    SimulatedHub hub(*io);
    SimNode responder(hub, io, "responder");
    responder.routes().Upsert("requester", Endpoint{"10.0.0.50", 4000});
    responder.routes().Upsert("other", Endpoint{"10.0.0.51", 4000});

    message::DhtFindMessage find;
    find.from = "requester";
    find.port = 4000;
    find.request_id = 5;
    find.key = "peer:zzz";
    REQUIRE(responder.dht().HandleFind(Endpoint{"10.0.0.50", 1234}, find));

    auto sent = responder.transport().sent();
    REQUIRE(sent.size() == 1);
    // Replies go to the advertised port, not the source port
    REQUIRE(sent[0].first == Endpoint{"10.0.0.50", 4000});

    auto reply = message::decode_envelope(sent[0].second.data(), sent[0].second.size());
    REQUIRE(reply);
    auto* found = static_cast<message::DhtFoundMessage*>(reply.get());
    REQUIRE(found->request_id == 5);
    REQUIRE_FALSE(found->value.has_value());
    REQUIRE(found->closer.size() == 1);
    REQUIRE(found->closer[0].peer_id == "other");
}

TEST_CASE("DhtNode - stray FOUND replies are ignored", "[network][dht]") {
    auto io = std::make_shared<boost::asio::io_context>();
    SimulatedHub hub(*io);
    SimNode node(hub, io, "node");

    message::DhtFoundMessage reply;
    reply.from = "x";
    reply.port = 1;
    reply.request_id = 999;
    reply.key = "peer:y";
    reply.value = Value("5");
    REQUIRE(node.dht().HandleFound(Endpoint{"10.0.0.9", 1}, reply));
    REQUIRE(node.dht().GetLocal("peer:y") == std::nullopt);
}

TEST_CASE("DhtNode - record store evicts the oldest record when full", "[network][dht]") {
    boost::asio::io_context io;
    SimulatedHub hub(io);
    auto transport = hub.CreateTransport();
    RoutingTable routes("self");
    DhtNode::Config config;
    config.max_records = 2;
    DhtNode dht(io, "self", *transport, routes, config);

    {
        util::MockTimeScope t(100);
        dht.put_record("k1", Value("1"));
    }
    {
        util::MockTimeScope t(200);
        dht.put_record("k2", Value("2"));
    }
    {
        util::MockTimeScope t(300);
        dht.put_record("k3", Value("3"));
    }

    REQUIRE(dht.RecordCount() == 2);
    REQUIRE_FALSE(dht.GetLocal("k1").has_value());
    REQUIRE(dht.GetLocal("k3") == Value("3"));
}

TEST_CASE("DhtNode - shutdown drops pending lookups", "[network][dht]") {
    auto io = std::make_shared<boost::asio::io_context>();
    SimulatedHub hub(*io);
    SimNode asker(hub, io, "asker");
    SimNode silent(hub, io, "silent");
    asker.Connect(silent);
    hub.Blackhole(silent.endpoint());

    PendingGet get(asker.dht(), "peer:silent");
    REQUIRE(asker.dht().PendingLookups() == 1);
    asker.dht().Shutdown();
    REQUIRE(asker.dht().PendingLookups() == 0);

    io->run_for(std::chrono::milliseconds(100));
    REQUIRE_FALSE(get.result.has_value());
}

TEST_CASE("DhtNode - a stale local copy does not hide newer network values", "[network][dht]") {
    auto io = std::make_shared<boost::asio::io_context>();
    SimulatedHub hub(*io);
    std::vector<std::unique_ptr<SimNode>> nodes;
    for (const char* id : {"a", "b", "c"}) {
        nodes.push_back(std::make_unique<SimNode>(hub, io, id));
    }
    test::ConnectAll(nodes);
    SimNode& a = *nodes[0];
    SimNode& b = *nodes[1];
    SimNode& c = *nodes[2];

    a.dht().put_record("peer:a", Value("100"));
    Drain(*io);

    // b misses the second STORE
    hub.Partition(a.transport().address(), b.transport().address());
    a.dht().put_record("peer:a", Value("200"));
    Drain(*io);
    hub.Heal();

    REQUIRE(b.dht().GetLocal("peer:a") == Value("100"));
    REQUIRE(c.dht().GetLocal("peer:a") == Value("200"));

    CollectingGet get(b.dht(), "peer:a");
    REQUIRE(b.dht().PendingLookups() == 1);
    Drain(*io);

    // Local copy first, then the network's newer value, each reported once
    REQUIRE(get.results.size() == 2);
    REQUIRE(get.results[0].status == LookupStatus::Found);
    REQUIRE(get.results[0].value == Value("100"));
    REQUIRE(get.results[1].status == LookupStatus::Found);
    REQUIRE(get.results[1].value == Value("200"));
    REQUIRE(b.dht().PendingLookups() == 0);
}

TEST_CASE("DhtNode - local copy with silent peers reports no timeout", "[network][dht][timing]") {
    auto io = std::make_shared<boost::asio::io_context>();
    SimulatedHub hub(*io);
    SimNode asker(hub, io, "asker", std::chrono::milliseconds(50));
    SimNode silent(hub, io, "silent");
    asker.Connect(silent);
    hub.Blackhole(silent.endpoint());

    asker.dht().put_record("peer:asker", Value("42"));

    CollectingGet get(asker.dht(), "peer:asker");
    REQUIRE(asker.dht().PendingLookups() == 1);
    io->run_for(std::chrono::milliseconds(300));

    REQUIRE(get.results.size() == 1);
    REQUIRE(get.results[0].status == LookupStatus::Found);
    REQUIRE(get.results[0].value == Value("42"));
    REQUIRE(asker.dht().PendingLookups() == 0);
}
