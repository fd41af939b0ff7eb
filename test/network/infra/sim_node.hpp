#pragma once

#include "network/dht_node.hpp"
#include "network/gossip_service.hpp"
#include "network/infra/simulated_transport.hpp"
#include "network/network_manager.hpp"
#include "network/routing_table.hpp"
#include <memory>
#include <string>

namespace peerwatch {
namespace test {

/**
 * SimNode - a full NetworkManager stack on a SimulatedHub
 *
 * All nodes share the hub's io_context; nothing runs until the test polls it.
 * Local discovery is disabled; peers are introduced with Connect().
 */
class SimNode {
public:
    SimNode(SimulatedHub& hub, std::shared_ptr<boost::asio::io_context> io, std::string peer_id,
            std::chrono::milliseconds query_timeout = std::chrono::milliseconds(500))
        : peer_id_(std::move(peer_id)), transport_(hub.CreateTransport()) {
        network::NetworkManager::Config config;
        config.io_threads = 0;
        config.discovery_enabled = false;
        config.dht.query_timeout = query_timeout;
        manager_ = std::make_unique<network::NetworkManager>(peer_id_, config, transport_, io);
        manager_->start();
    }

    // One-way: this node learns how to reach other
    void Connect(const SimNode& other) {
        manager_->dht().add_address(other.peer_id(), other.endpoint());
    }

    const std::string& peer_id() const { return peer_id_; }
    network::Endpoint endpoint() const { return transport_->endpoint(); }

    network::NetworkManager& manager() { return *manager_; }
    network::GossipService& gossip() { return manager_->gossip_service(); }
    network::DhtNode& dht() { return manager_->dht_node(); }
    network::RoutingTable& routes() { return manager_->routing_table(); }
    SimulatedTransport& transport() { return *transport_; }

private:
    std::string peer_id_;
    std::shared_ptr<SimulatedTransport> transport_;
    std::unique_ptr<network::NetworkManager> manager_;
};

// Connect every pair of nodes in both directions
template <typename Nodes>
void ConnectAll(Nodes& nodes) {
    for (auto& a : nodes) {
        for (auto& b : nodes) {
            if (a.get() != b.get()) {
                a->Connect(*b);
            }
        }
    }
}

} // namespace test
} // namespace peerwatch
