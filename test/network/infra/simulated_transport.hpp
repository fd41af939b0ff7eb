#ifndef PEERWATCH_TEST_SIMULATED_TRANSPORT_HPP
#define PEERWATCH_TEST_SIMULATED_TRANSPORT_HPP

#include "network/transport.hpp"
#include <boost/asio/io_context.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace peerwatch {
namespace test {

class SimulatedTransport;

/**
 * SimulatedHub - In-memory datagram fabric
 *
 * Every transport created by the hub gets its own address (10.0.0.N).
 * Datagrams are delivered by posting onto the shared io_context, so tests
 * drive the whole mesh deterministically with io.poll() / io.run_for().
 *
 * Supports:
 * - Dropping all traffic between two addresses (partitions)
 * - Dropping everything addressed to one endpoint (silent peer)
 * - Counting delivered datagrams
 */
class SimulatedHub {
public:
    explicit SimulatedHub(boost::asio::io_context& io_context) : io_context_(io_context) {}

    // Create a transport with the next free address
    std::shared_ptr<SimulatedTransport> CreateTransport();

    // Drop traffic in both directions between two addresses
    void Partition(const std::string& a, const std::string& b);
    void Heal();

    // Swallow every datagram sent to this endpoint (the peer never answers)
    void Blackhole(const network::Endpoint& endpoint);

    size_t delivered_count() const;

private:
    friend class SimulatedTransport;

    bool Register(SimulatedTransport* transport, const network::Endpoint& endpoint);
    void Unregister(const network::Endpoint& endpoint);
    void Deliver(const network::Endpoint& from, const network::Endpoint& to,
                 const std::vector<uint8_t>& data);

    boost::asio::io_context& io_context_;
    mutable std::mutex mutex_;
    int next_host_ = 1;
    std::map<std::pair<std::string, uint16_t>, SimulatedTransport*> endpoints_;
    std::set<std::pair<std::string, std::string>> partitions_;
    std::set<std::pair<std::string, uint16_t>> blackholes_;
    size_t delivered_ = 0;
};

/**
 * SimulatedTransport - DatagramTransport bound to a SimulatedHub
 *
 * Also records every datagram it sends so tests can inspect the wire.
 */
class SimulatedTransport : public network::DatagramTransport {
public:
    SimulatedTransport(SimulatedHub& hub, std::string address)
        : hub_(hub), address_(std::move(address)) {}
    ~SimulatedTransport() override { close(); }

    bool open(uint16_t port, network::DatagramCallback callback) override;
    bool send(const network::Endpoint& to, const std::vector<uint8_t>& data) override;
    void close() override;
    bool is_open() const override { return open_; }
    uint16_t local_port() const override { return port_; }

    network::Endpoint endpoint() const { return network::Endpoint{address_, port_}; }
    const std::string& address() const { return address_; }

    // Called by the hub on the io_context
    void Receive(const std::vector<uint8_t>& data, const network::Endpoint& from);

    // Inject a datagram as if it arrived from the wire
    void SimulateReceive(const std::vector<uint8_t>& data, const network::Endpoint& from) {
        Receive(data, from);
    }

    std::vector<std::pair<network::Endpoint, std::vector<uint8_t>>> sent() const;
    size_t sent_count() const;
    void clear_sent();

    // Make every send() report failure
    void set_fail_sends(bool fail) { fail_sends_ = fail; }

private:
    SimulatedHub& hub_;
    std::string address_;
    uint16_t port_ = 0;
    bool open_ = false;
    bool fail_sends_ = false;
    network::DatagramCallback callback_;

    mutable std::mutex mutex_;
    std::vector<std::pair<network::Endpoint, std::vector<uint8_t>>> sent_;
};

} // namespace test
} // namespace peerwatch

#endif // PEERWATCH_TEST_SIMULATED_TRANSPORT_HPP
