#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace peerwatch {
namespace network {

// Abstract datagram transport used by gossip and the DHT
// Allows dependency injection of different implementations:
// - UdpTransport: UDP socket via boost::asio
// - SimulatedTransport: in-memory delivery for testing (in test/)

// Remote address of a datagram
struct Endpoint {
  std::string address;
  uint16_t port{0};

  bool operator==(const Endpoint &other) const {
    return address == other.address && port == other.port;
  }
  bool operator!=(const Endpoint &other) const { return !(*this == other); }

  std::string ToString() const { return address + ":" + std::to_string(port); }
};

// Callback invoked on the reactor thread for every received datagram
using DatagramCallback =
    std::function<void(const std::vector<uint8_t> &data, const Endpoint &from)>;

class DatagramTransport {
public:
  virtual ~DatagramTransport() = default;

  // Bind to port (0 = ephemeral) and start receiving
  // Returns false if binding failed or the transport is already open
  virtual bool open(uint16_t port, DatagramCallback callback) = 0;

  // Queue a datagram for sending
  // Returns false if the transport is closed, the destination is not a
  // valid address, or the payload exceeds the datagram limit. A true result
  // does not mean the datagram was delivered.
  virtual bool send(const Endpoint &to, const std::vector<uint8_t> &data) = 0;

  // Stop receiving and release the socket
  virtual void close() = 0;

  virtual bool is_open() const = 0;

  // Actual bound port (0 if not open)
  virtual uint16_t local_port() const = 0;
};

using DatagramTransportPtr = std::shared_ptr<DatagramTransport>;

} // namespace network
} // namespace peerwatch
