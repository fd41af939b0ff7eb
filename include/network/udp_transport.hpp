#pragma once

#include "network/transport.hpp"
#include <array>
#include <atomic>
#include <utility>
#include <boost/asio.hpp>
#include <memory>

namespace peerwatch {
namespace network {

/**
 * UdpTransport - boost::asio implementation of DatagramTransport
 *
 * Uses a caller-owned io_context; all callbacks run on whichever thread runs
 * that context. The socket is dual-stack where the host supports it.
 */
class UdpTransport : public DatagramTransport {
public:
  explicit UdpTransport(boost::asio::io_context &io_context);
  ~UdpTransport() override;

  UdpTransport(const UdpTransport &) = delete;
  UdpTransport &operator=(const UdpTransport &) = delete;

  bool open(uint16_t port, DatagramCallback callback) override;
  bool send(const Endpoint &to, const std::vector<uint8_t> &data) override;
  void close() override;
  bool is_open() const override { return open_.load(); }
  uint16_t local_port() const override { return local_port_; }

private:
  void start_receive();
  void handle_receive(const boost::system::error_code &ec, size_t bytes);

  boost::asio::io_context &io_context_;
  std::unique_ptr<boost::asio::ip::udp::socket> socket_;
  bool dual_stack_{false};

  DatagramCallback callback_;
  boost::asio::ip::udp::endpoint sender_;

  // Receive buffer large enough for any UDP payload
  std::array<uint8_t, 64 * 1024> recv_buffer_{};

  std::atomic<bool> open_{false};
  uint16_t local_port_{0};
};

} // namespace network
} // namespace peerwatch
