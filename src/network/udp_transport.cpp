#include "network/udp_transport.hpp"
#include "network/protocol.hpp"
#include "util/logging.hpp"

namespace peerwatch {
namespace network {

namespace {

using udp = boost::asio::ip::udp;

// Report v4-mapped addresses from a dual-stack socket in plain IPv4 form
std::string AddressToString(const boost::asio::ip::address &addr) {
  if (addr.is_v6() && addr.to_v6().is_v4_mapped()) {
    return boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped, addr.to_v6()).to_string();
  }
  return addr.to_string();
}

} // namespace

UdpTransport::UdpTransport(boost::asio::io_context &io_context) : io_context_(io_context) {}

UdpTransport::~UdpTransport() { close(); }

bool UdpTransport::open(uint16_t port, DatagramCallback callback) {
  if (socket_) {
    LOG_NET_TRACE("udp transport already open");
    return false;
  }

  try {
    socket_ = std::make_unique<udp::socket>(io_context_);

    // Try dual-stack (IPv6 with v6_only=false); fall back to IPv4-only on failure
    try {
      socket_->open(udp::v6());
      socket_->set_option(boost::asio::ip::v6_only(false));
      socket_->bind(udp::endpoint(udp::v6(), port));
      dual_stack_ = true;
    } catch (const std::exception &) {
      boost::system::error_code ec;
      socket_->close(ec);
      socket_->open(udp::v4());
      socket_->bind(udp::endpoint(udp::v4(), port));
      dual_stack_ = false;
    }

    // Record the actual bound port (handles ephemeral port 0)
    {
      boost::system::error_code ec;
      auto ep = socket_->local_endpoint(ec);
      local_port_ = ec ? 0 : ep.port();
    }
  } catch (const std::exception &e) {
    LOG_NET_ERROR("failed to bind udp port {}: {}", port, e.what());
    if (socket_) {
      boost::system::error_code ec;
      socket_->close(ec);
      socket_.reset();
    }
    local_port_ = 0;
    return false;
  }

  callback_ = std::move(callback);
  open_.store(true);
  LOG_NET_INFO("listening on udp port {}{}", local_port_, dual_stack_ ? " (dual-stack)" : "");
  start_receive();
  return true;
}

bool UdpTransport::send(const Endpoint &to, const std::vector<uint8_t> &data) {
  if (!open_.load() || !socket_) {
    return false;
  }
  if (data.empty() || data.size() > protocol::MAX_DATAGRAM_SIZE) {
    LOG_NET_TRACE("refusing to send {} byte datagram to {}", data.size(), to.ToString());
    return false;
  }

  boost::system::error_code ec;
  auto addr = boost::asio::ip::make_address(to.address, ec);
  if (ec || to.port == 0) {
    LOG_NET_TRACE("invalid destination {}", to.ToString());
    return false;
  }
  if (dual_stack_ && addr.is_v4()) {
    addr = boost::asio::ip::make_address_v6(boost::asio::ip::v4_mapped, addr.to_v4());
  } else if (!dual_stack_ && addr.is_v6()) {
    LOG_NET_TRACE("cannot reach IPv6 destination {} from IPv4-only socket", to.ToString());
    return false;
  }

  auto payload = std::make_shared<std::vector<uint8_t>>(data);
  udp::endpoint destination(addr, to.port);
  socket_->async_send_to(
      boost::asio::buffer(*payload), destination,
      [payload, destination](const boost::system::error_code &send_ec, size_t) {
        if (send_ec && send_ec != boost::asio::error::operation_aborted) {
          LOG_NET_TRACE("send to {}:{} failed: {}", destination.address().to_string(),
                        destination.port(), send_ec.message());
        }
      });
  return true;
}

void UdpTransport::start_receive() {
  if (!socket_) {
    return;
  }
  socket_->async_receive_from(
      boost::asio::buffer(recv_buffer_), sender_,
      [this](const boost::system::error_code &ec, size_t bytes) { handle_receive(ec, bytes); });
}

void UdpTransport::handle_receive(const boost::system::error_code &ec, size_t bytes) {
  if (ec) {
    if (ec == boost::asio::error::operation_aborted || !open_.load()) {
      return;
    }
    // ICMP errors from earlier sends surface here on some platforms
    LOG_NET_TRACE("udp receive error: {}", ec.message());
    start_receive();
    return;
  }

  if (bytes > 0 && callback_) {
    std::vector<uint8_t> data(recv_buffer_.begin(), recv_buffer_.begin() + bytes);
    Endpoint from{AddressToString(sender_.address()), sender_.port()};
    try {
      callback_(data, from);
    } catch (const std::exception &e) {
      LOG_NET_WARN("exception handling datagram from {}: {}", from.ToString(), e.what());
    }
  }

  start_receive();
}

void UdpTransport::close() {
  open_.store(false);
  if (socket_) {
    boost::system::error_code ec;
    socket_->close(ec);
    socket_.reset();
  }
  local_port_ = 0;
  // Release anything the callback captured
  callback_ = {};
}

} // namespace network
} // namespace peerwatch
