#include "network/local_discovery.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <limits>
#include <nlohmann/json.hpp>

namespace peerwatch {
namespace network {

using udp = boost::asio::ip::udp;

std::string EncodeBeacon(const std::string &peer_id, uint16_t port) {
  nlohmann::json j;
  j["peer"] = peer_id;
  j["port"] = port;
  j["agent"] = GetUserAgent();
  return j.dump();
}

std::optional<std::pair<std::string, uint16_t>> DecodeBeacon(const std::string &payload) {
  nlohmann::json j = nlohmann::json::parse(payload, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    return std::nullopt;
  }
  auto peer = j.find("peer");
  auto port = j.find("port");
  if (peer == j.end() || port == j.end() || !peer->is_string() || !port->is_number_unsigned()) {
    return std::nullopt;
  }
  const uint64_t port_value = port->get<uint64_t>();
  std::string peer_id = peer->get<std::string>();
  if (peer_id.empty() || port_value == 0 || port_value > std::numeric_limits<uint16_t>::max()) {
    return std::nullopt;
  }
  return std::make_pair(std::move(peer_id), static_cast<uint16_t>(port_value));
}

LocalDiscovery::LocalDiscovery(boost::asio::io_context &io_context, std::string local_peer_id,
                               const Config &config)
    : io_context_(io_context), local_peer_id_(std::move(local_peer_id)), config_(config) {}

LocalDiscovery::~LocalDiscovery() { stop(); }

bool LocalDiscovery::start(uint16_t advertised_port, DiscoveryCallback callback) {
  if (socket_) {
    return false;
  }

  try {
    auto group = boost::asio::ip::make_address_v4(config_.group);
    if (!group.is_multicast()) {
      LOG_DISC_WARN("discovery group {} is not a multicast address", config_.group);
      return false;
    }
    group_endpoint_ = udp::endpoint(group, config_.port);

    socket_ = std::make_unique<udp::socket>(io_context_);
    socket_->open(udp::v4());
    // Several nodes on one host share the beacon port
    socket_->set_option(udp::socket::reuse_address(true));
    socket_->bind(udp::endpoint(boost::asio::ip::address_v4::any(), config_.port));
    socket_->set_option(boost::asio::ip::multicast::join_group(group));
    socket_->set_option(boost::asio::ip::multicast::enable_loopback(true));
    socket_->set_option(boost::asio::ip::multicast::hops(1));
  } catch (const std::exception &e) {
    LOG_DISC_WARN("failed to join discovery group {}:{}: {}", config_.group, config_.port,
                  e.what());
    if (socket_) {
      boost::system::error_code ec;
      socket_->close(ec);
      socket_.reset();
    }
    return false;
  }

  advertised_port_ = advertised_port;
  callback_ = std::move(callback);
  announce_timer_ = std::make_unique<boost::asio::steady_timer>(io_context_);

  LOG_DISC_INFO("local discovery on {}:{} every {}s", config_.group, config_.port,
                config_.interval.count());
  start_receive();
  schedule_announce(std::chrono::seconds(0));
  return true;
}

void LocalDiscovery::stop() {
  if (announce_timer_) {
    announce_timer_->cancel();
  }
  if (socket_) {
    boost::system::error_code ec;
    socket_->close(ec);
    socket_.reset();
  }
  callback_ = {};
}

void LocalDiscovery::schedule_announce(std::chrono::seconds delay) {
  if (!announce_timer_) {
    return;
  }
  announce_timer_->expires_after(delay);
  announce_timer_->async_wait([this](const boost::system::error_code &ec) {
    if (ec || !socket_) {
      return;
    }
    announce();
    schedule_announce(config_.interval);
  });
}

void LocalDiscovery::announce() {
  auto payload = std::make_shared<std::string>(EncodeBeacon(local_peer_id_, advertised_port_));
  socket_->async_send_to(boost::asio::buffer(*payload), group_endpoint_,
                         [payload](const boost::system::error_code &ec, size_t) {
                           if (ec && ec != boost::asio::error::operation_aborted) {
                             LOG_DISC_DEBUG("beacon send failed: {}", ec.message());
                           }
                         });
}

void LocalDiscovery::start_receive() {
  if (!socket_) {
    return;
  }
  socket_->async_receive_from(
      boost::asio::buffer(recv_buffer_), sender_,
      [this](const boost::system::error_code &ec, size_t bytes) {
        if (ec == boost::asio::error::operation_aborted || !socket_) {
          return;
        }
        if (!ec) {
          HandleBeacon(std::string(recv_buffer_.data(), bytes), sender_.address().to_string());
        } else {
          LOG_DISC_TRACE("beacon receive error: {}", ec.message());
        }
        start_receive();
      });
}

void LocalDiscovery::HandleBeacon(const std::string &payload, const std::string &sender_address) {
  auto beacon = DecodeBeacon(payload);
  if (!beacon) {
    LOG_DISC_TRACE("ignoring malformed beacon from {}", sender_address);
    return;
  }
  if (beacon->first == local_peer_id_) {
    return;
  }
  if (callback_) {
    callback_(DiscoveredPeer{beacon->first, Endpoint{sender_address, beacon->second}});
  }
}

} // namespace network
} // namespace peerwatch
