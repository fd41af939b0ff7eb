#include "network/network_manager.hpp"
#include "network/gossip_service.hpp"
#include "network/message.hpp"
#include "network/message_dispatcher.hpp"
#include "network/routing_table.hpp"
#include "network/udp_transport.hpp"
#include "util/logging.hpp"

namespace peerwatch {
namespace network {

NetworkManager::NetworkManager(std::string local_peer_id, const Config &config,
                               std::shared_ptr<DatagramTransport> transport,
                               std::shared_ptr<boost::asio::io_context> external_io_context)
    : local_peer_id_(std::move(local_peer_id)), config_(config),
      // Shared ownership of io_context ensures it outlives all async operations and timers
      io_context_(external_io_context ? external_io_context
                                      : std::make_shared<boost::asio::io_context>()),
      external_io_context_(external_io_context != nullptr),
      transport_(transport ? transport : std::make_shared<UdpTransport>(*io_context_)) {

  // Create components in dependency order
  routes_ = std::make_unique<RoutingTable>(local_peer_id_);
  dispatcher_ = std::make_unique<MessageDispatcher>();
  gossip_ = std::make_unique<GossipService>(local_peer_id_, *transport_, *routes_);
  dht_ = std::make_unique<DhtNode>(*io_context_, local_peer_id_, *transport_, *routes_, config_.dht);
  if (config_.discovery_enabled) {
    discovery_ = std::make_unique<LocalDiscovery>(*io_context_, local_peer_id_, config_.discovery);
  }

  register_handlers();

  LOG_NET_TRACE("NetworkManager initialized (external_io_context: {})",
                external_io_context_ ? "yes" : "no");
}

NetworkManager::~NetworkManager() { stop(); }

void NetworkManager::register_handlers() {
  // Handlers delegate to the component owning each envelope type
  dispatcher_->Register<message::GossipMessage>(
      [this](const Endpoint &from, const message::GossipMessage &msg) {
        return gossip_->HandleGossip(from, msg);
      });
  dispatcher_->Register<message::DhtStoreMessage>(
      [this](const Endpoint &from, const message::DhtStoreMessage &msg) {
        return dht_->HandleStore(from, msg);
      });
  dispatcher_->Register<message::DhtFindMessage>(
      [this](const Endpoint &from, const message::DhtFindMessage &msg) {
        return dht_->HandleFind(from, msg);
      });
  dispatcher_->Register<message::DhtFoundMessage>(
      [this](const Endpoint &from, const message::DhtFoundMessage &msg) {
        return dht_->HandleFound(from, msg);
      });
}

void NetworkManager::set_discovery_callback(DiscoveryCallback callback) {
  discovery_callback_ = std::move(callback);
}

uint16_t NetworkManager::local_port() const { return transport_->local_port(); }

GossipChannel &NetworkManager::gossip() { return *gossip_; }

Dht &NetworkManager::dht() { return *dht_; }

bool NetworkManager::start() {
  std::lock_guard<std::mutex> lock(start_stop_mutex_);
  if (running_.load(std::memory_order_acquire)) {
    return false;
  }

  bool listening = transport_->open(
      config_.listen_port,
      [this](const std::vector<uint8_t> &data, const Endpoint &from) { handle_datagram(data, from); });
  if (!listening) {
    LOG_NET_ERROR("failed to open datagram transport on port {}", config_.listen_port);
    return false;
  }

  running_.store(true, std::memory_order_release);

  if (discovery_) {
    bool joined = discovery_->start(transport_->local_port(), [this](const DiscoveredPeer &peer) {
      if (discovery_callback_) {
        discovery_callback_(peer);
      }
    });
    // Multicast is often unavailable in containers; unicast keeps working
    if (!joined) {
      LOG_NET_WARN("local discovery unavailable, continuing without it");
    }
  }

  // Spawn reactor threads only when we own the io_context
  if (config_.io_threads > 0 && !external_io_context_) {
    work_guard_ = std::make_unique<
        boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
        boost::asio::make_work_guard(*io_context_));
    for (size_t i = 0; i < config_.io_threads; ++i) {
      io_threads_.emplace_back([this]() { io_context_->run(); });
    }
  }

  LOG_NET_INFO("network started: peer {} on udp port {}", local_peer_id_, transport_->local_port());
  return true;
}

void NetworkManager::stop() {
  std::lock_guard<std::mutex> lock(start_stop_mutex_);
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }

  // Set running_ = false FIRST so late datagrams are ignored
  running_.store(false, std::memory_order_release);

  // Don't log here - this is called from destructor, logger may be shut down

  // Halt the reactor first so component teardown cannot race a handler
  if (!external_io_context_) {
    work_guard_.reset();
    io_context_->stop();
    for (auto &thread : io_threads_) {
      if (thread.joinable()) {
        thread.join();
      }
    }
    io_threads_.clear();
  }

  if (discovery_) {
    discovery_->stop();
  }
  dht_->Shutdown();
  transport_->close();

  // Reset io_context for potential restart
  if (!external_io_context_) {
    io_context_->restart();
  }
}

void NetworkManager::handle_datagram(const std::vector<uint8_t> &data, const Endpoint &from) {
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }

  auto msg = message::decode_envelope(data.data(), data.size());
  if (!msg) {
    LOG_NET_TRACE("dropping undecodable datagram ({} bytes) from {}", data.size(), from.ToString());
    return;
  }
  if (msg->from == local_peer_id_) {
    return;
  }

  // The sender listens on the port it advertises, at the address we saw
  if (msg->port != 0) {
    routes_->Upsert(msg->from, Endpoint{from.address, msg->port});
  }

  if (!dispatcher_->Dispatch(from, *msg)) {
    LOG_NET_TRACE("{} from {} was not handled", msg->command(), from.ToString());
  }
}

} // namespace network
} // namespace peerwatch
