#include "application.hpp"
#include "network/gossip.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <chrono>
#include <iostream>
#include <thread>
#include <unistd.h>  // For write(), STDOUT_FILENO (async-signal-safe)

namespace peerwatch {
namespace app {

// Static instance for signal handling
Application *Application::instance_ = nullptr;

Application::Application(const AppConfig &config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  stop();
  // Components hold references into each other; tear down in reverse order
  http_server_.reset();
  membership_manager_.reset();
  network_manager_.reset();
  instance_ = nullptr;
}

Application *Application::instance() { return instance_; }

bool Application::initialize() {
  LOG_INFO("Initializing PeerWatch...");

  // Identity failure throws; main reports it
  if (!init_identity()) {
    LOG_ERROR("Failed to initialize identity");
    return false;
  }

  // Print startup banner (use std::cout for immediate visibility)
  std::cout << GetStartupBanner(identity_->peer_id()) << std::flush;

  if (!init_network()) {
    LOG_ERROR("Failed to initialize network manager");
    return false;
  }

  if (!init_membership()) {
    LOG_ERROR("Failed to initialize membership");
    return false;
  }

  if (!init_http()) {
    LOG_ERROR("Failed to initialize HTTP server");
    return false;
  }

  if (!config_.bootstrap_peers.empty()) {
    LOG_INFO("BOOTSTRAP_PEERS is reserved and not dialed: {} entries", config_.bootstrap_peers.size());
    for (const auto &peer : config_.bootstrap_peers) {
      LOG_DEBUG("  bootstrap peer (unused): {}", peer);
    }
  }

  LOG_INFO("Initialization complete");
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_ERROR("Application already running");
    return false;
  }
  if (!network_manager_ || !membership_manager_ || !http_server_) {
    LOG_ERROR("Application not initialized");
    return false;
  }

  LOG_INFO("Starting PeerWatch...");

  setup_signal_handlers();

  // Binding the UDP port is fatal on failure
  if (!network_manager_->start()) {
    LOG_ERROR("Failed to start network manager");
    return false;
  }

  // So is binding the HTTP port
  if (!http_server_->Start()) {
    LOG_ERROR("Failed to start HTTP server on port {}", config_.http_port);
    network_manager_->stop();
    return false;
  }

  membership_manager_->start();

  running_ = true;

  LOG_INFO("PeerWatch started successfully");
  LOG_INFO("Local peer id: {}", identity_->peer_id());
  LOG_INFO("Using gossip topic: {}", config_.membership_config.topic);
  LOG_INFO("Listening on udp port: {}", network_manager_->local_port());
  LOG_INFO("Press Ctrl+C to stop");

  return true;
}

void Application::stop() {
  if (!running_) {
    return;
  }

  shutdown();
}

void Application::wait_for_shutdown() {
  // Wait for shutdown signal
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (shutdown_requested_) {
    shutdown();
  }
}

void Application::shutdown() {
  if (!running_) {
    return;
  }

  LOG_INFO("Shutting down PeerWatch...");

  running_ = false;

  // Stop HTTP server first (stop accepting new requests)
  if (http_server_) {
    LOG_INFO("Stopping HTTP server...");
    http_server_->Stop();
  }

  // Halts the reactor; no membership handler runs after this
  if (network_manager_) {
    LOG_INFO("Stopping network manager...");
    network_manager_->stop();
  }

  if (membership_manager_) {
    membership_manager_->stop();
  }

  LOG_INFO("Shutdown complete ({} peers known)", directory_.Size());
}

bool Application::init_identity() {
  identity_.emplace(crypto::Identity::Generate());
  LOG_INFO("Local peer id: {}", identity_->peer_id());
  return true;
}

bool Application::init_network() {
  LOG_INFO("Initializing network manager...");

  network_manager_ = std::make_unique<network::NetworkManager>(identity_->peer_id(),
                                                               config_.network_config);
  return true;
}

bool Application::init_membership() {
  LOG_INFO("Initializing membership (heartbeat={}s, anti-entropy={}s, ttl={}s)",
           config_.membership_config.heartbeat_interval.count(),
           config_.membership_config.anti_entropy_interval.count(),
           config_.membership_config.peer_ttl);

  // Everything membership does runs on the network reactor
  membership_manager_ = std::make_unique<membership::MembershipManager>(
      network_manager_->io_context(), identity_->peer_id(), network_manager_->gossip(),
      network_manager_->dht(), directory_, config_.membership_config);

  network_manager_->set_discovery_callback([this](const network::DiscoveredPeer &peer) {
    membership_manager_->OnDiscovered(peer);
  });
  return true;
}

bool Application::init_http() {
  LOG_INFO("Initializing HTTP server...");

  http_server_ = std::make_unique<http::IntrospectionServer>(config_.http_port, directory_,
                                                             config_.http_bind_address);
  return true;
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
}

void Application::signal_handler(int signal) {
  (void)signal;
  if (instance_) {
    // Use write() for async-signal-safety (std::cout, snprintf are NOT safe)
    const char *msg = "\nReceived signal\n";
    ssize_t written = write(STDOUT_FILENO, msg, 17);  // Use literal length to avoid strlen()
    (void)written;

    instance_->shutdown_requested_ = true;
  }
}

} // namespace app
} // namespace peerwatch
