#pragma once

#include "config.hpp"
#include "crypto/identity.hpp"
#include "membership/directory.hpp"
#include "membership/membership_manager.hpp"
#include "network/http_server.hpp"
#include "network/network_manager.hpp"
#include <atomic>
#include <csignal>
#include <memory>
#include <optional>
#include <string>

namespace peerwatch {
namespace app {

// Application - Main application coordinator
// Initializes components, manages lifecycle, handles signals, coordinates
// shutdown
class Application {
public:
  explicit Application(const AppConfig &config = AppConfig{});
  ~Application();

  // Lifecycle
  bool initialize();
  bool start();
  void stop();
  void wait_for_shutdown();

  // Component access
  const crypto::Identity &identity() const { return *identity_; }
  membership::Directory &directory() { return directory_; }
  network::NetworkManager &network_manager() { return *network_manager_; }
  membership::MembershipManager &membership_manager() { return *membership_manager_; }
  http::IntrospectionServer &http_server() { return *http_server_; }

  // Status
  bool is_running() const { return running_; }

  void request_shutdown() { shutdown_requested_ = true; }

  // Signal handling
  static void signal_handler(int signal);
  static Application *instance();

private:
  AppConfig config_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};

  // Components (initialized in order)
  std::optional<crypto::Identity> identity_;
  membership::Directory directory_;
  std::unique_ptr<network::NetworkManager> network_manager_;
  std::unique_ptr<membership::MembershipManager> membership_manager_;
  std::unique_ptr<http::IntrospectionServer> http_server_;

  // Initialization steps
  bool init_identity();
  bool init_network();
  bool init_membership();
  bool init_http();

  // Shutdown
  void shutdown();

  // Signal handling
  static Application *instance_;
  void setup_signal_handlers();
};

} // namespace app
} // namespace peerwatch
