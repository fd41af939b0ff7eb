// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace peerwatch {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and easy access
 * to per-component loggers throughout the node.
 *
 * Thread-safety: All methods are thread-safe. Initialization is
 * performed exactly once using std::call_once. Logger access is
 * protected by mutex for safe concurrent use (the introspection
 * server logs from its own thread).
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical, off)
   * @param log_to_file If true, also log to a rotating file
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Thread-safe: Uses std::call_once internally. Multiple calls are safe;
   * only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "peerwatch.log");

  /**
   * Shutdown logging system (flushes buffers)
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (e.g., "gossip", "dht", "membership")
   *
   * Auto-initializes if not initialized. Unknown names map to "default".
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  /**
   * Set log level at runtime (all components)
   */
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   * @param component Component name (see Components())
   * @param level Log level (trace, debug, info, warn, error, critical)
   */
  static void SetComponentLevel(const std::string &component, const std::string &level);

  /**
   * Names of all component loggers created at initialization
   */
  static const std::vector<std::string> &Components();
};

} // namespace util
} // namespace peerwatch

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  peerwatch::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  peerwatch::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  peerwatch::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  peerwatch::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  peerwatch::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_NET_TRACE(...)                                                     \
  peerwatch::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...)                                                     \
  peerwatch::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...)                                                      \
  peerwatch::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...)                                                      \
  peerwatch::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...)                                                     \
  peerwatch::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_GOSSIP_TRACE(...)                                                  \
  peerwatch::util::LogManager::GetLogger("gossip")->trace(__VA_ARGS__)
#define LOG_GOSSIP_DEBUG(...)                                                  \
  peerwatch::util::LogManager::GetLogger("gossip")->debug(__VA_ARGS__)
#define LOG_GOSSIP_INFO(...)                                                   \
  peerwatch::util::LogManager::GetLogger("gossip")->info(__VA_ARGS__)
#define LOG_GOSSIP_WARN(...)                                                   \
  peerwatch::util::LogManager::GetLogger("gossip")->warn(__VA_ARGS__)

#define LOG_DHT_TRACE(...)                                                     \
  peerwatch::util::LogManager::GetLogger("dht")->trace(__VA_ARGS__)
#define LOG_DHT_DEBUG(...)                                                     \
  peerwatch::util::LogManager::GetLogger("dht")->debug(__VA_ARGS__)
#define LOG_DHT_INFO(...)                                                      \
  peerwatch::util::LogManager::GetLogger("dht")->info(__VA_ARGS__)
#define LOG_DHT_WARN(...)                                                      \
  peerwatch::util::LogManager::GetLogger("dht")->warn(__VA_ARGS__)

#define LOG_DISC_TRACE(...)                                                    \
  peerwatch::util::LogManager::GetLogger("discovery")->trace(__VA_ARGS__)
#define LOG_DISC_DEBUG(...)                                                    \
  peerwatch::util::LogManager::GetLogger("discovery")->debug(__VA_ARGS__)
#define LOG_DISC_INFO(...)                                                     \
  peerwatch::util::LogManager::GetLogger("discovery")->info(__VA_ARGS__)
#define LOG_DISC_WARN(...)                                                     \
  peerwatch::util::LogManager::GetLogger("discovery")->warn(__VA_ARGS__)

#define LOG_MEMBER_TRACE(...)                                                  \
  peerwatch::util::LogManager::GetLogger("membership")->trace(__VA_ARGS__)
#define LOG_MEMBER_DEBUG(...)                                                  \
  peerwatch::util::LogManager::GetLogger("membership")->debug(__VA_ARGS__)
#define LOG_MEMBER_INFO(...)                                                   \
  peerwatch::util::LogManager::GetLogger("membership")->info(__VA_ARGS__)
#define LOG_MEMBER_WARN(...)                                                   \
  peerwatch::util::LogManager::GetLogger("membership")->warn(__VA_ARGS__)

#define LOG_HTTP_DEBUG(...)                                                    \
  peerwatch::util::LogManager::GetLogger("http")->debug(__VA_ARGS__)
#define LOG_HTTP_INFO(...)                                                     \
  peerwatch::util::LogManager::GetLogger("http")->info(__VA_ARGS__)
#define LOG_HTTP_WARN(...)                                                     \
  peerwatch::util::LogManager::GetLogger("http")->warn(__VA_ARGS__)
#define LOG_HTTP_ERROR(...)                                                    \
  peerwatch::util::LogManager::GetLogger("http")->error(__VA_ARGS__)

#define LOG_CRYPTO_INFO(...)                                                   \
  peerwatch::util::LogManager::GetLogger("crypto")->info(__VA_ARGS__)
#define LOG_CRYPTO_ERROR(...)                                                  \
  peerwatch::util::LogManager::GetLogger("crypto")->error(__VA_ARGS__)
