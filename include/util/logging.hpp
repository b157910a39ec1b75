// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace chaincraft {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and easy access
 * to loggers throughout the node.
 *
 * Thread-safety: All methods are thread-safe. Logger registry access is
 * protected by a mutex.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical)
   * @param log_to_file If true, log to file instead of the console
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Multiple calls are safe; only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "debug.log");

  /**
   * Shutdown logging system (flushes buffers)
   * Subsequent logging calls after shutdown will auto-reinitialize.
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (e.g., "network", "gossip", "consensus")
   *
   * Auto-initializes if not initialized. Unknown names map to "default".
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  // Set log level at runtime (all components)
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   * @param component network, gossip, consensus, crypto, app, default
   * @param level trace, debug, info, warn, error, critical
   */
  static void SetComponentLevel(const std::string &component,
                                const std::string &level);
};

} // namespace util
} // namespace chaincraft

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  chaincraft::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  chaincraft::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  chaincraft::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  chaincraft::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  chaincraft::util::LogManager::GetLogger()->error(__VA_ARGS__)
#define LOG_CRITICAL(...)                                                      \
  chaincraft::util::LogManager::GetLogger()->critical(__VA_ARGS__)

// Component-specific logging
#define LOG_NET_TRACE(...)                                                     \
  chaincraft::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...)                                                     \
  chaincraft::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...)                                                      \
  chaincraft::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...)                                                      \
  chaincraft::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...)                                                     \
  chaincraft::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_GOSSIP_TRACE(...)                                                  \
  chaincraft::util::LogManager::GetLogger("gossip")->trace(__VA_ARGS__)
#define LOG_GOSSIP_DEBUG(...)                                                  \
  chaincraft::util::LogManager::GetLogger("gossip")->debug(__VA_ARGS__)
#define LOG_GOSSIP_INFO(...)                                                   \
  chaincraft::util::LogManager::GetLogger("gossip")->info(__VA_ARGS__)
#define LOG_GOSSIP_WARN(...)                                                   \
  chaincraft::util::LogManager::GetLogger("gossip")->warn(__VA_ARGS__)
#define LOG_GOSSIP_ERROR(...)                                                  \
  chaincraft::util::LogManager::GetLogger("gossip")->error(__VA_ARGS__)

#define LOG_CONSENSUS_TRACE(...)                                               \
  chaincraft::util::LogManager::GetLogger("consensus")->trace(__VA_ARGS__)
#define LOG_CONSENSUS_DEBUG(...)                                               \
  chaincraft::util::LogManager::GetLogger("consensus")->debug(__VA_ARGS__)
#define LOG_CONSENSUS_INFO(...)                                                \
  chaincraft::util::LogManager::GetLogger("consensus")->info(__VA_ARGS__)
#define LOG_CONSENSUS_WARN(...)                                                \
  chaincraft::util::LogManager::GetLogger("consensus")->warn(__VA_ARGS__)
#define LOG_CONSENSUS_ERROR(...)                                               \
  chaincraft::util::LogManager::GetLogger("consensus")->error(__VA_ARGS__)

#define LOG_CRYPTO_TRACE(...)                                                  \
  chaincraft::util::LogManager::GetLogger("crypto")->trace(__VA_ARGS__)
#define LOG_CRYPTO_DEBUG(...)                                                  \
  chaincraft::util::LogManager::GetLogger("crypto")->debug(__VA_ARGS__)
#define LOG_CRYPTO_INFO(...)                                                   \
  chaincraft::util::LogManager::GetLogger("crypto")->info(__VA_ARGS__)
#define LOG_CRYPTO_WARN(...)                                                   \
  chaincraft::util::LogManager::GetLogger("crypto")->warn(__VA_ARGS__)
#define LOG_CRYPTO_ERROR(...)                                                  \
  chaincraft::util::LogManager::GetLogger("crypto")->error(__VA_ARGS__)

#define LOG_APP_INFO(...)                                                      \
  chaincraft::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...)                                                      \
  chaincraft::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  chaincraft::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
