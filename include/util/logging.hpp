// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace stakenode {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * One named logger per component (default, network, sync, chain, storage,
 * crypto, app), all sharing the same sinks.
 *
 * Thread-safety: All methods are thread-safe. Logger access is protected by
 * a mutex; GetLogger() auto-initializes with console output if nothing has
 * been initialized yet.
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
   * Only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "debug.log");

  /**
   * Shutdown logging system (flushes buffers)
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (e.g., "network", "sync", "storage")
   *
   * Unknown names fall back to the default logger.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  // Set log level at runtime (all components)
  static void SetLogLevel(const std::string &level);

  // Set log level for a specific component
  static void SetComponentLevel(const std::string &component,
                                const std::string &level);

  // Names of all component loggers
  static const std::vector<std::string> &Components();
};

} // namespace util
} // namespace stakenode

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  stakenode::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  stakenode::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  stakenode::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  stakenode::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  stakenode::util::LogManager::GetLogger()->error(__VA_ARGS__)
#define LOG_CRITICAL(...)                                                      \
  stakenode::util::LogManager::GetLogger()->critical(__VA_ARGS__)

// Component-specific logging
#define LOG_NET_TRACE(...)                                                     \
  stakenode::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...)                                                     \
  stakenode::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...)                                                      \
  stakenode::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...)                                                      \
  stakenode::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...)                                                     \
  stakenode::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_SYNC_TRACE(...)                                                    \
  stakenode::util::LogManager::GetLogger("sync")->trace(__VA_ARGS__)
#define LOG_SYNC_DEBUG(...)                                                    \
  stakenode::util::LogManager::GetLogger("sync")->debug(__VA_ARGS__)
#define LOG_SYNC_INFO(...)                                                     \
  stakenode::util::LogManager::GetLogger("sync")->info(__VA_ARGS__)
#define LOG_SYNC_WARN(...)                                                     \
  stakenode::util::LogManager::GetLogger("sync")->warn(__VA_ARGS__)
#define LOG_SYNC_ERROR(...)                                                    \
  stakenode::util::LogManager::GetLogger("sync")->error(__VA_ARGS__)

#define LOG_CHAIN_TRACE(...)                                                   \
  stakenode::util::LogManager::GetLogger("chain")->trace(__VA_ARGS__)
#define LOG_CHAIN_DEBUG(...)                                                   \
  stakenode::util::LogManager::GetLogger("chain")->debug(__VA_ARGS__)
#define LOG_CHAIN_INFO(...)                                                    \
  stakenode::util::LogManager::GetLogger("chain")->info(__VA_ARGS__)
#define LOG_CHAIN_WARN(...)                                                    \
  stakenode::util::LogManager::GetLogger("chain")->warn(__VA_ARGS__)
#define LOG_CHAIN_ERROR(...)                                                   \
  stakenode::util::LogManager::GetLogger("chain")->error(__VA_ARGS__)
#define LOG_CHAIN_CRITICAL(...)                                                \
  stakenode::util::LogManager::GetLogger("chain")->critical(__VA_ARGS__)

#define LOG_STORAGE_TRACE(...)                                                 \
  stakenode::util::LogManager::GetLogger("storage")->trace(__VA_ARGS__)
#define LOG_STORAGE_DEBUG(...)                                                 \
  stakenode::util::LogManager::GetLogger("storage")->debug(__VA_ARGS__)
#define LOG_STORAGE_INFO(...)                                                  \
  stakenode::util::LogManager::GetLogger("storage")->info(__VA_ARGS__)
#define LOG_STORAGE_WARN(...)                                                  \
  stakenode::util::LogManager::GetLogger("storage")->warn(__VA_ARGS__)
#define LOG_STORAGE_ERROR(...)                                                 \
  stakenode::util::LogManager::GetLogger("storage")->error(__VA_ARGS__)

#define LOG_CRYPTO_TRACE(...)                                                  \
  stakenode::util::LogManager::GetLogger("crypto")->trace(__VA_ARGS__)
#define LOG_CRYPTO_DEBUG(...)                                                  \
  stakenode::util::LogManager::GetLogger("crypto")->debug(__VA_ARGS__)
#define LOG_CRYPTO_INFO(...)                                                   \
  stakenode::util::LogManager::GetLogger("crypto")->info(__VA_ARGS__)
#define LOG_CRYPTO_WARN(...)                                                   \
  stakenode::util::LogManager::GetLogger("crypto")->warn(__VA_ARGS__)
#define LOG_CRYPTO_ERROR(...)                                                  \
  stakenode::util::LogManager::GetLogger("crypto")->error(__VA_ARGS__)
