// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace statesync {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Components:
 *   default  - anything without a more specific home
 *   manifest - manifest computation and validation
 *   sync     - chunk assembly (Chunkable) and the StateSync facade
 *   cache    - the cross-attempt state sync cache
 *   app      - command line tool
 *
 * Thread-safety: All methods are thread-safe. Logger map access is
 * protected by a mutex.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical, off)
   * @param log_to_file If true, log to file instead of the console
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Multiple calls are safe; only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "statesync.log");

  /**
   * Shutdown logging system (flushes buffers)
   * Subsequent logging calls after shutdown will auto-reinitialize.
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (e.g., "manifest", "sync", "cache")
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
   */
  static void SetComponentLevel(const std::string &component,
                                const std::string &level);
};

} // namespace util
} // namespace statesync

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  statesync::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  statesync::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  statesync::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  statesync::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  statesync::util::LogManager::GetLogger()->error(__VA_ARGS__)
#define LOG_CRITICAL(...)                                                      \
  statesync::util::LogManager::GetLogger()->critical(__VA_ARGS__)

// Component-specific logging
#define LOG_MANIFEST_TRACE(...)                                                \
  statesync::util::LogManager::GetLogger("manifest")->trace(__VA_ARGS__)
#define LOG_MANIFEST_DEBUG(...)                                                \
  statesync::util::LogManager::GetLogger("manifest")->debug(__VA_ARGS__)
#define LOG_MANIFEST_INFO(...)                                                 \
  statesync::util::LogManager::GetLogger("manifest")->info(__VA_ARGS__)
#define LOG_MANIFEST_WARN(...)                                                 \
  statesync::util::LogManager::GetLogger("manifest")->warn(__VA_ARGS__)
#define LOG_MANIFEST_ERROR(...)                                                \
  statesync::util::LogManager::GetLogger("manifest")->error(__VA_ARGS__)

#define LOG_SYNC_TRACE(...)                                                    \
  statesync::util::LogManager::GetLogger("sync")->trace(__VA_ARGS__)
#define LOG_SYNC_DEBUG(...)                                                    \
  statesync::util::LogManager::GetLogger("sync")->debug(__VA_ARGS__)
#define LOG_SYNC_INFO(...)                                                     \
  statesync::util::LogManager::GetLogger("sync")->info(__VA_ARGS__)
#define LOG_SYNC_WARN(...)                                                     \
  statesync::util::LogManager::GetLogger("sync")->warn(__VA_ARGS__)
#define LOG_SYNC_ERROR(...)                                                    \
  statesync::util::LogManager::GetLogger("sync")->error(__VA_ARGS__)

#define LOG_CACHE_TRACE(...)                                                   \
  statesync::util::LogManager::GetLogger("cache")->trace(__VA_ARGS__)
#define LOG_CACHE_DEBUG(...)                                                   \
  statesync::util::LogManager::GetLogger("cache")->debug(__VA_ARGS__)
#define LOG_CACHE_INFO(...)                                                    \
  statesync::util::LogManager::GetLogger("cache")->info(__VA_ARGS__)
#define LOG_CACHE_WARN(...)                                                    \
  statesync::util::LogManager::GetLogger("cache")->warn(__VA_ARGS__)
#define LOG_CACHE_ERROR(...)                                                   \
  statesync::util::LogManager::GetLogger("cache")->error(__VA_ARGS__)

#define LOG_APP_INFO(...)                                                      \
  statesync::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...)                                                      \
  statesync::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  statesync::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
