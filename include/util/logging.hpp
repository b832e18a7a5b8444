// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace echosrv {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and per-component loggers
 * (default, network, server, client, app).
 *
 * Thread-safety: All methods are thread-safe. Initialization is
 * performed exactly once using std::call_once. Logger access is
 * protected by mutex for safe concurrent use.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical, off)
   * @param log_to_file If true, log to a rotating file instead of the console
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Thread-safe: Uses std::call_once internally. Multiple calls are safe;
   * only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "echosrv.log");

  /**
   * Shutdown logging system (flushes buffers)
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (e.g., "network", "server", "client")
   *
   * Auto-initializes if not initialized. Unknown components map to the
   * default logger.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  /**
   * Set log level at runtime (all components)
   */
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   * @param component Component name (network, server, client, app, default)
   * @param level Log level (trace, debug, info, warn, error, critical, off)
   */
  static void SetComponentLevel(const std::string &component, const std::string &level);
};

} // namespace util
} // namespace echosrv

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  echosrv::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  echosrv::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  echosrv::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  echosrv::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  echosrv::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_NET_TRACE(...)                                                     \
  echosrv::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...)                                                     \
  echosrv::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...)                                                      \
  echosrv::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...)                                                      \
  echosrv::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...)                                                     \
  echosrv::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_SERVER_TRACE(...)                                                  \
  echosrv::util::LogManager::GetLogger("server")->trace(__VA_ARGS__)
#define LOG_SERVER_DEBUG(...)                                                  \
  echosrv::util::LogManager::GetLogger("server")->debug(__VA_ARGS__)
#define LOG_SERVER_INFO(...)                                                   \
  echosrv::util::LogManager::GetLogger("server")->info(__VA_ARGS__)
#define LOG_SERVER_WARN(...)                                                   \
  echosrv::util::LogManager::GetLogger("server")->warn(__VA_ARGS__)
#define LOG_SERVER_ERROR(...)                                                  \
  echosrv::util::LogManager::GetLogger("server")->error(__VA_ARGS__)

#define LOG_CLIENT_TRACE(...)                                                  \
  echosrv::util::LogManager::GetLogger("client")->trace(__VA_ARGS__)
#define LOG_CLIENT_DEBUG(...)                                                  \
  echosrv::util::LogManager::GetLogger("client")->debug(__VA_ARGS__)
#define LOG_CLIENT_WARN(...)                                                   \
  echosrv::util::LogManager::GetLogger("client")->warn(__VA_ARGS__)

#define LOG_APP_INFO(...)                                                      \
  echosrv::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...)                                                      \
  echosrv::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  echosrv::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
