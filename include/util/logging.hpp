// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace lorasim {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized diagnostic logging for the orchestrator. This is the
 * operator-facing stream (warnings, errors, progress). The simulation event
 * record itself is written by sim::EventLog, not through these loggers.
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
   * @param log_to_file If true, also log to a rotating file
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Console output always goes to stderr so it never mixes with the event
   * log mirrored on stdout.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "orchestrator.log");

  /**
   * Shutdown logging system (flushes buffers)
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (default, node, router, scheduler, app)
   *
   * Auto-initializes if not initialized. Unknown names fall back to the
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
   */
  static void SetComponentLevel(const std::string &component, const std::string &level);
};

} // namespace util
} // namespace lorasim

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  lorasim::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  lorasim::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  lorasim::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  lorasim::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  lorasim::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_NODE_TRACE(...)                                                    \
  lorasim::util::LogManager::GetLogger("node")->trace(__VA_ARGS__)
#define LOG_NODE_DEBUG(...)                                                    \
  lorasim::util::LogManager::GetLogger("node")->debug(__VA_ARGS__)
#define LOG_NODE_INFO(...)                                                     \
  lorasim::util::LogManager::GetLogger("node")->info(__VA_ARGS__)
#define LOG_NODE_WARN(...)                                                     \
  lorasim::util::LogManager::GetLogger("node")->warn(__VA_ARGS__)
#define LOG_NODE_ERROR(...)                                                    \
  lorasim::util::LogManager::GetLogger("node")->error(__VA_ARGS__)

#define LOG_ROUTER_TRACE(...)                                                  \
  lorasim::util::LogManager::GetLogger("router")->trace(__VA_ARGS__)
#define LOG_ROUTER_DEBUG(...)                                                  \
  lorasim::util::LogManager::GetLogger("router")->debug(__VA_ARGS__)
#define LOG_ROUTER_WARN(...)                                                   \
  lorasim::util::LogManager::GetLogger("router")->warn(__VA_ARGS__)
#define LOG_ROUTER_ERROR(...)                                                  \
  lorasim::util::LogManager::GetLogger("router")->error(__VA_ARGS__)

#define LOG_SCHED_DEBUG(...)                                                   \
  lorasim::util::LogManager::GetLogger("scheduler")->debug(__VA_ARGS__)
#define LOG_SCHED_INFO(...)                                                    \
  lorasim::util::LogManager::GetLogger("scheduler")->info(__VA_ARGS__)
#define LOG_SCHED_WARN(...)                                                    \
  lorasim::util::LogManager::GetLogger("scheduler")->warn(__VA_ARGS__)
#define LOG_SCHED_ERROR(...)                                                   \
  lorasim::util::LogManager::GetLogger("scheduler")->error(__VA_ARGS__)

#define LOG_APP_DEBUG(...)                                                     \
  lorasim::util::LogManager::GetLogger("app")->debug(__VA_ARGS__)
#define LOG_APP_INFO(...)                                                      \
  lorasim::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...)                                                      \
  lorasim::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  lorasim::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
