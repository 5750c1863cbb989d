// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/logging.hpp"
#include <filesystem>
#include <iostream>
#include <map>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace lorasim {
namespace util {

static std::once_flag s_init_flag;

// Mutex protecting s_loggers map access (all reads and writes)
static std::mutex s_loggers_mutex;
static std::map<std::string, std::shared_ptr<spdlog::logger>> s_loggers;

static constexpr const char *kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";

static void InitializeInternal(const std::string &log_level, bool log_to_file,
                               const std::string &log_file_path) {
  try {
    std::vector<spdlog::sink_ptr> sinks;

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern(kPattern);
    sinks.push_back(console_sink);

    if (log_to_file) {
      namespace fs = std::filesystem;
      try {
        fs::path p = log_file_path.empty() ? fs::path("orchestrator.log") : fs::path(log_file_path);
        if (p.has_parent_path()) {
          std::error_code ec;
          fs::create_directories(p.parent_path(), ec);
        }
        // Rotating file sink (max 10MB per file, 3 files total)
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            p.string(), 10 * 1024 * 1024, 3);
        file_sink->set_pattern(kPattern);
        sinks.push_back(file_sink);
      } catch (const spdlog::spdlog_ex &ex) {
        std::cerr << "Failed to initialize file logger (" << ex.what()
                  << "), logging to console only\n";
      }
    }

    std::vector<std::string> components = {"default", "node", "router",
                                           "scheduler", "app"};

    std::lock_guard<std::mutex> lock(s_loggers_mutex);

    for (const auto &component : components) {
      auto logger = std::make_shared<spdlog::logger>(component, sinks.begin(),
                                                     sinks.end());
      logger->set_level(spdlog::level::from_str(log_level));
      // Flush every message so diagnostics interleave sensibly with node logs
      logger->flush_on(spdlog::level::trace);
      s_loggers[component] = logger;
    }

    spdlog::set_default_logger(s_loggers["default"]);

    // Direct logger access (cannot use LOG_INFO macro - would deadlock on mutex)
    if (log_level != "off") {
      s_loggers["default"]->debug("Logging system initialized (level: {})", log_level);
    }
  } catch (const spdlog::spdlog_ex &ex) {
    std::cerr << "Log initialization failed: " << ex.what() << std::endl;
  }
}

void LogManager::Initialize(const std::string &log_level, bool log_to_file,
                            const std::string &log_file_path) {
  std::call_once(s_init_flag, InitializeInternal, log_level, log_to_file, log_file_path);
}

void LogManager::Shutdown() {
  std::lock_guard<std::mutex> lock(s_loggers_mutex);
  for (auto &[name, logger] : s_loggers) {
    logger->flush();
  }
  spdlog::shutdown();
  s_loggers.clear();
}

std::shared_ptr<spdlog::logger> LogManager::GetLogger(const std::string &name) {
  Initialize();

  std::lock_guard<std::mutex> lock(s_loggers_mutex);

  auto it = s_loggers.find(name);
  if (it != s_loggers.end()) {
    return it->second;
  }

  // If loggers are empty (prior init failed or after Shutdown), install a
  // silent console logger so callers never dereference null.
  if (s_loggers.empty()) {
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern(kPattern);
    auto logger = std::make_shared<spdlog::logger>("default", console_sink);
    logger->set_level(spdlog::level::off);
    s_loggers["default"] = logger;
    return logger;
  }

  return s_loggers["default"];
}

void LogManager::SetLogLevel(const std::string &level) {
  std::lock_guard<std::mutex> lock(s_loggers_mutex);

  if (s_loggers.empty()) {
    return;
  }

  auto log_level = spdlog::level::from_str(level);
  for (auto &[name, logger] : s_loggers) {
    logger->set_level(log_level);
  }
}

void LogManager::SetComponentLevel(const std::string &component, const std::string &level) {
  std::lock_guard<std::mutex> lock(s_loggers_mutex);

  if (s_loggers.empty()) {
    return;
  }

  auto it = s_loggers.find(component);
  if (it != s_loggers.end()) {
    it->second->set_level(spdlog::level::from_str(level));
  } else if (s_loggers.count("default") > 0 &&
             s_loggers["default"]->level() != spdlog::level::off) {
    // Direct logger access (avoid deadlock)
    s_loggers["default"]->warn("Unknown log component: {}", component);
  }
}

} // namespace util
} // namespace lorasim
