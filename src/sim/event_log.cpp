// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "sim/event_log.hpp"
#include "util/time.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace lorasim {
namespace sim {

std::shared_ptr<spdlog::logger>
CreateLineLogger(const std::string &name, std::vector<spdlog::sink_ptr> sinks) {
  auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
  logger->set_pattern("%v");
  logger->set_level(spdlog::level::trace);
  logger->flush_on(spdlog::level::trace);
  return logger;
}

std::shared_ptr<spdlog::logger>
CreateLineFileLogger(const std::string &name, const std::filesystem::path &path) {
  auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(),
                                                                  /*truncate=*/true);
  return CreateLineLogger(name, {sink});
}

EventLog::EventLog(std::vector<spdlog::sink_ptr> sinks)
    : logger_(CreateLineLogger("events", std::move(sinks))) {}

EventLog::~EventLog() { logger_->flush(); }

std::unique_ptr<EventLog> EventLog::CreateForRun(const std::filesystem::path &path,
                                                 bool mirror_to_stdout) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), /*truncate=*/true));
  if (mirror_to_stdout) {
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());
  }
  return std::make_unique<EventLog>(std::move(sinks));
}

void EventLog::Record(double ts, const std::string &kind, const std::string &fields) {
  logger_->info("{},{},{}", util::FormatSeconds(ts), kind, fields);
}

void EventLog::Initialized(double ts, const std::string &node) {
  Record(ts, "initialized", node);
}

void EventLog::ConnectivityUpdate(double ts, const std::string &bitstring) {
  Record(ts, "connectivity_update", bitstring);
}

void EventLog::Tx(double ts, const std::string &src, const std::string &hexdata) {
  Record(ts, "tx", src + "," + hexdata);
}

void EventLog::Forward(double ts, const std::string &src, const std::string &dst,
                       const std::string &hexdata) {
  Record(ts, "forward", src + "," + dst + "," + hexdata);
}

void EventLog::SendCommand(double ts, const std::string &dst, const std::string &command) {
  Record(ts, "send_command", dst + "," + command);
}

void EventLog::State(double ts, const std::string &node, const std::string &response) {
  Record(ts, "state", node + "," + response);
}

void EventLog::Flush() { logger_->flush(); }

} // namespace sim
} // namespace lorasim
