// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace lorasim {
namespace sim {

/**
 * Create a logger that writes each message verbatim as one line
 *
 * Pattern is "%v" and every record is flushed immediately, so files built
 * on it can be tailed while the run is in progress. The logger is not
 * registered with spdlog's global registry; the caller owns it.
 *
 * Sinks must be the thread-safe (_mt) variants when more than one thread
 * writes; spdlog then guarantees whole-line writes.
 */
std::shared_ptr<spdlog::logger>
CreateLineLogger(const std::string &name, std::vector<spdlog::sink_ptr> sinks);

/**
 * Create a line logger over a single file, truncating any previous content
 * @throws spdlog::spdlog_ex if the file cannot be opened
 */
std::shared_ptr<spdlog::logger>
CreateLineFileLogger(const std::string &name, const std::filesystem::path &path);

/**
 * EventLog - canonical record of a simulation run
 *
 * One comma-delimited record per line, first field is the timestamp in
 * seconds with millisecond precision, second field the record kind:
 *
 *   <ts>,initialized,<node>
 *   <ts>,connectivity_update,<bitstring>
 *   <ts>,tx,<src>,<hexdata>
 *   <ts>,forward,<src>,<dst>,<hexdata>
 *   <ts>,send_command,<dst>,<raw_command>
 *   <ts>,state,<node>,<get_state response>
 *
 * This stream is the only integration surface for visualization tools.
 * It is passed by reference to every component that records events; no
 * component writes to a global stream.
 *
 * Thread-safety: all writers may be called concurrently; records never
 * interleave within a line.
 */
class EventLog {
public:
  explicit EventLog(std::vector<spdlog::sink_ptr> sinks);
  ~EventLog();

  EventLog(const EventLog &) = delete;
  EventLog &operator=(const EventLog &) = delete;

  /**
   * Event log for a run: truncates `path` and optionally mirrors to stdout
   * @throws spdlog::spdlog_ex if the file cannot be opened
   */
  static std::unique_ptr<EventLog> CreateForRun(const std::filesystem::path &path,
                                                bool mirror_to_stdout);

  void Initialized(double ts, const std::string &node);
  void ConnectivityUpdate(double ts, const std::string &bitstring);
  void Tx(double ts, const std::string &src, const std::string &hexdata);
  void Forward(double ts, const std::string &src, const std::string &dst,
               const std::string &hexdata);
  void SendCommand(double ts, const std::string &dst, const std::string &command);
  void State(double ts, const std::string &node, const std::string &response);

  void Flush();

private:
  void Record(double ts, const std::string &kind, const std::string &fields);

  std::shared_ptr<spdlog::logger> logger_;
};

} // namespace sim
} // namespace lorasim
