// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "sim/node_endpoint.hpp"
#include "util/threadsafe_containers.hpp"
#include "util/time.hpp"
#include <atomic>
#include <boost/asio.hpp>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <sys/types.h>
#include <thread>

namespace lorasim {
namespace sim {

class EventLog;

// Launching a node program failed (fatal for the run)
class SpawnError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Invoked on the node's stdout reader thread for every transmit_packet line
using TransmitCallback =
    std::function<void(const std::string &src, const std::string &hexdata)>;

/**
 * NodeProcess - supervisor for one simulated node's external process
 *
 * Owns the child process, its three pipes and two reader threads:
 * - stdout reader: timestamps every line into <log_dir>/<name>.stdout.log,
 *   then classifies it. transmit_packet lines are push events: a tx record
 *   is written and the payload handed to the TransmitCallback (the router).
 *   They never reach the response slot. Every other line replaces the
 *   content of the single-slot response mailbox.
 * - stderr reader: timestamps every line into <log_dir>/<name>.stderr.log.
 *   Never affects control flow.
 *
 * Writes to stdin are serialized by a per-node mutex so each command lands
 * as one whole line. Queries are serialized by a second per-node mutex, so
 * concurrent query_state() callers each get a complete clear/send/wait
 * exchange.
 *
 * The child runs in its own process group; terminate() signals the whole
 * group.
 *
 * Lifetime: EventLog, SimClock and the callback target must outlive the
 * NodeProcess. The destructor terminates the process and joins the readers.
 */
class NodeProcess : public NodeEndpoint {
  // Restricts construction to Spawn()
  struct PrivateTag {
    explicit PrivateTag() = default;
  };

public:
  NodeProcess(PrivateTag, std::string name, const util::SimClock &clock,
              EventLog &events, TransmitCallback on_transmit);

  /**
   * Launch `executable` with piped stdin/stdout/stderr and start readers
   * @throws SpawnError if the log files cannot be created or the program
   * cannot be executed
   */
  static std::shared_ptr<NodeProcess>
  Spawn(const std::string &name, const std::string &executable,
        const std::filesystem::path &log_dir, const util::SimClock &clock,
        EventLog &events, TransmitCallback on_transmit);

  ~NodeProcess() override;

  NodeProcess(const NodeProcess &) = delete;
  NodeProcess &operator=(const NodeProcess &) = delete;

  const std::string &name() const override { return name_; }
  bool send(const std::string &command_line) override;
  std::optional<std::string>
  query_state(std::chrono::milliseconds timeout) override;
  void terminate() override;

  /**
   * Wait for both output readers to finish
   * Readers exit at EOF, so call after terminate() or once the program exits
   */
  void join_readers();

  pid_t pid() const { return pid_; }

  // True until the node's stdout reaches EOF
  bool is_running() const { return stdout_open_.load(); }

private:
  void start_readers();
  void read_stdout_loop();
  void read_stderr_loop();
  void handle_stdout_line(const std::string &line);

  // Grace period between SIGTERM and SIGKILL
  static constexpr std::chrono::milliseconds kTerminateGrace{500};

  const std::string name_;
  const util::SimClock &clock_;
  EventLog &events_;
  TransmitCallback on_transmit_;

  pid_t pid_ = -1;

  // Synchronous pipe I/O only; the context is never run
  boost::asio::io_context io_context_;
  boost::asio::posix::stream_descriptor stdin_;
  boost::asio::posix::stream_descriptor stdout_;
  boost::asio::posix::stream_descriptor stderr_;

  std::mutex stdin_mutex_;
  std::mutex query_mutex_;
  util::LatestValueSlot<std::string> responses_;

  std::shared_ptr<spdlog::logger> stdout_log_;
  std::shared_ptr<spdlog::logger> stderr_log_;

  std::thread stdout_thread_;
  std::thread stderr_thread_;

  std::atomic<bool> stdout_open_{false};
  std::atomic<bool> terminated_{false};
};

} // namespace sim
} // namespace lorasim
