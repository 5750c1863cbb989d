// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "sim/event_log.hpp"
#include "sim/node_process.hpp"
#include "sim/node_protocol.hpp"
#include "sim/router.hpp"
#include "sim/scheduler.hpp"
#include "sim/stop_signal.hpp"
#include "sim/timeline.hpp"
#include "util/time.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace lorasim {
namespace app {

// Application configuration
struct AppConfig {
  // Timeline file (required)
  std::filesystem::path input;

  // Node names, configuration order
  std::vector<std::string> nodes{"ND01", "ND02", "ND03", "ND04"};

  // External node program
  std::string node_executable = "./network_simulator";

  // Directory for sim_output.log, per-node logs and final_states.json
  std::filesystem::path outdir = ".";

  // Stop after this many seconds of Running (none = wait for cancellation)
  std::optional<double> duration;

  // Explicit per-node spawn offsets (empty = random in [0, spawn_max])
  std::vector<double> spawn_offsets;
  double spawn_max = 5.0;
  uint32_t seed = 0;

  // Query deadlines in seconds
  double query_timeout = 1.0;
  double probe_timeout = 0.2;  // 0 disables post-forward probes

  // Also stop once every timeline event has been applied
  bool until_timeline_end = false;

  // Do not mirror the event log to stdout
  bool quiet = false;

  // Watch a terminal stdin for ESC (ignored when stdin is not a tty)
  bool listen_for_escape = true;
};

// Final outcome for one node
enum class NodeStatus { OK, NO_RESPONSE, NOT_SPAWNED, UNKNOWN };

std::string NodeStatusToString(NodeStatus status);

struct NodeSummary {
  std::string name;
  NodeStatus status = NodeStatus::NO_RESPONSE;
  std::string raw;                       // raw get_state line if OK
  std::optional<sim::StateReport> report;
};

// Application - Lifecycle controller for one simulation run
//
// Idle -> Spawning -> Running -> Draining -> Terminated
//
// initialize() validates configuration, opens the event log and loads the
// timeline. start() starts the simulation clock, spawns the nodes at their
// offsets and launches the scheduler. wait_for_shutdown() blocks until a stop condition fires and
// then runs stop(), which collects final node states, prints the summary and
// terminates every node process.
class Application {
public:
  enum class Phase { IDLE, SPAWNING, RUNNING, DRAINING, TERMINATED };

  explicit Application(const AppConfig &config = AppConfig{});
  ~Application();

  Application(const Application &) = delete;
  Application &operator=(const Application &) = delete;

  // Lifecycle
  bool initialize();
  bool start();
  void stop();
  void wait_for_shutdown();

  // Cancellation (first request wins)
  void request_shutdown(sim::StopReason reason = sim::StopReason::INTERACTIVE) {
    stop_.Request(reason);
  }

  // Status
  Phase phase() const { return phase_.load(); }
  sim::StopReason stop_reason() const { return stop_.reason(); }
  const std::vector<NodeSummary> &summary() const { return summary_; }

  // Component access
  sim::Router &router() { return *router_; }
  sim::EventLog &event_log() { return *events_; }
  const util::SimClock &clock() const { return *clock_; }

  // Render the human-readable final summary
  static std::string FormatSummary(const std::vector<NodeSummary> &summary);

  // Signal handling
  static void signal_handler(int signal);
  static Application *instance();

private:
  AppConfig config_;
  std::atomic<Phase> phase_{Phase::IDLE};
  sim::StopSignal stop_;

  // Simulation clock, started when spawning begins
  std::unique_ptr<util::SimClock> clock_;
  std::chrono::steady_clock::time_point running_since_;

  std::unique_ptr<sim::EventLog> events_;
  std::vector<sim::TimelineEvent> timeline_;
  std::unique_ptr<sim::Router> router_;
  std::unique_ptr<sim::Scheduler> scheduler_;

  // Spawned nodes; declared after router_ so they are released first
  std::map<std::string, std::shared_ptr<sim::NodeProcess>> nodes_;

  std::vector<NodeSummary> summary_;

  // ESC key listener
  std::thread key_thread_;

  std::atomic<bool> stopping_{false};

  // Initialization steps
  bool validate_config();
  bool init_outdir();
  bool init_event_log();
  bool init_timeline();

  // Spawning
  std::vector<std::pair<double, std::string>> spawn_schedule() const;
  bool spawn_nodes();

  // Running
  void start_key_listener();
  void stop_key_listener();
  void key_listener_loop();

  // Draining
  void collect_final_states();
  bool save_final_states() const;
  void terminate_nodes();

  // Signal handling
  static Application *instance_;
  void setup_signal_handlers();
};

} // namespace app
} // namespace lorasim
