// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "application.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <iostream>
#include <limits>
#include <nlohmann/json.hpp>
#include <poll.h>
#include <random>
#include <spdlog/fmt/fmt.h>
#include <termios.h>
#include <unistd.h>  // For write(), STDOUT_FILENO (async-signal-safe)

namespace lorasim {
namespace app {

namespace {

constexpr char KEY_ESCAPE = '\x1b';

std::chrono::milliseconds SecondsToMillis(double seconds) {
  return std::chrono::milliseconds(std::llround(seconds * 1000.0));
}

} // namespace

std::string NodeStatusToString(NodeStatus status) {
  switch (status) {
  case NodeStatus::OK:
    return "ok";
  case NodeStatus::NO_RESPONSE:
    return "no_response";
  case NodeStatus::NOT_SPAWNED:
    return "not_spawned";
  case NodeStatus::UNKNOWN:
    return "unknown";
  }
  return "unknown";
}

// Static instance for signal handling
Application *Application::instance_ = nullptr;

Application::Application(const AppConfig &config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

Application *Application::instance() { return instance_; }

bool Application::initialize() {
  LOG_APP_INFO("Initializing simulation...");

  if (!validate_config()) {
    return false;
  }

  if (!init_outdir()) {
    LOG_APP_ERROR("Failed to initialize output directory");
    return false;
  }

  if (!init_event_log()) {
    LOG_APP_ERROR("Failed to open event log");
    return false;
  }

  if (!init_timeline()) {
    LOG_APP_ERROR("Failed to load timeline");
    return false;
  }

  LOG_APP_INFO("Initialization complete ({} nodes, {} timeline events)",
               config_.nodes.size(), timeline_.size());
  return true;
}

bool Application::validate_config() {
  if (config_.input.empty()) {
    LOG_APP_ERROR("No timeline given (--input is required)");
    return false;
  }

  if (config_.nodes.empty()) {
    LOG_APP_ERROR("Node list is empty");
    return false;
  }

  std::set<std::string> seen;
  for (const auto &name : config_.nodes) {
    if (name.empty() || name == sim::CONNECTIVITY_DESTINATION ||
        name.find(sim::protocol::FIELD_DELIMITER) != std::string::npos) {
      LOG_APP_ERROR("Invalid node name '{}'", name);
      return false;
    }
    if (!seen.insert(name).second) {
      LOG_APP_ERROR("Duplicate node name '{}'", name);
      return false;
    }
  }

  if (!config_.spawn_offsets.empty()) {
    if (config_.spawn_offsets.size() != config_.nodes.size()) {
      LOG_APP_ERROR("--spawn-offsets length {} != number of nodes {}",
                    config_.spawn_offsets.size(), config_.nodes.size());
      return false;
    }
    for (double offset : config_.spawn_offsets) {
      if (!(offset >= 0.0)) {
        LOG_APP_ERROR("Spawn offset {} is negative", offset);
        return false;
      }
    }
  }

  if (config_.spawn_max < 0.0 || config_.query_timeout < 0.0 ||
      config_.probe_timeout < 0.0 || (config_.duration && *config_.duration < 0.0)) {
    LOG_APP_ERROR("Durations and timeouts must not be negative");
    return false;
  }

  return true;
}

bool Application::init_outdir() {
  LOG_APP_INFO("Output directory: {}", config_.outdir.string());

  if (auto ec = util::CreateOutputDirectory(config_.outdir)) {
    LOG_APP_ERROR("Failed to create output directory {}: {}", config_.outdir.string(),
                  ec.message());
    return false;
  }
  return true;
}

bool Application::init_event_log() {
  auto path = util::OutputLayout{config_.outdir}.event_log();
  try {
    events_ = sim::EventLog::CreateForRun(path, !config_.quiet);
  } catch (const spdlog::spdlog_ex &e) {
    LOG_APP_ERROR("Cannot open {}: {}", path.string(), e.what());
    return false;
  }
  LOG_APP_DEBUG("Event log: {}", path.string());
  return true;
}

bool Application::init_timeline() {
  auto timeline = sim::LoadTimelineFile(config_.input);
  if (!timeline) {
    LOG_APP_ERROR("Cannot read timeline {}", config_.input.string());
    return false;
  }

  if (timeline->skipped_lines > 0) {
    LOG_APP_WARN("Timeline {}: skipped {} malformed line(s)", config_.input.string(),
                 timeline->skipped_lines);
  }
  if (timeline->events.empty()) {
    LOG_APP_WARN("Timeline {} has no events", config_.input.string());
  }

  timeline_ = std::move(timeline->events);
  return true;
}

bool Application::start() {
  if (phase_ != Phase::IDLE || !events_) {
    LOG_APP_ERROR("Application not initialized or already started");
    return false;
  }

  LOG_APP_INFO("Starting simulation...");

  setup_signal_handlers();

  clock_ = std::make_unique<util::SimClock>();

  sim::Router::Options options;
  options.probe_timeout = SecondsToMillis(config_.probe_timeout);
  router_ = std::make_unique<sim::Router>(config_.nodes, *events_, *clock_, options);

  phase_ = Phase::SPAWNING;
  if (!spawn_nodes()) {
    terminate_nodes();
    phase_ = Phase::TERMINATED;
    return false;
  }

  scheduler_ = std::make_unique<sim::Scheduler>(timeline_, *router_, *events_,
                                                *clock_, stop_);
  scheduler_->Start();

  start_key_listener();

  running_since_ = std::chrono::steady_clock::now();
  phase_ = Phase::RUNNING;

  if (config_.duration) {
    LOG_APP_INFO("Running for {:.3f} s", *config_.duration);
  } else if (config_.until_timeline_end) {
    LOG_APP_INFO("Running until the timeline is complete");
  } else {
    LOG_APP_INFO("Running until interrupted");
  }

  return true;
}

std::vector<std::pair<double, std::string>> Application::spawn_schedule() const {
  std::vector<double> offsets = config_.spawn_offsets;
  if (offsets.empty()) {
    std::mt19937 rng(config_.seed);
    std::uniform_real_distribution<double> dist(0.0, config_.spawn_max);
    for (size_t i = 0; i < config_.nodes.size(); ++i) {
      offsets.push_back(dist(rng));
    }
  }

  std::vector<std::pair<double, std::string>> schedule;
  schedule.reserve(config_.nodes.size());
  for (size_t i = 0; i < config_.nodes.size(); ++i) {
    schedule.emplace_back(offsets[i], config_.nodes[i]);
  }
  std::stable_sort(schedule.begin(), schedule.end(),
                   [](const auto &a, const auto &b) { return a.first < b.first; });
  return schedule;
}

bool Application::spawn_nodes() {
  sim::Router *router = router_.get();
  auto on_transmit = [router](const std::string &src, const std::string &hexdata) {
    router->Deliver(src, hexdata);
  };

  for (const auto &[offset, name] : spawn_schedule()) {
    if (!stop_.SleepUntil(clock_->TimePointAt(offset))) {
      LOG_APP_INFO("Stop requested during spawning; {} of {} nodes running",
                   nodes_.size(), config_.nodes.size());
      return true;
    }

    std::shared_ptr<sim::NodeProcess> node;
    try {
      node = sim::NodeProcess::Spawn(name, config_.node_executable, config_.outdir,
                                     *clock_, *events_, on_transmit);
    } catch (const sim::SpawnError &e) {
      LOG_APP_ERROR("Failed to spawn node {}: {}", name, e.what());
      return false;
    }

    nodes_.emplace(name, node);
    if (!router_->RegisterNode(node)) {
      LOG_APP_ERROR("Failed to register node {}", name);
      return false;
    }
    events_->Initialized(clock_->ElapsedSeconds(), name);
  }
  return true;
}

void Application::wait_for_shutdown() {
  using clock = std::chrono::steady_clock;

  if (phase_ != Phase::RUNNING) {
    return;
  }

  std::optional<clock::time_point> deadline;
  if (config_.duration) {
    deadline = running_since_ + util::SecondsToDuration(*config_.duration);
  }

  while (!stop_.IsSet()) {
    auto now = clock::now();
    if (deadline && now >= *deadline) {
      stop_.Request(sim::StopReason::DURATION_ELAPSED);
      break;
    }
    if (config_.until_timeline_end && scheduler_->finished()) {
      stop_.Request(sim::StopReason::TIMELINE_COMPLETE);
      break;
    }
    auto wake = now + sim::StopSignal::kPollInterval;
    if (deadline && *deadline < wake) {
      wake = *deadline;
    }
    stop_.SleepUntil(wake);
  }

  LOG_APP_INFO("Stopping: {}", sim::StopReasonToString(stop_.reason()));
  stop();
}

void Application::stop() {
  Phase phase = phase_.load();
  if (phase == Phase::IDLE || phase == Phase::TERMINATED) {
    return;
  }
  if (stopping_.exchange(true)) {
    return;
  }

  // No-op if a stop condition already fired
  stop_.Request(sim::StopReason::INTERACTIVE);
  phase_ = Phase::DRAINING;

  if (scheduler_) {
    LOG_APP_DEBUG("Waiting for scheduler...");
    scheduler_->Join();
  }

  stop_key_listener();

  if (router_) {
    LOG_APP_DEBUG("Draining state probes...");
    router_->Stop();
  }

  collect_final_states();

  events_->Flush();
  std::cout << FormatSummary(summary_) << std::flush;

  if (!save_final_states()) {
    LOG_APP_ERROR("Failed to save final node states");
  }

  terminate_nodes();

  phase_ = Phase::TERMINATED;
  LOG_APP_INFO("Shutdown complete");
}

void Application::collect_final_states() {
  summary_.clear();
  const auto timeout = SecondsToMillis(config_.query_timeout);

  for (const auto &name : config_.nodes) {
    NodeSummary entry;
    entry.name = name;

    auto it = nodes_.find(name);
    if (it == nodes_.end()) {
      entry.status = NodeStatus::NOT_SPAWNED;
    } else if (auto response = it->second->query_state(timeout)) {
      entry.status = NodeStatus::OK;
      entry.raw = *response;
      entry.report = sim::ParseStateReport(*response);
    } else {
      LOG_APP_WARN("Node {} did not answer get_state within {} ms", name,
                   timeout.count());
      entry.status = NodeStatus::NO_RESPONSE;
    }
    summary_.push_back(std::move(entry));
  }

  if (scheduler_) {
    for (const auto &name : scheduler_->unknown_destinations()) {
      if (std::find(config_.nodes.begin(), config_.nodes.end(), name) !=
          config_.nodes.end()) {
        continue;  // configured, reported above
      }
      NodeSummary entry;
      entry.name = name;
      entry.status = NodeStatus::UNKNOWN;
      summary_.push_back(std::move(entry));
    }
  }
}

std::string Application::FormatSummary(const std::vector<NodeSummary> &summary) {
  std::string out = "\nFinal node states:\n";

  for (const auto &node : summary) {
    out += fmt::format("\n{}:\n", node.name);
    switch (node.status) {
    case NodeStatus::NO_RESPONSE:
      out += "  <no response>\n";
      continue;
    case NodeStatus::NOT_SPAWNED:
      out += "  <not spawned>\n";
      continue;
    case NodeStatus::UNKNOWN:
      out += "  <unknown node>\n";
      continue;
    case NodeStatus::OK:
      break;
    }

    if (!node.report) {
      out += fmt::format("  {}\n", node.raw);
      continue;
    }
    out += fmt::format("    {:>4} {:>10} {:>10} {:>10}\n", "Node", "Timestamp", "Lat",
                       "Lon");
    for (const auto &e : node.report->entries) {
      out += fmt::format("    {:>4} {:>10} {:>10} {:>10}\n", e.name, e.timestamp, e.lat,
                         e.lon);
    }
  }

  out += "Simulation terminated.\n";
  return out;
}

bool Application::save_final_states() const {
  using json = nlohmann::json;

  auto path = util::OutputLayout{config_.outdir}.final_states();
  try {
    json root = json::object();
    for (const auto &node : summary_) {
      json j;
      j["status"] = NodeStatusToString(node.status);
      if (node.status == NodeStatus::OK) {
        j["raw"] = node.raw;
        j["entries"] = json::array();
        if (node.report) {
          auto uptime = util::SafeParseInt64(node.report->uptime_ms, 0,
                                             std::numeric_limits<int64_t>::max());
          if (uptime) {
            j["uptime_ms"] = *uptime;
          } else {
            j["uptime_ms"] = node.report->uptime_ms;
          }
          for (const auto &e : node.report->entries) {
            j["entries"].push_back(
                {{"name", e.name}, {"timestamp", e.timestamp}, {"lat", e.lat}, {"lon", e.lon}});
          }
        }
      }
      root[node.name] = j;
    }

    if (auto ec = util::WriteFileAtomic(path, root.dump(2) + "\n")) {
      LOG_APP_ERROR("Failed to write {}: {}", path.string(), ec.message());
      return false;
    }
    LOG_APP_DEBUG("Saved final states to {}", path.string());
    return true;
  } catch (const std::exception &e) {
    LOG_APP_ERROR("Exception while saving final states: {}", e.what());
    return false;
  }
}

void Application::terminate_nodes() {
  if (nodes_.empty()) {
    return;
  }
  LOG_APP_INFO("Terminating {} node(s)...", nodes_.size());

  for (auto &[name, node] : nodes_) {
    node->terminate();
  }
  // Readers may still be forwarding buffered output until they hit EOF
  for (auto &[name, node] : nodes_) {
    node->join_readers();
  }
}

void Application::start_key_listener() {
  if (!config_.listen_for_escape || !::isatty(STDIN_FILENO)) {
    return;
  }
  LOG_APP_INFO("Press ESC to stop the simulation");
  key_thread_ = std::thread(&Application::key_listener_loop, this);
}

void Application::stop_key_listener() {
  if (key_thread_.joinable()) {
    key_thread_.join();
  }
}

void Application::key_listener_loop() {
  termios original{};
  if (::tcgetattr(STDIN_FILENO, &original) != 0) {
    LOG_APP_WARN("Cannot read terminal settings; ESC listener disabled");
    return;
  }

  // Unbuffered, no echo
  termios cbreak = original;
  cbreak.c_lflag &= ~(ICANON | ECHO);
  cbreak.c_cc[VMIN] = 1;
  cbreak.c_cc[VTIME] = 0;
  if (::tcsetattr(STDIN_FILENO, TCSANOW, &cbreak) != 0) {
    LOG_APP_WARN("Cannot set terminal mode; ESC listener disabled");
    return;
  }

  const int poll_ms = static_cast<int>(sim::StopSignal::kPollInterval.count());
  while (!stop_.IsSet()) {
    pollfd pfd{STDIN_FILENO, POLLIN, 0};
    int ready = ::poll(&pfd, 1, poll_ms);
    if (ready < 0 && errno != EINTR) {
      LOG_APP_WARN("poll on stdin failed: {}", std::strerror(errno));
      break;
    }
    if (ready <= 0) {
      continue;
    }
    char ch = 0;
    ssize_t n = ::read(STDIN_FILENO, &ch, 1);
    if (n <= 0) {
      break;  // stdin closed
    }
    if (ch == KEY_ESCAPE) {
      stop_.Request(sim::StopReason::INTERACTIVE);
    }
  }

  if (::tcsetattr(STDIN_FILENO, TCSADRAIN, &original) != 0) {
    LOG_APP_WARN("Failed to restore terminal settings");
  }
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
}

void Application::signal_handler(int signal) {
  (void)signal;
  if (instance_) {
    // Use write() for async-signal-safety (std::cout, snprintf are NOT safe)
    const char *msg = "\nReceived signal\n";
    ssize_t written = write(STDERR_FILENO, msg, 17);
    (void)written;

    instance_->stop_.Request(sim::StopReason::INTERRUPT);
  }
}

} // namespace app
} // namespace lorasim
