// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "sim/timeline.hpp"
#include "util/time.hpp"
#include <atomic>
#include <cstddef>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace lorasim {
namespace sim {

class EventLog;
class Router;
class StopSignal;

/**
 * Scheduler - drives the timeline against wall-clock time
 *
 * Runs on its own thread. For each event in timestamp order it sleeps until
 * the event's logical time (late events fire immediately), then either
 * replaces the connectivity matrix (destination "-1") or sends the payload
 * to the destination node and records a send_command event.
 *
 * Unknown destinations are reported and skipped. Stop is observed between
 * events and while sleeping, bounded by StopSignal::kPollInterval.
 */
class Scheduler {
public:
  Scheduler(std::vector<TimelineEvent> events, Router &router, EventLog &events_log,
            const util::SimClock &clock, const StopSignal &stop);
  ~Scheduler();

  Scheduler(const Scheduler &) = delete;
  Scheduler &operator=(const Scheduler &) = delete;

  void Start();

  /**
   * Wait for the scheduler thread to exit (stop requested or timeline done)
   */
  void Join();

  /**
   * Run the whole timeline on the calling thread
   */
  void Run();

  /**
   * Apply a single event immediately
   * @return true if the event was applied
   */
  bool Apply(const TimelineEvent &event);

  bool finished() const { return finished_.load(); }
  size_t applied_count() const { return applied_.load(); }
  size_t event_count() const { return events_.size(); }

  /**
   * Destinations seen in the timeline that no running node answered to
   */
  std::set<std::string> unknown_destinations() const;

private:
  const std::vector<TimelineEvent> events_;
  Router &router_;
  EventLog &log_;
  const util::SimClock &clock_;
  const StopSignal &stop_;

  std::thread thread_;
  std::atomic<bool> finished_{false};
  std::atomic<size_t> applied_{0};

  mutable std::mutex unknown_mutex_;
  std::set<std::string> unknown_;
};

} // namespace sim
} // namespace lorasim
