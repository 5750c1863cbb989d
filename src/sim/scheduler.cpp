// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "sim/scheduler.hpp"
#include "sim/event_log.hpp"
#include "sim/router.hpp"
#include "sim/stop_signal.hpp"
#include "util/logging.hpp"

namespace lorasim {
namespace sim {

namespace {

std::vector<TimelineEvent> Sorted(std::vector<TimelineEvent> events) {
  SortTimeline(events);
  return events;
}

} // namespace

Scheduler::Scheduler(std::vector<TimelineEvent> events, Router &router,
                     EventLog &events_log, const util::SimClock &clock,
                     const StopSignal &stop)
    : events_(Sorted(std::move(events))), router_(router), log_(events_log),
      clock_(clock), stop_(stop) {}

Scheduler::~Scheduler() { Join(); }

void Scheduler::Start() {
  if (thread_.joinable()) {
    LOG_SCHED_WARN("Scheduler already started");
    return;
  }
  thread_ = std::thread([this]() { Run(); });
}

void Scheduler::Join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

void Scheduler::Run() {
  LOG_SCHED_INFO("Scheduler running {} events", events_.size());

  for (const auto &event : events_) {
    if (!stop_.SleepUntil(clock_.TimePointAt(event.timestamp))) {
      break;
    }
    // Stop may have landed between the deadline check and here
    if (stop_.IsSet()) {
      break;
    }
    if (Apply(event)) {
      applied_.fetch_add(1);
    }
  }

  finished_ = true;
  LOG_SCHED_INFO("Scheduler finished ({}/{} events applied{})", applied_.load(),
                 events_.size(), stop_.IsSet() ? ", stopped" : "");
}

bool Scheduler::Apply(const TimelineEvent &event) {
  if (event.is_connectivity_update()) {
    return router_.UpdateConnectivity(event.payload, event.timestamp);
  }

  auto node = router_.FindNode(event.destination);
  if (!node) {
    LOG_SCHED_ERROR("Unknown destination '{}' at ts {:.3f} (line {})",
                    event.destination, event.timestamp, event.line);
    std::lock_guard<std::mutex> lock(unknown_mutex_);
    unknown_.insert(event.destination);
    return false;
  }

  if (!node->send(event.payload)) {
    LOG_SCHED_WARN("Failed to send '{}' to {} at ts {:.3f}", event.payload,
                   event.destination, event.timestamp);
    return false;
  }
  log_.SendCommand(event.timestamp, event.destination, event.payload);
  return true;
}

std::set<std::string> Scheduler::unknown_destinations() const {
  std::lock_guard<std::mutex> lock(unknown_mutex_);
  return unknown_;
}

} // namespace sim
} // namespace lorasim
