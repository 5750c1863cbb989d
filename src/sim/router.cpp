// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "sim/router.hpp"
#include "sim/event_log.hpp"
#include "sim/node_protocol.hpp"
#include "util/logging.hpp"
#include "util/worker_pool.hpp"
#include <algorithm>

namespace lorasim {
namespace sim {

Router::Router(std::vector<std::string> node_names, EventLog &events,
               const util::SimClock &clock)
    : Router(std::move(node_names), events, clock, Options{}) {}

Router::Router(std::vector<std::string> node_names, EventLog &events,
               const util::SimClock &clock, Options options)
    : node_names_(std::move(node_names)), events_(events), clock_(clock),
      options_(options),
      reachable_(node_names_.size() * node_names_.size(), false) {
  for (size_t i = 0; i < node_names_.size(); ++i) {
    index_.emplace(node_names_[i], i);
  }
  if (options_.probe_timeout.count() > 0) {
    probe_pool_ = std::make_unique<util::WorkerPool>("state-probe", options_.probe_threads,
                                                     options_.max_pending_probes);
  }
}

Router::~Router() { Stop(); }

bool Router::RegisterNode(NodeEndpointPtr node) {
  if (!node) {
    LOG_ROUTER_ERROR("RegisterNode called with null node");
    return false;
  }
  if (index_.count(node->name()) == 0) {
    LOG_ROUTER_ERROR("Cannot register node '{}': not in the configured node set",
                     node->name());
    return false;
  }
  if (!nodes_.TryInsert(node->name(), node)) {
    LOG_ROUTER_ERROR("Node '{}' is already registered", node->name());
    return false;
  }
  LOG_ROUTER_DEBUG("Registered node {}", node->name());
  return true;
}

bool Router::UpdateConnectivity(const std::string &bitstring, double timestamp) {
  const size_t n = node_names_.size();
  if (bitstring.size() != n * n) {
    LOG_ROUTER_ERROR("Connectivity string length {} != {}^2 (at ts {:.3f})",
                     bitstring.size(), n, timestamp);
    return false;
  }

  auto bad = std::find_if(bitstring.begin(), bitstring.end(),
                          [](char c) { return c != '0' && c != '1'; });
  if (bad != bitstring.end()) {
    LOG_ROUTER_ERROR("Connectivity string has invalid character '{}' at offset {} (at ts {:.3f})",
                     *bad, bad - bitstring.begin(), timestamp);
    return false;
  }

  std::vector<bool> next(n * n);
  for (size_t i = 0; i < bitstring.size(); ++i) {
    next[i] = bitstring[i] == '1';
  }

  // Record under the lock so no forward over a new link is logged first
  std::lock_guard<std::mutex> lock(matrix_mutex_);
  reachable_.swap(next);
  events_.ConnectivityUpdate(timestamp, bitstring);
  return true;
}

size_t Router::Deliver(const std::string &src, const std::string &hexdata) {
  auto src_it = index_.find(src);
  if (src_it == index_.end()) {
    LOG_ROUTER_WARN("Dropping packet from unknown source '{}'", src);
    return 0;
  }

  std::vector<std::string> destinations = ReachableFrom(src);

  const std::string command = MakeReceivePacketCommand(hexdata);
  size_t delivered = 0;
  for (const auto &dst : destinations) {
    NodeEndpointPtr node = FindNode(dst);
    if (!node) {
      // Reachable but not spawned yet
      LOG_ROUTER_TRACE("{} -> {}: destination not running, packet dropped", src, dst);
      continue;
    }
    if (!node->send(command)) {
      LOG_ROUTER_WARN("{} -> {}: delivery failed", src, dst);
      continue;
    }
    double ts = clock_.ElapsedSeconds();
    events_.Forward(ts, src, dst, hexdata);
    ++delivered;
    ScheduleStateProbe(node, ts);
  }
  return delivered;
}

void Router::ScheduleStateProbe(const NodeEndpointPtr &node, double timestamp) {
  if (!probe_pool_ || stopped_.load()) {
    return;
  }

  auto timeout = options_.probe_timeout;
  bool accepted = probe_pool_->Submit([this, node, timestamp, timeout]() {
    auto response = node->query_state(timeout);
    if (response) {
      events_.State(timestamp, node->name(), *response);
    } else {
      LOG_ROUTER_DEBUG("State probe of {} timed out", node->name());
    }
  });
  if (!accepted) {
    LOG_ROUTER_DEBUG("Skipping state probe of {}: probe queue full or stopped",
                     node->name());
  }
}

bool Router::IsReachable(const std::string &src, const std::string &dst) const {
  auto s = index_.find(src);
  auto d = index_.find(dst);
  if (s == index_.end() || d == index_.end()) {
    return false;
  }
  std::lock_guard<std::mutex> lock(matrix_mutex_);
  return reachable_[s->second * node_names_.size() + d->second];
}

std::vector<std::string> Router::ReachableFrom(const std::string &src) const {
  std::vector<std::string> out;
  auto s = index_.find(src);
  if (s == index_.end()) {
    return out;
  }

  const size_t n = node_names_.size();
  const size_t row = s->second * n;
  std::lock_guard<std::mutex> lock(matrix_mutex_);
  for (size_t j = 0; j < n; ++j) {
    if (j != s->second && reachable_[row + j]) {
      out.push_back(node_names_[j]);
    }
  }
  return out;
}

std::string Router::ConnectivityString() const {
  std::lock_guard<std::mutex> lock(matrix_mutex_);
  std::string out;
  out.reserve(reachable_.size());
  for (bool bit : reachable_) {
    out.push_back(bit ? '1' : '0');
  }
  return out;
}

NodeEndpointPtr Router::FindNode(const std::string &name) const {
  NodeEndpointPtr node;
  nodes_.Read(name, [&](const NodeEndpointPtr &n) { node = n; });
  return node;
}

void Router::Stop() {
  stopped_ = true;
  if (probe_pool_) {
    probe_pool_->Stop();
  }
}

} // namespace sim
} // namespace lorasim
