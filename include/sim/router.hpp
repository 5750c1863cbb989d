// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "sim/node_endpoint.hpp"
#include "util/threadsafe_containers.hpp"
#include "util/time.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace lorasim {

namespace util {
class WorkerPool;
} // namespace util

namespace sim {

class EventLog;

/**
 * Router - connectivity-gated packet fan-out between nodes
 *
 * Owns the directed reachability matrix over the configured node names and
 * the registry of live nodes. Row i of the matrix is reachability FROM node
 * i, in configuration order.
 *
 * Locking:
 * - matrix_mutex_ guards the matrix. UpdateConnectivity replaces it whole
 *   and writes its connectivity_update record under the lock; Deliver
 *   snapshots the destination set under the same lock, so a delivery never
 *   sees a half-applied update and never logs a forward ahead of the update
 *   that enabled it.
 * - Sends happen after the lock is released. A slow node pipe therefore
 *   never blocks a connectivity update or another node's fan-out.
 * - The node registry has its own lock (ThreadSafeMap).
 *
 * State probes: after each forward the router asks the destination for its
 * state on a small worker pool and records the answer as a `state` event.
 * Reader threads never wait on another node's reply.
 */
class Router {
public:
  struct Options {
    // 0 disables post-forward state probes
    std::chrono::milliseconds probe_timeout{200};
    size_t probe_threads = 2;
    size_t max_pending_probes = 64;
  };

  Router(std::vector<std::string> node_names, EventLog &events,
         const util::SimClock &clock);
  Router(std::vector<std::string> node_names, EventLog &events,
         const util::SimClock &clock, Options options);
  ~Router();

  Router(const Router &) = delete;
  Router &operator=(const Router &) = delete;

  /**
   * Add a live node to the routing table
   * @return false if the name is not a configured node or already registered
   */
  bool RegisterNode(NodeEndpointPtr node);

  /**
   * Replace the whole matrix from a row-major bitstring of N*N '0'/'1'
   * characters and record a connectivity_update event at `timestamp`.
   * On a length mismatch or a non-binary character the matrix is left
   * unchanged, the error is logged and false is returned.
   */
  bool UpdateConnectivity(const std::string &bitstring, double timestamp);

  /**
   * Forward `hexdata` from `src` to every registered node reachable from it,
   * never back to `src` itself. Each delivery sends a network_receive_packet
   * command and records a forward event.
   * @return number of nodes the packet was written to
   */
  size_t Deliver(const std::string &src, const std::string &hexdata);

  bool IsReachable(const std::string &src, const std::string &dst) const;

  /**
   * Destinations a packet from `src` would reach right now (self excluded,
   * configuration order, registered or not)
   */
  std::vector<std::string> ReachableFrom(const std::string &src) const;

  /**
   * Current matrix as a row-major bitstring
   */
  std::string ConnectivityString() const;

  NodeEndpointPtr FindNode(const std::string &name) const;

  const std::vector<std::string> &node_names() const { return node_names_; }
  size_t node_count() const { return node_names_.size(); }

  /**
   * Stop scheduling state probes and wait for queued ones to finish
   * Safe to call multiple times
   */
  void Stop();

private:
  void ScheduleStateProbe(const NodeEndpointPtr &node, double timestamp);

  const std::vector<std::string> node_names_;
  std::unordered_map<std::string, size_t> index_;

  EventLog &events_;
  const util::SimClock &clock_;
  const Options options_;

  mutable std::mutex matrix_mutex_;
  std::vector<bool> reachable_;  // row-major, node_count^2

  util::ThreadSafeMap<std::string, NodeEndpointPtr> nodes_;

  std::unique_ptr<util::WorkerPool> probe_pool_;
  std::atomic<bool> stopped_{false};
};

} // namespace sim
} // namespace lorasim
