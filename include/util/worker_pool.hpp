// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace lorasim {
namespace util {

/**
 * WorkerPool - fixed set of threads running fire-and-forget jobs
 *
 * Jobs are best-effort: Submit refuses work once the pool is stopping or
 * `max_pending` jobs are already waiting, and the caller decides what to
 * log. Stop() lets every accepted job run to completion before joining.
 *
 * A job that throws is logged and dropped; the worker keeps running.
 */
class WorkerPool {
public:
  using Job = std::function<void()>;

  /**
   * @param name Used in log messages
   * @param threads Number of workers (at least one is started)
   * @param max_pending Jobs allowed to wait for a worker (0 = unbounded)
   */
  WorkerPool(std::string name, size_t threads, size_t max_pending);
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  /**
   * @return false if the pool is stopping or the pending queue is full
   */
  bool Submit(Job job);

  /**
   * Refuse new jobs, finish accepted ones and join the workers
   * Safe to call multiple times
   */
  void Stop();

  size_t thread_count() const { return workers_.size(); }

private:
  void Run();

  const std::string name_;
  const size_t max_pending_;

  std::mutex mutex_;
  std::condition_variable wake_;
  std::deque<Job> pending_;
  bool stopping_ = false;

  std::vector<std::thread> workers_;
  std::once_flag joined_;
};

} // namespace util
} // namespace lorasim
