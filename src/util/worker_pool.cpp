// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/worker_pool.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <exception>

namespace lorasim {
namespace util {

WorkerPool::WorkerPool(std::string name, size_t threads, size_t max_pending)
    : name_(std::move(name)), max_pending_(max_pending) {
  threads = std::max<size_t>(1, threads);
  workers_.reserve(threads);
  for (size_t i = 0; i < threads; ++i) {
    workers_.emplace_back([this] { Run(); });
  }
}

WorkerPool::~WorkerPool() { Stop(); }

bool WorkerPool::Submit(Job job) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
      return false;
    }
    if (max_pending_ > 0 && pending_.size() >= max_pending_) {
      return false;
    }
    pending_.push_back(std::move(job));
  }
  wake_.notify_one();
  return true;
}

void WorkerPool::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  wake_.notify_all();

  std::call_once(joined_, [this] {
    for (auto &worker : workers_) {
      worker.join();
    }
  });
}

void WorkerPool::Run() {
  for (;;) {
    Job job;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      wake_.wait(lock, [this] { return stopping_ || !pending_.empty(); });
      if (pending_.empty()) {
        return;  // stopping and drained
      }
      job = std::move(pending_.front());
      pending_.pop_front();
    }

    try {
      job();
    } catch (const std::exception &e) {
      LOG_ERROR("{} worker: job failed: {}", name_, e.what());
    }
  }
}

} // namespace util
} // namespace lorasim
