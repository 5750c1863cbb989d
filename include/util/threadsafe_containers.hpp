#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

namespace lorasim {
namespace util {

/**
 * ThreadSafeMap - insert-once registry guarded by one mutex
 *
 * Usage:
 *   ThreadSafeMap<std::string, NodeEndpointPtr> nodes_;
 *   nodes_.TryInsert(name, node);
 *
 *   NodeEndpointPtr node;
 *   nodes_.Read(name, [&](const NodeEndpointPtr& n) { node = n; });
 *
 * Entries are never replaced or removed, so a reader that copied a value
 * out keeps a valid one. Read() runs the callback under the lock.
 */
template <typename Key, typename Value>
class ThreadSafeMap {
public:
    ThreadSafeMap() = default;

    ThreadSafeMap(const ThreadSafeMap&) = delete;
    ThreadSafeMap& operator=(const ThreadSafeMap&) = delete;

    /**
     * Returns true if inserted, false if key already exists
     */
    bool TryInsert(const Key& key, const Value& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        return map_.emplace(key, value).second;
    }

    /**
     * Calls reader(const Value&) under lock if key exists
     * Returns true if key exists and was read
     */
    template <typename Func>
    bool Read(const Key& key, Func&& reader) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end()) {
            return false;
        }
        reader(it->second);
        return true;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<Key, Value> map_;
};

/**
 * LatestValueSlot - single-slot mailbox, most recent value wins
 *
 * Holds at most one unconsumed value. Put() overwrites whatever is in the
 * slot, so a consumer only ever sees the newest value, never history.
 *
 * Usage:
 *   LatestValueSlot<std::string> responses_;
 *   responses_.Clear();                       // drop stale value
 *   ...request...
 *   auto v = responses_.TakeUntil(deadline);  // nullopt on timeout
 *
 * Producer and consumer may be different threads. Multiple concurrent
 * consumers are not coordinated with each other; callers that need
 * request/response pairing must serialize their Clear/request/Take sequence.
 */
template <typename T>
class LatestValueSlot {
public:
    LatestValueSlot() = default;

    LatestValueSlot(const LatestValueSlot&) = delete;
    LatestValueSlot& operator=(const LatestValueSlot&) = delete;

    /**
     * Store value, replacing any unconsumed one
     * Returns true if an unconsumed value was overwritten
     */
    bool Put(T value) {
        bool overwritten;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            overwritten = value_.has_value();
            value_ = std::move(value);
        }
        cv_.notify_one();
        return overwritten;
    }

    /**
     * Discard unconsumed value
     * Returns true if a value was discarded
     */
    bool Clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        bool had = value_.has_value();
        value_.reset();
        return had;
    }

    /**
     * Wait until a value is present or the deadline passes, then take it
     * Returns std::nullopt on timeout
     */
    std::optional<T> TakeUntil(std::chrono::steady_clock::time_point deadline) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_until(lock, deadline, [this] { return value_.has_value(); })) {
            return std::nullopt;
        }
        return TakeLocked();
    }

private:
    std::optional<T> TakeLocked() {
        std::optional<T> out = std::move(value_);
        value_.reset();
        return out;
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<T> value_;
};

} // namespace util
} // namespace lorasim
