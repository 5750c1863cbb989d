#pragma once

#include <atomic>
#include <chrono>
#include <string>

namespace lorasim {
namespace sim {

enum class StopReason : int {
  NONE = 0,
  DURATION_ELAPSED,
  INTERACTIVE,
  INTERRUPT,
  TIMELINE_COMPLETE,
};

std::string StopReasonToString(StopReason reason);

/**
 * StopSignal - the single shared stop flag of a run
 *
 * Set once; the first Request() wins and records its reason, later requests
 * are ignored. Request() only touches a lock-free atomic, so it is safe to
 * call from a signal handler.
 *
 * Waiters poll at kPollInterval, which bounds how long a sleeping loop takes
 * to notice cancellation.
 */
class StopSignal {
public:
  static constexpr std::chrono::milliseconds kPollInterval{50};

  /**
   * Request stop
   * @return true if this call set the signal
   */
  bool Request(StopReason reason) noexcept {
    int expected = static_cast<int>(StopReason::NONE);
    return reason_.compare_exchange_strong(expected, static_cast<int>(reason));
  }

  bool IsSet() const noexcept {
    return reason_.load() != static_cast<int>(StopReason::NONE);
  }

  StopReason reason() const noexcept {
    return static_cast<StopReason>(reason_.load());
  }

  /**
   * Sleep until `deadline` unless stop is requested first
   * @return true if the deadline was reached, false if stop was requested
   */
  bool SleepUntil(std::chrono::steady_clock::time_point deadline) const;

private:
  static_assert(std::atomic<int>::is_always_lock_free,
                "StopSignal::Request must be async-signal-safe");
  std::atomic<int> reason_{static_cast<int>(StopReason::NONE)};
};

} // namespace sim
} // namespace lorasim
