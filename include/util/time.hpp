// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <string>

namespace lorasim {
namespace util {

// Largest offset, in seconds, accepted for any simulation time value
constexpr double MAX_SIM_SECONDS = 1e9;

/**
 * Convert seconds to a steady clock duration
 *
 * Input is clamped to [0, MAX_SIM_SECONDS] so the integer conversion stays
 * in range.
 */
inline std::chrono::steady_clock::duration SecondsToDuration(double seconds) {
  if (!(seconds > 0.0)) {
    return std::chrono::steady_clock::duration::zero();
  }
  if (seconds > MAX_SIM_SECONDS) {
    seconds = MAX_SIM_SECONDS;
  }
  return std::chrono::duration_cast<std::chrono::steady_clock::duration>(
      std::chrono::duration<double>(seconds));
}

/**
 * Simulation clock
 *
 * Wall-clock time elapsed since the start of the run. Every component that
 * timestamps a record (event log, per-node output logs) or aligns itself to
 * logical timeline timestamps reads the same instance.
 *
 * The start point is fixed at construction, so concurrent reads need no
 * synchronization.
 */
class SimClock {
public:
  SimClock() : start_(std::chrono::steady_clock::now()) {}
  explicit SimClock(std::chrono::steady_clock::time_point start) : start_(start) {}

  std::chrono::steady_clock::time_point start() const { return start_; }

  /**
   * Seconds elapsed since start
   */
  double ElapsedSeconds() const {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_)
        .count();
  }

  /**
   * Steady clock instant corresponding to a logical offset from start
   * (offsets beyond MAX_SIM_SECONDS are clamped)
   */
  std::chrono::steady_clock::time_point TimePointAt(double seconds) const {
    return start_ + SecondsToDuration(seconds);
  }

private:
  const std::chrono::steady_clock::time_point start_;
};

/**
 * Format a duration in seconds with millisecond precision
 *
 * Example: FormatSeconds(1.23456) -> "1.235"
 */
std::string FormatSeconds(double seconds);

} // namespace util
} // namespace lorasim
