#include "sim/stop_signal.hpp"
#include <algorithm>
#include <thread>

namespace lorasim {
namespace sim {

std::string StopReasonToString(StopReason reason) {
  switch (reason) {
  case StopReason::NONE:
    return "none";
  case StopReason::DURATION_ELAPSED:
    return "duration elapsed";
  case StopReason::INTERACTIVE:
    return "interactive stop";
  case StopReason::INTERRUPT:
    return "interrupt";
  case StopReason::TIMELINE_COMPLETE:
    return "timeline complete";
  }
  return "unknown";
}

bool StopSignal::SleepUntil(std::chrono::steady_clock::time_point deadline) const {
  using clock = std::chrono::steady_clock;
  while (!IsSet()) {
    auto now = clock::now();
    if (now >= deadline) {
      return true;
    }
    auto slice = std::min<clock::duration>(deadline - now, kPollInterval);
    std::this_thread::sleep_for(slice);
  }
  return false;
}

} // namespace sim
} // namespace lorasim
