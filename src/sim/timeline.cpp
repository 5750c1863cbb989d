#include "sim/timeline.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"
#include <algorithm>
#include <fstream>
#include <istream>

namespace lorasim {
namespace sim {

Timeline ParseTimeline(std::istream &in) {
  Timeline timeline;
  std::string raw;
  size_t lineno = 0;

  while (std::getline(in, raw)) {
    ++lineno;

    // Strip full-line and inline comments
    std::string line = util::Trim(raw.substr(0, raw.find('#')));
    if (line.empty()) {
      continue;
    }

    auto parts = util::SplitFields(line, ',', 3);
    if (parts.size() < 3) {
      LOG_SCHED_WARN("Skipping malformed line {}: {}", lineno, line);
      ++timeline.skipped_lines;
      continue;
    }

    auto ts = util::SafeParseDouble(util::Trim(parts[0]), 0.0, util::MAX_SIM_SECONDS);
    if (!ts) {
      LOG_SCHED_WARN("Invalid timestamp on line {}: {}", lineno, parts[0]);
      ++timeline.skipped_lines;
      continue;
    }

    std::string destination = util::Trim(parts[1]);
    if (destination.empty() || parts[2].empty()) {
      LOG_SCHED_WARN("Skipping line {} with empty destination or payload: {}", lineno, line);
      ++timeline.skipped_lines;
      continue;
    }

    TimelineEvent event;
    event.timestamp = *ts;
    event.destination = std::move(destination);
    event.payload = parts[2];
    event.line = lineno;
    timeline.events.push_back(std::move(event));
  }

  SortTimeline(timeline.events);
  return timeline;
}

std::optional<Timeline> LoadTimelineFile(const std::filesystem::path &path) {
  std::ifstream file(path);
  if (!file) {
    LOG_SCHED_ERROR("Cannot open timeline file: {}", path.string());
    return std::nullopt;
  }

  Timeline timeline = ParseTimeline(file);
  LOG_SCHED_INFO("Loaded {} events from {} ({} lines skipped)",
                 timeline.events.size(), path.string(), timeline.skipped_lines);
  return timeline;
}

void SortTimeline(std::vector<TimelineEvent> &events) {
  std::stable_sort(events.begin(), events.end(),
                   [](const TimelineEvent &a, const TimelineEvent &b) {
                     return a.timestamp < b.timestamp;
                   });
}

} // namespace sim
} // namespace lorasim
