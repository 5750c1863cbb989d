#pragma once

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace lorasim {
namespace sim {

// Destination reserved for full connectivity-matrix replacement
constexpr const char *CONNECTIVITY_DESTINATION = "-1";

/**
 * One authored command: at logical time `timestamp` (seconds since the start
 * of the run) deliver `payload` to `destination`.
 */
struct TimelineEvent {
  double timestamp = 0.0;
  std::string destination;
  std::string payload;
  size_t line = 0;  // source line number, 0 if not from a file

  bool is_connectivity_update() const {
    return destination == CONNECTIVITY_DESTINATION;
  }
};

struct Timeline {
  std::vector<TimelineEvent> events;  // non-decreasing timestamp order
  size_t skipped_lines = 0;           // malformed lines reported and dropped
};

/**
 * Parse a timeline
 *
 * Format: one event per line, "<timestamp>,<destination|-1>,<payload>".
 * '#' starts a comment that runs to end of line. Blank and comment-only
 * lines are ignored. Malformed lines (missing fields, bad, negative or
 * out-of-range timestamp, empty destination or payload) are logged with their line
 * number and skipped.
 *
 * The payload is everything after the second comma, so node commands keep
 * their own commas.
 *
 * Events are returned sorted by timestamp; equal timestamps keep input order.
 */
Timeline ParseTimeline(std::istream &in);

/**
 * Load and parse a timeline file
 * @return std::nullopt if the file cannot be opened
 */
std::optional<Timeline> LoadTimelineFile(const std::filesystem::path &path);

/**
 * Stable sort by timestamp
 */
void SortTimeline(std::vector<TimelineEvent> &events);

} // namespace sim
} // namespace lorasim
