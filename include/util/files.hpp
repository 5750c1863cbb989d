#pragma once

#include <filesystem>
#include <string>
#include <system_error>

namespace lorasim {
namespace util {

/**
 * File names inside a run's output directory
 *
 *   sim_output.log         event log
 *   orchestrator.log       diagnostic log (rotating)
 *   final_states.json      drained node states
 *   <node>.stdout.log      raw node output, one per node
 *   <node>.stderr.log
 */
struct OutputLayout {
  std::filesystem::path dir;

  std::filesystem::path event_log() const { return dir / "sim_output.log"; }
  std::filesystem::path orchestrator_log() const { return dir / "orchestrator.log"; }
  std::filesystem::path final_states() const { return dir / "final_states.json"; }
  std::filesystem::path node_stdout_log(const std::string &node) const {
    return dir / (node + ".stdout.log");
  }
  std::filesystem::path node_stderr_log(const std::string &node) const {
    return dir / (node + ".stderr.log");
  }
};

/**
 * Create the output directory (and parents) if needed
 * @return empty error_code on success; std::errc::not_a_directory if the
 *         path exists as something other than a directory
 */
std::error_code CreateOutputDirectory(const std::filesystem::path &dir);

/**
 * Replace `path` with `data` so readers never see a partial file
 *
 * Writes a sibling temp file, fsyncs it and the directory, then renames it
 * over the target. Missing parent directories are created. On failure the
 * target is untouched and the temp file is removed.
 *
 * @return empty error_code on success, otherwise the failing step's errno
 */
std::error_code WriteFileAtomic(const std::filesystem::path &path,
                                const std::string &data);

} // namespace util
} // namespace lorasim
