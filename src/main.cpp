// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "application.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"
#include "version.hpp"
#include <csignal>
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <limits>

namespace {

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " --input=<timeline> [options]\n"
      << "\n"
      << "Simulation:\n"
      << "  --input=<path>       Timeline file: <ts>,<dest|-1>,<payload> per line (required)\n"
      << "  --nodes=<n1,n2,...>  Node names (default: ND01,ND02,ND03,ND04)\n"
      << "  --node-exe=<path>    Node program (default: ./network_simulator)\n"
      << "  --outdir=<path>      Directory for log files (default: .)\n"
      << "  --duration=<secs>    Stop after this many seconds (default: until ESC or Ctrl+C)\n"
      << "  --until-timeline-end Stop once every timeline event has been applied\n"
      << "  --spawn-offsets=<o1,o2,...>\n"
      << "                       Per-node spawn offsets in seconds, one per node\n"
      << "  --spawn-max=<secs>   Upper bound of random spawn offsets (default: 5.0)\n"
      << "  --seed=<n>           Seed for random spawn offsets (default: 0)\n"
      << "  --query-timeout=<secs>\n"
      << "                       Final get_state deadline per node (default: 1.0)\n"
      << "  --probe-timeout=<secs>\n"
      << "                       get_state deadline after each forward, 0 disables (default: 0.2)\n"
      << "  --quiet              Do not mirror the event log to stdout\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: info\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: node, router, scheduler, app, all\n"
      << "                       Can be comma-separated: --debug=node,router\n"
      << "  --verbose            Equivalent to --loglevel=debug\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

std::optional<double> ParseSeconds(const std::string &value) {
  return lorasim::util::SafeParseDouble(value, 0.0, lorasim::util::MAX_SIM_SECONDS);
}

} // namespace

int main(int argc, char *argv[]) {
  using namespace lorasim;

  try {
    // Parse command line arguments
    app::AppConfig config;
    std::string log_level = "info";
    std::vector<std::string> debug_components;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << GetFullVersionString() << std::endl;
        std::cout << GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--input=") == 0) {
        config.input = arg.substr(8);
      } else if (arg.find("--nodes=") == 0) {
        config.nodes = util::SplitFields(arg.substr(8), ',');
      } else if (arg.find("--node-exe=") == 0) {
        config.node_executable = arg.substr(11);
      } else if (arg.find("--outdir=") == 0) {
        config.outdir = arg.substr(9);
      } else if (arg.find("--duration=") == 0) {
        auto secs = ParseSeconds(arg.substr(11));
        if (!secs) {
          std::cerr << "Error: Invalid duration: " << arg.substr(11) << std::endl;
          return 1;
        }
        config.duration = *secs;
      } else if (arg == "--until-timeline-end") {
        config.until_timeline_end = true;
      } else if (arg.find("--spawn-offsets=") == 0) {
        config.spawn_offsets.clear();
        for (const auto &field : util::SplitFields(arg.substr(16), ',')) {
          auto offset = ParseSeconds(util::Trim(field));
          if (!offset) {
            std::cerr << "Error: Invalid spawn offset: " << field << std::endl;
            std::cerr << "Offsets must be non-negative numbers of seconds" << std::endl;
            return 1;
          }
          config.spawn_offsets.push_back(*offset);
        }
      } else if (arg.find("--spawn-max=") == 0) {
        auto secs = ParseSeconds(arg.substr(12));
        if (!secs) {
          std::cerr << "Error: Invalid spawn max: " << arg.substr(12) << std::endl;
          return 1;
        }
        config.spawn_max = *secs;
      } else if (arg.find("--seed=") == 0) {
        auto seed = util::SafeParseInt64(arg.substr(7), 0,
                                         std::numeric_limits<uint32_t>::max());
        if (!seed) {
          std::cerr << "Error: Invalid seed: " << arg.substr(7) << std::endl;
          return 1;
        }
        config.seed = static_cast<uint32_t>(*seed);
      } else if (arg.find("--query-timeout=") == 0) {
        auto secs = ParseSeconds(arg.substr(16));
        if (!secs) {
          std::cerr << "Error: Invalid query timeout: " << arg.substr(16) << std::endl;
          return 1;
        }
        config.query_timeout = *secs;
      } else if (arg.find("--probe-timeout=") == 0) {
        auto secs = ParseSeconds(arg.substr(16));
        if (!secs) {
          std::cerr << "Error: Invalid probe timeout: " << arg.substr(16) << std::endl;
          return 1;
        }
        config.probe_timeout = *secs;
      } else if (arg == "--quiet") {
        config.quiet = true;
      } else if (arg == "--verbose") {
        log_level = "debug";
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--debug=") == 0) {
        // Comma-separated components: --debug=node,router
        for (const auto &component : util::SplitFields(arg.substr(8), ',')) {
          if (!component.empty()) {
            debug_components.push_back(component);
          }
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    if (config.input.empty()) {
      std::cerr << "Error: --input is required" << std::endl;
      print_usage(argv[0]);
      return 1;
    }

    // Node pipes may close under us; write errors are handled as EPIPE
    std::signal(SIGPIPE, SIG_IGN);

    // Ensure outdir exists before initializing file logger
    if (auto ec = util::CreateOutputDirectory(config.outdir)) {
      std::cerr << "Error: Cannot create output directory " << config.outdir.string()
                << ": " << ec.message() << std::endl;
      return 1;
    }
    std::string log_file = util::OutputLayout{config.outdir}.orchestrator_log().string();
    util::LogManager::Initialize(log_level, true, log_file);

    // Apply component-specific debug levels
    for (const auto &component : debug_components) {
      if (component == "all") {
        util::LogManager::SetLogLevel("trace");
      } else if (component == "sched") {
        util::LogManager::SetComponentLevel("scheduler", "trace");
      } else {
        util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    // IMPORTANT: Use nested scope to ensure app destructor runs before LogManager::Shutdown()
    // Node reader threads log until the app has terminated them
    int exit_code = 0;
    {
      app::Application app(config);

      if (!app.initialize()) {
        LOG_ERROR("Failed to initialize simulation");
        exit_code = 1;
      } else if (!app.start()) {
        LOG_ERROR("Failed to start simulation");
        exit_code = 1;
      } else {
        // Run until a stop condition fires, then drain and terminate
        app.wait_for_shutdown();
      }
    }

    // Shutdown logging AFTER app is fully destroyed
    util::LogManager::Shutdown();

    return exit_code;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    lorasim::util::LogManager::Shutdown();
    return 1;
  }
}
