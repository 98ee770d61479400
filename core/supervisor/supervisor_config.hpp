#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace minekeeper {
namespace supervisor {

// The supervised executable. Started with no arguments.
struct WorkerSpec {
    std::string executable;   // Path to worker executable
    bool new_session = true;  // Detach into its own session / console

    // Parent directory of the executable, empty if the path has none.
    // The worker is started from here so it can resolve relative resources.
    std::string working_directory() const { return std::filesystem::path(executable).parent_path().string(); }
};

struct RestartPolicyConfig {
    double target_throughput = 0.0;          // Minimum acceptable throughput (worker units)
    int hot_restart_threshold_minutes = 5;   // Restarts sooner than this after a start go cold
    int max_run_time_minutes = 40;           // Forced cycle after this much run time
    int settle_minutes = 2;                  // Wait after launch before the first health check
    int poll_interval_seconds = 20;          // Delay between health checks
    int kill_grace_seconds = 5;              // Wait after kill before relaunch
    int cold_start_delay_seconds = 16;       // Sleep after each cold start command
    std::vector<std::string> cold_start_commands;  // Shell commands, run in order on cold start
};

}  // namespace supervisor
}  // namespace minekeeper
