#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

#include "clock.hpp"
#include "health/i_health_prober.hpp"
#include "process/command_runner.hpp"
#include "process/i_process_controller.hpp"
#include "restart_policy.hpp"
#include "runtime/config.hpp"

namespace minekeeper {
namespace supervisor {

// Mutable state of one supervisor session. Owned by the supervisor thread only.
struct SupervisionState {
    std::optional<process::WorkerHandle> current;  // Replaced on every cycle, never shared
    std::optional<Clock::time_point> last_start;   // nullopt until the first launch
    int start_count = 0;
    std::optional<RestartReason> last_reason;
};

// Outcome of one STARTING -> SETTLING -> MONITORING -> STOPPING pass
struct CycleReport {
    bool cold_start = false;
    int64_t pid = -1;  // -1 if launch failed
    RestartReason reason = RestartReason::RUN_TIME_EXPIRED;
    bool killed = false;
    int health_checks = 0;
    std::optional<double> last_throughput;
};

// Supervisor keeps exactly one worker running
// - Cold vs hot restart from the time since the previous start
// - Settle delay, then periodic liveness + throughput checks
// - Kill (with descendants) on under-performance, failed checks or max run time
class Supervisor {
public:
    Supervisor(const runtime::KeeperConfig &config, process::IProcessController &controller,
               health::IHealthProber &prober, process::ICommandRunner &commands, Clock &clock);

    Supervisor(const Supervisor &) = delete;
    Supervisor &operator=(const Supervisor &) = delete;

    // Run cycles until a shutdown is requested (blocking)
    void run();

    // One full cycle. Blocking for settle + monitoring time.
    CycleReport run_cycle();

    const SupervisionState &state() const { return state_; }

private:
    // Dispatch every cold start command, sleeping after each.
    // Returns false if interrupted by shutdown.
    bool run_cold_start_sequence();

    RestartReason monitor(const process::WorkerHandle &handle, CycleReport &report);

    void stop(const process::WorkerHandle &handle, CycleReport &report);

    const runtime::KeeperConfig &config_;  // Must outlive the supervisor
    process::IProcessController &controller_;
    health::IHealthProber &prober_;
    process::ICommandRunner &commands_;
    Clock &clock_;

    SupervisionState state_;
};

}  // namespace supervisor
}  // namespace minekeeper
