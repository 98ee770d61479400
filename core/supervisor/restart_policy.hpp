#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace minekeeper {
namespace supervisor {

enum class HealthStatus {
    OK,            // Throughput at or above target
    UNREACHABLE,   // Probe failed (value <= 0)
    BELOW_TARGET   // 0 < value < target
};

// Why a run ended
enum class RestartReason {
    WORKER_EXITED,
    LAUNCH_FAILED,
    HEALTH_UNREACHABLE,
    BELOW_TARGET,
    RUN_TIME_EXPIRED,
    SHUTDOWN_REQUESTED
};

// A restart is cold (environment reset first) when there was no previous start in
// this session, or the previous start was less than threshold ago. Exactly
// threshold counts as hot.
bool needs_cold_start(std::optional<std::chrono::steady_clock::time_point> last_start,
                      std::chrono::steady_clock::time_point now, std::chrono::steady_clock::duration threshold);

HealthStatus classify_throughput(double value, double target);

std::string health_status_to_string(HealthStatus status);
std::string restart_reason_to_string(RestartReason reason);

}  // namespace supervisor
}  // namespace minekeeper
