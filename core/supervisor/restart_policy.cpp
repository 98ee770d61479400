#include "restart_policy.hpp"

namespace minekeeper {
namespace supervisor {

bool needs_cold_start(std::optional<std::chrono::steady_clock::time_point> last_start,
                      std::chrono::steady_clock::time_point now, std::chrono::steady_clock::duration threshold) {
    if (!last_start) {
        return true;
    }
    return (now - *last_start) < threshold;
}

HealthStatus classify_throughput(double value, double target) {
    if (value <= 0) {
        return HealthStatus::UNREACHABLE;
    }
    if (value < target) {
        return HealthStatus::BELOW_TARGET;
    }
    return HealthStatus::OK;
}

std::string health_status_to_string(HealthStatus status) {
    switch (status) {
        case HealthStatus::OK:
            return "OK";
        case HealthStatus::UNREACHABLE:
            return "UNREACHABLE";
        case HealthStatus::BELOW_TARGET:
            return "BELOW_TARGET";
        default:
            return "UNKNOWN";
    }
}

std::string restart_reason_to_string(RestartReason reason) {
    switch (reason) {
        case RestartReason::WORKER_EXITED:
            return "WORKER_EXITED";
        case RestartReason::LAUNCH_FAILED:
            return "LAUNCH_FAILED";
        case RestartReason::HEALTH_UNREACHABLE:
            return "HEALTH_UNREACHABLE";
        case RestartReason::BELOW_TARGET:
            return "BELOW_TARGET";
        case RestartReason::RUN_TIME_EXPIRED:
            return "RUN_TIME_EXPIRED";
        case RestartReason::SHUTDOWN_REQUESTED:
            return "SHUTDOWN_REQUESTED";
        default:
            return "UNKNOWN";
    }
}

}  // namespace supervisor
}  // namespace minekeeper
