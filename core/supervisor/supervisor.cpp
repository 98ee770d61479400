#include "supervisor.hpp"

#include "logging/logger.hpp"
#include "runtime/signal_handler.hpp"

namespace minekeeper {
namespace supervisor {

namespace {

std::chrono::minutes minutes(int value) { return std::chrono::minutes(value); }
std::chrono::seconds seconds(int value) { return std::chrono::seconds(value); }

}  // namespace

Supervisor::Supervisor(const runtime::KeeperConfig &config, process::IProcessController &controller,
                       health::IHealthProber &prober, process::ICommandRunner &commands, Clock &clock)
    : config_(config), controller_(controller), prober_(prober), commands_(commands), clock_(clock) {}

void Supervisor::run() {
    LOG_INFO("[Supervisor] Supervising " << config_.worker.executable);

    while (!runtime::SignalHandler::is_shutdown_requested()) {
        CycleReport report = run_cycle();
        if (report.reason == RestartReason::SHUTDOWN_REQUESTED) {
            break;
        }
    }

    if (state_.current) {
        // Deliberate: the worker outlives the supervisor
        LOG_INFO("[Supervisor] Exiting; worker PID=" << state_.current->pid << " left running");
    } else {
        LOG_INFO("[Supervisor] Exiting");
    }
}

CycleReport Supervisor::run_cycle() {
    CycleReport report;
    const auto &policy = config_.policy;

    // STARTING
    const auto threshold = minutes(policy.hot_restart_threshold_minutes);
    report.cold_start = needs_cold_start(state_.last_start, clock_.now(), threshold);

    if (!state_.last_start) {
        LOG_INFO("[Supervisor] First start in current session, running cold start commands");
    } else if (report.cold_start) {
        LOG_INFO("[Supervisor] Last start was less than " << policy.hot_restart_threshold_minutes
                                                          << " minutes ago, running cold start commands");
    } else {
        LOG_INFO("[Supervisor] Hot restarting worker");
    }

    if (report.cold_start && !run_cold_start_sequence()) {
        report.reason = RestartReason::SHUTDOWN_REQUESTED;
        state_.last_reason = report.reason;
        return report;
    }

    LOG_INFO("[Supervisor] Running worker for up to " << policy.max_run_time_minutes << " minutes");
    auto handle = controller_.launch(config_.worker);
    state_.last_start = clock_.now();
    state_.start_count++;

    if (!handle) {
        LOG_ERROR("[Supervisor] Launch failed: " << controller_.last_error());
        state_.current.reset();
        report.reason = RestartReason::LAUNCH_FAILED;
        state_.last_reason = report.reason;
        // Avoid a tight relaunch loop when there are no cold commands to pace it
        if (!clock_.sleep_for(seconds(policy.kill_grace_seconds))) {
            report.reason = RestartReason::SHUTDOWN_REQUESTED;
        }
        return report;
    }

    state_.current = *handle;
    report.pid = handle->pid;
    LOG_INFO("[Supervisor] Worker started (PID=" << handle->pid << ", start #" << state_.start_count << ")");

    // SETTLING
    LOG_INFO("[Supervisor] Sleeping " << policy.settle_minutes << " minutes to stabilize throughput before checks");
    if (!clock_.sleep_for(minutes(policy.settle_minutes))) {
        report.reason = RestartReason::SHUTDOWN_REQUESTED;
        state_.last_reason = report.reason;
        return report;
    }

    // MONITORING
    report.reason = monitor(*handle, report);
    state_.last_reason = report.reason;
    if (report.reason == RestartReason::SHUTDOWN_REQUESTED) {
        return report;
    }

    // STOPPING
    stop(*handle, report);
    return report;
}

bool Supervisor::run_cold_start_sequence() {
    const auto &policy = config_.policy;
    for (const auto &command : policy.cold_start_commands) {
        LOG_INFO("[Supervisor] Running: \"" << command << "\"");
        if (!commands_.dispatch(command)) {
            LOG_ERROR("[Supervisor] Could not start cold start command, continuing");
        }
        if (!clock_.sleep_for(seconds(policy.cold_start_delay_seconds))) {
            return false;
        }
    }
    return true;
}

RestartReason Supervisor::monitor(const process::WorkerHandle &handle, CycleReport &report) {
    const auto &policy = config_.policy;
    const auto max_run_time = minutes(policy.max_run_time_minutes);
    const auto started = *state_.last_start;

    bool healthy = true;
    RestartReason reason = RestartReason::RUN_TIME_EXPIRED;

    while (clock_.now() - started < max_run_time && healthy) {
        if (!clock_.sleep_for(seconds(policy.poll_interval_seconds))) {
            return RestartReason::SHUTDOWN_REQUESTED;
        }
        commands_.collect_finished();

        if (!controller_.is_alive(handle)) {
            LOG_WARN("[Supervisor] Worker process is dead, restarting");
            return RestartReason::WORKER_EXITED;
        }

        const double throughput = prober_.probe(config_.health);
        report.health_checks++;
        report.last_throughput = throughput;

        switch (classify_throughput(throughput, policy.target_throughput)) {
            case HealthStatus::UNREACHABLE:
                LOG_ERROR("[Supervisor] Could not read worker throughput, restarting");
                reason = RestartReason::HEALTH_UNREACHABLE;
                healthy = false;
                break;
            case HealthStatus::BELOW_TARGET:
                LOG_ERROR("[Supervisor] Throughput " << throughput << " is below target " << policy.target_throughput
                                                     << ", restarting");
                reason = RestartReason::BELOW_TARGET;
                healthy = false;
                break;
            case HealthStatus::OK:
                LOG_INFO("[Supervisor] [OK] Throughput " << throughput << " meets target " << policy.target_throughput);
                break;
        }
    }

    if (healthy) {
        LOG_INFO("[Supervisor] Max run time of " << policy.max_run_time_minutes << " minutes reached, cycling worker");
    }
    return reason;
}

void Supervisor::stop(const process::WorkerHandle &handle, CycleReport &report) {
    if (controller_.is_alive(handle)) {
        LOG_INFO("[Supervisor] Killing worker PID=" << handle.pid);
        controller_.force_kill(handle);
        report.killed = true;

        LOG_INFO("[Supervisor] Waiting " << config_.policy.kill_grace_seconds << "s for the worker to exit");
        if (!clock_.sleep_for(seconds(config_.policy.kill_grace_seconds))) {
            report.reason = RestartReason::SHUTDOWN_REQUESTED;
            state_.last_reason = report.reason;
            state_.current.reset();
            return;
        }

        if (controller_.is_alive(handle)) {
            LOG_WARN("[Supervisor] Worker PID=" << handle.pid << " still alive after grace period");
        }
    }

    state_.current.reset();
}

}  // namespace supervisor
}  // namespace minekeeper
