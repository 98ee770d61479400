#pragma once

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "i_process_controller.hpp"

namespace minekeeper {
namespace process {

// ProcessController owns the OS-specific worker lifecycle
// Responsibilities:
// - Spawn the worker in its own session/console, from its own directory
// - Poll liveness without blocking (reaping exited children)
// - Tree-kill the worker and its helper subprocesses
class ProcessController : public IProcessController {
public:
    ProcessController() = default;

    // Does not kill a running worker; see WorkerHandle
    ~ProcessController() override;

    ProcessController(const ProcessController &) = delete;
    ProcessController &operator=(const ProcessController &) = delete;

    std::optional<WorkerHandle> launch(const supervisor::WorkerSpec &spec) override;
    bool is_alive(const WorkerHandle &handle) override;
    void force_kill(const WorkerHandle &handle) override;

    const std::string &last_error() const override { return error_; }

private:
    std::string error_;

#ifdef _WIN32
    // Process handles of launched workers, keyed by pid. Holding the handle
    // keeps the pid from being reused while we still refer to it.
    std::unordered_map<int64_t, void *> handles_;  // HANDLE
#else
    // Pids we already reaped; the OS may hand the number to an unrelated process
    std::unordered_set<int64_t> reaped_;
#endif

    std::optional<WorkerHandle> launch_windows(const supervisor::WorkerSpec &spec);
    std::optional<WorkerHandle> launch_linux(const supervisor::WorkerSpec &spec);
    void kill_tree(int64_t pid);
};

#ifndef _WIN32
// All transitive children of root, from /proc parent links.
// Children are listed before their own children.
std::vector<int64_t> list_descendants(int64_t root);
#endif

}  // namespace process
}  // namespace minekeeper
