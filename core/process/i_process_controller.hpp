#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "supervisor/supervisor_config.hpp"

namespace minekeeper {
namespace process {

// Non-owning reference to a launched worker.
// The worker is a peer OS process: dropping the handle (or the supervisor)
// never terminates it. Only force_kill does.
struct WorkerHandle {
    int64_t pid = -1;
};

// Interface for ProcessController to enable mocking
class IProcessController {
public:
    virtual ~IProcessController() = default;

    // Start the worker detached from the supervisor.
    // Returns std::nullopt on failure (see last_error).
    virtual std::optional<WorkerHandle> launch(const supervisor::WorkerSpec &spec) = 0;

    // Non-blocking liveness check. Always false for a pid this controller did not launch.
    virtual bool is_alive(const WorkerHandle &handle) = 0;

    // Kill the worker and every descendant. Fire-and-forget, no-op if already dead.
    virtual void force_kill(const WorkerHandle &handle) = 0;

    virtual const std::string &last_error() const = 0;
};

}  // namespace process
}  // namespace minekeeper
