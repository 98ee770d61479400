#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace minekeeper {
namespace process {

// Interface for CommandRunner to enable mocking
class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;

    // Start a shell command without waiting for it.
    // Returns false only if the command could not be started; its exit status is never checked.
    virtual bool dispatch(const std::string &command) = 0;

    // Collect dispatched commands that have finished. Never blocks.
    virtual void collect_finished() = 0;
};

// Runs cold start commands through the system shell (/bin/sh -c, or cmd /C on Windows)
class ShellCommandRunner : public ICommandRunner {
public:
    ShellCommandRunner() = default;
    ~ShellCommandRunner() override;

    bool dispatch(const std::string &command) override;
    void collect_finished() override;

    // Number of dispatched commands not yet seen to exit
    size_t pending() const { return pending_.size(); }

private:
    std::vector<int64_t> pending_;
};

}  // namespace process
}  // namespace minekeeper
