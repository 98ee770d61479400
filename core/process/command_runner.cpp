#include "command_runner.hpp"

#include <algorithm>

#include "logging/logger.hpp"

#ifdef _WIN32
#include <windows.h>
#else
#include <errno.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cstring>
#endif

namespace minekeeper {
namespace process {

// Still-running commands are left alone; only finished ones are collected
ShellCommandRunner::~ShellCommandRunner() { collect_finished(); }

#ifdef _WIN32
bool ShellCommandRunner::dispatch(const std::string &command) {
    std::string cmdline = "cmd /C " + command;
    std::vector<char> cmdline_buf(cmdline.begin(), cmdline.end());
    cmdline_buf.push_back('\0');

    STARTUPINFOA si = {};
    si.cb = sizeof(si);
    PROCESS_INFORMATION pi = {};

    if (!CreateProcessA(NULL, cmdline_buf.data(), NULL, NULL, FALSE, 0, NULL, NULL, &si, &pi)) {
        LOG_ERROR("[Command] Failed to start '" << command << "': " << GetLastError());
        return false;
    }

    CloseHandle(pi.hThread);
    CloseHandle(pi.hProcess);
    LOG_DEBUG("[Command] Dispatched (PID=" << pi.dwProcessId << ")");
    return true;
}

void ShellCommandRunner::collect_finished() {}
#else
bool ShellCommandRunner::dispatch(const std::string &command) {
    collect_finished();

    pid_t pid = fork();
    if (pid < 0) {
        LOG_ERROR("[Command] Fork failed for '" << command << "': " << std::strerror(errno));
        return false;
    }

    if (pid == 0) {
        execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char *>(nullptr));
        _exit(127);
    }

    pending_.push_back(pid);
    LOG_DEBUG("[Command] Dispatched (PID=" << pid << ")");
    return true;
}

void ShellCommandRunner::collect_finished() {
    // Reap so finished commands do not linger as zombies
    auto finished = [](int64_t pid) {
        int status = 0;
        pid_t result = waitpid(static_cast<pid_t>(pid), &status, WNOHANG);
        if (result == static_cast<pid_t>(pid)) {
            if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
                LOG_DEBUG("[Command] PID=" << pid << " exited with code " << WEXITSTATUS(status));
            }
            return true;
        }
        return result < 0 && errno == ECHILD;
    };
    pending_.erase(std::remove_if(pending_.begin(), pending_.end(), finished), pending_.end());
}
#endif

}  // namespace process
}  // namespace minekeeper
