#include "process_controller.hpp"

#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>

#include "logging/logger.hpp"

#ifdef _WIN32
#include <windows.h>
#else
#include <errno.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cstring>
#endif

namespace minekeeper {
namespace process {

ProcessController::~ProcessController() {
#ifdef _WIN32
    // Release our references only; the workers keep running
    for (auto &entry : handles_) {
        CloseHandle(static_cast<HANDLE>(entry.second));
    }
#endif
}

std::optional<WorkerHandle> ProcessController::launch(const supervisor::WorkerSpec &spec) {
    LOG_INFO("[Process] Launching: " << spec.executable);

    if (!std::filesystem::exists(spec.executable)) {
        error_ = "Executable not found: " + spec.executable;
        LOG_ERROR("[Process] " << error_);
        return std::nullopt;
    }

#ifdef _WIN32
    return launch_windows(spec);
#else
    return launch_linux(spec);
#endif
}

#ifdef _WIN32
std::optional<WorkerHandle> ProcessController::launch_windows(const supervisor::WorkerSpec &spec) {
    STARTUPINFOA si = {};
    si.cb = sizeof(si);
    PROCESS_INFORMATION pi = {};

    std::string abs_path = std::filesystem::absolute(spec.executable).string();
    std::string cmdline = "\"" + abs_path + "\"";
    std::vector<char> cmdline_buf(cmdline.begin(), cmdline.end());
    cmdline_buf.push_back('\0');

    std::string working_dir = spec.working_directory();
    if (!working_dir.empty()) {
        working_dir = std::filesystem::absolute(working_dir).string();
    }

    DWORD flags = spec.new_session ? CREATE_NEW_CONSOLE : 0;

    BOOL success = CreateProcessA(NULL,                // lpApplicationName
                                  cmdline_buf.data(),  // lpCommandLine (mutable)
                                  NULL,                // lpProcessAttributes
                                  NULL,                // lpThreadAttributes
                                  FALSE,               // bInheritHandles
                                  flags,               // dwCreationFlags
                                  NULL,                // lpEnvironment
                                  working_dir.empty() ? NULL : working_dir.c_str(),
                                  &si,  // lpStartupInfo
                                  &pi   // lpProcessInformation
    );

    if (!success) {
        error_ = "CreateProcess failed: " + std::to_string(GetLastError());
        LOG_ERROR("[Process] " << error_);
        return std::nullopt;
    }

    CloseHandle(pi.hThread);

    WorkerHandle handle;
    handle.pid = static_cast<int64_t>(pi.dwProcessId);
    handles_[handle.pid] = pi.hProcess;

    LOG_INFO("[Process] Worker started in new console (PID=" << handle.pid << ")");
    return handle;
}

bool ProcessController::is_alive(const WorkerHandle &handle) {
    // Only processes we launched and still hold a handle to can be alive.
    // A bare pid may already belong to an unrelated process.
    auto it = handles_.find(handle.pid);
    if (it == handles_.end()) return false;

    HANDLE process = static_cast<HANDLE>(it->second);
    DWORD exit_code = 0;
    if (GetExitCodeProcess(process, &exit_code) && exit_code == STILL_ACTIVE) {
        return true;
    }

    LOG_INFO("[Process] Worker PID=" << handle.pid << " exited with code " << exit_code);
    CloseHandle(process);
    handles_.erase(it);
    return false;
}

void ProcessController::kill_tree(int64_t pid) {
    // TASKKILL /T walks the child tree for us
    std::string cmdline = "TASKKILL /F /PID " + std::to_string(pid) + " /T";
    std::vector<char> cmdline_buf(cmdline.begin(), cmdline.end());
    cmdline_buf.push_back('\0');

    STARTUPINFOA si = {};
    si.cb = sizeof(si);
    PROCESS_INFORMATION pi = {};

    if (!CreateProcessA(NULL, cmdline_buf.data(), NULL, NULL, FALSE, CREATE_NO_WINDOW, NULL, NULL, &si, &pi)) {
        LOG_WARN("[Process] Failed to dispatch TASKKILL: " << GetLastError());
        return;
    }
    CloseHandle(pi.hThread);
    CloseHandle(pi.hProcess);
}
#else
std::optional<WorkerHandle> ProcessController::launch_linux(const supervisor::WorkerSpec &spec) {
    // Resolve everything before fork; the child only makes raw syscalls
    const std::string abs_path = std::filesystem::absolute(spec.executable).string();
    std::string working_dir = spec.working_directory();
    if (!working_dir.empty()) {
        working_dir = std::filesystem::absolute(working_dir).string();
    }

    pid_t pid = fork();
    if (pid < 0) {
        error_ = std::string("Fork failed: ") + std::strerror(errno);
        LOG_ERROR("[Process] " << error_);
        return std::nullopt;
    }

    if (pid == 0) {
        // Child process
        // New session: the worker no longer shares our terminal or process group,
        // so Ctrl+C on the supervisor does not reach it
        if (spec.new_session) {
            setsid();
        }

        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
            _exit(127);
        }

        execl(abs_path.c_str(), abs_path.c_str(), static_cast<char *>(nullptr));

        // If we get here, exec failed
        _exit(127);
    }

    reaped_.erase(pid);

    WorkerHandle handle;
    handle.pid = pid;

    LOG_INFO("[Process] Worker started in new session (PID=" << pid << ", cwd="
                                                             << (working_dir.empty() ? "." : working_dir) << ")");
    return handle;
}

bool ProcessController::is_alive(const WorkerHandle &handle) {
    if (handle.pid <= 0) return false;
    if (reaped_.count(handle.pid) > 0) return false;

    const pid_t pid = static_cast<pid_t>(handle.pid);

    while (true) {
        int status = 0;
        pid_t result = waitpid(pid, &status, WNOHANG);
        if (result == 0) {
            return true;  // Still running
        }
        if (result == pid) {
            reaped_.insert(handle.pid);
            if (WIFEXITED(status)) {
                LOG_INFO("[Process] Worker PID=" << pid << " exited with code " << WEXITSTATUS(status));
            } else if (WIFSIGNALED(status)) {
                LOG_INFO("[Process] Worker PID=" << pid << " terminated by signal " << WTERMSIG(status));
            }
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        // ECHILD: not a child of ours, so the pid may belong to anyone
        return false;
    }
}

std::vector<int64_t> list_descendants(int64_t root) {
    std::multimap<int64_t, int64_t> children;

    std::error_code ec;
    for (const auto &entry : std::filesystem::directory_iterator("/proc", ec)) {
        const std::string name = entry.path().filename().string();
        if (name.empty() || name.find_first_not_of("0123456789") != std::string::npos) {
            continue;
        }

        std::ifstream stat_file(entry.path() / "stat");
        std::string stat;
        if (!std::getline(stat_file, stat)) {
            continue;  // Process vanished between listing and reading
        }

        // Format: pid (comm) state ppid ...; comm may contain spaces and parens
        auto comm_end = stat.rfind(')');
        if (comm_end == std::string::npos) {
            continue;
        }
        std::istringstream fields(stat.substr(comm_end + 1));
        char state = 0;
        int64_t ppid = 0;
        if (!(fields >> state >> ppid)) {
            continue;
        }
        children.emplace(ppid, std::stoll(name));
    }

    std::vector<int64_t> result;
    std::vector<int64_t> frontier{root};
    while (!frontier.empty()) {
        int64_t parent = frontier.back();
        frontier.pop_back();
        auto range = children.equal_range(parent);
        for (auto it = range.first; it != range.second; ++it) {
            result.push_back(it->second);
            frontier.push_back(it->second);
        }
    }
    return result;
}

void ProcessController::kill_tree(int64_t pid) {
    // Snapshot descendants first: once the parent dies they are re-parented
    // and no longer reachable through /proc parent links
    auto descendants = list_descendants(pid);

    if (getpgid(static_cast<pid_t>(pid)) == static_cast<pid_t>(pid)) {
        killpg(static_cast<pid_t>(pid), SIGKILL);
    }
    if (kill(static_cast<pid_t>(pid), SIGKILL) != 0 && errno != ESRCH) {
        LOG_WARN("[Process] kill(" << pid << ") failed: " << std::strerror(errno));
    }

    for (int64_t child : descendants) {
        // Helpers that called setsid() themselves escape the group kill above
        if (kill(static_cast<pid_t>(child), SIGKILL) != 0 && errno != ESRCH) {
            LOG_DEBUG("[Process] kill(" << child << ") failed: " << std::strerror(errno));
        }
    }

    LOG_DEBUG("[Process] Sent SIGKILL to PID=" << pid << " and " << descendants.size() << " descendant(s)");
}
#endif

void ProcessController::force_kill(const WorkerHandle &handle) {
    if (!is_alive(handle)) {
        LOG_DEBUG("[Process] Worker PID=" << handle.pid << " already gone, nothing to kill");
        return;
    }

    LOG_INFO("[Process] Killing worker PID=" << handle.pid << " and its descendants");
    kill_tree(handle.pid);
}

}  // namespace process
}  // namespace minekeeper
