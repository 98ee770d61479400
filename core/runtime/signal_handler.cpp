#include "signal_handler.hpp"

#include <csignal>

#ifndef _WIN32
#include <signal.h>
#endif

namespace minekeeper {
namespace runtime {

std::atomic<bool> SignalHandler::shutdown_requested_{false};

void SignalHandler::install() {
#ifdef _WIN32
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
    std::signal(SIGBREAK, handle_signal);  // Ctrl+Break in the console
#else
    // No SA_RESTART: a blocking call in the loop should return early on Ctrl+C
    struct sigaction action {};
    action.sa_handler = handle_signal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
#endif
}

bool SignalHandler::is_shutdown_requested() { return shutdown_requested_.load(); }

void SignalHandler::reset() { shutdown_requested_.store(false); }

void SignalHandler::handle_signal(int) {
    // Only the flag is touched here; logging happens on the supervisor thread
    shutdown_requested_.store(true);
}

}  // namespace runtime
}  // namespace minekeeper
