#pragma once

#include <atomic>

namespace minekeeper {
namespace runtime {

// Turns SIGINT/SIGTERM into a flag polled by the supervision loop.
// The worker is not touched: it keeps running after the supervisor exits.
class SignalHandler {
public:
    static void install();
    static bool is_shutdown_requested();

    // Clear the flag (tests)
    static void reset();

private:
    static void handle_signal(int signal);
    static std::atomic<bool> shutdown_requested_;
};

}  // namespace runtime
}  // namespace minekeeper
