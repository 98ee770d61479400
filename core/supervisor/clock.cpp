#include "clock.hpp"

#include <algorithm>
#include <thread>

#include "runtime/signal_handler.hpp"

namespace minekeeper {
namespace supervisor {

namespace {
constexpr auto kSleepSlice = std::chrono::milliseconds(100);
}

bool SystemClock::sleep_for(duration d) {
    const auto deadline = now() + d;
    while (true) {
        if (runtime::SignalHandler::is_shutdown_requested()) {
            return false;
        }
        const auto current = now();
        if (current >= deadline) {
            return true;
        }
        std::this_thread::sleep_for(std::min<duration>(deadline - current, kSleepSlice));
    }
}

}  // namespace supervisor
}  // namespace minekeeper
