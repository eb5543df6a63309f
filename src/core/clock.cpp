// src/core/clock.cpp

#include "signal_ngin/core/clock.hpp"
#include <algorithm>
#include <thread>

namespace signal_ngin {

bool SystemClock::sleep_until(Timestamp deadline, const std::atomic<bool>& stop) {
    while (!stop.load(std::memory_order_acquire)) {
        auto current = now();
        if (current >= deadline) {
            return true;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - current);
        std::this_thread::sleep_for(std::min(remaining + std::chrono::milliseconds(1),
                                             poll_interval_));
    }
    return false;
}

}  // namespace signal_ngin
