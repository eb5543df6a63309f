// include/signal_ngin/core/clock.hpp
#pragma once

#include <atomic>
#include <chrono>
#include "signal_ngin/core/types.hpp"

namespace signal_ngin {

/**
 * @brief Source of wall-clock time for the tick loop
 */
class Clock {
public:
    virtual ~Clock() = default;

    virtual Timestamp now() const = 0;

    /**
     * @brief Block until the deadline passes or stop becomes true
     * @return false if woken by stop before the deadline
     */
    virtual bool sleep_until(Timestamp deadline, const std::atomic<bool>& stop) = 0;
};

/**
 * @brief Real-time clock
 *
 * Sleeps in short slices so that a flag set from a signal handler is noticed promptly.
 */
class SystemClock : public Clock {
public:
    explicit SystemClock(std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100))
        : poll_interval_(poll_interval) {}

    Timestamp now() const override {
        return std::chrono::system_clock::now();
    }

    bool sleep_until(Timestamp deadline, const std::atomic<bool>& stop) override;

private:
    std::chrono::milliseconds poll_interval_;
};

}  // namespace signal_ngin
