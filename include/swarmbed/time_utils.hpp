#pragma once

#include "swarmbed/common.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <thread>

namespace swarmbed {
namespace time {

// Monotonic clock; nothing here is ever compared to wall time
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = Clock::duration;
using Milliseconds = std::chrono::milliseconds;

TimePoint now();

template<typename Rep, typename Period>
inline uint64_t duration_to_milliseconds(const std::chrono::duration<Rep, Period>& duration) {
    return static_cast<uint64_t>(std::chrono::duration_cast<Milliseconds>(duration).count());
}

// Render a duration for log lines, e.g. "1000ms" or "unbounded"
std::string describe(const std::optional<Milliseconds>& duration);

// Timer for measuring elapsed time
class Timer {
public:
    Timer() : start_(now()) {}

    // Get elapsed time in milliseconds
    uint64_t elapsed_milliseconds() const {
        return duration_to_milliseconds(now() - start_);
    }

private:
    TimePoint start_;
};

// Timeout checker
class Timeout {
public:
    explicit Timeout(Milliseconds timeout)
        : timeout_(timeout)
        , start_(now()) {}

    // Check if timeout has expired
    bool expired() const {
        return (now() - start_) >= timeout_;
    }

private:
    Duration timeout_;
    TimePoint start_;
};

// Sleep utilities
inline void sleep_for(Milliseconds duration) {
    std::this_thread::sleep_for(duration);
}

inline void sleep_milliseconds(uint32_t milliseconds) {
    std::this_thread::sleep_for(Milliseconds(milliseconds));
}

} // namespace time
} // namespace swarmbed
