#pragma once

#include <chrono>

namespace mocap {

// Monotonic clock for every capture-side timer.
// Time is passed into state machines explicitly so tests can drive it.
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

inline double seconds_between(TimePoint from, TimePoint to) {
    return std::chrono::duration<double>(to - from).count();
}

inline TimePoint advance(TimePoint t, double seconds) {
    return t + std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(seconds));
}

} // namespace mocap
