#pragma once

#include "mocap/pose.hpp"
#include <cstdint>
#include <mutex>

namespace mocap {

// Newest real-time frame, written by the polling side and read by consumers.
// Intermediate frames are overwritten; the lock is held only for the copy.
class LatestFrameSlot {
public:
    void publish(const PoseFrame& frame) {
        std::lock_guard<std::mutex> lock(mutex_);
        frame_ = frame;
        ++sequence_;
    }

    // Copy the newest frame into out; false if nothing was published yet
    bool read(PoseFrame& out) const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sequence_ == 0) return false;
        out = frame_;
        return true;
    }

    // Number of frames published since the last clear
    std::uint64_t sequence() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sequence_;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        frame_ = PoseFrame();
        sequence_ = 0;
    }

private:
    mutable std::mutex mutex_;
    PoseFrame frame_;
    std::uint64_t sequence_ = 0;
};

} // namespace mocap
