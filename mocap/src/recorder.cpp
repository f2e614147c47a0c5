#include "mocap/recorder.hpp"
#include "mocap/bvh.hpp"
#include "mocap/error.hpp"
#include "mocap/log.hpp"
#include "mocap/rig.hpp"

#include <cstdio>

namespace mocap {

RecordingBuffer::RecordingBuffer(Skeleton rig) : rig_(std::move(rig)) {}

void RecordingBuffer::start_recording(double fps, TimePoint now) {
    if (!(fps > 0.0)) {
        throw MocapError(ErrorCode::ConfigError, "Recording fps must be positive, got " + std::to_string(fps));
    }
    frames_.clear();
    start_ = now;
    fps_ = fps;
    frame_time_ = 1.0 / fps;
    recording_ = true;
    MOCAP_LOG_INFO("[Recording] Started at " << fps << " FPS");
}

void RecordingBuffer::record_frame(const PoseFrame& frame, TimePoint now) {
    if (!recording_) {
        return;
    }
    RecordedFrame recorded;
    recorded.index = frames_.size();
    recorded.timestamp = seconds_between(start_, now);
    recorded.joints = frame.joints;
    frames_.push_back(std::move(recorded));
}

std::size_t RecordingBuffer::stop_recording() {
    recording_ = false;
    MOCAP_LOG_INFO("[Recording] Stopped. Total: " << frames_.size() << " frames, Duration: " << duration() << "s");
    return frames_.size();
}

void RecordingBuffer::clear() {
    frames_.clear();
    recording_ = false;
}

std::vector<std::string> RecordingBuffer::export_joints() const {
    std::vector<std::string> joints;
    if (frames_.empty()) {
        return joints;
    }
    const RecordedFrame& first = frames_.front();
    const std::string& root = rig::export_order().front();
    for (const auto& name : rig::export_order()) {
        auto id = rig_.find(name);
        const bool present = id && *id < first.joints.size() && first.joints[*id].present;
        if (present || name == root) {
            joints.push_back(name);
        }
    }
    return joints;
}

bool RecordingBuffer::export_bvh(const std::string& path) const {
    if (frames_.empty()) {
        MOCAP_LOG_ERROR("[Recording] No frames to export");
        return false;
    }
    return write_bvh(path, rig_, frames_, export_joints(), frame_time_);
}

std::string RecordingBuffer::status_text() const {
    if (frames_.empty() && !recording_) {
        return "No recording";
    }
    char buf[96];
    std::snprintf(buf, sizeof(buf), "%s: %zu frames (%.1fs)",
                  recording_ ? "Recording" : "Recorded", frames_.size(), duration());
    return buf;
}

} // namespace mocap
