#pragma once

#include "mocap/clock.hpp"
#include "mocap/pose.hpp"
#include "mocap/skeleton.hpp"
#include <string>
#include <vector>

namespace mocap {

// Buffer of real-time frames captured between start and stop, exportable as BVH.
// Frames are indexed against the rig skeleton given at construction.
class RecordingBuffer {
public:
    explicit RecordingBuffer(Skeleton rig);

    // Clear the buffer and begin recording.
    // Throws MocapError(ConfigError) if fps is not positive.
    void start_recording(double fps, TimePoint now);

    // Append a copy of the frame; no-op unless recording
    void record_frame(const PoseFrame& frame, TimePoint now);

    // Stop recording and return the number of buffered frames
    std::size_t stop_recording();

    void clear();

    // Write the buffer as BVH. Exported joints are the rig joints present in
    // the first frame; the root is always exported.
    bool export_bvh(const std::string& path) const;

    // Joints export_bvh writes, in export-table order
    std::vector<std::string> export_joints() const;

    bool is_recording() const { return recording_; }
    std::size_t frame_count() const { return frames_.size(); }
    const RecordedFrame& frame(std::size_t i) const { return frames_.at(i); }
    const std::vector<RecordedFrame>& frames() const { return frames_; }
    double fps() const { return fps_; }
    double frame_time() const { return frame_time_; }
    double duration() const { return frames_.size() * frame_time_; }
    const Skeleton& rig() const { return rig_; }

    // "Recording: N frames (X.Xs)", "Recorded: N frames (X.Xs)" or "No recording"
    std::string status_text() const;

private:
    Skeleton rig_;
    std::vector<RecordedFrame> frames_;
    bool recording_ = false;
    TimePoint start_;
    double fps_ = 60.0;
    double frame_time_ = 1.0 / 60.0;
};

} // namespace mocap
