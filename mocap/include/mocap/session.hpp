#pragma once

#include "mocap/capture.hpp"
#include "mocap/config.hpp"
#include "mocap/frame_slot.hpp"
#include "mocap/recorder.hpp"
#include "mocap/source.hpp"
#include "mocap/stream_monitor.hpp"
#include <mutex>
#include <string>
#include <vector>

namespace mocap {

// Live capture pipeline around one source.
// Device sources run through the capture state machine; broadcast sources
// through the stream monitor. Frames land in the latest-frame slot and, while
// recording and ready to record, in the recording buffer.
//
// Public operations may be called from different threads: the session lock
// covers the source, the state machine, the monitor and the recorder. The
// machine(), monitor() and recorder() references bypass the lock and are for
// the polling thread only.
class CaptureSession {
public:
    CaptureSession(CaptureSource& source, const Config& config);

    // Open the source. Device sources then request start-capture.
    bool connect(TimePoint now);

    // Drain source events, publish the newest frame, record it, check timeouts
    void poll(TimePoint now);

    bool start_calibration(TimePoint now);

    // Start recording when ready, or stop a running recording.
    // Returns false if a start was refused.
    bool toggle_recording(double fps, TimePoint now);
    bool toggle_recording(TimePoint now) { return toggle_recording(config_.record_fps, now); }

    // Stop recording, stop capture if possible, close the source, reset state
    void disconnect();

    bool is_device() const { return source_.supports_commands(); }
    bool is_ready_for_record() const;
    bool is_recording() const;

    bool latest_frame(PoseFrame& out) const { return slot_.read(out); }
    std::uint64_t frames_received() const { return slot_.sequence(); }
    double fps() const;

    // One-line status for display
    std::string status_text() const;

    const CaptureStateMachine& machine() const { return machine_; }
    const StreamMonitor& monitor() const { return monitor_; }
    const RecordingBuffer& recorder() const { return recorder_; }
    const Skeleton& rig() const { return recorder_.rig(); }

    // Export the recording as BVH
    bool export_bvh(const std::string& path) const;

private:
    // Callers hold mutex_
    bool dispatch(Command command);
    void handle(const CaptureEvent& event, TimePoint now);
    bool ready_for_record_locked() const;
    std::string status_text_locked() const;

    CaptureSource& source_;
    Config config_;
    CaptureStateMachine machine_;
    StreamMonitor monitor_;
    FrameRateMeter meter_;
    LatestFrameSlot slot_;
    RecordingBuffer recorder_;
    std::vector<CaptureEvent> events_;
    mutable std::mutex mutex_;
};

} // namespace mocap
