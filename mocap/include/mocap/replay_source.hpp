#pragma once

#include "mocap/bvh.hpp"
#include "mocap/source.hpp"
#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace mocap {

struct ReplayOptions {
    bool broadcast = false;          // stream without commands, like a UDP BVH broadcast
    bool loop = false;               // restart at the first frame when exhausted
    int reply_latency_polls = 1;     // polls before a command's first reply
    bool fail_calibration = false;   // answer Calibrate with a non-zero result
    bool refuse_commands = false;    // issue() returns false
    bool fail_open = false;          // open() fails
};

// Capture source that replays a parsed BVH motion as real-time frames.
// Each poll yields at most one frame; the caller paces polls at the motion's
// frame time. Device mode streams only between StartCapture and StopCapture
// and answers commands with scripted replies.
class ReplaySource : public CaptureSource {
public:
    ReplaySource(BvhMotion motion, const Skeleton& rig, ReplayOptions options = ReplayOptions());

    bool open(std::string& message) override;
    void close() override;
    void poll(std::vector<CaptureEvent>& events) override;
    bool issue(Command command) override;
    bool supports_commands() const override { return !options_.broadcast; }
    std::string name() const override;

    // Restart at the first frame
    void rewind() { cursor_ = 0; emitted_ = 0; }
    void set_loop(bool loop) { options_.loop = loop; }

    // Push an error event into the next poll
    void inject_error(const std::string& message);

    // Real-time frame for motion frame i
    PoseFrame frame_at(std::size_t i) const;

    double frame_time() const { return motion_.frame_time; }
    std::size_t frame_count() const { return motion_.frame_count(); }
    std::size_t frames_emitted() const { return emitted_; }
    bool is_open() const { return open_; }
    bool is_streaming() const { return streaming_; }

    // True once every frame was emitted and looping is off
    bool finished() const;

private:
    struct Scheduled {
        int polls_left;
        CaptureEvent event;
        bool start_stream;
        bool stop_stream;
    };

    void schedule(int delay, CaptureEvent event, bool start_stream = false, bool stop_stream = false);

    BvhMotion motion_;
    std::size_t rig_size_;
    std::vector<std::optional<std::size_t>> rig_ids_;  // motion joint id -> rig joint id
    ReplayOptions options_;
    bool open_ = false;
    bool streaming_ = false;
    std::size_t cursor_ = 0;
    std::size_t emitted_ = 0;
    std::deque<Scheduled> scheduled_;
};

} // namespace mocap
