#include "mocap/replay_source.hpp"
#include "mocap/log.hpp"
#include "mocap/rotation.hpp"

#include <algorithm>

namespace mocap {

ReplaySource::ReplaySource(BvhMotion motion, const Skeleton& rig, ReplayOptions options)
    : motion_(std::move(motion)),
      rig_size_(rig.size()),
      options_(options) {
    // Resolve names once; joints the rig does not know are dropped
    rig_ids_.reserve(motion_.skeleton.size());
    for (const auto& joint : motion_.skeleton.joints()) {
        rig_ids_.push_back(rig.find(joint.name));
    }
}

std::string ReplaySource::name() const {
    return options_.broadcast ? "replay-broadcast" : "replay-device";
}

bool ReplaySource::open(std::string& message) {
    if (options_.fail_open) {
        message = "replay source configured to fail";
        return false;
    }
    if (motion_.frames.empty()) {
        message = "motion has no frames";
        return false;
    }
    open_ = true;
    cursor_ = 0;
    emitted_ = 0;
    scheduled_.clear();
    streaming_ = options_.broadcast;
    message = "Replaying " + std::to_string(motion_.frame_count()) + " frames";
    return true;
}

void ReplaySource::close() {
    open_ = false;
    streaming_ = false;
    scheduled_.clear();
}

void ReplaySource::schedule(int delay, CaptureEvent event, bool start_stream, bool stop_stream) {
    scheduled_.push_back(Scheduled{std::max(0, delay), std::move(event), start_stream, stop_stream});
}

bool ReplaySource::issue(Command command) {
    if (!open_ || options_.broadcast || options_.refuse_commands) {
        return false;
    }

    const int latency = options_.reply_latency_polls;
    switch (command) {
        case Command::StartCapture:
            schedule(latency, CaptureEvent::make_response());
            schedule(latency, CaptureEvent::make_result(0), true, false);
            break;
        case Command::StopCapture:
            schedule(latency, CaptureEvent::make_response());
            schedule(latency, CaptureEvent::make_result(0), false, true);
            break;
        case Command::Calibrate: {
            CalibrationProgress step;
            step.pose_name = "V-Pose";
            schedule(latency, CaptureEvent::make_response());
            step.step = CalibrationStep::Prepare;
            schedule(latency, CaptureEvent::make_progress(step));
            step.step = CalibrationStep::Countdown;
            for (int s = 3; s >= 1; --s) {
                step.countdown = s;
                schedule(latency + 4 - s, CaptureEvent::make_progress(step));
            }
            step.step = CalibrationStep::Progress;
            step.percent = 50;
            schedule(latency + 4, CaptureEvent::make_progress(step));
            step.percent = 100;
            schedule(latency + 5, CaptureEvent::make_progress(step));
            if (options_.fail_calibration) {
                schedule(latency + 6, CaptureEvent::make_result(1, "calibration rejected by replay source"));
            } else {
                schedule(latency + 6, CaptureEvent::make_result(0));
            }
            break;
        }
    }
    MOCAP_LOG_VERBOSE("[Replay] Accepted " << command_to_string(command));
    return true;
}

void ReplaySource::inject_error(const std::string& message) {
    schedule(0, CaptureEvent::make_error(message));
}

void ReplaySource::poll(std::vector<CaptureEvent>& events) {
    if (!open_) {
        return;
    }

    // Due replies in scheduling order
    for (auto it = scheduled_.begin(); it != scheduled_.end();) {
        if (it->polls_left > 0) {
            --it->polls_left;
            ++it;
            continue;
        }
        if (it->start_stream) streaming_ = true;
        if (it->stop_stream) streaming_ = false;
        events.push_back(std::move(it->event));
        it = scheduled_.erase(it);
    }

    if (!streaming_ || finished()) {
        return;
    }
    if (cursor_ >= motion_.frame_count()) {
        cursor_ = 0;
    }
    events.push_back(CaptureEvent::make_frame(frame_at(cursor_)));
    ++cursor_;
    ++emitted_;
}

bool ReplaySource::finished() const {
    return !options_.loop && emitted_ >= motion_.frame_count();
}

PoseFrame ReplaySource::frame_at(std::size_t i) const {
    PoseFrame frame(rig_size_);
    frame.timestamp = static_cast<double>(i) * motion_.frame_time;
    if (i >= motion_.frames.size()) {
        return frame;
    }
    const std::vector<double>& values = motion_.frames[i];

    for (std::size_t id = 0; id < motion_.skeleton.size(); ++id) {
        if (!rig_ids_[id]) continue;
        const Joint& joint = motion_.skeleton.joint(id);

        std::vector<double> joint_values(joint.channels.size(), 0.0);
        for (std::size_t c = 0; c < joint.channels.size(); ++c) {
            const std::size_t index = joint.channel_start + c;
            if (index < values.size()) joint_values[c] = values[index];
        }

        JointPose& pose = frame.joints[*rig_ids_[id]];
        pose.present = true;
        pose.rotation = euler_to_quaternion(joint.channels, joint_values);
        if (joint.is_root()) {
            pose.position = Eigen::Vector3d::Zero();
            for (std::size_t c = 0; c < joint.channels.size(); ++c) {
                if (is_position(joint.channels[c])) {
                    pose.position[channel_axis(joint.channels[c])] = joint_values[c];
                }
            }
        } else {
            pose.position = joint.offset;
        }
    }
    return frame;
}

} // namespace mocap
