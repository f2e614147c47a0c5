#pragma once

#include <Eigen/Core>
#include <Eigen/Geometry>
#include <cstddef>
#include <vector>

namespace mocap {

// Per-joint sample of a real-time frame
struct JointPose {
    Eigen::Vector3d position = Eigen::Vector3d::Zero();
    Eigen::Quaterniond rotation = Eigen::Quaterniond::Identity();
    bool present = false;
};

// Real-time frame, one JointPose per joint of the rig skeleton indexed by joint id.
// Joints the source did not send keep the defaults with present == false.
struct PoseFrame {
    std::vector<JointPose> joints;
    double timestamp = 0.0;  // source clock, seconds

    PoseFrame() = default;
    explicit PoseFrame(std::size_t joint_count) : joints(joint_count) {}
};

// Frame held by the recording buffer
struct RecordedFrame {
    std::size_t index = 0;
    double timestamp = 0.0;  // seconds since recording started
    std::vector<JointPose> joints;
};

} // namespace mocap
