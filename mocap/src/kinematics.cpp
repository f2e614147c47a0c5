#include "mocap/kinematics.hpp"
#include "mocap/rotation.hpp"

namespace mocap {

namespace {

double channel_value(const std::vector<double>& frame, std::size_t index) {
    return index < frame.size() ? frame[index] : 0.0;
}

void evaluate_joint(const Skeleton& skeleton,
                    std::size_t id,
                    const std::vector<double>& frame,
                    WorldTransforms& out) {
    const Joint& joint = skeleton.joint(id);

    Eigen::Isometry3d T = Eigen::Isometry3d::Identity();
    if (joint.is_root()) {
        Eigen::Vector3d position = Eigen::Vector3d::Zero();
        for (std::size_t i = 0; i < joint.channels.size(); ++i) {
            if (is_position(joint.channels[i])) {
                position[channel_axis(joint.channels[i])] = channel_value(frame, joint.channel_start + i);
            }
        }
        T.translation() = position;
    } else {
        T = out[*joint.parent];
        T.translate(joint.offset);
    }

    for (std::size_t i = 0; i < joint.channels.size(); ++i) {
        if (is_rotation(joint.channels[i])) {
            T.rotate(axis_rotation(joint.channels[i], channel_value(frame, joint.channel_start + i)));
        }
    }
    out[id] = T;

    for (std::size_t child : joint.children) {
        evaluate_joint(skeleton, child, frame, out);
    }
}

} // namespace

void evaluate(const Skeleton& skeleton, const std::vector<double>& frame, WorldTransforms& out) {
    out.assign(skeleton.size(), Eigen::Isometry3d::Identity());
    if (skeleton.empty()) return;
    evaluate_joint(skeleton, skeleton.root(), frame, out);
}

WorldTransforms evaluate(const Skeleton& skeleton, const std::vector<double>& frame) {
    WorldTransforms out;
    evaluate(skeleton, frame, out);
    return out;
}

void evaluate_pose(const Skeleton& skeleton, const PoseFrame& frame, WorldTransforms& out) {
    out.assign(skeleton.size(), Eigen::Isometry3d::Identity());

    // Parents precede children in the arena
    for (std::size_t id = 0; id < skeleton.size(); ++id) {
        const Joint& joint = skeleton.joint(id);
        const bool have = id < frame.joints.size() && frame.joints[id].present;

        Eigen::Isometry3d T = Eigen::Isometry3d::Identity();
        if (joint.is_root()) {
            if (have) T.translation() = frame.joints[id].position;
        } else {
            T = out[*joint.parent];
            T.translate(joint.offset);
        }
        if (have) {
            T.rotate(quaternion_to_matrix(frame.joints[id].rotation));
        }
        out[id] = T;
    }
}

std::vector<Eigen::Vector3d> world_positions(const WorldTransforms& transforms) {
    std::vector<Eigen::Vector3d> positions;
    positions.reserve(transforms.size());
    for (const auto& T : transforms) {
        positions.push_back(T.translation());
    }
    return positions;
}

} // namespace mocap
