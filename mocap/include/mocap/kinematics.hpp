#pragma once

#include "mocap/pose.hpp"
#include "mocap/skeleton.hpp"
#include <Eigen/Geometry>
#include <vector>

namespace mocap {

// World transforms indexed by joint id
using WorldTransforms = std::vector<Eigen::Isometry3d, Eigen::aligned_allocator<Eigen::Isometry3d>>;

// Forward kinematics for one channel frame.
// Root: translation from its position channels. Others: parent * T(offset).
// Rotation channels are then applied in declaration order.
// Channels past the end of the frame read as zero.
void evaluate(const Skeleton& skeleton, const std::vector<double>& frame, WorldTransforms& out);
WorldTransforms evaluate(const Skeleton& skeleton, const std::vector<double>& frame);

// Forward kinematics for one real-time frame indexed against the rig skeleton.
// Root: T(position) * R(rotation). Others: parent * T(offset) * R(rotation).
// Absent joints use identity rotation.
void evaluate_pose(const Skeleton& skeleton, const PoseFrame& frame, WorldTransforms& out);

// Translation part of every transform
std::vector<Eigen::Vector3d> world_positions(const WorldTransforms& transforms);

} // namespace mocap
