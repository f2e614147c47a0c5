#pragma once

#include "mocap/bvh.hpp"
#include <Eigen/Core>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mocap {

// Per-frame series, [frame][joint id]
using Vec3Series = std::vector<std::vector<Eigen::Vector3d>>;

// Angle name -> degrees. Keys are "<parent>_<joint>".
using AngleMap = std::map<std::string, double>;

// Finite differences over the frame axis.
// Result is zero for frames 0 and 1, and everywhere when frame_time <= 0.
Vec3Series compute_velocities(const Vec3Series& positions, double frame_time);
Vec3Series compute_accelerations(const Vec3Series& velocities, double frame_time);

// Angle at current between the vectors towards parent and child, degrees rounded to 0.01.
// Empty if either vector is shorter than 1e-6.
std::optional<double> anatomical_angle(const Eigen::Vector3d& parent,
                                       const Eigen::Vector3d& current,
                                       const Eigen::Vector3d& child);

// All joint angles of one evaluated frame: adjacency sweep over the draw order,
// then back bend (Hips_Spine) and head down (Spine2_Neck).
AngleMap compute_anatomical_angles(const Skeleton& skeleton, const std::vector<Eigen::Vector3d>& positions);

struct MotionAnalysis {
    Vec3Series positions;
    Vec3Series velocities;
    Vec3Series accelerations;
    std::vector<AngleMap> angles;
    double frame_time = 0.0;

    std::size_t frame_count() const { return positions.size(); }
};

// Evaluate every frame of a parsed motion and derive kinematics and angles
MotionAnalysis analyze_motion(const BvhMotion& motion);

// CSV export of an analysis.
// position_scale converts skeleton units to metres (0.01 for centimetres).
// Returns false (and logs) if the file cannot be written.
bool write_csv(const std::string& path,
               const Skeleton& skeleton,
               const MotionAnalysis& analysis,
               double position_scale);

} // namespace mocap
