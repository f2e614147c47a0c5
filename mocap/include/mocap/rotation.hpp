#pragma once

#include "mocap/skeleton.hpp"
#include <Eigen/Core>
#include <cmath>
#include <Eigen/Geometry>
#include <vector>

namespace mocap {

// Sine magnitude of the middle (X) axis above which ZXY extraction takes the gimbal branch
constexpr double kGimbalThreshold = 1.0 - 1e-5;

// Rotation matrix about the channel's axis, angle in degrees.
// Position channels yield identity.
Eigen::Matrix3d axis_rotation(Channel channel, double degrees);

// Rotation matrix of a (w, x, y, z) quaternion.
// The quaternion is normalized first; a near-zero quaternion maps to identity.
Eigen::Matrix3d quaternion_to_matrix(const Eigen::Quaterniond& q);

// ZXY Euler angles in degrees, returned as (z, x, y), such that
//   Rz(z) * Rx(x) * Ry(y) == quaternion_to_matrix(q)
// When |sin(x)| is within 1e-5 of 1 the Y angle is forced to zero
// and Z carries the combined rotation.
Eigen::Vector3d quaternion_to_euler_zxy(const Eigen::Quaterniond& q);

// Sequential composition of per-axis rotations in the given channel order.
// Position channels in the list are skipped. Angles in degrees.
Eigen::Quaterniond euler_to_quaternion(const std::vector<Channel>& order,
                                       const std::vector<double>& degrees);

inline double deg_to_rad(double deg) { return deg * M_PI / 180.0; }
inline double rad_to_deg(double rad) { return rad * 180.0 / M_PI; }

} // namespace mocap
