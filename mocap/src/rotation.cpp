#include "mocap/rotation.hpp"
#include <algorithm>
#include <cmath>

namespace mocap {

Eigen::Matrix3d axis_rotation(Channel channel, double degrees) {
    const double rad = deg_to_rad(degrees);
    const double c = std::cos(rad);
    const double s = std::sin(rad);

    Eigen::Matrix3d R = Eigen::Matrix3d::Identity();
    switch (channel) {
        case Channel::Xrotation:
            R << 1, 0,  0,
                 0, c, -s,
                 0, s,  c;
            break;
        case Channel::Yrotation:
            R <<  c, 0, s,
                  0, 1, 0,
                 -s, 0, c;
            break;
        case Channel::Zrotation:
            R << c, -s, 0,
                 s,  c, 0,
                 0,  0, 1;
            break;
        default:
            break;
    }
    return R;
}

Eigen::Matrix3d quaternion_to_matrix(const Eigen::Quaterniond& q) {
    const double n = q.norm();
    if (n < 1e-12) {
        return Eigen::Matrix3d::Identity();
    }
    return Eigen::Quaterniond(q.coeffs() / n).toRotationMatrix();
}

Eigen::Vector3d quaternion_to_euler_zxy(const Eigen::Quaterniond& q) {
    const Eigen::Matrix3d m = quaternion_to_matrix(q);

    double z, x, y;
    if (std::abs(m(2, 1)) < kGimbalThreshold) {
        x = std::asin(m(2, 1));
        z = std::atan2(-m(0, 1), m(1, 1));
        y = std::atan2(-m(2, 0), m(2, 2));
    } else {
        // Gimbal lock: X = +-90 deg, Y folds into Z
        x = std::copysign(M_PI / 2.0, m(2, 1));
        z = std::atan2(m(1, 0), m(0, 0));
        y = 0.0;
    }

    // + 0.0 turns -0.0 into 0.0
    return Eigen::Vector3d(rad_to_deg(z) + 0.0, rad_to_deg(x) + 0.0, rad_to_deg(y) + 0.0);
}

Eigen::Quaterniond euler_to_quaternion(const std::vector<Channel>& order,
                                       const std::vector<double>& degrees) {
    Eigen::Quaterniond q = Eigen::Quaterniond::Identity();
    const std::size_t count = std::min(order.size(), degrees.size());
    for (std::size_t i = 0; i < count; ++i) {
        if (!is_rotation(order[i])) {
            continue;
        }
        Eigen::Vector3d axis = Eigen::Vector3d::Zero();
        axis[channel_axis(order[i])] = 1.0;
        q = q * Eigen::Quaterniond(Eigen::AngleAxisd(deg_to_rad(degrees[i]), axis));
    }
    return q.normalized();
}

} // namespace mocap
