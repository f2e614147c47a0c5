#include "mocap/analysis.hpp"
#include "mocap/kinematics.hpp"
#include "mocap/log.hpp"
#include "mocap/rig.hpp"
#include "mocap/rotation.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <set>

namespace mocap {

namespace {

Vec3Series zeros_like(const Vec3Series& series) {
    Vec3Series out;
    out.reserve(series.size());
    for (const auto& frame : series) {
        out.emplace_back(frame.size(), Eigen::Vector3d::Zero());
    }
    return out;
}

Vec3Series difference(const Vec3Series& series, double frame_time, const char* what) {
    Vec3Series out = zeros_like(series);
    if (frame_time <= 0.0) {
        MOCAP_LOG_WARN("[Analysis] Non-positive frame time " << frame_time << ", " << what << " set to zero");
        return out;
    }
    for (std::size_t i = 2; i < series.size(); ++i) {
        const std::size_t n = std::min(series[i].size(), series[i - 1].size());
        for (std::size_t j = 0; j < n; ++j) {
            out[i][j] = (series[i][j] - series[i - 1][j]) / frame_time;
        }
    }
    return out;
}

std::optional<double> angle_between(const Skeleton& skeleton,
                                    const std::vector<Eigen::Vector3d>& positions,
                                    const std::string& parent,
                                    const std::string& current,
                                    const std::string& child) {
    auto p = skeleton.find(parent);
    auto c = skeleton.find(current);
    auto k = skeleton.find(child);
    if (!p || !c || !k) {
        return std::nullopt;
    }
    return anatomical_angle(positions.at(*p), positions.at(*c), positions.at(*k));
}

void write_number(std::ostream& os, double value) {
    // Avoid "-0.0000" for values that round to zero
    if (std::abs(value) < 0.00005) value = 0.0;
    os << "," << value;
}

} // namespace

Vec3Series compute_velocities(const Vec3Series& positions, double frame_time) {
    return difference(positions, frame_time, "velocities");
}

Vec3Series compute_accelerations(const Vec3Series& velocities, double frame_time) {
    return difference(velocities, frame_time, "accelerations");
}

std::optional<double> anatomical_angle(const Eigen::Vector3d& parent,
                                       const Eigen::Vector3d& current,
                                       const Eigen::Vector3d& child) {
    const Eigen::Vector3d v1 = parent - current;
    const Eigen::Vector3d v2 = child - current;
    const double n1 = v1.norm();
    const double n2 = v2.norm();
    if (n1 <= 1e-6 || n2 <= 1e-6) {
        return std::nullopt;
    }
    const double cos_theta = std::clamp(v1.dot(v2) / (n1 * n2), -1.0, 1.0);
    return std::round(rad_to_deg(std::acos(cos_theta)) * 100.0) / 100.0;
}

AngleMap compute_anatomical_angles(const Skeleton& skeleton, const std::vector<Eigen::Vector3d>& positions) {
    AngleMap angles;

    for (const auto& name : rig::draw_order()) {
        auto id = skeleton.find(name);
        if (!id) continue;
        const Joint& joint = skeleton.joint(*id);
        if (joint.is_root()) continue;

        const std::string& parent = skeleton.joint(*joint.parent).name;
        for (std::size_t child : joint.children) {
            auto angle = anatomical_angle(positions.at(*joint.parent), positions.at(*id), positions.at(child));
            if (angle) {
                angles[parent + "_" + name] = *angle;
            }
        }
    }

    // Non-adjacent triples, always recomputed
    const struct { const char* key; const char* parent; const char* current; const char* child; } named[] = {
        {"Hips_Spine", "Hips", "Spine", "Spine2"},      // back bend
        {"Spine2_Neck", "Spine2", "Neck", "Head"},      // head down
    };
    for (const auto& n : named) {
        auto angle = angle_between(skeleton, positions, n.parent, n.current, n.child);
        if (angle) {
            angles[n.key] = *angle;
        } else {
            angles.erase(n.key);
        }
    }
    return angles;
}

MotionAnalysis analyze_motion(const BvhMotion& motion) {
    MotionAnalysis result;
    result.frame_time = motion.frame_time;
    result.positions.reserve(motion.frame_count());
    result.angles.reserve(motion.frame_count());

    WorldTransforms transforms;
    for (const auto& frame : motion.frames) {
        evaluate(motion.skeleton, frame, transforms);
        std::vector<Eigen::Vector3d> positions = world_positions(transforms);
        result.angles.push_back(compute_anatomical_angles(motion.skeleton, positions));
        result.positions.push_back(std::move(positions));
    }

    result.velocities = compute_velocities(result.positions, motion.frame_time);
    result.accelerations = compute_accelerations(result.velocities, motion.frame_time);
    return result;
}

bool write_csv(const std::string& path,
               const Skeleton& skeleton,
               const MotionAnalysis& analysis,
               double position_scale) {
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        MOCAP_LOG_ERROR("[CSV] Cannot write " << path);
        return false;
    }

    std::vector<std::pair<std::string, std::size_t>> columns;
    for (const auto& name : rig::draw_order()) {
        auto id = skeleton.find(name);
        if (id) columns.emplace_back(name, *id);
    }

    std::set<std::string> angle_keys;
    for (const auto& frame_angles : analysis.angles) {
        for (const auto& kv : frame_angles) angle_keys.insert(kv.first);
    }

    // UTF-8 byte order mark
    file << "\xEF\xBB\xBF";
    file << "Frame";
    for (const auto& column : columns) {
        const std::string& j = column.first;
        for (const char* axis : {"X", "Y", "Z"}) file << "," << j << "_pos_" << axis << "(m)";
        for (const char* axis : {"X", "Y", "Z"}) file << "," << j << "_vel_" << axis << "(m/s)";
        for (const char* axis : {"X", "Y", "Z"}) file << "," << j << "_accel_" << axis << "(m/s\xC2\xB2)";
    }
    for (const auto& key : angle_keys) {
        file << "," << key << "(\xC2\xB0)";
    }
    file << "\n";

    const Eigen::Vector3d zero = Eigen::Vector3d::Zero();
    auto sample = [&](const Vec3Series& series, std::size_t frame, std::size_t joint) -> const Eigen::Vector3d& {
        if (frame < series.size() && joint < series[frame].size()) return series[frame][joint];
        return zero;
    };

    for (std::size_t f = 0; f < analysis.frame_count(); ++f) {
        file << (f + 1);
        file << std::fixed << std::setprecision(4);
        for (const auto& column : columns) {
            for (const Vec3Series* series : {&analysis.positions, &analysis.velocities, &analysis.accelerations}) {
                const Eigen::Vector3d& v = sample(*series, f, column.second);
                for (int k = 0; k < 3; ++k) write_number(file, v[k] * position_scale);
            }
        }
        file << std::setprecision(2);
        const AngleMap empty;
        const AngleMap& frame_angles = f < analysis.angles.size() ? analysis.angles[f] : empty;
        for (const auto& key : angle_keys) {
            auto it = frame_angles.find(key);
            if (it != frame_angles.end()) {
                file << "," << it->second;
            } else {
                file << ",nan";
            }
        }
        file << "\n";
        file << std::defaultfloat;
    }

    if (!file) {
        MOCAP_LOG_ERROR("[CSV] Write error on " << path);
        return false;
    }
    MOCAP_LOG_INFO("[CSV] Exported " << analysis.frame_count() << " frames, " << columns.size()
                   << " joints, " << angle_keys.size() << " angles to " << path);
    return true;
}

} // namespace mocap
