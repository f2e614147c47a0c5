#pragma once

#include "mocap/pose.hpp"
#include "mocap/skeleton.hpp"
#include <Eigen/Core>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mocap {

// Parsed BVH file: hierarchy plus raw channel frames
struct BvhMotion {
    Skeleton skeleton;
    std::vector<std::vector<double>> frames;  // one channel vector per motion line
    int declared_frames = 0;                  // value of "Frames:"
    double frame_time = 0.0;                  // value of "Frame Time:"

    std::size_t frame_count() const { return frames.size(); }
};

// Parse BVH text. Returns empty on malformed input; the reason is logged.
// source names the input in log messages.
std::optional<BvhMotion> parse_bvh(std::istream& in, const std::string& source = "<stream>");
std::optional<BvhMotion> parse_bvh_text(const std::string& text);

// Parse a BVH file, empty if it cannot be read or parsed
std::optional<BvhMotion> load_bvh(const std::string& path);

// Joints of the export set in depth-first hierarchy order, starting from the root.
// Children follow the canonical export order; joints outside the set are skipped
// together with their subtrees.
std::vector<std::string> hierarchy_order(const std::vector<std::string>& joints);

// HIERARCHY section for the export set, using the given offset and end-site tables
std::string generate_hierarchy_text(const std::vector<std::string>& joints,
                                    const std::map<std::string, Eigen::Vector3d>& offsets,
                                    const std::map<std::string, Eigen::Vector3d>& end_sites);

// One MOTION line: root position then Z X Y Euler angles per joint in hierarchy order.
// rig resolves joint names to slots of the recorded frame.
std::string generate_frame_line(const Skeleton& rig,
                                const RecordedFrame& frame,
                                const std::vector<std::string>& ordered_joints);

// Write a complete BVH file from recorded frames using the canonical tables.
// Returns false (and logs) if there are no frames or the file cannot be written.
bool write_bvh(const std::string& path,
               const Skeleton& rig,
               const std::vector<RecordedFrame>& frames,
               const std::vector<std::string>& joints,
               double frame_time);

} // namespace mocap
