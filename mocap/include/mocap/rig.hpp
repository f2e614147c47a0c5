#pragma once

#include "mocap/skeleton.hpp"
#include <Eigen/Core>
#include <map>
#include <string>
#include <vector>

namespace mocap {

// Canonical body rig shared by the real-time path and the BVH exporter.
// Offsets are in centimetres with +Y up.
namespace rig {

// Joints written on export, root first. A parent precedes its children.
const std::vector<std::string>& export_order();

// Parent of every exported joint except the root
const std::map<std::string, std::string>& parent_table();

const std::map<std::string, Eigen::Vector3d>& default_offsets();

// End Site offsets for the leaf joints of the export hierarchy
const std::map<std::string, Eigen::Vector3d>& end_sites();

// Body plus finger joints in drawing order; drives the angle sweep and CSV columns
const std::vector<std::string>& draw_order();

// Exported children of a joint in export_order() order
std::vector<std::string> children_of(const std::string& name);

bool is_exported(const std::string& name);

} // namespace rig

// Skeleton built from the rig tables, no channels.
// Real-time pose frames are indexed against this skeleton.
Skeleton build_rig_skeleton();

} // namespace mocap
