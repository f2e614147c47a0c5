#include "mocap/rig.hpp"
#include <algorithm>

namespace mocap {
namespace rig {

const std::vector<std::string>& export_order() {
    static const std::vector<std::string> order = {
        "Hips",
        "RightUpLeg", "RightLeg", "RightFoot",
        "LeftUpLeg", "LeftLeg", "LeftFoot",
        "Spine", "Spine1", "Spine2",
        "Neck", "Neck1", "Head",
        "RightShoulder", "RightArm", "RightForeArm", "RightHand",
        "LeftShoulder", "LeftArm", "LeftForeArm", "LeftHand",
    };
    return order;
}

const std::map<std::string, std::string>& parent_table() {
    static const std::map<std::string, std::string> parents = {
        {"RightUpLeg", "Hips"},
        {"RightLeg", "RightUpLeg"},
        {"RightFoot", "RightLeg"},
        {"LeftUpLeg", "Hips"},
        {"LeftLeg", "LeftUpLeg"},
        {"LeftFoot", "LeftLeg"},
        {"Spine", "Hips"},
        {"Spine1", "Spine"},
        {"Spine2", "Spine1"},
        {"Neck", "Spine2"},
        {"Neck1", "Neck"},
        {"Head", "Neck1"},
        {"RightShoulder", "Spine2"},
        {"RightArm", "RightShoulder"},
        {"RightForeArm", "RightArm"},
        {"RightHand", "RightForeArm"},
        {"LeftShoulder", "Spine2"},
        {"LeftArm", "LeftShoulder"},
        {"LeftForeArm", "LeftArm"},
        {"LeftHand", "LeftForeArm"},
    };
    return parents;
}

const std::map<std::string, Eigen::Vector3d>& default_offsets() {
    static const std::map<std::string, Eigen::Vector3d> offsets = {
        {"Hips",          Eigen::Vector3d(0.0, 0.0, 0.0)},
        {"RightUpLeg",    Eigen::Vector3d(-8.5, 0.0, 0.0)},
        {"RightLeg",      Eigen::Vector3d(0.0, -40.0, 0.0)},
        {"RightFoot",     Eigen::Vector3d(0.0, -40.0, 0.0)},
        {"LeftUpLeg",     Eigen::Vector3d(8.5, 0.0, 0.0)},
        {"LeftLeg",       Eigen::Vector3d(0.0, -40.0, 0.0)},
        {"LeftFoot",      Eigen::Vector3d(0.0, -40.0, 0.0)},
        {"Spine",         Eigen::Vector3d(0.0, 10.0, 0.0)},
        {"Spine1",        Eigen::Vector3d(0.0, 10.0, 0.0)},
        {"Spine2",        Eigen::Vector3d(0.0, 10.0, 0.0)},
        {"Neck",          Eigen::Vector3d(0.0, 10.0, 0.0)},
        {"Neck1",         Eigen::Vector3d(0.0, 5.0, 0.0)},
        {"Head",          Eigen::Vector3d(0.0, 8.0, 0.0)},
        {"RightShoulder", Eigen::Vector3d(-5.0, 8.0, 0.0)},
        {"RightArm",      Eigen::Vector3d(-12.0, 0.0, 0.0)},
        {"RightForeArm",  Eigen::Vector3d(-25.0, 0.0, 0.0)},
        {"RightHand",     Eigen::Vector3d(-25.0, 0.0, 0.0)},
        {"LeftShoulder",  Eigen::Vector3d(5.0, 8.0, 0.0)},
        {"LeftArm",       Eigen::Vector3d(12.0, 0.0, 0.0)},
        {"LeftForeArm",   Eigen::Vector3d(25.0, 0.0, 0.0)},
        {"LeftHand",      Eigen::Vector3d(25.0, 0.0, 0.0)},
    };
    return offsets;
}

const std::map<std::string, Eigen::Vector3d>& end_sites() {
    static const std::map<std::string, Eigen::Vector3d> sites = {
        {"RightFoot", Eigen::Vector3d(0.0, -7.85, 14.28)},
        {"LeftFoot",  Eigen::Vector3d(0.0, -7.85, 14.28)},
        {"Head",      Eigen::Vector3d(0.0, 16.45, 0.0)},
        {"RightHand", Eigen::Vector3d(-8.0, 0.0, 0.0)},
        {"LeftHand",  Eigen::Vector3d(8.0, 0.0, 0.0)},
    };
    return sites;
}

namespace {

void append_fingers(std::vector<std::string>& order, const std::string& side) {
    const std::string hand = side + "Hand";
    for (int i = 1; i <= 3; ++i) order.push_back(hand + "Thumb" + std::to_string(i));
    for (const char* finger : {"Index", "Middle", "Ring", "Pinky"}) {
        order.push_back(side + "InHand" + finger);
        for (int i = 1; i <= 3; ++i) order.push_back(hand + finger + std::to_string(i));
    }
}

std::vector<std::string> build_draw_order() {
    std::vector<std::string> order = {
        "Hips",
        "RightUpLeg", "RightLeg", "RightFoot",
        "LeftUpLeg", "LeftLeg", "LeftFoot",
        "Spine", "Spine1", "Spine2",
        "Neck", "Neck1", "Head",
        "RightShoulder", "RightArm", "RightForeArm", "RightHand",
    };
    append_fingers(order, "Right");
    for (const char* name : {"LeftShoulder", "LeftArm", "LeftForeArm", "LeftHand"}) {
        order.push_back(name);
    }
    append_fingers(order, "Left");
    order.push_back("Spine3");
    return order;
}

} // namespace

const std::vector<std::string>& draw_order() {
    static const std::vector<std::string> order = build_draw_order();
    return order;
}

std::vector<std::string> children_of(const std::string& name) {
    std::vector<std::string> children;
    const auto& parents = parent_table();
    for (const auto& joint : export_order()) {
        auto it = parents.find(joint);
        if (it != parents.end() && it->second == name) {
            children.push_back(joint);
        }
    }
    return children;
}

bool is_exported(const std::string& name) {
    const auto& order = export_order();
    return std::find(order.begin(), order.end(), name) != order.end();
}

} // namespace rig

Skeleton build_rig_skeleton() {
    Skeleton skeleton;
    const auto& parents = rig::parent_table();
    const auto& offsets = rig::default_offsets();
    const auto& sites = rig::end_sites();

    for (const auto& name : rig::export_order()) {
        std::optional<std::size_t> parent;
        auto pit = parents.find(name);
        if (pit != parents.end()) {
            parent = skeleton.find(pit->second);
        }
        const std::size_t id = skeleton.add_joint(name, parent, offsets.at(name));
        auto sit = sites.find(name);
        if (sit != sites.end()) {
            skeleton.set_end_site(id, sit->second);
        }
    }
    return skeleton;
}

} // namespace mocap
