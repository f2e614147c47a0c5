#pragma once

#include <Eigen/Core>
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mocap {

// One scalar animated degree of freedom
enum class Channel {
    Xposition,
    Yposition,
    Zposition,
    Xrotation,
    Yrotation,
    Zrotation
};

const char* channel_to_string(Channel channel);

// Returns empty for tags outside the six BVH channel names
std::optional<Channel> channel_from_string(const std::string& tag);

inline bool is_rotation(Channel channel) {
    return channel == Channel::Xrotation || channel == Channel::Yrotation || channel == Channel::Zrotation;
}

inline bool is_position(Channel channel) { return !is_rotation(channel); }

// 0 = X, 1 = Y, 2 = Z
int channel_axis(Channel channel);

// Joint record in the skeleton arena.
// Channel i of a joint lives at channel_start + i in the flattened frame vector.
struct Joint {
    std::string name;
    std::optional<std::size_t> parent;   // empty for the root
    std::vector<std::size_t> children;   // declaration order
    Eigen::Vector3d offset = Eigen::Vector3d::Zero();
    std::vector<Channel> channels;
    std::size_t channel_start = 0;
    std::optional<Eigen::Vector3d> end_site;

    bool is_root() const { return !parent.has_value(); }

    // Global index of a channel in the frame vector, empty if the joint does not declare it
    std::optional<std::size_t> channel_index(Channel channel) const;
};

// Joint hierarchy with a name lookup.
// Joints are stored in declaration order, so a parent always precedes its children.
// Topology is fixed once built; per-frame state lives outside the skeleton.
class Skeleton {
public:
    Skeleton() = default;

    // Append a joint under parent (empty for the root) and return its id.
    // Channels are placed after every channel declared so far.
    // Throws MocapError(ParseError) on a duplicate name, a second root,
    // or an unknown parent id.
    std::size_t add_joint(const std::string& name,
                          std::optional<std::size_t> parent,
                          const Eigen::Vector3d& offset,
                          const std::vector<Channel>& channels = {});

    void set_end_site(std::size_t id, const Eigen::Vector3d& offset);

    bool empty() const { return joints_.empty(); }
    std::size_t size() const { return joints_.size(); }
    std::size_t channel_count() const { return channel_count_; }

    // Root is always id 0 once the skeleton is non-empty
    std::size_t root() const { return 0; }

    const Joint& joint(std::size_t id) const { return joints_.at(id); }
    const std::vector<Joint>& joints() const { return joints_; }

    bool contains(const std::string& name) const { return index_.count(name) > 0; }
    std::optional<std::size_t> find(const std::string& name) const;

    // Name of the joint's parent, empty string for the root
    std::string parent_name(std::size_t id) const;

private:
    std::vector<Joint> joints_;
    std::unordered_map<std::string, std::size_t> index_;
    std::size_t channel_count_ = 0;
};

} // namespace mocap
