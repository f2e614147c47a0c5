#include "mocap/skeleton.hpp"
#include "mocap/error.hpp"

namespace mocap {

const char* channel_to_string(Channel channel) {
    switch (channel) {
        case Channel::Xposition: return "Xposition";
        case Channel::Yposition: return "Yposition";
        case Channel::Zposition: return "Zposition";
        case Channel::Xrotation: return "Xrotation";
        case Channel::Yrotation: return "Yrotation";
        case Channel::Zrotation: return "Zrotation";
        default:                 return "Unknown";
    }
}

std::optional<Channel> channel_from_string(const std::string& tag) {
    if (tag == "Xposition") return Channel::Xposition;
    if (tag == "Yposition") return Channel::Yposition;
    if (tag == "Zposition") return Channel::Zposition;
    if (tag == "Xrotation") return Channel::Xrotation;
    if (tag == "Yrotation") return Channel::Yrotation;
    if (tag == "Zrotation") return Channel::Zrotation;
    return std::nullopt;
}

int channel_axis(Channel channel) {
    switch (channel) {
        case Channel::Xposition:
        case Channel::Xrotation: return 0;
        case Channel::Yposition:
        case Channel::Yrotation: return 1;
        case Channel::Zposition:
        case Channel::Zrotation: return 2;
        default:                 return 0;
    }
}

std::optional<std::size_t> Joint::channel_index(Channel channel) const {
    for (std::size_t i = 0; i < channels.size(); ++i) {
        if (channels[i] == channel) {
            return channel_start + i;
        }
    }
    return std::nullopt;
}

std::size_t Skeleton::add_joint(const std::string& name,
                                std::optional<std::size_t> parent,
                                const Eigen::Vector3d& offset,
                                const std::vector<Channel>& channels) {
    if (index_.count(name)) {
        throw MocapError(ErrorCode::ParseError, "Duplicate joint name '" + name + "'");
    }
    if (!parent && !joints_.empty()) {
        throw MocapError(ErrorCode::ParseError, "Second root joint '" + name + "'");
    }
    if (parent && *parent >= joints_.size()) {
        throw MocapError(ErrorCode::ParseError, "Joint '" + name + "' references unknown parent");
    }
    const std::size_t id = joints_.size();
    Joint joint;
    joint.name = name;
    joint.parent = parent;
    joint.offset = offset;
    joint.channels = channels;
    joint.channel_start = channel_count_;
    joints_.push_back(std::move(joint));

    if (parent) {
        joints_[*parent].children.push_back(id);
    }
    index_[name] = id;
    channel_count_ += channels.size();
    return id;
}

void Skeleton::set_end_site(std::size_t id, const Eigen::Vector3d& offset) {
    joints_.at(id).end_site = offset;
}

std::optional<std::size_t> Skeleton::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string Skeleton::parent_name(std::size_t id) const {
    const Joint& j = joints_.at(id);
    if (!j.parent) {
        return "";
    }
    return joints_[*j.parent].name;
}

} // namespace mocap
