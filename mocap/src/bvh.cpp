#include "mocap/bvh.hpp"
#include "mocap/error.hpp"
#include "mocap/log.hpp"
#include "mocap/rig.hpp"
#include "mocap/rotation.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <limits>
#include <set>
#include <sstream>

namespace mocap {

namespace {

// Joint as declared in the file, before the skeleton is assembled
struct ParsedJoint {
    std::string name;
    std::optional<std::size_t> parent;
    Eigen::Vector3d offset = Eigen::Vector3d::Zero();
    std::vector<Channel> channels;
    std::optional<Eigen::Vector3d> end_site;
};

// Open brace scope: a joint body or an End Site body
struct Block {
    std::size_t joint;
    bool end_site;
};

std::vector<std::string> tokenize(const std::string& line) {
    std::istringstream iss(line);
    std::vector<std::string> tokens;
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

double to_number(const std::string& token, const std::string& where) {
    std::size_t used = 0;
    double value = 0.0;
    try {
        value = std::stod(token, &used);
    } catch (const std::exception&) {
        throw MocapError(ErrorCode::ParseError, where, "Non-numeric value '" + token + "'");
    }
    if (used != token.size()) {
        throw MocapError(ErrorCode::ParseError, where, "Non-numeric value '" + token + "'");
    }
    return value;
}

class BvhParser {
public:
    explicit BvhParser(const std::string& source) : source_(source) {}

    BvhMotion parse(std::istream& in) {
        std::string line;
        while (std::getline(in, line)) {
            ++line_no_;
            std::vector<std::string> tokens = tokenize(line);
            if (tokens.empty()) continue;
            if (in_motion_) {
                motion_line(tokens);
            } else {
                hierarchy_line(tokens);
            }
        }

        if (!blocks_.empty() || pending_) {
            throw MocapError(ErrorCode::ParseError, source_, "Unbalanced braces at end of file");
        }
        if (joints_.empty()) {
            throw MocapError(ErrorCode::ParseError, source_, "No ROOT joint");
        }
        if (!in_motion_) {
            MOCAP_LOG_WARN("[BVH] No MOTION section in " << source_);
        }
        return build();
    }

private:
    std::string where() const { return source_ + ":" + std::to_string(line_no_); }

    void hierarchy_line(const std::vector<std::string>& tokens) {
        const std::string& key = tokens[0];

        if (key == "HIERARCHY") {
            return;
        }
        if (key == "ROOT" || key == "JOINT") {
            if (tokens.size() < 2) {
                throw MocapError(ErrorCode::ParseError, where(), key + " without a name");
            }
            if (key == "ROOT" && !joints_.empty()) {
                throw MocapError(ErrorCode::ParseError, where(), "Second root joint '" + tokens[1] + "'");
            }
            if (key == "JOINT" && blocks_.empty()) {
                throw MocapError(ErrorCode::ParseError, where(), "JOINT '" + tokens[1] + "' outside any joint");
            }
            if (key == "JOINT" && blocks_.back().end_site) {
                throw MocapError(ErrorCode::ParseError, where(), "JOINT '" + tokens[1] + "' inside an End Site");
            }
            if (pending_) {
                throw MocapError(ErrorCode::ParseError, where(), "Expected '{' before " + key);
            }
            if (!names_.insert(tokens[1]).second) {
                throw MocapError(ErrorCode::ParseError, where(), "Duplicate joint name '" + tokens[1] + "'");
            }
            ParsedJoint joint;
            joint.name = tokens[1];
            if (!blocks_.empty()) {
                joint.parent = blocks_.back().joint;
            }
            joints_.push_back(std::move(joint));
            pending_ = Block{joints_.size() - 1, false};
            return;
        }
        if (key == "End") {
            if (pending_) {
                throw MocapError(ErrorCode::ParseError, where(), "Expected '{' before End Site");
            }
            if (blocks_.empty() || blocks_.back().end_site) {
                throw MocapError(ErrorCode::ParseError, where(), "End Site outside a joint");
            }
            pending_ = Block{blocks_.back().joint, true};
            return;
        }
        if (key == "{") {
            if (!pending_) {
                throw MocapError(ErrorCode::ParseError, where(), "Unexpected '{'");
            }
            blocks_.push_back(*pending_);
            pending_.reset();
            return;
        }
        if (key == "}") {
            if (blocks_.empty()) {
                throw MocapError(ErrorCode::ParseError, where(), "'}' without an open block");
            }
            blocks_.pop_back();
            return;
        }
        if (key == "OFFSET") {
            if (pending_) {
                throw MocapError(ErrorCode::ParseError, where(), "Expected '{' before OFFSET");
            }
            if (blocks_.empty()) {
                throw MocapError(ErrorCode::ParseError, where(), "OFFSET outside a joint");
            }
            if (tokens.size() < 4) {
                throw MocapError(ErrorCode::ParseError, where(), "OFFSET needs three values");
            }
            Eigen::Vector3d offset(to_number(tokens[1], where()),
                                   to_number(tokens[2], where()),
                                   to_number(tokens[3], where()));
            const Block& block = blocks_.back();
            if (block.end_site) {
                joints_[block.joint].end_site = offset;
            } else {
                joints_[block.joint].offset = offset;
            }
            return;
        }
        if (key == "CHANNELS") {
            if (pending_) {
                throw MocapError(ErrorCode::ParseError, where(), "Expected '{' before CHANNELS");
            }
            if (blocks_.empty() || blocks_.back().end_site) {
                throw MocapError(ErrorCode::ParseError, where(), "CHANNELS outside a joint");
            }
            if (tokens.size() < 2) {
                throw MocapError(ErrorCode::ParseError, where(), "CHANNELS without a count");
            }
            const double declared = to_number(tokens[1], where());
            if (declared < 0 || declared != static_cast<double>(tokens.size() - 2)) {
                throw MocapError(ErrorCode::ParseError, where(),
                                 "CHANNELS count " + tokens[1] + " does not match "
                                 + std::to_string(tokens.size() - 2) + " tags");
            }
            std::vector<Channel> channels;
            for (std::size_t i = 2; i < tokens.size(); ++i) {
                auto channel = channel_from_string(tokens[i]);
                if (!channel) {
                    throw MocapError(ErrorCode::ParseError, where(), "Unknown channel tag '" + tokens[i] + "'");
                }
                channels.push_back(*channel);
            }
            joints_[blocks_.back().joint].channels = std::move(channels);
            return;
        }
        if (key == "MOTION") {
            if (!blocks_.empty() || pending_) {
                throw MocapError(ErrorCode::ParseError, where(), "MOTION inside an open block");
            }
            if (joints_.empty()) {
                throw MocapError(ErrorCode::ParseError, where(), "No ROOT joint");
            }
            in_motion_ = true;
            return;
        }
        throw MocapError(ErrorCode::ParseError, where(), "Unexpected token '" + key + "'");
    }

    void motion_line(const std::vector<std::string>& tokens) {
        if (tokens[0] == "Frames:") {
            if (tokens.size() < 2) {
                throw MocapError(ErrorCode::ParseError, where(), "Frames: without a value");
            }
            const double declared = to_number(tokens[1], where());
            if (!(declared >= 0.0 && declared <= static_cast<double>(std::numeric_limits<int>::max()))) {
                throw MocapError(ErrorCode::ParseError, where(), "Frames: count out of range '" + tokens[1] + "'");
            }
            declared_frames_ = static_cast<int>(declared);
            return;
        }
        if (tokens[0] == "Frame" && tokens.size() >= 2 && tokens[1] == "Time:") {
            if (tokens.size() < 3) {
                throw MocapError(ErrorCode::ParseError, where(), "Frame Time: without a value");
            }
            frame_time_ = to_number(tokens[2], where());
            return;
        }

        std::vector<double> values;
        values.reserve(tokens.size());
        for (const auto& token : tokens) {
            values.push_back(to_number(token, where()));
        }
        frames_.push_back(std::move(values));
    }

    BvhMotion build() {
        BvhMotion motion;
        for (const auto& joint : joints_) {
            const std::size_t id = motion.skeleton.add_joint(joint.name, joint.parent, joint.offset, joint.channels);
            if (joint.end_site) {
                motion.skeleton.set_end_site(id, *joint.end_site);
            }
        }

        const std::size_t channels = motion.skeleton.channel_count();
        for (std::size_t i = 0; i < frames_.size(); ++i) {
            if (frames_[i].size() != channels) {
                MOCAP_LOG_WARN("[BVH] Frame " << i << " of " << source_ << " has " << frames_[i].size()
                               << " values, expected " << channels);
            }
        }
        if (in_motion_ && declared_frames_ != static_cast<int>(frames_.size())) {
            MOCAP_LOG_WARN("[BVH] " << source_ << " declares " << declared_frames_
                           << " frames but contains " << frames_.size());
        }

        motion.frames = std::move(frames_);
        motion.declared_frames = declared_frames_;
        motion.frame_time = frame_time_;
        return motion;
    }

    std::string source_;
    int line_no_ = 0;
    bool in_motion_ = false;
    std::vector<ParsedJoint> joints_;
    std::set<std::string> names_;
    std::vector<Block> blocks_;
    std::optional<Block> pending_;
    std::vector<std::vector<double>> frames_;
    int declared_frames_ = 0;
    double frame_time_ = 0.0;
};

void write_vector(std::ostream& os, const Eigen::Vector3d& v) {
    os << v.x() << " " << v.y() << " " << v.z();
}

void write_joint(std::ostream& os,
                 const std::string& name,
                 int depth,
                 const std::set<std::string>& exported,
                 const std::map<std::string, Eigen::Vector3d>& offsets,
                 const std::map<std::string, Eigen::Vector3d>& end_sites) {
    const std::string indent(depth * 4, ' ');
    const std::string inner((depth + 1) * 4, ' ');
    const bool is_root = depth == 0;

    auto oit = offsets.find(name);
    const Eigen::Vector3d offset = oit != offsets.end() ? oit->second : Eigen::Vector3d::Zero();

    os << indent << (is_root ? "ROOT " : "JOINT ") << name << "\n";
    os << indent << "{\n";
    os << inner << "OFFSET ";
    write_vector(os, offset);
    os << "\n";
    if (is_root) {
        os << inner << "CHANNELS 6 Xposition Yposition Zposition Zrotation Xrotation Yrotation\n";
    } else {
        os << inner << "CHANNELS 3 Zrotation Xrotation Yrotation\n";
    }

    bool has_children = false;
    for (const auto& child : rig::children_of(name)) {
        if (exported.count(child)) {
            write_joint(os, child, depth + 1, exported, offsets, end_sites);
            has_children = true;
        }
    }

    auto eit = end_sites.find(name);
    if (!has_children && eit != end_sites.end()) {
        const std::string leaf((depth + 2) * 4, ' ');
        os << inner << "End Site\n";
        os << inner << "{\n";
        os << leaf << "OFFSET ";
        write_vector(os, eit->second);
        os << "\n";
        os << inner << "}\n";
    }

    os << indent << "}\n";
}

void collect_order(const std::string& name,
                   const std::set<std::string>& exported,
                   std::vector<std::string>& out) {
    out.push_back(name);
    for (const auto& child : rig::children_of(name)) {
        if (exported.count(child)) {
            collect_order(child, exported, out);
        }
    }
}

// Root of the canonical export hierarchy
const std::string& export_root() { return rig::export_order().front(); }

} // namespace

std::optional<BvhMotion> parse_bvh(std::istream& in, const std::string& source) {
    try {
        BvhParser parser(source);
        BvhMotion motion = parser.parse(in);
        MOCAP_LOG_VERBOSE("[BVH] Parsed " << source << ": " << motion.skeleton.size() << " joints, "
                          << motion.frame_count() << " frames, frame time " << motion.frame_time);
        return motion;
    } catch (const MocapError& e) {
        MOCAP_LOG_ERROR("[BVH] Failed to parse " << source << ": " << e.what());
        return std::nullopt;
    }
}

std::optional<BvhMotion> parse_bvh_text(const std::string& text) {
    std::istringstream iss(text);
    return parse_bvh(iss, "<text>");
}

std::optional<BvhMotion> load_bvh(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        MOCAP_LOG_ERROR("[BVH] Cannot open " << path);
        return std::nullopt;
    }
    return parse_bvh(file, path);
}

std::vector<std::string> hierarchy_order(const std::vector<std::string>& joints) {
    std::set<std::string> exported(joints.begin(), joints.end());
    exported.insert(export_root());

    std::vector<std::string> order;
    collect_order(export_root(), exported, order);
    return order;
}

std::string generate_hierarchy_text(const std::vector<std::string>& joints,
                                    const std::map<std::string, Eigen::Vector3d>& offsets,
                                    const std::map<std::string, Eigen::Vector3d>& end_sites) {
    std::set<std::string> exported(joints.begin(), joints.end());
    exported.insert(export_root());

    std::ostringstream os;
    os << std::fixed << std::setprecision(2);
    os << "HIERARCHY\n";
    write_joint(os, export_root(), 0, exported, offsets, end_sites);
    return os.str();
}

std::string generate_frame_line(const Skeleton& rig,
                                const RecordedFrame& frame,
                                const std::vector<std::string>& ordered_joints) {
    static const JointPose kMissing;

    std::ostringstream os;
    os << std::fixed << std::setprecision(6);
    bool first = true;
    auto emit = [&](double value) {
        if (!first) os << " ";
        os << value;
        first = false;
    };

    for (std::size_t i = 0; i < ordered_joints.size(); ++i) {
        auto id = rig.find(ordered_joints[i]);
        const JointPose& pose = (id && *id < frame.joints.size()) ? frame.joints[*id] : kMissing;
        if (i == 0) {
            emit(pose.position.x());
            emit(pose.position.y());
            emit(pose.position.z());
        }
        const Eigen::Vector3d zxy = quaternion_to_euler_zxy(pose.rotation);
        emit(zxy[0]);
        emit(zxy[1]);
        emit(zxy[2]);
    }
    return os.str();
}

bool write_bvh(const std::string& path,
               const Skeleton& rig,
               const std::vector<RecordedFrame>& frames,
               const std::vector<std::string>& joints,
               double frame_time) {
    if (frames.empty()) {
        MOCAP_LOG_ERROR("[BVH] Nothing to export to " << path);
        return false;
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        MOCAP_LOG_ERROR("[BVH] Cannot write " << path);
        return false;
    }

    const std::vector<std::string> ordered = hierarchy_order(joints);
    file << generate_hierarchy_text(joints, rig::default_offsets(), rig::end_sites());
    file << "MOTION\n";
    file << "Frames: " << frames.size() << "\n";
    file << "Frame Time: " << std::fixed << std::setprecision(6) << frame_time << "\n";
    for (const auto& frame : frames) {
        file << generate_frame_line(rig, frame, ordered) << "\n";
    }

    if (!file) {
        MOCAP_LOG_ERROR("[BVH] Write error on " << path);
        return false;
    }
    MOCAP_LOG_INFO("[BVH] Exported " << frames.size() << " frames (" << ordered.size() << " joints) to " << path);
    return true;
}

} // namespace mocap
