// Kinematics Test Suite
// Tests forward kinematics, rotation conversions, derivatives, joint angles and CSV export

#include "test_common.hpp"

#include "mocap/analysis.hpp"
#include "mocap/bvh.hpp"
#include "mocap/kinematics.hpp"
#include "mocap/rig.hpp"
#include "mocap/rotation.hpp"

#include <fstream>
#include <limits>
#include <sstream>

namespace fs = std::filesystem;

static bool near_vec(const Eigen::Vector3d& a, const Eigen::Vector3d& b, double tol = 1e-9) {
    return (a - b).norm() <= tol;
}

// ============================================================================
// Forward Kinematics Tests
// ============================================================================

void test_fk_rest_pose() {
    std::cout << "  test_fk_rest_pose..." << std::endl;

    auto motion = mocap::parse_bvh_text(kChainBvh);
    ASSERT_TRUE(motion.has_value());

    mocap::WorldTransforms T = mocap::evaluate(motion->skeleton, motion->frames[0]);
    ASSERT_EQ(T.size(), 3u);
    ASSERT_TRUE(near_vec(T[0].translation(), Eigen::Vector3d(0, 0, 0)));
    ASSERT_TRUE(near_vec(T[1].translation(), Eigen::Vector3d(0, 10, 0)));
    ASSERT_TRUE(near_vec(T[2].translation(), Eigen::Vector3d(0, 20, 0)));
}

void test_fk_rotation_and_translation() {
    std::cout << "  test_fk_rotation_and_translation..." << std::endl;

    auto motion = mocap::parse_bvh_text(kChainBvh);
    ASSERT_TRUE(motion.has_value());

    // Root at x=1, Spine turned 90 degrees about Z swings Head to -X
    mocap::WorldTransforms T = mocap::evaluate(motion->skeleton, motion->frames[1]);
    ASSERT_TRUE(near_vec(T[0].translation(), Eigen::Vector3d(1, 0, 0)));
    ASSERT_TRUE(near_vec(T[1].translation(), Eigen::Vector3d(1, 10, 0)));
    ASSERT_TRUE(near_vec(T[2].translation(), Eigen::Vector3d(-9, 10, 0)));
}

void test_fk_channel_order_matters() {
    std::cout << "  test_fk_channel_order_matters..." << std::endl;

    // Same angles, two channel orders
    auto build = [](const std::vector<mocap::Channel>& order) {
        mocap::Skeleton skel;
        const std::size_t root = skel.add_joint("Root", std::nullopt, Eigen::Vector3d::Zero(), order);
        skel.add_joint("Tip", root, Eigen::Vector3d(0, 0, 10));
        return skel;
    };
    using C = mocap::Channel;
    mocap::Skeleton zx = build({C::Zrotation, C::Xrotation});
    mocap::Skeleton xz = build({C::Xrotation, C::Zrotation});

    // Values are per declared channel: 90 on the first, 90 on the second
    std::vector<double> frame = {90.0, 90.0};
    mocap::WorldTransforms a = mocap::evaluate(zx, frame);
    mocap::WorldTransforms b = mocap::evaluate(xz, frame);

    // Rz(90) Rx(90) (0,0,10) = (10,0,0); Rx(90) Rz(90) (0,0,10) = (0,-10,0)
    ASSERT_TRUE(near_vec(a[1].translation(), Eigen::Vector3d(10, 0, 0)));
    ASSERT_TRUE(near_vec(b[1].translation(), Eigen::Vector3d(0, -10, 0)));
}

void test_fk_short_frame_reads_zero() {
    std::cout << "  test_fk_short_frame_reads_zero..." << std::endl;

    auto motion = mocap::parse_bvh_text(kChainBvh);
    ASSERT_TRUE(motion.has_value());

    // Only the root position survives
    mocap::WorldTransforms T = mocap::evaluate(motion->skeleton, {4.0, 5.0, 6.0});
    ASSERT_TRUE(near_vec(T[0].translation(), Eigen::Vector3d(4, 5, 6)));
    ASSERT_TRUE(near_vec(T[2].translation(), Eigen::Vector3d(4, 25, 6)));
    ASSERT_TRUE(T[2].linear().isApprox(Eigen::Matrix3d::Identity()));
}

void test_fk_deterministic() {
    std::cout << "  test_fk_deterministic..." << std::endl;

    auto motion = mocap::parse_bvh_text(kChainBvh);
    ASSERT_TRUE(motion.has_value());

    std::vector<double> frame = {1.25, -3.5, 7.0, 13.0, -47.0, 88.0, 31.0, 12.5, -0.25, 179.0, -91.0, 45.0};
    mocap::WorldTransforms a = mocap::evaluate(motion->skeleton, frame);
    mocap::WorldTransforms b;
    mocap::evaluate(motion->skeleton, frame, b);
    mocap::evaluate(motion->skeleton, frame, b);

    for (std::size_t i = 0; i < a.size(); ++i) {
        ASSERT_TRUE(a[i].matrix() == b[i].matrix());
    }
}

void test_fk_pose_frame() {
    std::cout << "  test_fk_pose_frame..." << std::endl;

    mocap::Skeleton rig = mocap::build_rig_skeleton();
    mocap::PoseFrame frame(rig.size());

    // Empty frame: rest pose from the default offsets
    mocap::WorldTransforms T;
    mocap::evaluate_pose(rig, frame, T);
    ASSERT_TRUE(near_vec(T[*rig.find("Head")].translation(), Eigen::Vector3d(0, 53, 0)));
    ASSERT_TRUE(near_vec(T[*rig.find("LeftHand")].translation(), Eigen::Vector3d(67, 38, 0)));

    // Root translated and turned 90 degrees about Y; RightUpLeg (-8.5,0,0) maps to (0,0,8.5)
    mocap::JointPose& hips = frame.joints[0];
    hips.present = true;
    hips.position = Eigen::Vector3d(10, 90, 0);
    hips.rotation = Eigen::Quaterniond(Eigen::AngleAxisd(M_PI / 2.0, Eigen::Vector3d::UnitY()));
    mocap::evaluate_pose(rig, frame, T);
    ASSERT_TRUE(near_vec(T[0].translation(), Eigen::Vector3d(10, 90, 0)));
    ASSERT_TRUE(near_vec(T[*rig.find("RightUpLeg")].translation(), Eigen::Vector3d(10, 90, 8.5), 1e-9));

    // Unnormalized quaternions are normalized before use
    hips.rotation = Eigen::Quaterniond(2.0, 0.0, 0.0, 0.0);
    mocap::evaluate_pose(rig, frame, T);
    ASSERT_TRUE(T[0].linear().isApprox(Eigen::Matrix3d::Identity()));
}

void run_fk_tests() {
    std::cout << "=== Forward Kinematics Tests ===" << std::endl;
    test_fk_rest_pose();
    test_fk_rotation_and_translation();
    test_fk_channel_order_matters();
    test_fk_short_frame_reads_zero();
    test_fk_deterministic();
    test_fk_pose_frame();
    std::cout << "  Forward kinematics tests completed" << std::endl << std::endl;
}

// ============================================================================
// Rotation Tests
// ============================================================================

static Eigen::Matrix3d zxy_matrix(const Eigen::Vector3d& zxy) {
    return mocap::axis_rotation(mocap::Channel::Zrotation, zxy[0]) *
           mocap::axis_rotation(mocap::Channel::Xrotation, zxy[1]) *
           mocap::axis_rotation(mocap::Channel::Yrotation, zxy[2]);
}

void test_euler_zxy_reproduces_rotation() {
    std::cout << "  test_euler_zxy_reproduces_rotation..." << std::endl;

    const Eigen::Quaterniond samples[] = {
        Eigen::Quaterniond::Identity(),
        Eigen::Quaterniond(Eigen::AngleAxisd(0.7, Eigen::Vector3d(1, 2, 3).normalized())),
        Eigen::Quaterniond(Eigen::AngleAxisd(-2.1, Eigen::Vector3d(-0.3, 0.9, 0.1).normalized())),
        Eigen::Quaterniond(Eigen::AngleAxisd(3.0, Eigen::Vector3d(0.0, 0.0, 1.0))),
        Eigen::Quaterniond(0.2, -0.4, 0.7, 0.1),  // not unit
    };

    for (const auto& q : samples) {
        const Eigen::Vector3d zxy = mocap::quaternion_to_euler_zxy(q);
        ASSERT_TRUE(zxy_matrix(zxy).isApprox(mocap::quaternion_to_matrix(q), 1e-9));
        ASSERT_TRUE(zxy[1] >= -90.0 && zxy[1] <= 90.0);
    }
}

void test_euler_zxy_known_angles() {
    std::cout << "  test_euler_zxy_known_angles..." << std::endl;

    using C = mocap::Channel;
    Eigen::Quaterniond q = mocap::euler_to_quaternion({C::Zrotation, C::Xrotation, C::Yrotation}, {30.0, -20.0, 45.0});
    Eigen::Vector3d zxy = mocap::quaternion_to_euler_zxy(q);
    ASSERT_NEAR(zxy[0], 30.0, 1e-9);
    ASSERT_NEAR(zxy[1], -20.0, 1e-9);
    ASSERT_NEAR(zxy[2], 45.0, 1e-9);
}

void test_euler_zxy_gimbal() {
    std::cout << "  test_euler_zxy_gimbal..." << std::endl;

    using C = mocap::Channel;
    // X = 90 with a Y twist: Y folds into Z
    Eigen::Quaterniond q = mocap::euler_to_quaternion({C::Xrotation, C::Yrotation}, {90.0, 30.0});
    Eigen::Vector3d zxy = mocap::quaternion_to_euler_zxy(q);
    ASSERT_NEAR(zxy[1], 90.0, 1e-6);
    ASSERT_EQ(zxy[2], 0.0);
    ASSERT_NEAR(zxy[0], 30.0, 1e-6);
    ASSERT_TRUE(zxy_matrix(zxy).isApprox(mocap::quaternion_to_matrix(q), 1e-6));

    // X = -90
    q = mocap::euler_to_quaternion({C::Zrotation, C::Xrotation, C::Yrotation}, {10.0, -90.0, 25.0});
    zxy = mocap::quaternion_to_euler_zxy(q);
    ASSERT_NEAR(zxy[1], -90.0, 1e-6);
    ASSERT_EQ(zxy[2], 0.0);
    ASSERT_TRUE(zxy_matrix(zxy).isApprox(mocap::quaternion_to_matrix(q), 1e-6));
}

void test_degenerate_quaternion() {
    std::cout << "  test_degenerate_quaternion..." << std::endl;

    Eigen::Quaterniond zero(0.0, 0.0, 0.0, 0.0);
    ASSERT_TRUE(mocap::quaternion_to_matrix(zero).isApprox(Eigen::Matrix3d::Identity()));
    Eigen::Vector3d zxy = mocap::quaternion_to_euler_zxy(zero);
    ASSERT_TRUE(zxy.isZero());
}

void run_rotation_tests() {
    std::cout << "=== Rotation Tests ===" << std::endl;
    test_euler_zxy_reproduces_rotation();
    test_euler_zxy_known_angles();
    test_euler_zxy_gimbal();
    test_degenerate_quaternion();
    std::cout << "  Rotation tests completed" << std::endl << std::endl;
}

// ============================================================================
// Derivative and Angle Tests
// ============================================================================

void test_velocity_acceleration() {
    std::cout << "  test_velocity_acceleration..." << std::endl;

    mocap::Vec3Series positions;
    for (double x : {0.0, 1.0, 3.0, 6.0, 10.0}) {
        positions.push_back({Eigen::Vector3d(x, 0, 0)});
    }
    const double dt = 0.5;
    mocap::Vec3Series vel = mocap::compute_velocities(positions, dt);
    mocap::Vec3Series acc = mocap::compute_accelerations(vel, dt);

    ASSERT_EQ(vel.size(), 5u);
    ASSERT_TRUE(vel[0][0].isZero());
    ASSERT_TRUE(vel[1][0].isZero());
    for (std::size_t i = 2; i < positions.size(); ++i) {
        ASSERT_TRUE(near_vec(vel[i][0], (positions[i][0] - positions[i - 1][0]) / dt));
    }
    ASSERT_NEAR(vel[2][0].x(), 4.0, 1e-12);
    ASSERT_NEAR(vel[4][0].x(), 8.0, 1e-12);

    ASSERT_TRUE(acc[0][0].isZero());
    ASSERT_TRUE(acc[1][0].isZero());
    ASSERT_NEAR(acc[2][0].x(), 8.0, 1e-12);  // (4 - 0) / 0.5
    ASSERT_NEAR(acc[3][0].x(), 4.0, 1e-12);  // (6 - 4) / 0.5
}

void test_derivatives_nonpositive_frame_time() {
    std::cout << "  test_derivatives_nonpositive_frame_time..." << std::endl;

    mocap::Vec3Series positions;
    for (double x : {0.0, 1.0, 3.0}) {
        positions.push_back({Eigen::Vector3d(x, x, x)});
    }
    mocap::Vec3Series vel = mocap::compute_velocities(positions, 0.0);
    ASSERT_EQ(vel.size(), 3u);
    for (const auto& frame : vel) {
        ASSERT_TRUE(frame[0].isZero());
    }
}

void test_anatomical_angle() {
    std::cout << "  test_anatomical_angle..." << std::endl;

    const Eigen::Vector3d origin(0, 0, 0);

    // Straight chain
    auto straight = mocap::anatomical_angle(Eigen::Vector3d(0, -1, 0), origin, Eigen::Vector3d(0, 2, 0));
    ASSERT_TRUE(straight.has_value());
    ASSERT_EQ(*straight, 180.0);

    // Folded back on itself
    auto folded = mocap::anatomical_angle(Eigen::Vector3d(0, 1, 0), origin, Eigen::Vector3d(0, 2, 0));
    ASSERT_TRUE(folded.has_value());
    ASSERT_EQ(*folded, 0.0);

    // Right angle
    auto right = mocap::anatomical_angle(Eigen::Vector3d(1, 0, 0), origin, Eigen::Vector3d(0, 0, 3));
    ASSERT_TRUE(right.has_value());
    ASSERT_NEAR(*right, 90.0, 1e-12);

    // Rounded to two decimals
    auto odd = mocap::anatomical_angle(Eigen::Vector3d(1, 0, 0), origin, Eigen::Vector3d(1, 1, 0.1));
    ASSERT_TRUE(odd.has_value());
    ASSERT_NEAR(*odd * 100.0, std::round(*odd * 100.0), 1e-6);
    ASSERT_TRUE(*odd >= 0.0 && *odd <= 180.0);

    // Degenerate vector
    ASSERT_FALSE(mocap::anatomical_angle(origin, origin, Eigen::Vector3d(0, 1, 0)).has_value());
}

void test_anatomical_angles_rig_rest_pose() {
    std::cout << "  test_anatomical_angles_rig_rest_pose..." << std::endl;

    mocap::Skeleton rig = mocap::build_rig_skeleton();
    mocap::WorldTransforms T;
    mocap::evaluate_pose(rig, mocap::PoseFrame(rig.size()), T);
    mocap::AngleMap angles = mocap::compute_anatomical_angles(rig, mocap::world_positions(T));

    // Named triples
    ASSERT_TRUE(angles.count("Hips_Spine"));
    ASSERT_NEAR(angles["Hips_Spine"], 180.0, 1e-9);
    ASSERT_TRUE(angles.count("Spine2_Neck"));
    ASSERT_NEAR(angles["Spine2_Neck"], 180.0, 1e-9);

    // Adjacency angles
    ASSERT_NEAR(angles["Spine_Spine1"], 180.0, 1e-9);
    ASSERT_NEAR(angles["Hips_RightUpLeg"], 90.0, 1e-9);
    ASSERT_NEAR(angles["RightUpLeg_RightLeg"], 180.0, 1e-9);
    ASSERT_NEAR(angles["RightShoulder_RightArm"], 180.0, 1e-9);
    ASSERT_TRUE(angles.count("Spine1_Spine2"));

    // Leaves and the root produce no key of their own
    ASSERT_FALSE(angles.count("RightLeg_RightFoot"));
    ASSERT_FALSE(angles.count("Neck1_Head"));
}

void test_anatomical_angles_missing_joints() {
    std::cout << "  test_anatomical_angles_missing_joints..." << std::endl;

    // Hips -> Spine -> Head: Spine2 and Neck are absent
    auto motion = mocap::parse_bvh_text(kChainBvh);
    ASSERT_TRUE(motion.has_value());

    mocap::WorldTransforms T = mocap::evaluate(motion->skeleton, motion->frames[1]);
    mocap::AngleMap angles = mocap::compute_anatomical_angles(motion->skeleton, mocap::world_positions(T));

    // The adjacency value under Hips_Spine is dropped because the back-bend triple is undefined
    ASSERT_FALSE(angles.count("Hips_Spine"));
    ASSERT_FALSE(angles.count("Spine2_Neck"));
    ASSERT_TRUE(angles.empty());
}

void run_angle_tests() {
    std::cout << "=== Derivative and Angle Tests ===" << std::endl;
    test_velocity_acceleration();
    test_derivatives_nonpositive_frame_time();
    test_anatomical_angle();
    test_anatomical_angles_rig_rest_pose();
    test_anatomical_angles_missing_joints();
    std::cout << "  Derivative and angle tests completed" << std::endl << std::endl;
}

// ============================================================================
// Motion Analysis and CSV Tests
// ============================================================================

// Hips -> Spine -> Spine1 -> Spine2 -> Neck -> Head
static const char* kSpineBvh =
    "HIERARCHY\n"
    "ROOT Hips\n{\n  OFFSET 0 0 0\n  CHANNELS 6 Xposition Yposition Zposition Zrotation Xrotation Yrotation\n"
    "  JOINT Spine\n  {\n    OFFSET 0 10 0\n    CHANNELS 3 Zrotation Xrotation Yrotation\n"
    "    JOINT Spine1\n    {\n      OFFSET 0 10 0\n      CHANNELS 3 Zrotation Xrotation Yrotation\n"
    "      JOINT Spine2\n      {\n        OFFSET 0 10 0\n        CHANNELS 3 Zrotation Xrotation Yrotation\n"
    "        JOINT Neck\n        {\n          OFFSET 0 10 0\n          CHANNELS 3 Zrotation Xrotation Yrotation\n"
    "          JOINT Head\n          {\n            OFFSET 0 10 0\n            CHANNELS 3 Zrotation Xrotation Yrotation\n"
    "            End Site\n            {\n              OFFSET 0 5 0\n            }\n"
    "          }\n        }\n      }\n    }\n  }\n}\n"
    "MOTION\nFrames: 3\nFrame Time: 0.5\n"
    "0 100 0 0 0 0 0 0 0 0 0 0 0 0 0 0 0 0 0 0 0\n"
    "100 100 0 0 0 0 0 0 0 0 0 0 0 0 0 0 0 0 0 0 0\n"
    "300 100 0 0 0 0 0 0 0 0 0 0 90 0 0 0 0 0 0 0 0\n";

void test_analyze_motion() {
    std::cout << "  test_analyze_motion..." << std::endl;

    auto motion = mocap::parse_bvh_text(kSpineBvh);
    ASSERT_TRUE(motion.has_value());
    ASSERT_EQ(motion->skeleton.channel_count(), 21u);

    mocap::MotionAnalysis analysis = mocap::analyze_motion(*motion);
    ASSERT_EQ(analysis.frame_count(), 3u);
    ASSERT_EQ(analysis.velocities.size(), 3u);
    ASSERT_EQ(analysis.angles.size(), 3u);

    // Hips x: 0, 100, 300 cm over 0.5 s frames
    ASSERT_TRUE(analysis.velocities[1][0].isZero());
    ASSERT_NEAR(analysis.velocities[2][0].x(), 400.0, 1e-9);
    ASSERT_NEAR(analysis.accelerations[2][0].x(), 800.0, 1e-9);

    // Straight spine, then a 90 degree bend at Spine2 (Spine2 rotation channels start at 12)
    ASSERT_NEAR(analysis.angles[0].at("Hips_Spine"), 180.0, 1e-9);
    ASSERT_NEAR(analysis.angles[0].at("Spine1_Spine2"), 180.0, 1e-9);
    ASSERT_NEAR(analysis.angles[2].at("Spine1_Spine2"), 90.0, 1e-9);
    ASSERT_NEAR(analysis.angles[2].at("Hips_Spine"), 180.0, 1e-9);
}

static std::vector<std::string> split(const std::string& line, char sep) {
    std::vector<std::string> out;
    std::stringstream ss(line);
    std::string cell;
    while (std::getline(ss, cell, sep)) out.push_back(cell);
    return out;
}

void test_write_csv_layout() {
    std::cout << "  test_write_csv_layout..." << std::endl;

    auto motion = mocap::parse_bvh_text(kSpineBvh);
    ASSERT_TRUE(motion.has_value());
    mocap::MotionAnalysis analysis = mocap::analyze_motion(*motion);

    // A key only present in one frame is written as nan elsewhere
    analysis.angles[1]["Extra_Angle"] = 12.5;

    const std::string path = temp_path("analysis.csv");
    ASSERT_TRUE(mocap::write_csv(path, motion->skeleton, analysis, 0.01));

    std::ifstream in(path, std::ios::binary);
    ASSERT_TRUE(in.is_open());
    std::string header;
    std::getline(in, header);

    // Byte order mark
    ASSERT_TRUE(header.compare(0, 3, "\xEF\xBB\xBF") == 0);
    header = header.substr(3);

    std::vector<std::string> columns = split(header, ',');
    // Frame + 6 joints * 9 + angle keys
    const std::size_t joint_columns = 1 + 6 * 9;
    ASSERT_EQ(columns[0], "Frame");
    ASSERT_EQ(columns[1], "Hips_pos_X(m)");
    ASSERT_EQ(columns[4], "Hips_vel_X(m/s)");
    ASSERT_EQ(columns[7], "Hips_accel_X(m/s\xC2\xB2)");
    ASSERT_EQ(columns[10], "Spine_pos_X(m)");

    // Angle keys sorted
    std::vector<std::string> angle_columns(columns.begin() + joint_columns, columns.end());
    ASSERT_TRUE(angle_columns.size() >= 2);
    ASSERT_EQ(angle_columns[0], "Extra_Angle(\xC2\xB0)");
    for (std::size_t i = 1; i < angle_columns.size(); ++i) {
        ASSERT_TRUE(angle_columns[i - 1] < angle_columns[i]);
    }

    std::vector<std::vector<std::string>> rows;
    std::string line;
    while (std::getline(in, line)) rows.push_back(split(line, ','));
    ASSERT_EQ(rows.size(), 3u);
    ASSERT_EQ(rows[0][0], "1");
    ASSERT_EQ(rows[2][0], "3");
    ASSERT_EQ(rows[0].size(), columns.size());

    // Centimetres to metres, four decimals
    ASSERT_EQ(rows[2][1], "3.0000");
    ASSERT_EQ(rows[2][2], "1.0000");
    ASSERT_EQ(rows[2][4], "4.0000");
    ASSERT_EQ(rows[2][7], "8.0000");

    // Missing angle
    ASSERT_EQ(rows[0][joint_columns], "nan");
    ASSERT_EQ(rows[1][joint_columns], "12.50");

    in.close();
    fs::remove(path);
}

void test_write_csv_unwritable() {
    std::cout << "  test_write_csv_unwritable..." << std::endl;

    auto motion = mocap::parse_bvh_text(kSpineBvh);
    ASSERT_TRUE(motion.has_value());
    mocap::MotionAnalysis analysis = mocap::analyze_motion(*motion);
    ASSERT_FALSE(mocap::write_csv(temp_path("no_such_dir/out.csv"), motion->skeleton, analysis, 0.01));
}

void run_analysis_tests() {
    std::cout << "=== Motion Analysis Tests ===" << std::endl;
    test_analyze_motion();
    test_write_csv_layout();
    test_write_csv_unwritable();
    std::cout << "  Motion analysis tests completed" << std::endl << std::endl;
}

// ============================================================================
// Main
// ============================================================================

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "Kinematics Test Suite" << std::endl;
    std::cout << "========================================" << std::endl;

    try {
        run_fk_tests();
        run_rotation_tests();
        run_angle_tests();
        run_analysis_tests();

        std::cout << "========================================" << std::endl;
        std::cout << "All tests completed successfully!" << std::endl;
        std::cout << "========================================" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
