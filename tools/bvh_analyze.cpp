/**
 * @file bvh_analyze.cpp
 * @brief Kinematics report and CSV export for a BVH motion
 *
 * Parses a BVH file, evaluates forward kinematics for every frame and writes
 * joint positions, velocities, accelerations and anatomical angles to CSV.
 *
 * Usage:
 *   bvh_analyze -i motion.bvh
 *   bvh_analyze -i motion.bvh -o motion.csv -c data/mocap_config.yaml -v
 */

#include <boost/program_options.hpp>
#include <filesystem>
#include <iomanip>
#include <iostream>

#include "mocap/analysis.hpp"
#include "mocap/bvh.hpp"
#include "mocap/config.hpp"
#include "mocap/error.hpp"
#include "mocap/log.hpp"

namespace po = boost::program_options;
namespace fs = std::filesystem;

int main(int argc, char** argv) {
    po::options_description desc("BVH Kinematics Analyzer");
    desc.add_options()
        ("help,h", "Show help")
        ("input,i", po::value<std::string>(), "Input BVH file")
        ("output,o", po::value<std::string>(), "Output CSV (default: <input>_kinematics.csv)")
        ("config,c", po::value<std::string>(), "Config YAML")
        ("verbose,v", po::bool_switch(), "Print per-joint details");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << desc << std::endl;
        return 1;
    }

    if (vm.count("help") || !vm.count("input")) {
        std::cout << "BVH Kinematics Analyzer\n\n";
        std::cout << "Usage: " << argv[0] << " -i <motion.bvh> [-o <out.csv>]\n\n";
        std::cout << desc << std::endl;
        return vm.count("help") ? 0 : 1;
    }

    const std::string inputPath = vm["input"].as<std::string>();
    const bool verbose = vm["verbose"].as<bool>();
    if (verbose) {
        MOCAP_LOG_PRINT_LEVEL();
    }

    mocap::Config config;
    if (vm.count("config")) {
        try {
            config = mocap::Config::load(vm["config"].as<std::string>());
        } catch (const mocap::MocapError& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return 1;
        }
    }

    std::string outputPath;
    if (vm.count("output")) {
        outputPath = vm["output"].as<std::string>();
    } else {
        fs::path p(inputPath);
        outputPath = (p.parent_path() / (p.stem().string() + "_kinematics.csv")).string();
    }

    auto motion = mocap::load_bvh(inputPath);
    if (!motion) {
        std::cerr << "Error: Failed to load BVH: " << inputPath << std::endl;
        return 1;
    }

    const mocap::Skeleton& skel = motion->skeleton;
    std::cout << "File:        " << inputPath << "\n";
    std::cout << "Joints:      " << skel.size() << "\n";
    std::cout << "Channels:    " << skel.channel_count() << "\n";
    std::cout << "Frames:      " << motion->frame_count() << " (declared " << motion->declared_frames << ")\n";
    std::cout << "Frame time:  " << motion->frame_time << " s\n";
    if (motion->frame_time > 0.0) {
        std::cout << "Duration:    " << std::fixed << std::setprecision(2)
                  << motion->frame_count() * motion->frame_time << " s ("
                  << 1.0 / motion->frame_time << " FPS)" << std::defaultfloat << "\n";
    }

    if (verbose) {
        std::cout << "\nHierarchy:\n";
        for (std::size_t id = 0; id < skel.size(); ++id) {
            const mocap::Joint& j = skel.joint(id);
            std::cout << "  " << std::setw(20) << std::left << j.name
                      << " parent=" << std::setw(16) << (j.is_root() ? "-" : skel.parent_name(id))
                      << " channels=" << j.channels.size()
                      << (j.end_site ? " [end site]" : "") << std::right << "\n";
        }
    }

    mocap::MotionAnalysis analysis = mocap::analyze_motion(*motion);

    if (verbose && analysis.frame_count() > 0) {
        std::cout << "\nAngles, frame 1:\n";
        for (const auto& kv : analysis.angles.front()) {
            std::cout << "  " << std::setw(28) << std::left << kv.first << std::right
                      << std::fixed << std::setprecision(2) << kv.second << std::defaultfloat << " deg\n";
        }
    }

    if (!mocap::write_csv(outputPath, skel, analysis, config.position_scale)) {
        std::cerr << "Error: Failed to write CSV: " << outputPath << std::endl;
        return 1;
    }
    std::cout << "\nWrote " << outputPath << std::endl;
    return 0;
}
