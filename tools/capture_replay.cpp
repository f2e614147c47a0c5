/**
 * @file capture_replay.cpp
 * @brief Drive the live capture pipeline from a BVH file
 *
 * Replays a BVH motion through a capture session on a simulated clock:
 * connect, stabilize, calibrate, record one pass of the motion, export BVH.
 * With --broadcast the source behaves like a UDP BVH stream (no commands,
 * no calibration).
 *
 * Usage:
 *   capture_replay -i motion.bvh -o recorded.bvh
 *   capture_replay -i motion.bvh -o recorded.bvh --stabilize 2 --broadcast -v
 */

#include <boost/program_options.hpp>
#include <iostream>

#include "mocap/mocap.hpp"

namespace po = boost::program_options;

namespace {

// Poll until pred holds or max_polls elapse, advancing the simulated clock
template <typename Pred>
bool run_until(mocap::CaptureSession& session, mocap::TimePoint& now, double step,
               std::size_t max_polls, Pred pred) {
    for (std::size_t i = 0; i < max_polls; ++i) {
        if (pred()) return true;
        session.poll(now);
        now = mocap::advance(now, step);
    }
    return pred();
}

} // namespace

int main(int argc, char** argv) {
    po::options_description desc("Capture Replay");
    desc.add_options()
        ("help,h", "Show help")
        ("input,i", po::value<std::string>(), "Input BVH file")
        ("output,o", po::value<std::string>(), "Output BVH file")
        ("config,c", po::value<std::string>(), "Config YAML")
        ("stabilize", po::value<double>(), "Override stabilization seconds")
        ("broadcast", po::bool_switch(), "Replay as a broadcast stream")
        ("verbose,v", po::bool_switch(), "Print status while running");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << desc << std::endl;
        return 1;
    }

    if (vm.count("help") || !vm.count("input") || !vm.count("output")) {
        std::cout << "Capture Replay\n\n";
        std::cout << "Usage: " << argv[0] << " -i <motion.bvh> -o <recorded.bvh>\n\n";
        std::cout << desc << std::endl;
        return vm.count("help") ? 0 : 1;
    }

    const std::string inputPath = vm["input"].as<std::string>();
    const std::string outputPath = vm["output"].as<std::string>();
    const bool verbose = vm["verbose"].as<bool>();

    mocap::Config config;
    try {
        if (vm.count("config")) {
            config = mocap::Config::load(vm["config"].as<std::string>());
        }
    } catch (const mocap::MocapError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    if (vm.count("stabilize")) {
        config.stabilize_seconds = vm["stabilize"].as<double>();
    }

    auto motion = mocap::load_bvh(inputPath);
    if (!motion) {
        std::cerr << "Error: Failed to load BVH: " << inputPath << std::endl;
        return 1;
    }
    const double step = motion->frame_time > 0.0 ? motion->frame_time : 1.0 / config.record_fps;
    const double fps = 1.0 / step;

    mocap::ReplayOptions options;
    options.broadcast = vm["broadcast"].as<bool>();
    options.loop = true;
    mocap::ReplaySource source(std::move(*motion), mocap::build_rig_skeleton(), options);
    mocap::CaptureSession session(source, config);

    mocap::TimePoint now = mocap::Clock::now();
    if (!session.connect(now)) {
        std::cerr << "Error: Failed to connect: " << session.machine().status_message() << std::endl;
        return 1;
    }

    // Generous bound on simulated polls for each phase
    const std::size_t max_polls = static_cast<std::size_t>(
        (config.stabilize_seconds + config.calibration_timeout_seconds + 10.0) * fps);

    if (session.is_device()) {
        if (!run_until(session, now, step, max_polls,
                       [&] { return session.machine().can_start_calibration(); })) {
            std::cerr << "Error: Capture did not stabilize (" << session.status_text() << ")" << std::endl;
            return 1;
        }
        if (verbose) std::cout << "Stabilized: " << session.status_text() << std::endl;

        if (!session.start_calibration(now)) {
            std::cerr << "Error: Calibration refused: " << session.machine().status_message() << std::endl;
            return 1;
        }
        run_until(session, now, step, max_polls, [&] {
            auto c = session.machine().calibration();
            return c == mocap::CalibrationState::Completed || c == mocap::CalibrationState::Failed;
        });
        if (!session.is_ready_for_record()) {
            std::cerr << "Error: Calibration failed: " << session.machine().overall_message() << std::endl;
            return 1;
        }
        if (verbose) std::cout << "Calibrated: " << session.status_text() << std::endl;
    } else {
        run_until(session, now, step, max_polls, [&] { return session.monitor().is_receiving(); });
        if (!session.is_ready_for_record()) {
            std::cerr << "Error: No data from stream" << std::endl;
            return 1;
        }
    }

    // One pass over the motion
    source.rewind();
    source.set_loop(false);
    if (!session.toggle_recording(fps, now)) {
        std::cerr << "Error: Recording refused (" << session.status_text() << ")" << std::endl;
        return 1;
    }
    run_until(session, now, step, source.frame_count() + 2, [&] { return source.finished(); });
    session.toggle_recording(fps, now);

    if (verbose) std::cout << session.recorder().status_text() << std::endl;

    const bool ok = session.export_bvh(outputPath);
    session.disconnect();
    if (!ok) {
        std::cerr << "Error: Export failed: " << outputPath << std::endl;
        return 1;
    }
    std::cout << "Recorded " << session.recorder().frame_count() << " frames to " << outputPath << std::endl;
    return 0;
}
