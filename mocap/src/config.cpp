#include "mocap/config.hpp"
#include "mocap/error.hpp"
#include "mocap/log.hpp"
#include <yaml-cpp/yaml.h>

namespace mocap {

namespace {

double positive_or_throw(const YAML::Node& node, const char* key, double fallback) {
    if (!node || !node[key]) {
        return fallback;
    }
    double value = node[key].as<double>();
    if (value <= 0.0) {
        throw MocapError(ErrorCode::ConfigError,
            std::string("'") + key + "' must be positive, got " + std::to_string(value));
    }
    return value;
}

Config from_node(const YAML::Node& root) {
    Config config;
    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw MocapError(ErrorCode::ConfigError, "top-level YAML node must be a map");
    }

    try {
        const YAML::Node capture = root["capture"];
        config.stabilize_seconds = positive_or_throw(capture, "stabilize_seconds", config.stabilize_seconds);
        config.calibration_timeout_seconds =
            positive_or_throw(capture, "calibration_timeout_seconds", config.calibration_timeout_seconds);
        config.data_timeout_seconds = positive_or_throw(capture, "data_timeout_seconds", config.data_timeout_seconds);

        const YAML::Node recording = root["recording"];
        config.record_fps = positive_or_throw(recording, "fps", config.record_fps);

        const YAML::Node analysis = root["analysis"];
        config.position_scale = positive_or_throw(analysis, "position_scale", config.position_scale);

        if (const YAML::Node device = root["device"]) {
            config.device.local_ip = device["local_ip"].as<std::string>(config.device.local_ip);
            config.device.local_port = device["local_port"].as<int>(config.device.local_port);
            config.device.device_ip = device["device_ip"].as<std::string>(config.device.device_ip);
            config.device.device_port = device["device_port"].as<int>(config.device.device_port);
            config.device.udp_port = device["udp_port"].as<int>(config.device.udp_port);
        }
    } catch (const YAML::Exception& e) {
        throw MocapError(ErrorCode::ConfigError, std::string("Invalid config value: ") + e.what());
    }

    return config;
}

} // namespace

Config Config::load(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw MocapError(ErrorCode::ConfigError, path,
            std::string("Failed to load config: ") + e.what());
    }

    Config config = from_node(root);
    MOCAP_LOG_INFO("[Config] Loaded " << path
        << " (stabilize " << config.stabilize_seconds << "s"
        << ", calibration timeout " << config.calibration_timeout_seconds << "s"
        << ", record " << config.record_fps << " fps)");
    return config;
}

Config Config::parse(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw MocapError(ErrorCode::ConfigError, std::string("Failed to parse config: ") + e.what());
    }
    return from_node(root);
}

} // namespace mocap
