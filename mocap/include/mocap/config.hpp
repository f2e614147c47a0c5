#pragma once

#include <string>

namespace mocap {

// Network endpoints handed to the transport collaborator.
// The core never opens sockets itself; these are carried for the source.
struct DeviceConfig {
    std::string local_ip = "10.42.0.101";
    int local_port = 8002;
    std::string device_ip = "10.42.0.202";
    int device_port = 8080;
    int udp_port = 7012;  // broadcast BVH stream
};

// Runtime configuration
//
// Config format (every key optional):
//   capture:
//     stabilize_seconds: 20
//     calibration_timeout_seconds: 60
//     data_timeout_seconds: 5
//   recording:
//     fps: 60
//   analysis:
//     position_scale: 0.01    # BVH centimetres -> CSV metres
//   device:
//     local_ip: 10.42.0.101
//     local_port: 8002
//     device_ip: 10.42.0.202
//     device_port: 8080
//     udp_port: 7012
struct Config {
    double stabilize_seconds = 20.0;
    double calibration_timeout_seconds = 60.0;
    double data_timeout_seconds = 5.0;
    double record_fps = 60.0;
    double position_scale = 0.01;
    DeviceConfig device;

    // Load from YAML file
    // Throws MocapError(ConfigError) if the file cannot be read or a value is invalid
    static Config load(const std::string& path);

    // Parse from YAML text (same rules as load)
    static Config parse(const std::string& yaml_text);
};

} // namespace mocap
