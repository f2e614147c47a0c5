#pragma once

#include "mocap/clock.hpp"
#include <optional>
#include <string>

namespace mocap {

// Frames per second over one-second windows
class FrameRateMeter {
public:
    // Count one frame; publishes a new rate once a second has elapsed
    void on_frame(TimePoint now);
    void reset();

    double fps() const { return fps_; }

private:
    std::optional<TimePoint> window_start_;
    int count_ = 0;
    double fps_ = 0.0;
};

enum class StreamState {
    Disconnected,
    Listening,
    Receiving,
    Error
};

const char* stream_state_to_string(StreamState state);

// Liveness tracker for broadcast-only sources (no commands, no calibration)
class StreamMonitor {
public:
    explicit StreamMonitor(double data_timeout_seconds = 5.0);

    void on_listen_result(bool success, const std::string& message, TimePoint now);
    void on_frame(TimePoint now);
    void on_source_error(const std::string& message);
    void stop();

    // Drops back to Listening when no frame arrived for the data timeout
    void tick(TimePoint now);

    StreamState state() const { return state_; }
    bool is_receiving() const { return state_ == StreamState::Receiving; }
    bool is_ready_for_record() const { return is_receiving(); }
    double fps() const { return meter_.fps(); }
    const std::string& status_message() const { return status_message_; }

    std::string status_text() const;

private:
    double data_timeout_seconds_;
    StreamState state_ = StreamState::Disconnected;
    std::optional<TimePoint> last_data_;
    FrameRateMeter meter_;
    std::string status_message_;
};

} // namespace mocap
