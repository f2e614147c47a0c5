#include "mocap/stream_monitor.hpp"
#include "mocap/log.hpp"

#include <cstdio>

namespace mocap {

void FrameRateMeter::on_frame(TimePoint now) {
    if (!window_start_) {
        window_start_ = now;
    }
    ++count_;
    const double elapsed = seconds_between(*window_start_, now);
    if (elapsed >= 1.0) {
        fps_ = count_ / elapsed;
        count_ = 0;
        window_start_ = now;
    }
}

void FrameRateMeter::reset() {
    window_start_.reset();
    count_ = 0;
    fps_ = 0.0;
}

const char* stream_state_to_string(StreamState state) {
    switch (state) {
        case StreamState::Disconnected: return "Disconnected";
        case StreamState::Listening:    return "Listening";
        case StreamState::Receiving:    return "Receiving";
        case StreamState::Error:        return "Error";
        default:                        return "Unknown";
    }
}

StreamMonitor::StreamMonitor(double data_timeout_seconds)
    : data_timeout_seconds_(data_timeout_seconds) {}

void StreamMonitor::on_listen_result(bool success, const std::string& message, TimePoint now) {
    status_message_ = message;
    if (success) {
        state_ = StreamState::Listening;
        last_data_ = now;
        meter_.reset();
        MOCAP_LOG_INFO("[Stream] " << message << ", waiting for broadcast");
    } else {
        state_ = StreamState::Error;
        MOCAP_LOG_ERROR("[Stream] Failed to listen: " << message);
    }
}

void StreamMonitor::on_frame(TimePoint now) {
    if (state_ != StreamState::Listening && state_ != StreamState::Receiving) {
        return;
    }
    if (state_ == StreamState::Listening) {
        state_ = StreamState::Receiving;
        MOCAP_LOG_INFO("[Stream] Receiving data");
    }
    last_data_ = now;
    meter_.on_frame(now);
}

void StreamMonitor::on_source_error(const std::string& message) {
    state_ = StreamState::Error;
    status_message_ = message;
    MOCAP_LOG_ERROR("[Stream] " << message);
}

void StreamMonitor::stop() {
    state_ = StreamState::Disconnected;
    last_data_.reset();
    meter_.reset();
    MOCAP_LOG_INFO("[Stream] Stopped listening");
}

void StreamMonitor::tick(TimePoint now) {
    if (state_ != StreamState::Receiving || !last_data_) {
        return;
    }
    if (seconds_between(*last_data_, now) > data_timeout_seconds_) {
        state_ = StreamState::Listening;
        status_message_ = "No data for " + std::to_string(static_cast<int>(data_timeout_seconds_)) + "s";
        MOCAP_LOG_WARN("[Stream] " << status_message_ << ", broadcaster may have stopped");
    }
}

std::string StreamMonitor::status_text() const {
    switch (state_) {
        case StreamState::Disconnected: return "Not Listening";
        case StreamState::Listening:    return "Waiting for Data...";
        case StreamState::Receiving: {
            char buf[48];
            std::snprintf(buf, sizeof(buf), "Receiving (%.1f FPS)", meter_.fps());
            return buf;
        }
        case StreamState::Error:        return "Error";
    }
    return "Unknown";
}

} // namespace mocap
