#include "mocap/session.hpp"
#include "mocap/log.hpp"
#include "mocap/rig.hpp"

#include <cstdio>

namespace mocap {

CaptureSession::CaptureSession(CaptureSource& source, const Config& config)
    : source_(source),
      config_(config),
      machine_(config.stabilize_seconds, config.calibration_timeout_seconds),
      monitor_(config.data_timeout_seconds),
      recorder_(build_rig_skeleton()) {}

bool CaptureSession::dispatch(Command command) {
    if (!source_.issue(command)) {
        machine_.on_issue_failed(std::string(command_to_string(command)) + " refused by " + source_.name());
        return false;
    }
    return true;
}

bool CaptureSession::connect(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string message;

    if (!is_device()) {
        const bool ok = source_.open(message);
        monitor_.on_listen_result(ok, message, now);
        return ok;
    }

    if (!machine_.begin_connect()) {
        return false;
    }
    const bool ok = source_.open(message);
    machine_.on_connect_result(ok, message);
    if (!ok) {
        return false;
    }
    meter_.reset();
    if (machine_.request_start_capture()) {
        dispatch(Command::StartCapture);
    }
    return true;
}

void CaptureSession::handle(const CaptureEvent& event, TimePoint now) {
    switch (event.type) {
        case CaptureEvent::Type::Frame:
            if (is_device()) {
                machine_.on_frame(now);
                meter_.on_frame(now);
            } else {
                monitor_.on_frame(now);
            }
            break;
        case CaptureEvent::Type::CommandReply:
            switch (event.reply) {
                case ReplyKind::Response:
                    MOCAP_LOG_VERBOSE("[Session] Command acknowledged");
                    break;
                case ReplyKind::Running:
                    machine_.on_calibration_progress(event.progress);
                    break;
                case ReplyKind::Result:
                    machine_.on_command_result(event.result_code, event.message);
                    break;
            }
            break;
        case CaptureEvent::Type::Notify:
            MOCAP_LOG_INFO("[Session] " << source_.name() << ": " << event.message);
            break;
        case CaptureEvent::Type::Error:
            if (recorder_.is_recording()) {
                recorder_.stop_recording();
                MOCAP_LOG_WARN("[Session] Recording stopped by source error");
            }
            if (is_device()) {
                machine_.on_source_error(event.message);
            } else {
                monitor_.on_source_error(event.message);
            }
            break;
    }
}

void CaptureSession::poll(TimePoint now) {
    const PoseFrame* newest = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.clear();
        source_.poll(events_);

        for (const auto& event : events_) {
            handle(event, now);
            if (event.type == CaptureEvent::Type::Frame) {
                newest = &event.frame;
            }
        }

        if (newest && ready_for_record_locked()) {
            recorder_.record_frame(*newest, now);
        }

        if (is_device()) {
            machine_.tick(now);
        } else {
            monitor_.tick(now);
        }
    }

    // events_ is refilled only by poll; one thread polls
    if (newest) {
        slot_.publish(*newest);
    }
}

bool CaptureSession::start_calibration(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_device()) {
        MOCAP_LOG_WARN("[Session] " << source_.name() << " does not support calibration");
        return false;
    }
    if (!machine_.request_calibration(now)) {
        return false;
    }
    return dispatch(Command::Calibrate);
}

bool CaptureSession::ready_for_record_locked() const {
    return is_device() ? machine_.is_ready_for_record() : monitor_.is_ready_for_record();
}

bool CaptureSession::is_ready_for_record() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ready_for_record_locked();
}

bool CaptureSession::is_recording() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return recorder_.is_recording();
}

bool CaptureSession::toggle_recording(double fps, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (recorder_.is_recording()) {
        recorder_.stop_recording();
        return true;
    }
    if (!ready_for_record_locked()) {
        MOCAP_LOG_WARN("[Session] Not ready to record (" << status_text_locked() << ")");
        return false;
    }
    recorder_.start_recording(fps, now);
    return true;
}

void CaptureSession::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (recorder_.is_recording()) {
        recorder_.stop_recording();
    }

    if (is_device()) {
        if (machine_.is_capturing() && !machine_.has_command_in_flight() && machine_.request_stop_capture()) {
            dispatch(Command::StopCapture);
        }
        source_.close();
        machine_.on_disconnected();
    } else {
        source_.close();
        monitor_.stop();
    }
    meter_.reset();
    slot_.clear();
}

double CaptureSession::fps() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return is_device() ? meter_.fps() : monitor_.fps();
}

std::string CaptureSession::status_text() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_text_locked();
}

std::string CaptureSession::status_text_locked() const {
    if (!is_device()) {
        return monitor_.status_text();
    }
    if (machine_.connection() == ConnectionState::Capturing && machine_.phase() == CapturePhase::Calibrated) {
        char buf[48];
        std::snprintf(buf, sizeof(buf), "Calibrated (%.1f FPS)", meter_.fps());
        return buf;
    }
    return machine_.connection_status_text();
}

bool CaptureSession::export_bvh(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return recorder_.export_bvh(path);
}

} // namespace mocap
