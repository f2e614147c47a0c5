#include "mocap/capture.hpp"
#include "mocap/log.hpp"

#include <algorithm>

namespace mocap {

const char* connection_state_to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Connecting:   return "Connecting";
        case ConnectionState::Connected:    return "Connected";
        case ConnectionState::Capturing:    return "Capturing";
        case ConnectionState::Calibrating:  return "Calibrating";
        case ConnectionState::Error:        return "Error";
        default:                            return "Unknown";
    }
}

const char* capture_phase_to_string(CapturePhase phase) {
    switch (phase) {
        case CapturePhase::Idle:        return "Idle";
        case CapturePhase::Stabilizing: return "Stabilizing";
        case CapturePhase::Ready:       return "Ready";
        case CapturePhase::Calibrated:  return "Calibrated";
        default:                        return "Unknown";
    }
}

const char* calibration_state_to_string(CalibrationState state) {
    switch (state) {
        case CalibrationState::None:       return "None";
        case CalibrationState::Preparing:  return "Preparing";
        case CalibrationState::Countdown:  return "Countdown";
        case CalibrationState::InProgress: return "InProgress";
        case CalibrationState::Completed:  return "Completed";
        case CalibrationState::Failed:     return "Failed";
        default:                           return "Unknown";
    }
}

CaptureStateMachine::CaptureStateMachine(double stabilize_seconds, double calibration_timeout_seconds)
    : stabilize_seconds_(stabilize_seconds),
      calibration_timeout_seconds_(calibration_timeout_seconds) {}

bool CaptureStateMachine::reject(const std::string& message) {
    status_message_ = message;
    last_error_ = ErrorCode::CommandRejected;
    MOCAP_LOG_WARN("[Capture] " << message);
    return false;
}

void CaptureStateMachine::report(ErrorCode code, const std::string& message) {
    status_message_ = message;
    last_error_ = code;
    MOCAP_LOG_ERROR("[Capture] " << message);
}

void CaptureStateMachine::accept(Command command) {
    ctx_.in_flight = command;
    MOCAP_LOG_VERBOSE("[Capture] " << command_to_string(command) << " issued");
}

bool CaptureStateMachine::is_link_up() const {
    return ctx_.connected &&
           (ctx_.connection == ConnectionState::Connected ||
            ctx_.connection == ConnectionState::Capturing ||
            ctx_.connection == ConnectionState::Calibrating);
}

// ============================================================================
// Connection
// ============================================================================

bool CaptureStateMachine::begin_connect() {
    if (ctx_.connection != ConnectionState::Disconnected && ctx_.connection != ConnectionState::Error) {
        return reject(std::string("Cannot connect while ") + connection_state_to_string(ctx_.connection));
    }
    ctx_ = CaptureContext();
    rollback_.reset();
    ctx_.connection = ConnectionState::Connecting;
    return true;
}

void CaptureStateMachine::on_connect_result(bool success, const std::string& message) {
    if (ctx_.connection != ConnectionState::Connecting) {
        MOCAP_LOG_WARN("[Capture] Connect result while " << connection_state_to_string(ctx_.connection));
        return;
    }
    if (success) {
        ctx_.connected = true;
        ctx_.connection = ConnectionState::Connected;
        status_message_ = message;
        last_error_.reset();
        MOCAP_LOG_INFO("[Capture] Connected: " << message);
    } else {
        ctx_.connection = ConnectionState::Error;
        report(ErrorCode::IOError, "Connection failed: " + message);
    }
}

void CaptureStateMachine::on_disconnected() {
    ctx_ = CaptureContext();
    rollback_.reset();
    status_message_.clear();
    last_error_.reset();
    MOCAP_LOG_INFO("[Capture] Disconnected");
}

// ============================================================================
// Commands
// ============================================================================

bool CaptureStateMachine::request_start_capture() {
    if (!is_link_up()) {
        return reject("Not connected, cannot start capture");
    }
    if (ctx_.capturing) {
        return reject("Already capturing");
    }
    if (ctx_.in_flight) {
        return reject(std::string("Another command (") + command_to_string(*ctx_.in_flight) + ") is pending");
    }
    rollback_ = ctx_;
    accept(Command::StartCapture);
    return true;
}

bool CaptureStateMachine::request_stop_capture() {
    if (!is_link_up()) {
        return reject("Not connected, cannot stop capture");
    }
    if (!ctx_.capturing) {
        return reject("Not capturing");
    }
    if (ctx_.in_flight) {
        return reject(std::string("Another command (") + command_to_string(*ctx_.in_flight) + ") is pending");
    }
    rollback_ = ctx_;
    accept(Command::StopCapture);
    return true;
}

bool CaptureStateMachine::request_calibration(TimePoint now) {
    if (!ctx_.capturing) {
        return reject("Not capturing, cannot calibrate");
    }
    if (ctx_.phase != CapturePhase::Ready) {
        return reject(std::string("Capture not ready (phase ") + capture_phase_to_string(ctx_.phase)
                      + "), wait for stabilization");
    }
    if (ctx_.in_flight) {
        return reject(std::string("Another command (") + command_to_string(*ctx_.in_flight) + ") is pending");
    }
    if (ctx_.calibration_pending) {
        return reject("Calibration already in progress");
    }

    rollback_ = ctx_;
    accept(Command::Calibrate);
    ctx_.connection = ConnectionState::Calibrating;
    ctx_.calibration_pending = true;
    ctx_.calibration_start = now;
    ctx_.calibration = CalibrationState::Preparing;
    ctx_.calibration_progress = 0;
    MOCAP_LOG_INFO("[Calibration] Started (timeout " << calibration_timeout_seconds_ << "s)");
    return true;
}

void CaptureStateMachine::on_issue_failed(const std::string& message) {
    if (rollback_) {
        ctx_ = *rollback_;
        rollback_.reset();
    } else {
        ctx_.in_flight.reset();
    }
    report(ErrorCode::CommandRejected, "Source refused command: " + message);
}

// ============================================================================
// Source events
// ============================================================================

void CaptureStateMachine::on_frame(TimePoint now) {
    if (!is_link_up()) {
        return;
    }

    // The first frame is proof that capture started even without a result
    if (ctx_.in_flight == Command::StartCapture) {
        ctx_.in_flight.reset();
        rollback_.reset();
    }

    if (!ctx_.capturing && !ctx_.in_flight) {
        ctx_.capturing = true;
        ctx_.connection = ConnectionState::Capturing;
        ctx_.phase = CapturePhase::Stabilizing;
        ctx_.stabilize_start = now;
        ctx_.stabilize_remaining = stabilize_seconds_;
        MOCAP_LOG_INFO("[Capture] Capturing started, hold still for " << stabilize_seconds_ << "s");
    }

    if (ctx_.phase == CapturePhase::Stabilizing && ctx_.in_flight != Command::Calibrate && ctx_.stabilize_start) {
        const double elapsed = seconds_between(*ctx_.stabilize_start, now);
        ctx_.stabilize_remaining = std::max(0.0, stabilize_seconds_ - elapsed);
        if (elapsed >= stabilize_seconds_) {
            ctx_.phase = CapturePhase::Ready;
            MOCAP_LOG_INFO("[Capture] Stabilized, ready for calibration");
        }
    }
}

void CaptureStateMachine::on_calibration_progress(const CalibrationProgress& progress) {
    if (ctx_.in_flight != Command::Calibrate) {
        MOCAP_LOG_VERBOSE("[Calibration] Progress ignored, no calibration in flight");
        return;
    }

    ctx_.calibration_pose = progress.pose_name;
    switch (progress.step) {
        case CalibrationStep::Prepare:
            ctx_.calibration = CalibrationState::Preparing;
            ctx_.calibration_countdown = 0;
            ctx_.calibration_progress = 0;
            break;
        case CalibrationStep::Countdown:
            ctx_.calibration = CalibrationState::Countdown;
            ctx_.calibration_countdown = progress.countdown;
            ctx_.calibration_progress = 0;
            break;
        case CalibrationStep::Progress:
            ctx_.calibration = CalibrationState::InProgress;
            ctx_.calibration_progress = progress.percent;
            break;
    }
    MOCAP_LOG_VERBOSE("[Calibration] " << calibration_state_to_string(ctx_.calibration)
                      << " (" << ctx_.calibration_pose << ")");
}

void CaptureStateMachine::on_command_result(int code, const std::string& message) {
    if (!ctx_.in_flight) {
        MOCAP_LOG_VERBOSE("[Capture] Result with no command in flight, ignored");
        return;
    }
    const Command command = *ctx_.in_flight;

    if (code != 0) {
        if (command == Command::Calibrate) {
            ctx_.calibration = CalibrationState::Failed;
            ctx_.calibration_pending = false;
            ctx_.calibration_start.reset();
            ctx_.connection = ConnectionState::Capturing;
        }
        report(ErrorCode::CommandFailed,
               std::string(command_to_string(command)) + " failed (" + std::to_string(code) + "): " + message);
    } else {
        switch (command) {
            case Command::StopCapture:
                ctx_.capturing = false;
                ctx_.connection = ConnectionState::Connected;
                ctx_.phase = CapturePhase::Idle;
                ctx_.stabilize_start.reset();
                ctx_.stabilize_remaining = 0.0;
                break;
            case Command::StartCapture:
                break;
            case Command::Calibrate:
                ctx_.connection = ConnectionState::Capturing;
                ctx_.calibration = CalibrationState::Completed;
                ctx_.calibration_progress = 100;
                ctx_.phase = CapturePhase::Calibrated;
                ctx_.calibration_pending = false;
                ctx_.calibration_start.reset();
                break;
        }
        MOCAP_LOG_INFO("[Capture] " << command_to_string(command) << " completed");
    }

    ctx_.in_flight.reset();
    rollback_.reset();
}

void CaptureStateMachine::on_source_error(const std::string& message) {
    ctx_ = CaptureContext();
    rollback_.reset();
    ctx_.connection = ConnectionState::Error;
    report(ErrorCode::IOError, "Source error: " + message);
}

void CaptureStateMachine::tick(TimePoint now) {
    if (!ctx_.calibration_pending || !ctx_.calibration_start) {
        return;
    }
    if (seconds_between(*ctx_.calibration_start, now) < calibration_timeout_seconds_) {
        return;
    }

    ctx_.calibration = CalibrationState::Failed;
    ctx_.calibration_pending = false;
    ctx_.calibration_start.reset();
    ctx_.calibration_progress = 0;
    ctx_.connection = ConnectionState::Capturing;
    ctx_.in_flight.reset();
    rollback_.reset();
    if (ctx_.phase != CapturePhase::Calibrated) {
        ctx_.phase = CapturePhase::Ready;
    }
    report(ErrorCode::CommandTimeout,
           "Calibration timed out after " + std::to_string(static_cast<int>(calibration_timeout_seconds_)) + "s");
}

// ============================================================================
// Queries
// ============================================================================

bool CaptureStateMachine::can_start_calibration() const {
    return ctx_.capturing &&
           ctx_.phase == CapturePhase::Ready &&
           !ctx_.in_flight &&
           !ctx_.calibration_pending &&
           (ctx_.calibration == CalibrationState::None ||
            ctx_.calibration == CalibrationState::Completed ||
            ctx_.calibration == CalibrationState::Failed);
}

bool CaptureStateMachine::is_ready_for_capture() const {
    return ctx_.connected && !ctx_.capturing;
}

bool CaptureStateMachine::is_ready_for_record() const {
    return ctx_.capturing &&
           ctx_.phase == CapturePhase::Calibrated &&
           ctx_.calibration == CalibrationState::Completed;
}

std::string CaptureStateMachine::connection_status_text() const {
    switch (ctx_.connection) {
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Connecting:   return "Connecting...";
        case ConnectionState::Connected:    return "Connected";
        case ConnectionState::Calibrating:  return "Calibrating...";
        case ConnectionState::Error:        return "Error";
        case ConnectionState::Capturing:
            switch (ctx_.phase) {
                case CapturePhase::Idle:        return "Idle";
                case CapturePhase::Stabilizing:
                    return "Stabilizing (" + std::to_string(static_cast<int>(ctx_.stabilize_remaining)) + "s)";
                case CapturePhase::Ready:       return "Ready for Calibration";
                case CapturePhase::Calibrated:  return "Calibrated";
            }
            return "Capturing";
    }
    return "Unknown";
}

std::string CaptureStateMachine::phase_message() const {
    switch (ctx_.phase) {
        case CapturePhase::Idle:
            return "";
        case CapturePhase::Stabilizing:
            return "Stabilizing - hold still (" + std::to_string(static_cast<int>(ctx_.stabilize_remaining)) + "s)";
        case CapturePhase::Ready:
            return "Capture stable - ready to calibrate";
        case CapturePhase::Calibrated:
            return "Calibration complete - ready to record";
    }
    return "";
}

std::string CaptureStateMachine::calibration_message() const {
    const std::string pose = ctx_.calibration_pose.empty() ? "calibration pose" : ctx_.calibration_pose;
    switch (ctx_.calibration) {
        case CalibrationState::None:
            return "";
        case CalibrationState::Preparing:
            return "Hold " + pose + " - preparing...";
        case CalibrationState::Countdown:
            return "Hold " + pose + " - starting in " + std::to_string(ctx_.calibration_countdown) + "s";
        case CalibrationState::InProgress:
            return "Calibrating (" + pose + ")... " + std::to_string(ctx_.calibration_progress) + "%";
        case CalibrationState::Completed:
            return "Calibration complete - ready to record";
        case CalibrationState::Failed:
            return "Calibration failed - please retry";
    }
    return "";
}

std::string CaptureStateMachine::overall_message() const {
    if (ctx_.calibration != CalibrationState::None && ctx_.calibration != CalibrationState::Completed) {
        return calibration_message();
    }
    return phase_message();
}

} // namespace mocap
