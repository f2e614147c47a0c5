#pragma once

#include "mocap/clock.hpp"
#include "mocap/error.hpp"
#include "mocap/source.hpp"
#include <optional>
#include <string>

namespace mocap {

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Capturing,
    Calibrating,
    Error
};

// Meaningful while capturing
enum class CapturePhase {
    Idle,
    Stabilizing,  // subject holds still for the stabilization window
    Ready,        // calibration may be requested
    Calibrated
};

enum class CalibrationState {
    None,
    Preparing,
    Countdown,
    InProgress,
    Completed,
    Failed
};

const char* connection_state_to_string(ConnectionState state);
const char* capture_phase_to_string(CapturePhase phase);
const char* calibration_state_to_string(CalibrationState state);

// Everything the state machine knows about a device session
struct CaptureContext {
    ConnectionState connection = ConnectionState::Disconnected;
    CapturePhase phase = CapturePhase::Idle;
    CalibrationState calibration = CalibrationState::None;
    bool connected = false;
    bool capturing = false;

    // At most one command is outstanding
    std::optional<Command> in_flight;

    std::optional<TimePoint> stabilize_start;
    double stabilize_remaining = 0.0;

    bool calibration_pending = false;
    std::optional<TimePoint> calibration_start;
    int calibration_progress = 0;
    int calibration_countdown = 0;
    std::string calibration_pose;
};

// Capture and calibration state machine for command-capable sources.
// Callers feed it source events and the current time; it never blocks and
// owns no transport. Rejected requests change only the status message.
class CaptureStateMachine {
public:
    explicit CaptureStateMachine(double stabilize_seconds = 20.0,
                                 double calibration_timeout_seconds = 60.0);

    // Connection
    bool begin_connect();
    void on_connect_result(bool success, const std::string& message);
    void on_disconnected();

    // Command requests. On acceptance the command becomes the in-flight sentinel
    // and the caller must hand it to the source.
    bool request_start_capture();
    bool request_stop_capture();
    bool request_calibration(TimePoint now);

    // The source refused the command just requested; undo the request
    void on_issue_failed(const std::string& message);

    // Source events
    void on_frame(TimePoint now);
    void on_calibration_progress(const CalibrationProgress& progress);
    void on_command_result(int code, const std::string& message);
    void on_source_error(const std::string& message);

    // Timeout check, call once per poll
    void tick(TimePoint now);

    // Queries
    const CaptureContext& context() const { return ctx_; }
    ConnectionState connection() const { return ctx_.connection; }
    CapturePhase phase() const { return ctx_.phase; }
    CalibrationState calibration() const { return ctx_.calibration; }
    bool is_capturing() const { return ctx_.capturing; }
    bool has_command_in_flight() const { return ctx_.in_flight.has_value(); }

    bool can_start_calibration() const;
    bool is_ready_for_capture() const;
    bool is_ready_for_record() const;

    // Status surface
    std::string connection_status_text() const;
    std::string phase_message() const;
    std::string calibration_message() const;
    std::string overall_message() const;

    // Message and code of the last rejection, failure or timeout
    const std::string& status_message() const { return status_message_; }
    std::optional<ErrorCode> last_error() const { return last_error_; }

    double stabilize_seconds() const { return stabilize_seconds_; }
    double calibration_timeout_seconds() const { return calibration_timeout_seconds_; }

private:
    bool reject(const std::string& message);
    void report(ErrorCode code, const std::string& message);
    void accept(Command command);
    bool is_link_up() const;

    double stabilize_seconds_;
    double calibration_timeout_seconds_;
    CaptureContext ctx_;
    std::optional<CaptureContext> rollback_;
    std::string status_message_;
    std::optional<ErrorCode> last_error_;
};

} // namespace mocap
