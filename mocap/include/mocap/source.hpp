#pragma once

#include "mocap/pose.hpp"
#include <string>
#include <vector>

namespace mocap {

enum class Command {
    StartCapture,
    StopCapture,
    Calibrate
};

const char* command_to_string(Command command);

// Stage of a command reply
enum class ReplyKind {
    Response,  // acknowledged
    Running,   // progress while the command executes
    Result     // final, carries a result code
};

enum class CalibrationStep {
    Prepare,
    Countdown,
    Progress
};

// Payload of a Running reply to a calibration command
struct CalibrationProgress {
    CalibrationStep step = CalibrationStep::Prepare;
    std::string pose_name;
    int countdown = 0;  // seconds, Countdown step
    int percent = 0;    // 0-100, Progress step
};

// Event drained from a capture source
struct CaptureEvent {
    enum class Type {
        Frame,
        CommandReply,
        Notify,
        Error
    };

    Type type = Type::Notify;
    PoseFrame frame;                // Frame
    ReplyKind reply = ReplyKind::Response;  // CommandReply
    int result_code = 0;            // CommandReply/Result, 0 = success
    CalibrationProgress progress;   // CommandReply/Running
    std::string message;            // result message, notify text or error text

    static CaptureEvent make_frame(PoseFrame frame);
    static CaptureEvent make_response();
    static CaptureEvent make_progress(const CalibrationProgress& progress);
    static CaptureEvent make_result(int code, const std::string& message = "");
    static CaptureEvent make_notify(const std::string& text);
    static CaptureEvent make_error(const std::string& text);
};

// Producer of real-time frames and command replies.
// Implementations wrap a device SDK, a UDP listener or a recorded file.
// Frames are indexed against the rig skeleton (see build_rig_skeleton).
class CaptureSource {
public:
    virtual ~CaptureSource() = default;

    // Open the transport. On failure returns false and fills message.
    virtual bool open(std::string& message) = 0;
    virtual void close() = 0;

    // Append pending events without blocking
    virtual void poll(std::vector<CaptureEvent>& events) = 0;

    // Queue a command; false if the source refuses it
    virtual bool issue(Command command) = 0;

    // Device sources accept commands; broadcast streams do not
    virtual bool supports_commands() const = 0;

    virtual std::string name() const = 0;
};

} // namespace mocap
