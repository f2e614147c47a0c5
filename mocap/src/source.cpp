#include "mocap/source.hpp"

namespace mocap {

const char* command_to_string(Command command) {
    switch (command) {
        case Command::StartCapture: return "StartCapture";
        case Command::StopCapture:  return "StopCapture";
        case Command::Calibrate:    return "Calibrate";
        default:                    return "Unknown";
    }
}

CaptureEvent CaptureEvent::make_frame(PoseFrame frame) {
    CaptureEvent event;
    event.type = Type::Frame;
    event.frame = std::move(frame);
    return event;
}

CaptureEvent CaptureEvent::make_response() {
    CaptureEvent event;
    event.type = Type::CommandReply;
    event.reply = ReplyKind::Response;
    return event;
}

CaptureEvent CaptureEvent::make_progress(const CalibrationProgress& progress) {
    CaptureEvent event;
    event.type = Type::CommandReply;
    event.reply = ReplyKind::Running;
    event.progress = progress;
    return event;
}

CaptureEvent CaptureEvent::make_result(int code, const std::string& message) {
    CaptureEvent event;
    event.type = Type::CommandReply;
    event.reply = ReplyKind::Result;
    event.result_code = code;
    event.message = message;
    return event;
}

CaptureEvent CaptureEvent::make_notify(const std::string& text) {
    CaptureEvent event;
    event.type = Type::Notify;
    event.message = text;
    return event;
}

CaptureEvent CaptureEvent::make_error(const std::string& text) {
    CaptureEvent event;
    event.type = Type::Error;
    event.message = text;
    return event;
}

} // namespace mocap
