#pragma once

#include <exception>
#include <string>

namespace mocap {

enum class ErrorCode {
    ParseError,       // Malformed or unreadable BVH
    IOError,          // Filesystem or capture source I/O error
    ConfigError,      // YAML config parsing error
    CommandRejected,  // Another command is outstanding or the state forbids it
    CommandFailed,    // Capture source reported a non-zero result code
    CommandTimeout,   // No result within the command window
    ExportError       // Empty buffer or unwritable destination
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::ParseError:      return "ParseError";
        case ErrorCode::IOError:         return "IOError";
        case ErrorCode::ConfigError:     return "ConfigError";
        case ErrorCode::CommandRejected: return "CommandRejected";
        case ErrorCode::CommandFailed:   return "CommandFailed";
        case ErrorCode::CommandTimeout:  return "CommandTimeout";
        case ErrorCode::ExportError:     return "ExportError";
        default:                         return "Unknown";
    }
}

class MocapError : public std::exception {
public:
    MocapError(ErrorCode code, const std::string& message)
        : code_(code), message_(message), source_() {
        build_what();
    }

    // source: file path or line reference the error refers to
    MocapError(ErrorCode code, const std::string& source, const std::string& message)
        : code_(code), message_(message), source_(source) {
        build_what();
    }

    ErrorCode code() const noexcept { return code_; }
    const char* what() const noexcept override { return what_.c_str(); }
    const std::string& message() const noexcept { return message_; }
    const std::string& source() const noexcept { return source_; }

private:
    void build_what() {
        what_ = std::string("[mocap::") + error_code_to_string(code_) + "] " + message_;
        if (!source_.empty()) {
            what_ += " (" + source_ + ")";
        }
    }

    ErrorCode code_;
    std::string message_;
    std::string source_;
    std::string what_;
};

} // namespace mocap
