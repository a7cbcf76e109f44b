#pragma once

#include <string>
#include <utility>

namespace proxyvisor {
namespace common {

/**
 * @brief Failure categories surfaced by installer, supervisor and manager
 *
 * Retryable: NETWORK_ERROR, PORT_CONFLICT, PRECONDITION_FAILED, SPAWN_FAILED, STARTUP_FAILED.
 * Terminal: NO_COMPATIBLE_BINARY, CHECKSUM_UNAVAILABLE, CHECKSUM_MISMATCH, CORRUPT_BINARY.
 */
enum class ErrorCode {
    OK,
    NETWORK_ERROR,
    NO_COMPATIBLE_BINARY,
    CHECKSUM_UNAVAILABLE,
    CHECKSUM_MISMATCH,
    CORRUPT_BINARY,
    EXTRACTION_FAILED,
    IO_ERROR,
    CANCELLED,
    PRECONDITION_FAILED,
    PORT_CONFLICT,
    SPAWN_FAILED,
    STARTUP_FAILED,
    INVALID_ARGUMENT,
    OPERATION_IN_PROGRESS
};

inline const char *error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:
            return "OK";
        case ErrorCode::NETWORK_ERROR:
            return "NETWORK_ERROR";
        case ErrorCode::NO_COMPATIBLE_BINARY:
            return "NO_COMPATIBLE_BINARY";
        case ErrorCode::CHECKSUM_UNAVAILABLE:
            return "CHECKSUM_UNAVAILABLE";
        case ErrorCode::CHECKSUM_MISMATCH:
            return "CHECKSUM_MISMATCH";
        case ErrorCode::CORRUPT_BINARY:
            return "CORRUPT_BINARY";
        case ErrorCode::EXTRACTION_FAILED:
            return "EXTRACTION_FAILED";
        case ErrorCode::IO_ERROR:
            return "IO_ERROR";
        case ErrorCode::CANCELLED:
            return "CANCELLED";
        case ErrorCode::PRECONDITION_FAILED:
            return "PRECONDITION_FAILED";
        case ErrorCode::PORT_CONFLICT:
            return "PORT_CONFLICT";
        case ErrorCode::SPAWN_FAILED:
            return "SPAWN_FAILED";
        case ErrorCode::STARTUP_FAILED:
            return "STARTUP_FAILED";
        case ErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case ErrorCode::OPERATION_IN_PROGRESS:
            return "OPERATION_IN_PROGRESS";
        default:
            return "UNKNOWN";
    }
}

// True for failures that must never be downgraded to a warning
inline bool is_security_failure(ErrorCode code) {
    return code == ErrorCode::CHECKSUM_UNAVAILABLE || code == ErrorCode::CHECKSUM_MISMATCH ||
           code == ErrorCode::CORRUPT_BINARY;
}

/**
 * @brief Result of a fallible operation: error code plus human-readable message
 */
class Status {
public:
    Status() = default;

    static Status ok() { return Status(); }
    static Status error(ErrorCode code, std::string message) { return Status(code, std::move(message)); }

    bool is_ok() const { return code_ == ErrorCode::OK; }
    explicit operator bool() const { return is_ok(); }

    ErrorCode code() const { return code_; }
    const std::string &message() const { return message_; }

    std::string to_string() const {
        if (is_ok()) {
            return "OK";
        }
        return std::string(error_code_to_string(code_)) + ": " + message_;
    }

private:
    Status(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

    ErrorCode code_ = ErrorCode::OK;
    std::string message_;
};

}  // namespace common
}  // namespace proxyvisor
