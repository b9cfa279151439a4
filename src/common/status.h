#pragma once

#include <string>
#include <utility>

namespace chunkpost {

enum class ErrorCode {
    kOk = 0,
    kConfigError,
    kBadRequest,
    kUnauthorized,
    kUnknownSession,
    kIntegrityError,
    kConflict,
    kIncompleteUpload,
    kPathEscape,
    kStorageError,
    kNotFound,
    kPayloadTooLarge,
    // Client side only
    kTimeout,
    kTransportError,
    kRefused,
};

// Outcome of an operation. Rich results travel through an output parameter.
class Status {
public:
    Status() = default;
    Status(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

    static Status OK() { return Status(); }

    bool ok() const { return code_ == ErrorCode::kOk; }
    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }

    std::string toString() const {
        if (ok()) return "OK";
        return std::string(errorCodeName(code_)) + ": " + message_;
    }

    static const char* errorCodeName(ErrorCode code) {
        switch (code) {
            case ErrorCode::kOk: return "Ok";
            case ErrorCode::kConfigError: return "ConfigError";
            case ErrorCode::kBadRequest: return "BadRequest";
            case ErrorCode::kUnauthorized: return "Unauthorized";
            case ErrorCode::kUnknownSession: return "UnknownSession";
            case ErrorCode::kIntegrityError: return "IntegrityError";
            case ErrorCode::kConflict: return "Conflict";
            case ErrorCode::kIncompleteUpload: return "IncompleteUpload";
            case ErrorCode::kPathEscape: return "PathEscape";
            case ErrorCode::kStorageError: return "StorageError";
            case ErrorCode::kNotFound: return "NotFound";
            case ErrorCode::kPayloadTooLarge: return "PayloadTooLarge";
            case ErrorCode::kTimeout: return "Timeout";
            case ErrorCode::kTransportError: return "TransportError";
            case ErrorCode::kRefused: return "Refused";
        }
        return "Unknown";
    }

    static ErrorCode errorCodeFromName(const std::string& name) {
        for (int i = static_cast<int>(ErrorCode::kOk); i <= static_cast<int>(ErrorCode::kRefused); ++i) {
            ErrorCode code = static_cast<ErrorCode>(i);
            if (name == errorCodeName(code)) {
                return code;
            }
        }
        return ErrorCode::kTransportError;
    }

private:
    ErrorCode code_ = ErrorCode::kOk;
    std::string message_;
};

} // namespace chunkpost
