#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace mcptools {

enum class ErrorCode {
    Unknown = 1,
    InvalidConfig,
    InvalidArgument,
    NotFound,
    UnknownTool,
    MissingField,
    TypeMismatch,
    DuplicateName,
    HandlerFault,
    TaskNotFound,
    TaskStillRunning,
    Cancelled,
    Timeout,
    ConnectionFailed,
    ProtocolError,
    SerializationError,
    IoError,
    ProcessError,
    ProviderError,
    InternalError,
};

class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, std::string detail)
        : code_(code), message_(std::move(message)), detail_(std::move(detail)) {}

    [[nodiscard]] auto code() const noexcept -> ErrorCode { return code_; }
    [[nodiscard]] auto message() const noexcept -> std::string_view { return message_; }
    [[nodiscard]] auto detail() const noexcept -> std::string_view { return detail_; }

    [[nodiscard]] auto what() const -> std::string {
        if (detail_.empty()) return message_;
        return message_ + ": " + detail_;
    }

private:
    ErrorCode code_;
    std::string message_;
    std::string detail_;
};

template <typename T>
using Result = std::expected<T, Error>;

using VoidResult = std::expected<void, Error>;

inline auto make_error(ErrorCode code, std::string message) -> Error {
    return Error(code, std::move(message));
}

inline auto make_error(ErrorCode code, std::string message, std::string detail) -> Error {
    return Error(code, std::move(message), std::move(detail));
}

/// Stable upper-snake name of an ErrorCode, used in protocol error data.
inline auto error_code_to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::Unknown: return "UNKNOWN";
        case ErrorCode::InvalidConfig: return "INVALID_CONFIG";
        case ErrorCode::InvalidArgument: return "INVALID_ARGUMENT";
        case ErrorCode::NotFound: return "NOT_FOUND";
        case ErrorCode::UnknownTool: return "UNKNOWN_TOOL";
        case ErrorCode::MissingField: return "MISSING_FIELD";
        case ErrorCode::TypeMismatch: return "TYPE_MISMATCH";
        case ErrorCode::DuplicateName: return "DUPLICATE_NAME";
        case ErrorCode::HandlerFault: return "HANDLER_FAULT";
        case ErrorCode::TaskNotFound: return "TASK_NOT_FOUND";
        case ErrorCode::TaskStillRunning: return "TASK_STILL_RUNNING";
        case ErrorCode::Cancelled: return "CANCELLED";
        case ErrorCode::Timeout: return "TIMEOUT";
        case ErrorCode::ConnectionFailed: return "CONNECTION_FAILED";
        case ErrorCode::ProtocolError: return "PROTOCOL_ERROR";
        case ErrorCode::SerializationError: return "SERIALIZATION_ERROR";
        case ErrorCode::IoError: return "IO_ERROR";
        case ErrorCode::ProcessError: return "PROCESS_ERROR";
        case ErrorCode::ProviderError: return "PROVIDER_ERROR";
        case ErrorCode::InternalError: return "INTERNAL_ERROR";
        default: return "UNKNOWN";
    }
}

} // namespace mcptools
