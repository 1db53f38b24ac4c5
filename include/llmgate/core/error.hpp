#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace llmgate {

enum class ErrorCode {
    Unknown = 1,
    InvalidConfig,
    InvalidArgument,
    NotFound,
    AlreadyExists,
    Unauthorized,
    NoProviderAvailable,
    ProviderNotInitialized,
    ConnectionFailed,
    ConnectionClosed,
    TransportError,
    RemoteError,
    ProtocolError,
    RequestIdMismatch,
    Cancelled,
    SerializationError,
    IoError,
    DatabaseError,
    LoadFailed,
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

/// Stable upper-case name for an ErrorCode, used on the wire and in logs.
inline auto error_code_to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::Unknown: return "UNKNOWN";
        case ErrorCode::InvalidConfig: return "INVALID_CONFIG";
        case ErrorCode::InvalidArgument: return "INVALID_ARGUMENT";
        case ErrorCode::NotFound: return "NOT_FOUND";
        case ErrorCode::AlreadyExists: return "ALREADY_EXISTS";
        case ErrorCode::Unauthorized: return "UNAUTHORIZED";
        case ErrorCode::NoProviderAvailable: return "NO_PROVIDER_AVAILABLE";
        case ErrorCode::ProviderNotInitialized: return "PROVIDER_NOT_INITIALIZED";
        case ErrorCode::ConnectionFailed: return "CONNECTION_FAILED";
        case ErrorCode::ConnectionClosed: return "CONNECTION_CLOSED";
        case ErrorCode::TransportError: return "TRANSPORT_ERROR";
        case ErrorCode::RemoteError: return "REMOTE_ERROR";
        case ErrorCode::ProtocolError: return "PROTOCOL_ERROR";
        case ErrorCode::RequestIdMismatch: return "REQUEST_ID_MISMATCH";
        case ErrorCode::Cancelled: return "CANCELLED";
        case ErrorCode::SerializationError: return "SERIALIZATION_ERROR";
        case ErrorCode::IoError: return "IO_ERROR";
        case ErrorCode::DatabaseError: return "DATABASE_ERROR";
        case ErrorCode::LoadFailed: return "LOAD_FAILED";
        case ErrorCode::InternalError: return "INTERNAL_ERROR";
        default: return "UNKNOWN";
    }
}

/// Inverse of error_code_to_string. Unrecognised names map to Unknown.
auto error_code_from_string(std::string_view name) -> ErrorCode;

/// Failure value for coroutines returning awaitable<Result<T>>. GCC 14
/// hits an internal compiler error on `co_return std::unexpected(...)`
/// (https://gcc.gnu.org/bugzilla/show_bug.cgi?id=112341); converting
/// through this type keeps the std::unexpected construction out of the
/// coroutine frame.
struct Fail {
    Error error;

    explicit Fail(Error e) : error(std::move(e)) {}

    template <typename T>
    operator Result<T>() && { return std::unexpected(std::move(error)); }
};

/// Use co_return make_fail(err) instead of co_return std::unexpected(err).
inline auto make_fail(Error e) -> Fail { return Fail(std::move(e)); }

/// Use co_return ok_result() instead of co_return Result<void>{}.
inline auto ok_result() -> Result<void> { return {}; }

} // namespace llmgate
