#include "llmgate/core/error.hpp"

#include <array>

namespace llmgate {

auto error_code_from_string(std::string_view name) -> ErrorCode {
    static constexpr std::array kCodes = {
        ErrorCode::InvalidConfig,
        ErrorCode::InvalidArgument,
        ErrorCode::NotFound,
        ErrorCode::AlreadyExists,
        ErrorCode::Unauthorized,
        ErrorCode::NoProviderAvailable,
        ErrorCode::ProviderNotInitialized,
        ErrorCode::ConnectionFailed,
        ErrorCode::ConnectionClosed,
        ErrorCode::TransportError,
        ErrorCode::RemoteError,
        ErrorCode::ProtocolError,
        ErrorCode::RequestIdMismatch,
        ErrorCode::Cancelled,
        ErrorCode::SerializationError,
        ErrorCode::IoError,
        ErrorCode::DatabaseError,
        ErrorCode::LoadFailed,
        ErrorCode::InternalError,
    };
    for (auto code : kCodes) {
        if (error_code_to_string(code) == name) return code;
    }
    return ErrorCode::Unknown;
}

} // namespace llmgate
