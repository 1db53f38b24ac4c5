#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace llmgate::utils {

auto generate_id(std::size_t length = 16) -> std::string;
auto generate_uuid() -> std::string;
auto timestamp_ms() -> int64_t;
auto trim(std::string_view s) -> std::string;
auto to_lower(std::string_view s) -> std::string;
/// Lower-case hex SHA-256 digest. Empty if the digest cannot be computed.
auto sha256(std::string_view data) -> std::string;

/// Short, log-safe identifier for a secret: the first 8 hex digits of its
/// SHA-256. Empty input yields "<empty>".
auto fingerprint(std::string_view secret) -> std::string;

/// True when `url` has an http or https scheme followed by a host.
auto is_http_url(std::string_view url) -> bool;

} // namespace llmgate::utils
