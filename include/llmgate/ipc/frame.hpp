#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

#include "llmgate/core/error.hpp"
#include "llmgate/core/types.hpp"

namespace llmgate::ipc {

/// A command invocation sent to the remote engine.
struct RequestFrame {
    std::string id;
    std::string method;
    json params;
};

void to_json(json& j, const RequestFrame& f);
void from_json(const json& j, RequestFrame& f);

/// The remote engine's reply to a RequestFrame with the same id.
struct ResponseFrame {
    std::string id;
    bool ok = true;
    std::optional<json> result;
    std::optional<json> error;

    [[nodiscard]] auto is_error() const noexcept -> bool {
        return !ok || error.has_value();
    }
};

void to_json(json& j, const ResponseFrame& f);
void from_json(const json& j, ResponseFrame& f);

/// A message published on a named channel.
struct EventFrame {
    std::string event;
    json data;
};

void to_json(json& j, const EventFrame& f);
void from_json(const json& j, EventFrame& f);

using Frame = std::variant<RequestFrame, ResponseFrame, EventFrame>;

/// Parses a raw JSON text into a typed Frame. An explicit "type" field
/// ("req", "res", "event") wins; otherwise the type is inferred from shape.
auto parse_frame(std::string_view data) -> Result<Frame>;

auto serialize_frame(const Frame& frame) -> std::string;

auto make_request(std::string id, std::string method, json params = json::object())
    -> RequestFrame;
auto make_response(const std::string& id, json result) -> ResponseFrame;
auto make_error_response(const std::string& id, ErrorCode code,
                         std::string_view message) -> ResponseFrame;
auto make_event(std::string event, json data = json::object()) -> EventFrame;

/// Converts an error ResponseFrame into an Error of kind RemoteError; the
/// remote code name is kept as the detail.
auto response_error(const ResponseFrame& frame) -> Error;

} // namespace llmgate::ipc
