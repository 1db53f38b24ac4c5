#include "llmgate/ipc/frame.hpp"

namespace llmgate::ipc {

void to_json(json& j, const RequestFrame& f) {
    j = json{
        {"type", "req"},
        {"id", f.id},
        {"method", f.method},
        {"params", f.params},
    };
}

void from_json(const json& j, RequestFrame& f) {
    j.at("id").get_to(f.id);
    j.at("method").get_to(f.method);
    f.params = j.contains("params") ? j.at("params") : json::object();
}

void to_json(json& j, const ResponseFrame& f) {
    j = json{
        {"type", "res"},
        {"id", f.id},
        {"ok", f.ok},
    };
    if (f.result) j["payload"] = *f.result;
    if (f.error) j["error"] = *f.error;
}

void from_json(const json& j, ResponseFrame& f) {
    j.at("id").get_to(f.id);
    f.ok = j.value("ok", true);
    if (j.contains("payload")) {
        f.result = j.at("payload");
    } else if (j.contains("result")) {
        f.result = j.at("result");
    }
    if (j.contains("error") && !j.at("error").is_null()) f.error = j.at("error");
}

void to_json(json& j, const EventFrame& f) {
    j = json{
        {"type", "event"},
        {"event", f.event},
        {"payload", f.data},
    };
}

void from_json(const json& j, EventFrame& f) {
    j.at("event").get_to(f.event);
    if (j.contains("payload")) {
        f.data = j.at("payload");
    } else if (j.contains("data")) {
        f.data = j.at("data");
    } else {
        f.data = json::object();
    }
}

auto parse_frame(std::string_view data) -> Result<Frame> {
    json j;
    try {
        j = json::parse(data);
    } catch (const json::parse_error& e) {
        return std::unexpected(
            make_error(ErrorCode::SerializationError, "Failed to parse frame JSON", e.what()));
    }

    if (!j.is_object()) {
        return std::unexpected(
            make_error(ErrorCode::ProtocolError, "Frame must be a JSON object"));
    }

    std::string type;
    if (j.contains("type") && j["type"].is_string()) {
        type = j["type"].get<std::string>();
    } else if (j.contains("method")) {
        type = "req";
    } else if (j.contains("event")) {
        type = "event";
    } else if (j.contains("id") &&
               (j.contains("payload") || j.contains("result") || j.contains("error"))) {
        type = "res";
    } else {
        return std::unexpected(
            make_error(ErrorCode::ProtocolError, "Cannot determine frame type from JSON"));
    }

    try {
        if (type == "req") {
            return Frame{j.get<RequestFrame>()};
        }
        if (type == "res") {
            return Frame{j.get<ResponseFrame>()};
        }
        if (type == "event") {
            return Frame{j.get<EventFrame>()};
        }
    } catch (const json::exception& e) {
        return std::unexpected(
            make_error(ErrorCode::SerializationError, "Failed to deserialize frame fields",
                       e.what()));
    }

    return std::unexpected(make_error(ErrorCode::ProtocolError, "Unknown frame type: " + type));
}

auto serialize_frame(const Frame& frame) -> std::string {
    json j;
    std::visit([&j](const auto& f) { to_json(j, f); }, frame);
    return j.dump();
}

auto make_request(std::string id, std::string method, json params) -> RequestFrame {
    return RequestFrame{
        .id = std::move(id),
        .method = std::move(method),
        .params = std::move(params),
    };
}

auto make_response(const std::string& id, json result) -> ResponseFrame {
    return ResponseFrame{
        .id = id,
        .ok = true,
        .result = std::move(result),
        .error = std::nullopt,
    };
}

auto make_error_response(const std::string& id, ErrorCode code,
                         std::string_view message) -> ResponseFrame {
    return ResponseFrame{
        .id = id,
        .ok = false,
        .result = std::nullopt,
        .error = json{
            {"code", std::string(error_code_to_string(code))},
            {"message", std::string(message)},
        },
    };
}

auto make_event(std::string event, json data) -> EventFrame {
    return EventFrame{
        .event = std::move(event),
        .data = std::move(data),
    };
}

auto response_error(const ResponseFrame& frame) -> Error {
    if (!frame.error) {
        return make_error(ErrorCode::RemoteError, "Remote call failed");
    }
    const auto& err = *frame.error;
    if (err.is_string()) {
        return make_error(ErrorCode::RemoteError, err.get<std::string>());
    }
    auto message = err.is_object() ? err.value("message", "Remote call failed")
                                   : std::string("Remote call failed");
    std::string code;
    if (err.is_object() && err.contains("code") && err["code"].is_string()) {
        code = err["code"].get<std::string>();
    }
    return make_error(ErrorCode::RemoteError, std::move(message), std::move(code));
}

} // namespace llmgate::ipc
