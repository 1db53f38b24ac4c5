#include "llmgate/streaming/event.hpp"

namespace llmgate::streaming {

namespace {

constexpr auto kCanonicalMetadataKey = "providerMetadata";

// Keys providers and engine versions have used for the same field.
constexpr const char* kMetadataAliases[] = {
    "provider_metadata",
    "providerOptions",
    "provider_options",
};

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

auto optional_metadata(const json& j) -> std::optional<json> {
    if (j.contains(kCanonicalMetadataKey) && !j[kCanonicalMetadataKey].is_null()) {
        return std::optional<json>{std::in_place, j[kCanonicalMetadataKey]};
    }
    return std::nullopt;
}

auto optional_count(const json& j, const char* key) -> std::optional<int64_t> {
    if (j.contains(key) && j[key].is_number_integer()) {
        return j[key].get<int64_t>();
    }
    return std::nullopt;
}

auto bad_event(std::string message, std::string detail = {}) -> Result<StreamEvent> {
    return std::unexpected(make_error(ErrorCode::ProtocolError, std::move(message),
                                      std::move(detail)));
}

} // anonymous namespace

auto event_type_name(const StreamEvent& event) -> std::string_view {
    return std::visit(overloaded{
        [](const TextStart&) -> std::string_view { return "text-start"; },
        [](const TextDelta&) -> std::string_view { return "text-delta"; },
        [](const ToolCall&) -> std::string_view { return "tool-call"; },
        [](const ReasoningStart&) -> std::string_view { return "reasoning-start"; },
        [](const ReasoningDelta&) -> std::string_view { return "reasoning-delta"; },
        [](const ReasoningEnd&) -> std::string_view { return "reasoning-end"; },
        [](const Usage&) -> std::string_view { return "usage"; },
        [](const Done&) -> std::string_view { return "done"; },
        [](const ErrorEvent&) -> std::string_view { return "error"; },
        [](const RawEvent&) -> std::string_view { return "raw"; },
    }, event);
}

auto is_terminal(const StreamEvent& event) -> bool {
    return std::holds_alternative<Done>(event) || std::holds_alternative<ErrorEvent>(event);
}

auto normalize_stream_event(json payload) -> json {
    if (!payload.is_object()) {
        return payload;
    }
    for (const auto* alias : kMetadataAliases) {
        if (!payload.contains(alias)) continue;
        if (!payload.contains(kCanonicalMetadataKey)) {
            payload[kCanonicalMetadataKey] = std::move(payload[alias]);
        }
        payload.erase(alias);
    }
    return payload;
}

auto parse_stream_event(const json& payload) -> Result<StreamEvent> {
    if (!payload.is_object()) {
        return bad_event("Stream event must be a JSON object");
    }
    if (!payload.contains("type") || !payload["type"].is_string()) {
        return bad_event("Stream event has no type");
    }

    auto type = payload["type"].get<std::string>();
    try {
        if (type == "text-start") {
            return TextStart{};
        }
        if (type == "text-delta") {
            return TextDelta{payload.at("text").get<std::string>()};
        }
        if (type == "tool-call") {
            return ToolCall{
                .tool_call_id = payload.at("toolCallId").get<std::string>(),
                .tool_name = payload.at("toolName").get<std::string>(),
                .input = payload.value("input", json::object()),
                .provider_metadata = optional_metadata(payload),
            };
        }
        if (type == "reasoning-start") {
            return ReasoningStart{
                .id = payload.at("id").get<std::string>(),
                .provider_metadata = optional_metadata(payload),
            };
        }
        if (type == "reasoning-delta") {
            return ReasoningDelta{
                .id = payload.at("id").get<std::string>(),
                .text = payload.at("text").get<std::string>(),
                .provider_metadata = optional_metadata(payload),
            };
        }
        if (type == "reasoning-end") {
            return ReasoningEnd{payload.at("id").get<std::string>()};
        }
        if (type == "usage") {
            return Usage{
                .input_tokens = payload.at("input_tokens").get<int64_t>(),
                .output_tokens = payload.at("output_tokens").get<int64_t>(),
                .total_tokens = optional_count(payload, "total_tokens"),
                .cached_input_tokens = optional_count(payload, "cached_input_tokens"),
                .cache_creation_input_tokens =
                    optional_count(payload, "cache_creation_input_tokens"),
            };
        }
        if (type == "done") {
            Done done;
            if (payload.contains("finish_reason") && payload["finish_reason"].is_string()) {
                done.finish_reason = payload["finish_reason"].get<std::string>();
            }
            return done;
        }
        if (type == "error") {
            ErrorEvent err{payload.value("message", "Unknown stream error"), std::nullopt};
            if (payload.contains("name") && payload["name"].is_string()) {
                err.name = payload["name"].get<std::string>();
            }
            return err;
        }
        if (type == "raw") {
            const auto& raw = payload.at("raw_value");
            return RawEvent{raw.is_string() ? raw.get<std::string>() : raw.dump()};
        }
    } catch (const json::exception& e) {
        return bad_event("Malformed " + type + " event", e.what());
    }

    return bad_event("Unknown stream event type: " + type);
}

auto stream_event_to_json(const StreamEvent& event) -> json {
    json j = json{{"type", event_type_name(event)}};
    std::visit(overloaded{
        [](const TextStart&) {},
        [&j](const TextDelta& e) { j["text"] = e.text; },
        [&j](const ToolCall& e) {
            j["toolCallId"] = e.tool_call_id;
            j["toolName"] = e.tool_name;
            j["input"] = e.input;
            if (e.provider_metadata) j["providerMetadata"] = *e.provider_metadata;
        },
        [&j](const ReasoningStart& e) {
            j["id"] = e.id;
            if (e.provider_metadata) j["providerMetadata"] = *e.provider_metadata;
        },
        [&j](const ReasoningDelta& e) {
            j["id"] = e.id;
            j["text"] = e.text;
            if (e.provider_metadata) j["providerMetadata"] = *e.provider_metadata;
        },
        [&j](const ReasoningEnd& e) { j["id"] = e.id; },
        [&j](const Usage& e) {
            j["input_tokens"] = e.input_tokens;
            j["output_tokens"] = e.output_tokens;
            if (e.total_tokens) j["total_tokens"] = *e.total_tokens;
            if (e.cached_input_tokens) j["cached_input_tokens"] = *e.cached_input_tokens;
            if (e.cache_creation_input_tokens)
                j["cache_creation_input_tokens"] = *e.cache_creation_input_tokens;
        },
        [&j](const Done& e) {
            if (e.finish_reason) j["finish_reason"] = *e.finish_reason;
        },
        [&j](const ErrorEvent& e) {
            j["message"] = e.message;
            if (e.name) j["name"] = *e.name;
        },
        [&j](const RawEvent& e) { j["raw_value"] = e.raw_value; },
    }, event);
    return j;
}

} // namespace llmgate::streaming
