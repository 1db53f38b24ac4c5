#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

#include "llmgate/core/error.hpp"
#include "llmgate/core/types.hpp"

namespace llmgate::streaming {

struct TextStart {};

struct TextDelta {
    std::string text;
};

struct ToolCall {
    std::string tool_call_id;
    std::string tool_name;
    json input;
    std::optional<json> provider_metadata;
};

struct ReasoningStart {
    std::string id;
    std::optional<json> provider_metadata;
};

struct ReasoningDelta {
    std::string id;
    std::string text;
    std::optional<json> provider_metadata;
};

struct ReasoningEnd {
    std::string id;
};

struct Usage {
    int64_t input_tokens = 0;
    int64_t output_tokens = 0;
    std::optional<int64_t> total_tokens;
    std::optional<int64_t> cached_input_tokens;
    std::optional<int64_t> cache_creation_input_tokens;
};

struct Done {
    std::optional<std::string> finish_reason;
};

struct ErrorEvent {
    std::string message;
    std::optional<std::string> name;
};

/// Provider output the engine could not classify, passed through verbatim.
struct RawEvent {
    std::string raw_value;
};

/// One incremental unit of a streamed response. Done and ErrorEvent are
/// terminal: nothing follows them on the same request.
using StreamEvent = std::variant<TextStart, TextDelta, ToolCall, ReasoningStart,
                                 ReasoningDelta, ReasoningEnd, Usage, Done,
                                 ErrorEvent, RawEvent>;

/// Wire tag of an event, e.g. "text-delta".
auto event_type_name(const StreamEvent& event) -> std::string_view;

auto is_terminal(const StreamEvent& event) -> bool;

/// Renames provider-native metadata keys to the canonical
/// "providerMetadata" field. Returns a normalized copy.
auto normalize_stream_event(json payload) -> json;

/// Parses a normalized wire payload. Unknown types and missing required
/// fields fail with ProtocolError.
auto parse_stream_event(const json& payload) -> Result<StreamEvent>;

auto stream_event_to_json(const StreamEvent& event) -> json;

} // namespace llmgate::streaming
