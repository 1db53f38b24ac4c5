#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "llmgate/core/types.hpp"

namespace llmgate::streaming {

enum class Role {
    System,
    User,
    Assistant,
    Tool,
};

NLOHMANN_JSON_SERIALIZE_ENUM(Role, {
    {Role::System, "system"},
    {Role::User, "user"},
    {Role::Assistant, "assistant"},
    {Role::Tool, "tool"},
})

struct TextPart {
    std::string text;
};

/// Image as a URL or data URL.
struct ImagePart {
    std::string image;
};

struct ToolCallPart {
    std::string tool_call_id;
    std::string tool_name;
    json input;
};

struct ToolResultPart {
    std::string tool_call_id;
    std::string tool_name;
    json output;
};

struct ReasoningPart {
    std::string text;
};

using ContentPart = std::variant<TextPart, ImagePart, ToolCallPart, ToolResultPart, ReasoningPart>;

void to_json(json& j, const ContentPart& part);

/// Message content is either plain text or a list of typed parts.
using MessageContent = std::variant<std::string, std::vector<ContentPart>>;

struct Message {
    Role role = Role::User;
    MessageContent content;
    std::optional<json> provider_options;
};

void to_json(json& j, const Message& m);

auto system_message(std::string text) -> Message;
auto user_message(std::string text) -> Message;
auto assistant_message(std::string text) -> Message;

struct ToolDefinition {
    std::string type = "function";
    std::string name;
    std::optional<std::string> description;
    json parameters = json::object();
    bool strict = false;
};

void to_json(json& j, const ToolDefinition& t);

struct TraceContext {
    std::optional<std::string> trace_id;
    std::optional<std::string> parent_span_id;
    std::optional<std::string> span_name;
    std::map<std::string, std::string> metadata;
};

void to_json(json& j, const TraceContext& t);

struct StreamTextRequest {
    std::string model;
    std::vector<Message> messages;
    std::optional<std::vector<ToolDefinition>> tools;
    bool stream = true;
    std::optional<double> temperature;
    std::optional<int> max_tokens;
    std::optional<double> top_p;
    std::optional<int> top_k;
    std::optional<json> provider_options;
    std::optional<std::string> request_id;
    std::optional<TraceContext> trace_context;
};

/// Wire form: camelCase keys (maxTokens, topP, requestId, traceContext).
void to_json(json& j, const StreamTextRequest& r);

/// Single-turn request: optional system prompt followed by one user message.
auto build_prompt_request(std::string model, std::string prompt,
                          std::optional<std::string> system_prompt = std::nullopt)
    -> StreamTextRequest;

auto build_messages_request(std::string model, std::vector<Message> messages)
    -> StreamTextRequest;

} // namespace llmgate::streaming
