#include "llmgate/streaming/request.hpp"

namespace llmgate::streaming {

namespace {

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

} // anonymous namespace

void to_json(json& j, const ContentPart& part) {
    j = std::visit(overloaded{
        [](const TextPart& p) {
            return json{{"type", "text"}, {"text", p.text}};
        },
        [](const ImagePart& p) {
            return json{{"type", "image"}, {"image", p.image}};
        },
        [](const ToolCallPart& p) {
            return json{
                {"type", "tool-call"},
                {"toolCallId", p.tool_call_id},
                {"toolName", p.tool_name},
                {"input", p.input},
            };
        },
        [](const ToolResultPart& p) {
            return json{
                {"type", "tool-result"},
                {"toolCallId", p.tool_call_id},
                {"toolName", p.tool_name},
                {"output", p.output},
            };
        },
        [](const ReasoningPart& p) {
            return json{{"type", "reasoning"}, {"text", p.text}};
        },
    }, part);
}

void to_json(json& j, const Message& m) {
    j = json{{"role", m.role}};
    if (const auto* text = std::get_if<std::string>(&m.content)) {
        j["content"] = *text;
    } else {
        auto parts = json::array();
        for (const auto& part : std::get<std::vector<ContentPart>>(m.content)) {
            json pj;
            to_json(pj, part);
            parts.push_back(std::move(pj));
        }
        j["content"] = std::move(parts);
    }
    if (m.provider_options) j["providerOptions"] = *m.provider_options;
}

auto system_message(std::string text) -> Message {
    return Message{.role = Role::System, .content = std::move(text)};
}

auto user_message(std::string text) -> Message {
    return Message{.role = Role::User, .content = std::move(text)};
}

auto assistant_message(std::string text) -> Message {
    return Message{.role = Role::Assistant, .content = std::move(text)};
}

void to_json(json& j, const ToolDefinition& t) {
    j = json{
        {"type", t.type},
        {"name", t.name},
        {"parameters", t.parameters},
        {"strict", t.strict},
    };
    if (t.description) j["description"] = *t.description;
}

void to_json(json& j, const TraceContext& t) {
    j = json::object();
    if (t.trace_id) j["traceId"] = *t.trace_id;
    if (t.parent_span_id) j["parentSpanId"] = *t.parent_span_id;
    if (t.span_name) j["spanName"] = *t.span_name;
    if (!t.metadata.empty()) j["metadata"] = t.metadata;
}

void to_json(json& j, const StreamTextRequest& r) {
    j = json{
        {"model", r.model},
        {"messages", r.messages},
        {"stream", r.stream},
    };
    if (r.tools) j["tools"] = *r.tools;
    if (r.temperature) j["temperature"] = *r.temperature;
    if (r.max_tokens) j["maxTokens"] = *r.max_tokens;
    if (r.top_p) j["topP"] = *r.top_p;
    if (r.top_k) j["topK"] = *r.top_k;
    if (r.provider_options) j["providerOptions"] = *r.provider_options;
    if (r.request_id) j["requestId"] = *r.request_id;
    if (r.trace_context) j["traceContext"] = *r.trace_context;
}

auto build_prompt_request(std::string model, std::string prompt,
                          std::optional<std::string> system_prompt) -> StreamTextRequest {
    std::vector<Message> messages;
    if (system_prompt && !system_prompt->empty()) {
        messages.push_back(system_message(std::move(*system_prompt)));
    }
    messages.push_back(user_message(std::move(prompt)));
    return build_messages_request(std::move(model), std::move(messages));
}

auto build_messages_request(std::string model, std::vector<Message> messages)
    -> StreamTextRequest {
    StreamTextRequest req;
    req.model = std::move(model);
    req.messages = std::move(messages);
    return req;
}

} // namespace llmgate::streaming
