#include "llmgate/providers/definition.hpp"
#include "llmgate/core/logger.hpp"

namespace llmgate::providers {

auto protocol_type_from_string(std::string_view name) -> std::optional<ProtocolType> {
    if (name == "openai-compatible" || name == "openai") return ProtocolType::OpenAiCompatible;
    if (name == "anthropic") return ProtocolType::Anthropic;
    if (name == "gemini") return ProtocolType::Gemini;
    return std::nullopt;
}

auto protocol_type_to_string(ProtocolType type) -> std::string_view {
    switch (type) {
        case ProtocolType::OpenAiCompatible: return "openai-compatible";
        case ProtocolType::Anthropic: return "anthropic";
        case ProtocolType::Gemini: return "gemini";
    }
    return "openai-compatible";
}

void to_json(json& j, const ProviderDefinition& d) {
    j = json{
        {"id", d.id},
        {"name", d.name},
        {"base_url", d.base_url},
        {"api_key_name", d.api_key_name},
        {"protocol", d.protocol},
        {"auth", d.auth},
        {"supports_oauth", d.supports_oauth},
        {"supports_alt_billing", d.supports_alt_billing},
        {"supports_international", d.supports_international},
        {"is_custom", d.is_custom},
    };
    if (d.alt_billing_base_url) j["alt_billing_base_url"] = *d.alt_billing_base_url;
    if (d.international_base_url) j["international_base_url"] = *d.international_base_url;
    if (!d.headers.empty()) j["headers"] = d.headers;
    if (d.extra_body) j["extra_body"] = *d.extra_body;
}

void to_json(json& j, const CustomProviderConfig& c) {
    j = json::object();
    j["id"] = c.id;
    if (c.name) j["name"] = *c.name;
    if (c.type) j["type"] = protocol_type_to_string(*c.type);
    if (c.base_url) j["base_url"] = *c.base_url;
    if (c.api_key) j["api_key"] = *c.api_key;
    j["enabled"] = c.enabled;
    if (c.description) j["description"] = *c.description;
    if (c.headers) j["headers"] = *c.headers;
    if (c.extra_body) j["extra_body"] = *c.extra_body;
}

void from_json(const json& j, CustomProviderConfig& c) {
    c.id = j.value("id", "");
    if (j.contains("name") && !j["name"].is_null())
        c.name = j["name"].get<std::string>();
    if (j.contains("type") && !j["type"].is_null()) {
        auto raw = j["type"].get<std::string>();
        c.type = protocol_type_from_string(raw);
        if (!c.type) {
            LOG_WARN("Custom provider '{}': unknown type '{}'", c.id, raw);
        }
    }
    if (j.contains("base_url") && !j["base_url"].is_null())
        c.base_url = j["base_url"].get<std::string>();
    if (j.contains("api_key") && !j["api_key"].is_null())
        c.api_key = j["api_key"].get<std::string>();
    c.enabled = j.value("enabled", true);
    if (j.contains("description") && !j["description"].is_null())
        c.description = j["description"].get<std::string>();
    if (j.contains("headers") && j["headers"].is_object())
        c.headers = j["headers"].get<HeaderMap>();
    if (j.contains("extra_body") && !j["extra_body"].is_null())
        c.extra_body = j["extra_body"];
}

void to_json(json& j, const CustomProvidersDocument& d) {
    j = json::object();
    j["version"] = d.version;
    j["providers"] = json::object();
    for (const auto& [id, cfg] : d.providers) {
        j["providers"][id] = cfg;
    }
}

void from_json(const json& j, CustomProvidersDocument& d) {
    d.version = j.value("version", "");
    if (j.contains("providers") && j["providers"].is_object()) {
        for (auto& [key, val] : j["providers"].items()) {
            try {
                auto cfg = val.get<CustomProviderConfig>();
                if (cfg.id.empty()) cfg.id = key;
                d.providers[key] = std::move(cfg);
            } catch (const json::exception& e) {
                LOG_WARN("Skipping malformed custom provider '{}': {}", key, e.what());
            }
        }
    }
}

} // namespace llmgate::providers
