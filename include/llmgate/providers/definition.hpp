#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "llmgate/core/types.hpp"

namespace llmgate::providers {

/// Wire protocol the remote engine speaks to a provider.
enum class ProtocolType {
    OpenAiCompatible,
    Anthropic,
    Gemini,
};

NLOHMANN_JSON_SERIALIZE_ENUM(ProtocolType, {
    {ProtocolType::OpenAiCompatible, "openai-compatible"},
    {ProtocolType::Anthropic, "anthropic"},
    {ProtocolType::Gemini, "gemini"},
})

/// How a provider proves authorization.
enum class AuthKind {
    ApiKey,
    OAuth,
    None,
};

NLOHMANN_JSON_SERIALIZE_ENUM(AuthKind, {
    {AuthKind::ApiKey, "api-key"},
    {AuthKind::OAuth, "oauth"},
    {AuthKind::None, "none"},
})

/// Strict parse of a protocol name; unknown names yield nullopt.
auto protocol_type_from_string(std::string_view name) -> std::optional<ProtocolType>;
auto protocol_type_to_string(ProtocolType type) -> std::string_view;

using HeaderMap = std::map<std::string, std::string>;

/// A named upstream LLM service. Registries are rebuilt wholesale whenever
/// the custom provider list changes; definitions are never patched in place.
struct ProviderDefinition {
    std::string id;
    std::string name;
    std::string base_url;
    std::string api_key_name;
    ProtocolType protocol = ProtocolType::OpenAiCompatible;
    AuthKind auth = AuthKind::ApiKey;
    bool supports_oauth = false;
    bool supports_alt_billing = false;
    bool supports_international = false;
    std::optional<std::string> alt_billing_base_url;
    std::optional<std::string> international_base_url;
    HeaderMap headers;
    std::optional<json> extra_body;
    bool is_custom = false;
};

void to_json(json& j, const ProviderDefinition& d);

/// Provider id -> definition. Ordered so iteration is deterministic.
using ProviderRegistry = std::map<std::string, ProviderDefinition, std::less<>>;

/// A user-defined provider, or a partial override of a built-in one.
/// Unset optionals leave the built-in value untouched.
struct CustomProviderConfig {
    std::string id;
    std::optional<std::string> name;
    std::optional<ProtocolType> type;
    std::optional<std::string> base_url;
    std::optional<std::string> api_key;
    bool enabled = true;
    std::optional<std::string> description;
    std::optional<HeaderMap> headers;
    std::optional<json> extra_body;
};

void to_json(json& j, const CustomProviderConfig& c);
void from_json(const json& j, CustomProviderConfig& c);

/// On-disk document holding every custom provider, keyed by id.
struct CustomProvidersDocument {
    std::string version;
    std::map<std::string, CustomProviderConfig> providers;
};

void to_json(json& j, const CustomProvidersDocument& d);
void from_json(const json& j, CustomProvidersDocument& d);

} // namespace llmgate::providers
