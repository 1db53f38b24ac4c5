#include "llmgate/providers/registry.hpp"
#include "llmgate/core/logger.hpp"
#include "llmgate/core/utils.hpp"

#include <algorithm>
#include <cctype>

namespace llmgate::providers {

namespace {

auto make_builtin(std::string id, std::string name, std::string base_url,
                  std::string api_key_name,
                  ProtocolType protocol = ProtocolType::OpenAiCompatible,
                  AuthKind auth = AuthKind::ApiKey) -> ProviderDefinition {
    ProviderDefinition def;
    def.id = std::move(id);
    def.name = std::move(name);
    def.base_url = std::move(base_url);
    def.api_key_name = std::move(api_key_name);
    def.protocol = protocol;
    def.auth = auth;
    return def;
}

auto build_builtin_table() -> ProviderRegistry {
    ProviderRegistry table;
    auto add = [&table](ProviderDefinition def) {
        auto id = def.id;
        table.emplace(std::move(id), std::move(def));
    };

    auto openai = make_builtin("openai", "OpenAI", "https://api.openai.com/v1",
                               "OPENAI_API_KEY");
    openai.supports_oauth = true;
    add(std::move(openai));

    auto anthropic = make_builtin("anthropic", "Anthropic", "https://api.anthropic.com/v1",
                                  "ANTHROPIC_API_KEY", ProtocolType::Anthropic);
    anthropic.supports_oauth = true;
    anthropic.headers["anthropic-version"] = "2023-06-01";
    add(std::move(anthropic));

    add(make_builtin("google", "Google AI",
                     "https://generativelanguage.googleapis.com/v1beta",
                     "GOOGLE_API_KEY", ProtocolType::Gemini));

    add(make_builtin("openRouter", "OpenRouter", "https://openrouter.ai/api/v1",
                     "OPEN_ROUTER_API_KEY"));
    add(make_builtin("aiGateway", "Vercel AI Gateway", "https://ai-gateway.vercel.sh/v1",
                     "AI_GATEWAY_API_KEY"));
    add(make_builtin("deepseek", "Deepseek", "https://api.deepseek.com",
                     "DEEPSEEK_API_KEY"));

    auto moonshot = make_builtin("moonshot", "Moonshot", "https://api.moonshot.cn/v1",
                                 "MOONSHOT_API_KEY");
    moonshot.supports_international = true;
    moonshot.international_base_url = "https://api.kimi.com/v1";
    add(std::move(moonshot));

    add(make_builtin("kimi_coding", "Kimi Coding Plan", "https://api.kimi.com/coding/v1",
                     "KIMI_CODING_API_KEY"));

    auto minimax = make_builtin("MiniMax", "MiniMax", "https://api.minimaxi.com/v1",
                                "MINIMAX_API_KEY");
    minimax.supports_alt_billing = true;
    minimax.alt_billing_base_url = "https://api.minimaxi.com/anthropic/v1";
    minimax.supports_international = true;
    minimax.international_base_url = "https://api.minimaxi.chat/anthropic/v1";
    add(std::move(minimax));

    auto zhipu = make_builtin("zhipu", "Zhipu AI", "https://open.bigmodel.cn/api/paas/v4/",
                              "ZHIPU_API_KEY");
    zhipu.supports_alt_billing = true;
    zhipu.alt_billing_base_url = "https://open.bigmodel.cn/api/coding/paas/v4";
    add(std::move(zhipu));

    auto zai = make_builtin("zai", "Z.AI", "https://api.z.ai/api/paas/v4/", "ZAI_API_KEY");
    zai.supports_alt_billing = true;
    zai.alt_billing_base_url = "https://api.z.ai/api/coding/paas/v4";
    add(std::move(zai));

    auto copilot = make_builtin("github_copilot", "GitHub Copilot",
                                "https://api.githubcopilot.com", "GITHUB_COPILOT_TOKEN");
    copilot.supports_oauth = true;
    copilot.headers["Editor-Version"] = "llmgate/1.0";
    copilot.headers["Copilot-Integration-Id"] = "vscode-chat";
    add(std::move(copilot));

    add(make_builtin("groq", "Groq", "https://api.groq.com/openai/v1", "GROQ_API_KEY"));

    add(make_builtin("ollama", "Ollama", "http://127.0.0.1:11434", "OLLAMA_ENABLED",
                     ProtocolType::OpenAiCompatible, AuthKind::None));
    add(make_builtin("lmstudio", "LM Studio", "http://127.0.0.1:1234", "LMSTUDIO_ENABLED",
                     ProtocolType::OpenAiCompatible, AuthKind::None));

    return table;
}

/// Applies the fields a custom entry sets on top of a built-in definition.
void apply_override(ProviderDefinition& def, const CustomProviderConfig& c) {
    if (c.name && !c.name->empty()) def.name = *c.name;
    if (c.type) def.protocol = *c.type;
    if (c.base_url) {
        if (utils::is_http_url(*c.base_url)) {
            def.base_url = *c.base_url;
        } else {
            LOG_WARN("Provider override '{}': ignoring invalid base URL", c.id);
        }
    }
    if (c.headers) {
        for (const auto& [k, v] : *c.headers) {
            def.headers[k] = v;
        }
    }
    if (c.extra_body) def.extra_body = *c.extra_body;
}

auto slugify(std::string_view name) -> std::string {
    std::string slug;
    bool pending_dash = false;
    for (char ch : name) {
        auto uc = static_cast<unsigned char>(ch);
        if (std::isalnum(uc)) {
            if (pending_dash && !slug.empty()) slug += '-';
            pending_dash = false;
            slug += static_cast<char>(std::tolower(uc));
        } else {
            pending_dash = true;
        }
    }
    return slug;
}

} // anonymous namespace

auto builtin_providers() -> const ProviderRegistry& {
    static const ProviderRegistry table = build_builtin_table();
    return table;
}

auto is_builtin_provider(std::string_view id) -> bool {
    return builtin_providers().find(id) != builtin_providers().end();
}

auto build_provider_registry(const std::vector<CustomProviderConfig>& custom)
    -> ProviderRegistry {
    ProviderRegistry registry = builtin_providers();

    for (const auto& c : custom) {
        if (c.id.empty()) {
            LOG_WARN("Skipping custom provider without an id");
            continue;
        }
        if (!c.enabled) {
            LOG_DEBUG("Custom provider '{}' is disabled", c.id);
            continue;
        }

        if (auto it = registry.find(c.id); it != registry.end() && !it->second.is_custom) {
            apply_override(it->second, c);
            LOG_DEBUG("Applied override to built-in provider '{}'", c.id);
            continue;
        }

        if (!c.type) {
            LOG_WARN("Skipping custom provider '{}': missing or unknown type", c.id);
            continue;
        }
        if (!c.base_url || !utils::is_http_url(*c.base_url)) {
            LOG_WARN("Skipping custom provider '{}': invalid base URL", c.id);
            continue;
        }

        ProviderDefinition def;
        def.id = c.id;
        def.name = (c.name && !c.name->empty()) ? *c.name : c.id;
        def.base_url = *c.base_url;
        def.api_key_name = c.id;
        def.protocol = *c.type;
        def.auth = AuthKind::ApiKey;
        if (c.headers) def.headers = *c.headers;
        def.extra_body = c.extra_body;
        def.is_custom = true;
        registry.insert_or_assign(c.id, std::move(def));
    }

    return registry;
}

auto validate_custom_provider(const CustomProviderConfig& config, bool editing)
    -> CustomProviderValidation {
    CustomProviderValidation result;

    if (!config.name || utils::trim(*config.name).empty()) {
        result.errors.emplace_back("Provider name is required");
    }
    if (!config.type) {
        result.errors.emplace_back("Provider type must be openai-compatible or anthropic");
    }
    if (!config.base_url || utils::trim(*config.base_url).empty()) {
        result.errors.emplace_back("Base URL is required");
    } else if (!utils::is_http_url(*config.base_url)) {
        result.errors.emplace_back("Base URL must be a valid http(s) URL");
    } else {
        auto lower = utils::to_lower(*config.base_url);
        if (lower.find("localhost") != std::string::npos ||
            lower.find("127.0.0.1") != std::string::npos) {
            result.warnings.emplace_back(
                "Using localhost URL - ensure the service is running locally");
        }
    }
    if (!config.api_key || utils::trim(*config.api_key).empty()) {
        result.errors.emplace_back("API key is required");
    }
    if (!editing && is_builtin_provider(config.id)) {
        result.errors.emplace_back("Provider ID '" + config.id +
                                   "' conflicts with a built-in provider");
    }

    return result;
}

auto generate_custom_provider_id(ProtocolType type, std::string_view name) -> std::string {
    std::string prefix = type == ProtocolType::Anthropic ? "custom-anthropic" : "custom-openai";
    auto slug = slugify(name);
    if (slug.empty()) {
        slug = utils::to_lower(utils::generate_id(8));
    }
    return prefix + "-" + slug;
}

} // namespace llmgate::providers
