#include "llmgate/providers/factory.hpp"
#include "llmgate/core/logger.hpp"
#include "llmgate/core/utils.hpp"

#include <algorithm>

namespace llmgate::providers {

namespace {

auto credential_for(const ProviderDefinition& def, const CredentialSet& credentials,
                    const std::vector<CustomProviderConfig>& custom_providers,
                    AuthStrategy strategy) -> std::string {
    switch (strategy) {
        case AuthStrategy::None:
            return {};
        case AuthStrategy::OAuthBearer:
            return credentials.oauth_for(def.id)->access_token;
        case AuthStrategy::Bearer:
        case AuthStrategy::ApiKeyHeader:
            break;
    }

    if (auto secret = credentials.secret_for(def.id)) {
        return std::string(*secret);
    }
    auto custom = std::find_if(custom_providers.begin(), custom_providers.end(),
                               [&](const CustomProviderConfig& c) { return c.id == def.id; });
    if (custom != custom_providers.end() && custom->api_key) {
        return *custom->api_key;
    }
    return {};
}

} // anonymous namespace

auto auth_strategy_name(AuthStrategy strategy) -> std::string_view {
    switch (strategy) {
        case AuthStrategy::None: return "none";
        case AuthStrategy::Bearer: return "bearer";
        case AuthStrategy::ApiKeyHeader: return "api-key-header";
        case AuthStrategy::OAuthBearer: return "oauth-bearer";
    }
    return "none";
}

auto ModelHandle::authorize() -> awaitable<Result<HeaderMap>> {
    HeaderMap out = headers;

    switch (auth) {
        case AuthStrategy::None:
            break;

        case AuthStrategy::Bearer:
            out["Authorization"] = "Bearer " + credential;
            break;

        case AuthStrategy::ApiKeyHeader:
            out[api_key_header] = credential;
            break;

        case AuthStrategy::OAuthBearer: {
            bool expiring = expires_at_ms &&
                *expires_at_ms <= to_epoch_ms(Clock::now() + refresh_buffer);
            if (expiring && refresher) {
                LOG_INFO("OAuth token for {} expiring, refreshing", provider_id);
                auto refreshed = co_await refresher(provider_id);
                if (!refreshed) {
                    co_return make_fail(refreshed.error());
                }
                credential = refreshed->access_token;
                expires_at_ms = refreshed->expires_at_ms;
                if (refreshed->account_id) account_id = refreshed->account_id;
            }
            out["Authorization"] = "Bearer " + credential;
            if (account_id) {
                out["chatgpt-account-id"] = *account_id;
            }
            if (protocol == ProtocolType::Anthropic) {
                out["anthropic-beta"] = "oauth-2025-04-20";
            }
            break;
        }
    }

    co_return out;
}

auto ModelHandle::describe() const -> json {
    json j = {
        {"provider", provider_id},
        {"model", model},
        {"base_url", base_url},
        {"protocol", protocol},
        {"auth", auth_strategy_name(auth)},
        {"credential", utils::fingerprint(credential)},
    };
    if (!headers.empty()) j["headers"] = headers;
    if (extra_body) j["extra_body"] = *extra_body;
    if (account_id) j["account_id"] = *account_id;
    return j;
}

auto resolve_base_url(const ProviderDefinition& def, const CredentialSet& credentials)
    -> std::string {
    if (auto it = credentials.base_url_overrides.find(def.id);
        it != credentials.base_url_overrides.end() && !it->second.empty()) {
        return it->second;
    }
    if (def.supports_international && def.international_base_url &&
        credentials.use_international(def.id)) {
        return *def.international_base_url;
    }
    if (def.supports_alt_billing && def.alt_billing_base_url &&
        credentials.use_alt_billing(def.id)) {
        return *def.alt_billing_base_url;
    }
    return def.base_url;
}

auto resolve_auth_strategy(const ProviderDefinition& def, const CredentialSet& credentials,
                           Timestamp now) -> AuthStrategy {
    if (def.auth == AuthKind::None || is_local_provider(def.id)) {
        return AuthStrategy::None;
    }
    if (def.supports_oauth && has_valid_oauth(def.id, credentials, now)) {
        return AuthStrategy::OAuthBearer;
    }
    switch (def.protocol) {
        case ProtocolType::Anthropic:
        case ProtocolType::Gemini:
            return AuthStrategy::ApiKeyHeader;
        case ProtocolType::OpenAiCompatible:
            return AuthStrategy::Bearer;
    }
    return AuthStrategy::Bearer;
}

auto create_providers(const CredentialSet& credentials,
                      const ProviderRegistry& registry,
                      const std::vector<CustomProviderConfig>& custom_providers,
                      Timestamp now,
                      OAuthRefresher refresher,
                      std::chrono::seconds refresh_buffer) -> ProviderMap {
    ProviderMap providers;

    for (const auto& [id, def] : registry) {
        if (!is_provider_usable(id, credentials, custom_providers, now)) {
            continue;
        }

        ModelHandle base;
        base.provider_id = id;
        base.base_url = resolve_base_url(def, credentials);
        base.protocol = def.protocol;
        base.auth = resolve_auth_strategy(def, credentials, now);
        base.credential = credential_for(def, credentials, custom_providers, base.auth);
        base.api_key_header = def.protocol == ProtocolType::Gemini ? "x-goog-api-key"
                                                                   : "x-api-key";
        base.headers = def.headers;
        base.extra_body = def.extra_body;
        base.refresh_buffer = refresh_buffer;

        if (base.auth == AuthStrategy::OAuthBearer) {
            const auto* bundle = credentials.oauth_for(id);
            base.account_id = bundle->account_id;
            base.expires_at_ms = bundle->expires_at_ms;
            base.refresher = refresher;
        }

        LOG_DEBUG("Provider {} ready: {} via {} ({})", id, base.base_url,
                  auth_strategy_name(base.auth), utils::fingerprint(base.credential));

        providers.emplace(id, [base = std::move(base)](std::string_view model) {
            ModelHandle handle = base;
            handle.model = std::string(model);
            return handle;
        });
    }

    return providers;
}

} // namespace llmgate::providers
