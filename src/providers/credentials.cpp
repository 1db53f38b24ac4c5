#include "llmgate/providers/credentials.hpp"

#include <algorithm>

namespace llmgate::providers {

auto OAuthBundle::expired(Timestamp now) const -> bool {
    if (!expires_at_ms) return false;
    return *expires_at_ms <= to_epoch_ms(now);
}

auto OAuthBundle::expires_within(Timestamp now, std::chrono::seconds buffer) const -> bool {
    if (!expires_at_ms) return false;
    return *expires_at_ms <= to_epoch_ms(now + buffer);
}

void to_json(json& j, const OAuthBundle& b) {
    j = json{{"access_token", b.access_token}};
    if (b.refresh_token) j["refresh_token"] = *b.refresh_token;
    if (b.expires_at_ms) j["expires_at"] = *b.expires_at_ms;
    if (b.account_id) j["account_id"] = *b.account_id;
}

void from_json(const json& j, OAuthBundle& b) {
    b.access_token = j.value("access_token", "");
    if (j.contains("refresh_token") && j["refresh_token"].is_string())
        b.refresh_token = j["refresh_token"].get<std::string>();
    if (j.contains("expires_at") && j["expires_at"].is_number_integer())
        b.expires_at_ms = j["expires_at"].get<int64_t>();
    if (j.contains("account_id") && j["account_id"].is_string())
        b.account_id = j["account_id"].get<std::string>();
}

auto CredentialSet::secret_for(std::string_view provider_id) const
    -> std::optional<std::string_view> {
    auto it = secrets.find(provider_id);
    if (it == secrets.end() || it->second.empty()) return std::nullopt;
    return std::string_view(it->second);
}

auto CredentialSet::oauth_for(std::string_view provider_id) const -> const OAuthBundle* {
    auto it = oauth.find(provider_id);
    if (it == oauth.end()) return nullptr;
    return &it->second;
}

namespace {

auto flag_set(const FlagMap& flags, std::string_view provider_id) -> bool {
    auto it = flags.find(provider_id);
    return it != flags.end() && it->second;
}

} // anonymous namespace

auto CredentialSet::use_alt_billing(std::string_view provider_id) const -> bool {
    return flag_set(alt_billing, provider_id);
}

auto CredentialSet::use_international(std::string_view provider_id) const -> bool {
    return flag_set(international, provider_id);
}

auto is_local_provider(std::string_view provider_id) -> bool {
    return provider_id == "ollama" || provider_id == "lmstudio";
}

auto has_valid_oauth(std::string_view provider_id, const CredentialSet& credentials,
                     Timestamp now) -> bool {
    const auto* bundle = credentials.oauth_for(provider_id);
    return bundle && !bundle->access_token.empty() && !bundle->expired(now);
}

auto is_provider_usable(std::string_view provider_id,
                        const CredentialSet& credentials,
                        const std::vector<CustomProviderConfig>& custom_providers,
                        Timestamp now) -> bool {
    if (credentials.secret_for(provider_id)) {
        return true;
    }

    auto custom = std::find_if(custom_providers.begin(), custom_providers.end(),
                               [&](const CustomProviderConfig& c) { return c.id == provider_id; });
    if (custom != custom_providers.end() && custom->enabled &&
        custom->api_key && !custom->api_key->empty()) {
        return true;
    }

    return has_valid_oauth(provider_id, credentials, now);
}

} // namespace llmgate::providers
