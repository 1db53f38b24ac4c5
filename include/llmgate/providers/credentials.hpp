#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "llmgate/core/types.hpp"
#include "llmgate/providers/definition.hpp"

namespace llmgate::providers {

/// Secret value stored for credential-less local providers.
inline constexpr std::string_view kEnabledSentinel = "enabled";

/// OAuth token bundle for one OAuth-capable provider.
struct OAuthBundle {
    std::string access_token;
    std::optional<std::string> refresh_token;
    std::optional<int64_t> expires_at_ms;
    std::optional<std::string> account_id;

    /// True when the token has an expiry at or before `now`.
    [[nodiscard]] auto expired(Timestamp now) const -> bool;

    /// True when the token expires within `buffer` of `now`.
    [[nodiscard]] auto expires_within(Timestamp now, std::chrono::seconds buffer) const -> bool;
};

void to_json(json& j, const OAuthBundle& b);
void from_json(const json& j, OAuthBundle& b);

using StringMap = std::map<std::string, std::string, std::less<>>;
using FlagMap = std::map<std::string, bool, std::less<>>;

/// Everything known about how to authenticate against each provider.
/// Reloaded wholesale; never mutated element-wise once published.
struct CredentialSet {
    StringMap secrets;
    StringMap base_url_overrides;
    FlagMap alt_billing;
    FlagMap international;
    std::map<std::string, OAuthBundle, std::less<>> oauth;

    [[nodiscard]] auto secret_for(std::string_view provider_id) const
        -> std::optional<std::string_view>;
    [[nodiscard]] auto oauth_for(std::string_view provider_id) const -> const OAuthBundle*;
    [[nodiscard]] auto use_alt_billing(std::string_view provider_id) const -> bool;
    [[nodiscard]] auto use_international(std::string_view provider_id) const -> bool;
};

/// Providers that run on the local machine and need no credential.
auto is_local_provider(std::string_view provider_id) -> bool;

/// True when `provider_id` holds a non-expired OAuth token at `now`.
auto has_valid_oauth(std::string_view provider_id, const CredentialSet& credentials,
                     Timestamp now) -> bool;

/// A provider is usable when any of these holds at `now`:
/// a non-empty secret (for local providers, the "enabled" sentinel),
/// an enabled custom provider carrying its own API key,
/// or a non-expired OAuth token.
auto is_provider_usable(std::string_view provider_id,
                        const CredentialSet& credentials,
                        const std::vector<CustomProviderConfig>& custom_providers,
                        Timestamp now) -> bool;

} // namespace llmgate::providers
