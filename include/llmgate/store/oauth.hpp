#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <utility>
#include <boost/asio/awaitable.hpp>

#include "llmgate/core/error.hpp"
#include "llmgate/providers/credentials.hpp"
#include "llmgate/store/settings.hpp"
#include "llmgate/streaming/client.hpp"

namespace llmgate::store {

/// Access to stored OAuth tokens for OAuth-capable providers.
class OAuthStore {
public:
    virtual ~OAuthStore() = default;

    /// The stored bundle, or nullopt when the provider was never authorized.
    virtual auto current(std::string_view provider_id)
        -> awaitable<Result<std::optional<providers::OAuthBundle>>> = 0;

    /// Exchanges the refresh token and persists the new bundle.
    virtual auto refresh(std::string_view provider_id)
        -> awaitable<Result<providers::OAuthBundle>> = 0;
};

/// Tokens kept in the settings table under "<provider>_oauth_<field>";
/// refresh is delegated to the remote engine.
class SettingsOAuthStore : public OAuthStore {
public:
    SettingsOAuthStore(SettingsStore& settings, streaming::LlmClient& client);

    auto current(std::string_view provider_id)
        -> awaitable<Result<std::optional<providers::OAuthBundle>>> override;
    auto refresh(std::string_view provider_id)
        -> awaitable<Result<providers::OAuthBundle>> override;

    /// Writes every field of `bundle`, removing the absent optional ones.
    auto save(std::string_view provider_id, const providers::OAuthBundle& bundle)
        -> awaitable<Result<void>>;

private:
    SettingsStore& settings_;
    streaming::LlmClient& client_;
};

} // namespace llmgate::store
