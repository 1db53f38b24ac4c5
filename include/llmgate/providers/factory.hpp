#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <utility>
#include <boost/asio/awaitable.hpp>

#include "llmgate/core/error.hpp"
#include "llmgate/core/types.hpp"
#include "llmgate/providers/credentials.hpp"
#include "llmgate/providers/definition.hpp"

namespace llmgate::providers {

using boost::asio::awaitable;

/// How a resolved model authenticates its requests.
enum class AuthStrategy {
    None,
    Bearer,
    ApiKeyHeader,
    OAuthBearer,
};

auto auth_strategy_name(AuthStrategy strategy) -> std::string_view;

/// Exchanges a provider's refresh token for a new bundle.
using OAuthRefresher = std::function<awaitable<Result<OAuthBundle>>(std::string provider_id)>;

/// A model bound to one provider: everything the remote engine needs to
/// address it. Produced by a ResolveFn; cheap to copy.
struct ModelHandle {
    std::string provider_id;
    std::string model;
    std::string base_url;
    ProtocolType protocol = ProtocolType::OpenAiCompatible;
    AuthStrategy auth = AuthStrategy::None;
    std::string credential;
    /// Header name for AuthStrategy::ApiKeyHeader.
    std::string api_key_header;
    HeaderMap headers;
    std::optional<json> extra_body;
    std::optional<std::string> account_id;
    std::optional<int64_t> expires_at_ms;
    OAuthRefresher refresher;
    std::chrono::seconds refresh_buffer{60};

    /// Builds the request headers for this model. An OAuth token that
    /// expires within the refresh buffer is refreshed first when a
    /// refresher is present.
    auto authorize() -> awaitable<Result<HeaderMap>>;

    /// JSON description with the credential replaced by its fingerprint.
    [[nodiscard]] auto describe() const -> json;
};

/// Resolves a provider-side model name into a handle.
using ResolveFn = std::function<ModelHandle(std::string_view model)>;

/// Provider id -> resolver. Absence means "unavailable", not an error.
using ProviderMap = std::map<std::string, ResolveFn, std::less<>>;

/// Effective base URL: explicit override, then the international endpoint
/// when flagged, then the alt-billing endpoint when flagged, then default.
auto resolve_base_url(const ProviderDefinition& def, const CredentialSet& credentials)
    -> std::string;

/// Picks the auth strategy for a provider given its credentials at `now`.
auto resolve_auth_strategy(const ProviderDefinition& def, const CredentialSet& credentials,
                           Timestamp now) -> AuthStrategy;

/// Builds one resolver per usable provider in `registry`.
auto create_providers(const CredentialSet& credentials,
                      const ProviderRegistry& registry,
                      const std::vector<CustomProviderConfig>& custom_providers,
                      Timestamp now,
                      OAuthRefresher refresher = {},
                      std::chrono::seconds refresh_buffer = std::chrono::seconds{60})
    -> ProviderMap;

} // namespace llmgate::providers
