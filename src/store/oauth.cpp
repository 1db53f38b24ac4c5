#include "llmgate/store/oauth.hpp"

#include "llmgate/core/logger.hpp"

#include <charconv>
#include <utility>

namespace llmgate::store {

namespace {

constexpr auto kAccessToken = "access_token";
constexpr auto kRefreshToken = "refresh_token";
constexpr auto kExpiresAt = "expires_at";
constexpr auto kAccountId = "account_id";

auto parse_epoch_ms(const std::string& text) -> std::optional<int64_t> {
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

} // anonymous namespace

SettingsOAuthStore::SettingsOAuthStore(SettingsStore& settings, streaming::LlmClient& client)
    : settings_(settings), client_(client) {}

auto SettingsOAuthStore::current(std::string_view provider_id)
    -> awaitable<Result<std::optional<providers::OAuthBundle>>> {
    auto values = co_await settings_.get_batch({
        setting_keys::oauth(provider_id, kAccessToken),
        setting_keys::oauth(provider_id, kRefreshToken),
        setting_keys::oauth(provider_id, kExpiresAt),
        setting_keys::oauth(provider_id, kAccountId),
    });
    if (!values) {
        co_return make_fail(values.error());
    }

    auto field = [&](const char* name) -> std::optional<std::string> {
        auto it = values->find(setting_keys::oauth(provider_id, name));
        if (it == values->end() || it->second.empty()) return std::nullopt;
        return it->second;
    };

    auto access = field(kAccessToken);
    if (!access) {
        co_return std::optional<providers::OAuthBundle>{};
    }

    providers::OAuthBundle bundle;
    bundle.access_token = *access;
    bundle.refresh_token = field(kRefreshToken);
    bundle.account_id = field(kAccountId);
    if (auto expires = field(kExpiresAt)) {
        bundle.expires_at_ms = parse_epoch_ms(*expires);
        if (!bundle.expires_at_ms) {
            LOG_WARN("Ignoring malformed OAuth expiry for {}: {}", provider_id, *expires);
        }
    }
    co_return std::optional<providers::OAuthBundle>(std::move(bundle));
}

auto SettingsOAuthStore::refresh(std::string_view provider_id)
    -> awaitable<Result<providers::OAuthBundle>> {
    LOG_INFO("Refreshing OAuth token for {}", provider_id);
    auto bundle = co_await client_.refresh_oauth(provider_id);
    if (!bundle) {
        LOG_WARN("OAuth refresh for {} failed: {}", provider_id, bundle.error().what());
        co_return make_fail(bundle.error());
    }

    // Keep the old refresh token when the engine does not rotate it.
    if (!bundle->refresh_token) {
        auto existing = co_await current(provider_id);
        if (existing && *existing) {
            bundle->refresh_token = (*existing)->refresh_token;
        }
    }

    auto saved = co_await save(provider_id, *bundle);
    if (!saved) {
        co_return make_fail(saved.error());
    }
    co_return *bundle;
}

auto SettingsOAuthStore::save(std::string_view provider_id,
                              const providers::OAuthBundle& bundle)
    -> awaitable<Result<void>> {
    std::optional<std::string> expires;
    if (bundle.expires_at_ms) {
        expires = std::to_string(*bundle.expires_at_ms);
    }

    const std::pair<const char*, std::optional<std::string>> fields[] = {
        {kAccessToken, bundle.access_token},
        {kRefreshToken, bundle.refresh_token},
        {kExpiresAt, expires},
        {kAccountId, bundle.account_id},
    };

    for (const auto& [name, value] : fields) {
        auto key = setting_keys::oauth(provider_id, name);
        auto result = value ? co_await settings_.set(key, *value)
                            : co_await settings_.remove(key);
        if (!result) {
            co_return make_fail(result.error());
        }
    }
    co_return ok_result();
}

} // namespace llmgate::store
