#include <catch2/catch_test_macros.hpp>

#include "llmgate/providers/factory.hpp"
#include "llmgate/providers/registry.hpp"

#include "../test_helpers.hpp"

using namespace llmgate;
using namespace llmgate::providers;
using llmgate::test::run_sync;
using namespace std::chrono_literals;

namespace {

auto valid_oauth(std::string token, Timestamp expires) -> OAuthBundle {
    OAuthBundle b;
    b.access_token = std::move(token);
    b.refresh_token = "refresh-1";
    b.expires_at_ms = to_epoch_ms(expires);
    return b;
}

} // anonymous namespace

TEST_CASE("resolve_base_url priority", "[providers][factory]") {
    const auto& minimax = builtin_providers().at("MiniMax");
    CredentialSet creds;

    CHECK(resolve_base_url(minimax, creds) == minimax.base_url);

    creds.alt_billing["MiniMax"] = true;
    CHECK(resolve_base_url(minimax, creds) == *minimax.alt_billing_base_url);

    creds.international["MiniMax"] = true;
    CHECK(resolve_base_url(minimax, creds) == *minimax.international_base_url);

    creds.base_url_overrides["MiniMax"] = "https://proxy.test/minimax";
    CHECK(resolve_base_url(minimax, creds) == "https://proxy.test/minimax");
}

TEST_CASE("Flags are ignored for providers without the capability", "[providers][factory]") {
    const auto& openai = builtin_providers().at("openai");
    CredentialSet creds;
    creds.alt_billing["openai"] = true;
    creds.international["openai"] = true;
    CHECK(resolve_base_url(openai, creds) == openai.base_url);
}

TEST_CASE("resolve_auth_strategy", "[providers][factory]") {
    const auto& table = builtin_providers();
    auto now = Clock::now();
    CredentialSet creds;

    CHECK(resolve_auth_strategy(table.at("openai"), creds, now) == AuthStrategy::Bearer);
    CHECK(resolve_auth_strategy(table.at("anthropic"), creds, now) ==
          AuthStrategy::ApiKeyHeader);
    CHECK(resolve_auth_strategy(table.at("google"), creds, now) == AuthStrategy::ApiKeyHeader);
    CHECK(resolve_auth_strategy(table.at("ollama"), creds, now) == AuthStrategy::None);

    creds.oauth["anthropic"] = valid_oauth("oauth-tok", now + 1h);
    CHECK(resolve_auth_strategy(table.at("anthropic"), creds, now) == AuthStrategy::OAuthBearer);

    // OAuth is ignored for providers that do not support it.
    creds.oauth["groq"] = valid_oauth("tok", now + 1h);
    CHECK(resolve_auth_strategy(table.at("groq"), creds, now) == AuthStrategy::Bearer);
}

TEST_CASE("create_providers includes exactly the usable providers", "[providers][factory]") {
    auto now = Clock::now();
    CredentialSet creds;
    creds.secrets["openai"] = "sk-openai";
    creds.secrets["lmstudio"] = std::string(kEnabledSentinel);
    creds.oauth["github_copilot"] = valid_oauth("gh-tok", now + 1h);
    creds.oauth["anthropic"] = valid_oauth("expired", now - 1h);

    auto registry = build_provider_registry({});
    auto providers = create_providers(creds, registry, {}, now);

    CHECK(providers.size() == 3);
    CHECK(providers.contains("openai"));
    CHECK(providers.contains("lmstudio"));
    CHECK(providers.contains("github_copilot"));
    CHECK_FALSE(providers.contains("anthropic"));
}

TEST_CASE("ResolveFn builds a model handle", "[providers][factory]") {
    auto now = Clock::now();
    CredentialSet creds;
    creds.secrets["google"] = "g-key";
    creds.secrets["ollama"] = std::string(kEnabledSentinel);

    auto providers = create_providers(creds, build_provider_registry({}), {}, now);

    auto gemini = providers.at("google")("gemini-2.5-pro");
    CHECK(gemini.provider_id == "google");
    CHECK(gemini.model == "gemini-2.5-pro");
    CHECK(gemini.protocol == ProtocolType::Gemini);
    CHECK(gemini.auth == AuthStrategy::ApiKeyHeader);
    CHECK(gemini.api_key_header == "x-goog-api-key");
    CHECK(gemini.credential == "g-key");

    auto headers = run_sync(gemini.authorize());
    REQUIRE(headers.has_value());
    CHECK(headers->at("x-goog-api-key") == "g-key");
    CHECK_FALSE(headers->contains("Authorization"));

    auto local = providers.at("ollama")("llama3.3");
    CHECK(local.auth == AuthStrategy::None);
    CHECK(local.credential.empty());
    auto local_headers = run_sync(local.authorize());
    REQUIRE(local_headers.has_value());
    CHECK(local_headers->empty());
}

TEST_CASE("Custom provider handle uses its own key and headers", "[providers][factory]") {
    CustomProviderConfig c;
    c.id = "custom-anthropic-proxy";
    c.name = "Proxy";
    c.type = ProtocolType::Anthropic;
    c.base_url = "https://proxy.test/v1";
    c.api_key = "sk-proxy";
    c.headers = HeaderMap{{"X-Org", "7"}};

    auto registry = build_provider_registry({c});
    auto providers = create_providers({}, registry, {c}, Clock::now());
    REQUIRE(providers.contains("custom-anthropic-proxy"));

    auto handle = providers.at("custom-anthropic-proxy")("claude-sonnet-4-5");
    CHECK(handle.base_url == "https://proxy.test/v1");
    CHECK(handle.auth == AuthStrategy::ApiKeyHeader);
    CHECK(handle.api_key_header == "x-api-key");

    auto headers = run_sync(handle.authorize());
    REQUIRE(headers.has_value());
    CHECK(headers->at("x-api-key") == "sk-proxy");
    CHECK(headers->at("X-Org") == "7");
}

TEST_CASE("OAuth handle refreshes an expiring token", "[providers][factory]") {
    auto now = Clock::now();
    CredentialSet creds;
    auto bundle = valid_oauth("old-token", now + 10s);
    bundle.account_id = "acct-1";
    creds.oauth["openai"] = bundle;

    int refresh_calls = 0;
    OAuthRefresher refresher = [&refresh_calls, now](std::string provider)
        -> awaitable<Result<OAuthBundle>> {
        ++refresh_calls;
        CHECK(provider == "openai");
        co_return valid_oauth("new-token", now + 1h);
    };

    auto providers = create_providers(creds, build_provider_registry({}), {}, now,
                                      refresher, 60s);
    auto handle = providers.at("openai")("gpt-5");
    CHECK(handle.auth == AuthStrategy::OAuthBearer);

    auto headers = run_sync(handle.authorize());
    REQUIRE(headers.has_value());
    CHECK(refresh_calls == 1);
    CHECK(headers->at("Authorization") == "Bearer new-token");
    CHECK(headers->at("chatgpt-account-id") == "acct-1");

    // The refreshed token is kept on the handle.
    auto again = run_sync(handle.authorize());
    REQUIRE(again.has_value());
    CHECK(refresh_calls == 1);
}

TEST_CASE("OAuth refresh failure propagates", "[providers][factory]") {
    auto now = Clock::now();
    CredentialSet creds;
    creds.oauth["anthropic"] = valid_oauth("old", now + 5s);

    OAuthRefresher refresher = [](std::string) -> awaitable<Result<OAuthBundle>> {
        co_return make_fail(make_error(ErrorCode::Unauthorized, "refresh rejected"));
    };

    auto providers = create_providers(creds, build_provider_registry({}), {}, now, refresher);
    auto handle = providers.at("anthropic")("claude-haiku-4-5");
    auto headers = run_sync(handle.authorize());
    REQUIRE_FALSE(headers.has_value());
    CHECK(headers.error().code() == ErrorCode::Unauthorized);
}

TEST_CASE("describe() never exposes the credential", "[providers][factory]") {
    CredentialSet creds;
    creds.secrets["deepseek"] = "sk-very-secret";
    auto providers = create_providers(creds, build_provider_registry({}), {}, Clock::now());
    auto described = providers.at("deepseek")("deepseek-chat").describe();

    CHECK(described["provider"] == "deepseek");
    CHECK(described["auth"] == "bearer");
    CHECK(described.dump().find("sk-very-secret") == std::string::npos);
}
