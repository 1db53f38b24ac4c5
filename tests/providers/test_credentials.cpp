#include <catch2/catch_test_macros.hpp>

#include "llmgate/providers/credentials.hpp"

using namespace llmgate;
using namespace llmgate::providers;
using namespace std::chrono_literals;

namespace {

const auto kNow = from_epoch_ms(1'700'000'000'000);

auto oauth_bundle(std::string token, std::optional<int64_t> expires_at_ms) -> OAuthBundle {
    OAuthBundle b;
    b.access_token = std::move(token);
    b.refresh_token = "refresh";
    b.expires_at_ms = expires_at_ms;
    return b;
}

} // anonymous namespace

TEST_CASE("OAuthBundle expiry", "[providers][credentials]") {
    auto now_ms = to_epoch_ms(kNow);

    CHECK_FALSE(oauth_bundle("t", std::nullopt).expired(kNow));
    CHECK_FALSE(oauth_bundle("t", now_ms + 1).expired(kNow));
    CHECK(oauth_bundle("t", now_ms).expired(kNow));

    auto soon = oauth_bundle("t", now_ms + 30'000);
    CHECK(soon.expires_within(kNow, 60s));
    CHECK_FALSE(soon.expires_within(kNow, 10s));
}

TEST_CASE("OAuthBundle JSON keys", "[providers][credentials]") {
    auto b = json::parse(R"({"access_token": "a", "expires_at": 123, "account_id": "acc"})")
                 .get<OAuthBundle>();
    CHECK(b.access_token == "a");
    CHECK(b.expires_at_ms == 123);
    CHECK(b.account_id == "acc");
    CHECK_FALSE(b.refresh_token.has_value());
    CHECK(json(b).contains("expires_at"));
}

TEST_CASE("CredentialSet lookups", "[providers][credentials]") {
    CredentialSet creds;
    creds.secrets["openai"] = "sk-1";
    creds.secrets["groq"] = "";
    creds.alt_billing["zhipu"] = true;
    creds.international["moonshot"] = false;

    CHECK(creds.secret_for("openai") == "sk-1");
    CHECK_FALSE(creds.secret_for("groq").has_value());
    CHECK_FALSE(creds.secret_for("anthropic").has_value());
    CHECK(creds.use_alt_billing("zhipu"));
    CHECK_FALSE(creds.use_alt_billing("zai"));
    CHECK_FALSE(creds.use_international("moonshot"));
    CHECK(creds.oauth_for("openai") == nullptr);
}

TEST_CASE("Provider usability", "[providers][credentials]") {
    CredentialSet creds;
    std::vector<CustomProviderConfig> customs;

    SECTION("API key") {
        creds.secrets["openai"] = "sk-1";
        CHECK(is_provider_usable("openai", creds, customs, kNow));
        CHECK_FALSE(is_provider_usable("anthropic", creds, customs, kNow));
    }

    SECTION("Local provider needs the enabled sentinel") {
        CHECK(is_local_provider("ollama"));
        CHECK(is_local_provider("lmstudio"));
        CHECK_FALSE(is_local_provider("openai"));
        CHECK_FALSE(is_provider_usable("ollama", creds, customs, kNow));
        creds.secrets["ollama"] = std::string(kEnabledSentinel);
        CHECK(is_provider_usable("ollama", creds, customs, kNow));
    }

    SECTION("OAuth token must not be expired") {
        creds.oauth["anthropic"] = oauth_bundle("tok", to_epoch_ms(kNow + 1h));
        CHECK(is_provider_usable("anthropic", creds, customs, kNow));
        CHECK(has_valid_oauth("anthropic", creds, kNow));

        // The same token is rejected once the clock passes its expiry.
        CHECK_FALSE(is_provider_usable("anthropic", creds, customs, kNow + 2h));
    }

    SECTION("Empty OAuth access token is not usable") {
        creds.oauth["openai"] = oauth_bundle("", std::nullopt);
        CHECK_FALSE(is_provider_usable("openai", creds, customs, kNow));
    }

    SECTION("Custom provider with its own key") {
        CustomProviderConfig c;
        c.id = "custom-openai-acme";
        c.api_key = "sk-acme";
        customs.push_back(c);
        CHECK(is_provider_usable("custom-openai-acme", creds, customs, kNow));

        customs.back().enabled = false;
        CHECK_FALSE(is_provider_usable("custom-openai-acme", creds, customs, kNow));
    }
}
