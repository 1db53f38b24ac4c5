#include <catch2/catch_test_macros.hpp>

#include "llmgate/models/availability.hpp"
#include "llmgate/providers/registry.hpp"

using namespace llmgate;
using namespace llmgate::models;
using namespace llmgate::providers;
using namespace std::chrono_literals;

namespace {

auto descriptor(std::string name, std::vector<std::string> providers,
                std::optional<std::string> input_price = std::nullopt) -> ModelDescriptor {
    ModelDescriptor d;
    d.name = std::move(name);
    d.providers = std::move(providers);
    if (input_price) {
        d.pricing = ModelPricing{.input = *input_price, .output = "0"};
    }
    return d;
}

// Holds the referenced inputs alive for an AvailabilityInputs view.
struct Fixture {
    CredentialSet credentials;
    ProviderRegistry registry = build_provider_registry({});
    std::vector<CustomProviderConfig> custom_providers;
    ModelCatalog catalog;
    Timestamp now = Clock::now();

    auto inputs() const -> AvailabilityInputs {
        return {credentials, registry, custom_providers, catalog, now};
    }
};

} // anonymous namespace

TEST_CASE("parse_model_identifier", "[models][availability]") {
    auto plain = parse_model_identifier("gpt-5");
    CHECK(plain.model_key == "gpt-5");
    CHECK_FALSE(plain.provider.has_value());

    auto pinned = parse_model_identifier("gpt-5@openRouter");
    CHECK(pinned.model_key == "gpt-5");
    CHECK(pinned.provider == "openRouter");

    auto last_at = parse_model_identifier("org@model@groq");
    CHECK(last_at.model_key == "org@model");
    CHECK(last_at.provider == "groq");

    CHECK_FALSE(parse_model_identifier("gpt-5@").provider.has_value());
    CHECK(parse_model_identifier("gpt-5@").model_key == "gpt-5@");
    CHECK_FALSE(parse_model_identifier("@groq").provider.has_value());
}

TEST_CASE("Declared provider order decides the best provider", "[models][availability]") {
    Fixture f;
    f.catalog["claude-sonnet-4.5"] = descriptor("Claude", {"anthropic", "openai"});
    f.credentials.secrets["openai"] = "sk-openai";

    CHECK(get_best_provider("claude-sonnet-4.5", f.inputs()) == "openai");
    CHECK(is_model_available("claude-sonnet-4.5", f.inputs()));

    f.credentials.secrets["anthropic"] = "sk-ant";
    CHECK(get_best_provider("claude-sonnet-4.5", f.inputs()) == "anthropic");
}

TEST_CASE("Explicit @provider", "[models][availability]") {
    Fixture f;
    f.catalog["gpt-5"] = descriptor("GPT-5", {"openai", "openRouter"});
    f.credentials.secrets["openai"] = "sk-openai";
    f.credentials.secrets["openRouter"] = "sk-or";

    CHECK(get_best_provider("gpt-5@openRouter", f.inputs()) == "openRouter");

    // An unusable explicit provider falls back to the declared list.
    CHECK(get_best_provider("gpt-5@groq", f.inputs()) == "openai");

    // An unknown model can still be addressed through a usable provider.
    CHECK(get_best_provider("not-in-catalog@openai", f.inputs()) == "openai");
    CHECK_FALSE(is_model_available("not-in-catalog", f.inputs()));
}

TEST_CASE("Unregistered providers are never selected", "[models][availability]") {
    Fixture f;
    f.catalog["m"] = descriptor("M", {"aiGateway", "groq"});
    f.credentials.secrets["aiGateway"] = "key";
    CHECK_FALSE(get_best_provider("m", f.inputs()).has_value());
    CHECK(compute_available_models(f.inputs()).empty());
}

TEST_CASE("compute_available_models", "[models][availability]") {
    Fixture f;
    f.catalog["b-model"] = descriptor("B", {"groq", "openai", "groq"}, "0.2");
    f.catalog["a-model"] = descriptor("A", {"anthropic"}, "0.1");
    f.catalog["c-model"] = descriptor("", {"openai"});
    f.credentials.secrets["groq"] = "g";
    f.credentials.secrets["openai"] = "o";

    auto models = compute_available_models(f.inputs());
    REQUIRE(models.size() == 3);
    CHECK(models[0].key == "b-model");
    CHECK(models[0].provider == "groq");
    CHECK(models[0].input_pricing == "0.2");
    CHECK(models[1].key == "b-model");
    CHECK(models[1].provider == "openai");
    CHECK(models[1].provider_name == f.registry.at("openai").name);
    CHECK(models[2].key == "c-model");
    CHECK(models[2].name == "c-model");

    SECTION("deterministic") {
        CHECK(compute_available_models(f.inputs()) == models);
    }

    SECTION("expired OAuth removes the pairing") {
        OAuthBundle bundle;
        bundle.access_token = "tok";
        bundle.expires_at_ms = to_epoch_ms(f.now + 1h);
        f.credentials.oauth["anthropic"] = bundle;
        CHECK(compute_available_models(f.inputs()).size() == 4);

        f.now += 2h;
        CHECK(compute_available_models(f.inputs()).size() == 3);
    }
}

TEST_CASE("resolve_provider_model_name", "[models][availability]") {
    ModelCatalog catalog;
    auto d = descriptor("Kimi", {"moonshot", "openRouter"});
    d.provider_mappings["openRouter"] = "moonshotai/kimi-k2";
    catalog["kimi-k2"] = d;

    CHECK(resolve_provider_model_name(catalog, "kimi-k2", "openRouter") == "moonshotai/kimi-k2");
    CHECK(resolve_provider_model_name(catalog, "kimi-k2", "moonshot") == "kimi-k2");
    CHECK(resolve_provider_model_name(catalog, "unknown", "openai") == "unknown");
}

TEST_CASE("cheapest_available_model", "[models][availability]") {
    CHECK_FALSE(cheapest_available_model({}).has_value());

    std::vector<AvailableModel> models(4);
    models[0].key = "pricey";
    models[0].input_pricing = "0.00001";
    models[1].key = "cheap";
    models[1].input_pricing = "0.000001";
    models[2].key = "also-cheap";
    models[2].input_pricing = "0.000001";
    models[3].key = "garbage";
    models[3].input_pricing = "n/a";

    // Unparseable prices count as zero.
    auto best = cheapest_available_model(models);
    REQUIRE(best.has_value());
    CHECK(best->key == "garbage");

    models.pop_back();
    best = cheapest_available_model(models);
    REQUIRE(best.has_value());
    CHECK(best->key == "cheap");
}

TEST_CASE("cheapest_available_model skips unpriced pairings", "[models][availability]") {
    std::vector<AvailableModel> models(2);
    models[0].key = "llama3";
    models[0].provider = "ollama";
    models[1].key = "gpt-5-mini";
    models[1].provider = "openai";
    models[1].input_pricing = "0.000001";

    auto best = cheapest_available_model(models);
    REQUIRE(best.has_value());
    CHECK(best->key == "gpt-5-mini");

    models.pop_back();
    CHECK_FALSE(cheapest_available_model(models).has_value());
}
