#include <catch2/catch_test_macros.hpp>

#include "llmgate/models/catalog.hpp"

using namespace llmgate;
using namespace llmgate::models;

TEST_CASE("Built-in model catalog", "[models][catalog]") {
    const auto& catalog = builtin_model_catalog();
    CHECK_FALSE(catalog.version.empty());
    REQUIRE(catalog.models.contains("claude-sonnet-4.5"));

    const auto& sonnet = catalog.models.at("claude-sonnet-4.5");
    CHECK(sonnet.name == "Claude Sonnet 4.5");
    CHECK(sonnet.image_input);
    REQUIRE_FALSE(sonnet.providers.empty());
    CHECK(sonnet.providers.front() == "anthropic");
    CHECK(sonnet.provider_mappings.at("anthropic") == "claude-sonnet-4-5");
    REQUIRE(sonnet.pricing.has_value());
    CHECK(sonnet.pricing->cached_input == "0.0000003");

    for (const auto& [key, model] : catalog.models) {
        INFO(key);
        CHECK_FALSE(model.providers.empty());
    }
}

TEST_CASE("parse_models_configuration", "[models][catalog]") {
    SECTION("Valid document") {
        auto parsed = parse_models_configuration(R"({
            "version": "test",
            "models": {
                "m1": {"name": "Model One", "providers": ["openai"],
                       "imageOutput": true, "context_length": 8192},
                "m2": {"name": "Model Two", "providers": ["groq", "ollama"],
                       "providerMappings": {"groq": "m2-groq"},
                       "pricing": {"input": "0.1", "output": "0.2"}}
            }
        })");
        REQUIRE(parsed.has_value());
        CHECK(parsed->version == "test");
        REQUIRE(parsed->models.size() == 2);
        CHECK(parsed->models.at("m1").image_output);
        CHECK(parsed->models.at("m1").context_length == 8192u);
        CHECK(parsed->models.at("m2").providers ==
              std::vector<std::string>{"groq", "ollama"});
        CHECK(parsed->models.at("m2").pricing->input == "0.1");
    }

    SECTION("Malformed model entries are skipped") {
        auto parsed = parse_models_configuration(R"({
            "models": {
                "ok": {"name": "OK", "providers": ["openai"]},
                "no-providers": {"name": "Missing"},
                "not-an-object": 7
            }
        })");
        REQUIRE(parsed.has_value());
        CHECK(parsed->models.size() == 1);
        CHECK(parsed->models.contains("ok"));
    }

    SECTION("Invalid JSON") {
        auto parsed = parse_models_configuration("{ nope");
        REQUIRE_FALSE(parsed.has_value());
        CHECK(parsed.error().code() == ErrorCode::SerializationError);
    }

    SECTION("Non-object document") {
        auto parsed = parse_models_configuration("[1, 2]");
        REQUIRE_FALSE(parsed.has_value());
        CHECK(parsed.error().code() == ErrorCode::SerializationError);
    }
}

TEST_CASE("Descriptor JSON keeps provider order", "[models][catalog]") {
    ModelDescriptor d;
    d.name = "Ordered";
    d.providers = {"zai", "anthropic", "openai"};
    auto back = json(d).get<ModelDescriptor>();
    CHECK(back.providers == d.providers);
}

TEST_CASE("merge_model_catalog", "[models][catalog]") {
    ModelCatalog base;
    base["shared"] = ModelDescriptor{.name = "Base", .providers = {"openai"}};
    base["base-only"] = ModelDescriptor{.name = "Base Only", .providers = {"groq"}};

    ModelCatalog custom;
    custom["shared"] = ModelDescriptor{.name = "Custom", .providers = {"anthropic"}};
    custom["custom-only"] = ModelDescriptor{.name = "Custom Only", .providers = {"ollama"}};

    auto merged = merge_model_catalog(base, custom);
    CHECK(merged.size() == 3);
    CHECK(merged.at("shared").name == "Custom");
    CHECK(merged.at("shared").providers == std::vector<std::string>{"anthropic"});
    CHECK(merged.at("base-only").name == "Base Only");
    CHECK(merged.at("custom-only").name == "Custom Only");

    // Inputs are untouched.
    CHECK(base.at("shared").name == "Base");
}
