#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include "llmgate/cli/commands.hpp"

using json = nlohmann::json;
using llmgate::cli::redact_config_json;

TEST_CASE("Config redaction hides secrets", "[cli][redaction]") {
    SECTION("Redacts api_key in nested provider arrays") {
        json j = {
            {"custom_providers", json::array({
                {{"id", "custom-openai-acme"}, {"api_key", "sk-secret"}},
                {{"id", "custom-anthropic-corp"}, {"api_key", "sk-other"}},
            })},
        };
        redact_config_json(j);
        CHECK(j["custom_providers"][0]["api_key"] == "***REDACTED***");
        CHECK(j["custom_providers"][1]["api_key"] == "***REDACTED***");
        CHECK(j["custom_providers"][0]["id"] == "custom-openai-acme");
    }

    SECTION("Redacts auth_token in the bridge section") {
        json j = {{"bridge", {{"url", "ws://localhost:18790"}, {"auth_token", "bridge-secret"}}}};
        redact_config_json(j);
        CHECK(j["bridge"]["auth_token"] == "***REDACTED***");
        CHECK(j["bridge"]["url"] == "ws://localhost:18790");
    }

    SECTION("Redacts OAuth tokens") {
        json j = {{"oauth", {{"access_token", "at"}, {"refresh_token", "rt"}, {"token", "t"}}}};
        redact_config_json(j);
        CHECK(j["oauth"]["access_token"] == "***REDACTED***");
        CHECK(j["oauth"]["refresh_token"] == "***REDACTED***");
        CHECK(j["oauth"]["token"] == "***REDACTED***");
    }

    SECTION("Leaves other keys and empty secrets alone") {
        json j = {
            {"log_level", "debug"},
            {"data_dir", "/tmp/llmgate"},
            {"secret", ""},
            {"store", {{"request_timeout_ms", 30000}}},
        };
        redact_config_json(j);
        CHECK(j["log_level"] == "debug");
        CHECK(j["data_dir"] == "/tmp/llmgate");
        CHECK(j["secret"] == "");
        CHECK(j["store"]["request_timeout_ms"] == 30000);
    }
}
