#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "llmgate/core/config.hpp"

TEST_CASE("default_config returns sane defaults", "[core][config]") {
    auto cfg = llmgate::default_config();

    CHECK(cfg.log_level == "info");
    CHECK(cfg.bridge.host == "127.0.0.1");
    CHECK(cfg.bridge.port == 18790);
    CHECK(cfg.bridge.path == "/");
    CHECK_FALSE(cfg.bridge.auth_token.has_value());
    CHECK(cfg.oauth_refresh_buffer_seconds == 60);
    CHECK_FALSE(cfg.data_dir.has_value());
}

TEST_CASE("load_config parses JSON file correctly", "[core][config]") {
    namespace fs = std::filesystem;

    auto tmp = fs::temp_directory_path() / "llmgate_test_config.json";
    {
        std::ofstream out(tmp);
        out << R"({
            "log_level": "debug",
            "data_dir": "/var/lib/llmgate",
            "bridge": {"port": 9999, "auth_token": "t0ken"},
            "oauth_refresh_buffer_seconds": 120
        })";
    }

    auto cfg = llmgate::load_config(tmp);

    CHECK(cfg.log_level == "debug");
    CHECK(cfg.bridge.port == 9999);
    CHECK(cfg.bridge.auth_token == "t0ken");
    // Unspecified fields keep defaults
    CHECK(cfg.bridge.host == "127.0.0.1");
    CHECK(cfg.oauth_refresh_buffer_seconds == 120);

    CHECK(llmgate::resolve_settings_db(cfg) == fs::path("/var/lib/llmgate") / "settings.db");
    CHECK(llmgate::resolve_custom_providers_path(cfg) ==
          fs::path("/var/lib/llmgate") / "custom-providers.json");
    CHECK(llmgate::resolve_custom_models_path(cfg) ==
          fs::path("/var/lib/llmgate") / "custom-models.json");

    fs::remove(tmp);
}

TEST_CASE("load_config falls back to defaults", "[core][config]") {
    namespace fs = std::filesystem;

    SECTION("missing file") {
        auto cfg = llmgate::load_config("/nonexistent/llmgate.json");
        CHECK(cfg.log_level == "info");
    }

    SECTION("malformed JSON") {
        auto tmp = fs::temp_directory_path() / "llmgate_bad_config.json";
        {
            std::ofstream out(tmp);
            out << "{ not json";
        }
        auto cfg = llmgate::load_config(tmp);
        CHECK(cfg.bridge.port == 18790);
        fs::remove(tmp);
    }
}

TEST_CASE("Explicit file paths override the data directory", "[core][config]") {
    llmgate::Config cfg;
    cfg.data_dir = "/data";
    cfg.settings_db = "/elsewhere/s.db";
    CHECK(llmgate::resolve_settings_db(cfg) == std::filesystem::path("/elsewhere/s.db"));
    CHECK(llmgate::resolve_custom_models_path(cfg) ==
          std::filesystem::path("/data") / "custom-models.json");
}

TEST_CASE("load_config expands environment references", "[core][config]") {
    namespace fs = std::filesystem;
    setenv("LLMGATE_TEST_BRIDGE_TOKEN", "from-env", 1);

    auto tmp = fs::temp_directory_path() / "llmgate_env_config.json";
    {
        std::ofstream out(tmp);
        out << R"({"bridge": {"auth_token": "${LLMGATE_TEST_BRIDGE_TOKEN}"}})";
    }
    auto cfg = llmgate::load_config(tmp);
    CHECK(cfg.bridge.auth_token == "from-env");
    fs::remove(tmp);
}
