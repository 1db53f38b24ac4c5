#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "llmgate/core/types.hpp"

namespace llmgate {

/// Where the remote engine's message bus listens.
struct BridgeConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 18790;
    std::string path = "/";
    std::optional<std::string> auth_token;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(BridgeConfig, host, port, path, auth_token)

struct Config {
    std::string log_level = "info";
    std::optional<std::string> data_dir;
    std::optional<std::string> settings_db;
    std::optional<std::string> custom_providers_file;
    std::optional<std::string> custom_models_file;
    BridgeConfig bridge;
    int oauth_refresh_buffer_seconds = 60;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, log_level, data_dir, settings_db, custom_providers_file, custom_models_file, bridge, oauth_refresh_buffer_seconds)

auto load_config(const std::filesystem::path& path) -> Config;
auto load_config_from_env() -> Config;
auto default_config() -> Config;
auto default_data_dir() -> std::filesystem::path;

/// Data directory for a config: `data_dir` when set, default_data_dir() otherwise.
auto resolve_data_dir(const Config& config) -> std::filesystem::path;
auto resolve_settings_db(const Config& config) -> std::filesystem::path;
auto resolve_custom_providers_path(const Config& config) -> std::filesystem::path;
auto resolve_custom_models_path(const Config& config) -> std::filesystem::path;

/// Resolves `${VAR}` environment variable references in a string.
/// Supports `$${VAR}` escape (literal `${VAR}`).
auto resolve_env_refs(std::string_view input) -> std::string;

} // namespace llmgate
