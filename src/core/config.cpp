#include "llmgate/core/config.hpp"
#include "llmgate/core/logger.hpp"

#include <cstdlib>
#include <fstream>

namespace llmgate {

namespace {

/// Expands ${VAR} references in every string value of a JSON tree.
void expand_env_refs(json& j) {
    if (j.is_string()) {
        j = resolve_env_refs(j.get<std::string>());
    } else if (j.is_object() || j.is_array()) {
        for (auto& child : j) {
            expand_env_refs(child);
        }
    }
}

} // anonymous namespace

auto load_config(const std::filesystem::path& path) -> Config {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        json j = json::parse(file);
        expand_env_refs(j);
        return j.get<Config>();
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return default_config();
    }
}

auto load_config_from_env() -> Config {
    Config config;

    if (auto* val = std::getenv("LLMGATE_LOG_LEVEL")) {
        config.log_level = val;
    }
    if (auto* val = std::getenv("LLMGATE_DATA_DIR")) {
        config.data_dir = val;
    }
    if (auto* val = std::getenv("LLMGATE_SETTINGS_DB")) {
        config.settings_db = val;
    }
    if (auto* val = std::getenv("LLMGATE_BRIDGE_HOST")) {
        config.bridge.host = val;
    }
    if (auto* val = std::getenv("LLMGATE_BRIDGE_PORT")) {
        try {
            config.bridge.port = static_cast<uint16_t>(std::stoi(val));
        } catch (const std::exception& e) {
            LOG_WARN("Ignoring invalid LLMGATE_BRIDGE_PORT '{}': {}", val, e.what());
        }
    }
    if (auto* val = std::getenv("LLMGATE_BRIDGE_TOKEN")) {
        config.bridge.auth_token = val;
    }

    return config;
}

auto default_config() -> Config {
    return Config{};
}

auto default_data_dir() -> std::filesystem::path {
    if (auto* val = std::getenv("LLMGATE_DATA_DIR")) {
        return val;
    }
    auto home = std::filesystem::path(std::getenv("HOME") ? std::getenv("HOME") : "/tmp");
    return home / ".llmgate";
}

auto resolve_data_dir(const Config& config) -> std::filesystem::path {
    if (config.data_dir && !config.data_dir->empty()) {
        return *config.data_dir;
    }
    return default_data_dir();
}

auto resolve_settings_db(const Config& config) -> std::filesystem::path {
    if (config.settings_db && !config.settings_db->empty()) {
        return *config.settings_db;
    }
    return resolve_data_dir(config) / "settings.db";
}

auto resolve_custom_providers_path(const Config& config) -> std::filesystem::path {
    if (config.custom_providers_file && !config.custom_providers_file->empty()) {
        return *config.custom_providers_file;
    }
    return resolve_data_dir(config) / "custom-providers.json";
}

auto resolve_custom_models_path(const Config& config) -> std::filesystem::path {
    if (config.custom_models_file && !config.custom_models_file->empty()) {
        return *config.custom_models_file;
    }
    return resolve_data_dir(config) / "custom-models.json";
}

auto resolve_env_refs(std::string_view input) -> std::string {
    std::string result;
    result.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        // Check for $$ escape
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '$') {
            // Escaped: $${VAR} -> literal ${VAR}
            result += '$';
            i += 2;
            continue;
        }

        // Check for ${VAR} pattern
        if (i + 2 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            auto close = input.find('}', i + 2);
            if (close != std::string_view::npos) {
                auto var_name = input.substr(i + 2, close - i - 2);
                std::string var_name_str(var_name);

                if (auto* val = std::getenv(var_name_str.c_str())) {
                    result += val;
                } else {
                    // Preserve unresolved refs
                    result += input.substr(i, close - i + 1);
                    LOG_DEBUG("Config: unresolved env ref ${{{}}}", var_name);
                }
                i = close + 1;
                continue;
            }
        }

        result += input[i];
        ++i;
    }

    return result;
}

} // namespace llmgate
