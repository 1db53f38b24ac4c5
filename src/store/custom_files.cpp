#include "llmgate/store/custom_files.hpp"

#include "llmgate/core/logger.hpp"
#include "llmgate/core/utils.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace llmgate::store {

namespace {

constexpr auto kDocumentVersion = "1";

/// Reads a JSON document; a missing file yields nullopt.
auto read_json(const std::filesystem::path& path) -> Result<std::optional<json>> {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::optional<json>{};
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(make_error(ErrorCode::IoError, "Cannot open file", path.string()));
    }

    try {
        return std::optional<json>(json::parse(file));
    } catch (const json::exception& e) {
        return std::unexpected(make_error(ErrorCode::SerializationError,
                                          "Invalid JSON in " + path.string(), e.what()));
    }
}

/// Writes through a temporary file so readers never see a partial document.
auto write_json(const std::filesystem::path& path, const json& doc) -> Result<void> {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return std::unexpected(make_error(ErrorCode::IoError, "Cannot create directory",
                                              ec.message()));
        }
    }

    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            return std::unexpected(make_error(ErrorCode::IoError, "Cannot write file",
                                              tmp.string()));
        }
        out << doc.dump(2);
        if (!out.good()) {
            return std::unexpected(make_error(ErrorCode::IoError, "Write failed", tmp.string()));
        }
    }

    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        return std::unexpected(make_error(ErrorCode::IoError, "Cannot replace file",
                                          ec.message()));
    }
    return {};
}

} // anonymous namespace

// -- CustomProviderFile --

CustomProviderFile::CustomProviderFile(std::filesystem::path path)
    : path_(std::move(path)) {}

auto CustomProviderFile::load() const -> Result<providers::CustomProvidersDocument> {
    auto raw = read_json(path_);
    if (!raw) {
        return std::unexpected(raw.error());
    }
    if (!*raw) {
        return providers::CustomProvidersDocument{kDocumentVersion, {}};
    }
    if (!(*raw)->is_object()) {
        return std::unexpected(make_error(ErrorCode::SerializationError,
                                          "Custom providers document must be an object"));
    }
    try {
        return (*raw)->get<providers::CustomProvidersDocument>();
    } catch (const json::exception& e) {
        return std::unexpected(make_error(ErrorCode::SerializationError,
                                          "Invalid custom providers document", e.what()));
    }
}

auto CustomProviderFile::save(const providers::CustomProvidersDocument& doc) const
    -> Result<void> {
    json j = doc;
    return write_json(path_, j);
}

auto CustomProviderFile::list_enabled() const
    -> Result<std::vector<providers::CustomProviderConfig>> {
    auto doc = load();
    if (!doc) {
        return std::unexpected(doc.error());
    }
    std::vector<providers::CustomProviderConfig> enabled;
    for (const auto& [id, config] : doc->providers) {
        if (config.enabled) {
            enabled.push_back(config);
        }
    }
    return enabled;
}

auto CustomProviderFile::add(const providers::CustomProviderConfig& config) const
    -> Result<void> {
    auto doc = load();
    if (!doc) {
        return std::unexpected(doc.error());
    }
    if (doc->providers.contains(config.id)) {
        return std::unexpected(make_error(ErrorCode::AlreadyExists,
                                          "Custom provider already exists", config.id));
    }
    doc->providers[config.id] = config;
    LOG_INFO("Adding custom provider {}", config.id);
    return save(*doc);
}

auto CustomProviderFile::update(std::string_view id, providers::CustomProviderConfig config) const
    -> Result<void> {
    auto doc = load();
    if (!doc) {
        return std::unexpected(doc.error());
    }
    auto it = doc->providers.find(std::string(id));
    if (it == doc->providers.end()) {
        return std::unexpected(make_error(ErrorCode::NotFound,
                                          "Custom provider not found", std::string(id)));
    }
    config.id = std::string(id);
    it->second = std::move(config);
    LOG_INFO("Updating custom provider {}", id);
    return save(*doc);
}

auto CustomProviderFile::remove(std::string_view id) const -> Result<void> {
    auto doc = load();
    if (!doc) {
        return std::unexpected(doc.error());
    }
    if (doc->providers.erase(std::string(id)) == 0) {
        return std::unexpected(make_error(ErrorCode::NotFound,
                                          "Custom provider not found", std::string(id)));
    }
    LOG_INFO("Removing custom provider {}", id);
    return save(*doc);
}

// -- CustomModelFile --

CustomModelFile::CustomModelFile(std::filesystem::path path)
    : path_(std::move(path)) {}

auto CustomModelFile::load() const -> Result<models::ModelsConfiguration> {
    auto raw = read_json(path_);
    if (!raw) {
        return std::unexpected(raw.error());
    }
    if (!*raw) {
        return models::ModelsConfiguration{kDocumentVersion, {}};
    }
    if (!(*raw)->is_object()) {
        return std::unexpected(make_error(ErrorCode::SerializationError,
                                          "Custom models document must be an object"));
    }
    try {
        return (*raw)->get<models::ModelsConfiguration>();
    } catch (const json::exception& e) {
        return std::unexpected(make_error(ErrorCode::SerializationError,
                                          "Invalid custom models document", e.what()));
    }
}

auto CustomModelFile::save(const models::ModelsConfiguration& config) const -> Result<void> {
    json j = config;
    return write_json(path_, j);
}

auto CustomModelFile::add(const std::string& key, const models::ModelDescriptor& model) const
    -> Result<void> {
    auto config = load();
    if (!config) {
        return std::unexpected(config.error());
    }

    auto it = config->models.find(key);
    if (it == config->models.end()) {
        config->models.emplace(key, model);
    } else {
        auto& existing = it->second;
        for (const auto& provider : model.providers) {
            if (std::find(existing.providers.begin(), existing.providers.end(), provider) ==
                existing.providers.end()) {
                existing.providers.push_back(provider);
            }
        }
        for (const auto& [provider, name] : model.provider_mappings) {
            existing.provider_mappings[provider] = name;
        }
    }

    LOG_INFO("Adding custom model {}", key);
    return save(*config);
}

auto CustomModelFile::remove(std::string_view key) const -> Result<void> {
    auto config = load();
    if (!config) {
        return std::unexpected(config.error());
    }
    auto it = config->models.find(key);
    if (it == config->models.end()) {
        return std::unexpected(make_error(ErrorCode::NotFound,
                                          "Custom model not found", std::string(key)));
    }
    config->models.erase(it);
    LOG_INFO("Removing custom model {}", key);
    return save(*config);
}

} // namespace llmgate::store
