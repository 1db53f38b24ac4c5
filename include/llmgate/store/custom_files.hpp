#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "llmgate/core/error.hpp"
#include "llmgate/models/model.hpp"
#include "llmgate/providers/definition.hpp"

namespace llmgate::store {

/// custom-providers.json: `{version, providers: {id: config}}`.
/// A missing file reads as an empty document.
class CustomProviderFile {
public:
    explicit CustomProviderFile(std::filesystem::path path);

    auto load() const -> Result<providers::CustomProvidersDocument>;
    auto save(const providers::CustomProvidersDocument& doc) const -> Result<void>;

    /// Enabled entries in id order.
    auto list_enabled() const -> Result<std::vector<providers::CustomProviderConfig>>;

    /// Fails with AlreadyExists when the id is taken.
    auto add(const providers::CustomProviderConfig& config) const -> Result<void>;
    /// Replaces an entry; fails with NotFound when absent.
    auto update(std::string_view id, providers::CustomProviderConfig config) const -> Result<void>;
    auto remove(std::string_view id) const -> Result<void>;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    std::filesystem::path path_;
};

/// custom-models.json, in the models.json format.
class CustomModelFile {
public:
    explicit CustomModelFile(std::filesystem::path path);

    auto load() const -> Result<models::ModelsConfiguration>;
    auto save(const models::ModelsConfiguration& config) const -> Result<void>;

    /// Adds a model. When the key exists, the provider lists are merged
    /// without duplicates and the provider mappings are merged.
    auto add(const std::string& key, const models::ModelDescriptor& model) const -> Result<void>;
    /// Fails with NotFound when absent.
    auto remove(std::string_view key) const -> Result<void>;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace llmgate::store
