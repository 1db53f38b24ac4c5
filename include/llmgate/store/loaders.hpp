#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <utility>
#include <boost/asio/awaitable.hpp>

#include "llmgate/core/error.hpp"
#include "llmgate/models/model.hpp"
#include "llmgate/providers/credentials.hpp"
#include "llmgate/providers/definition.hpp"
#include "llmgate/providers/factory.hpp"
#include "llmgate/store/custom_files.hpp"
#include "llmgate/store/oauth.hpp"
#include "llmgate/store/settings.hpp"

namespace llmgate::store {

using OAuthTokens = std::map<std::string, providers::OAuthBundle, std::less<>>;

/// The I/O seams of ProviderStore. Each member reads or writes one kind of
/// persisted state, so tests can substitute any of them.
struct StoreLoaders {
    // Readers
    std::function<awaitable<Result<providers::CredentialSet>>()> load_credentials;
    std::function<awaitable<Result<std::vector<providers::CustomProviderConfig>>>()>
        load_custom_providers;
    std::function<awaitable<Result<models::ModelCatalog>>()> load_base_models;
    std::function<awaitable<Result<models::ModelCatalog>>()> load_custom_models;
    std::function<awaitable<Result<OAuthTokens>>(std::vector<std::string> provider_ids)>
        load_oauth;
    providers::OAuthRefresher refresh_oauth;

    // Writers
    std::function<awaitable<Result<void>>(std::string key, std::string value)> save_setting;
    std::function<awaitable<Result<void>>(providers::CustomProviderConfig)> add_custom_provider;
    std::function<awaitable<Result<void>>(std::string id, providers::CustomProviderConfig)>
        update_custom_provider;
    std::function<awaitable<Result<void>>(std::string id)> remove_custom_provider;
    std::function<awaitable<Result<void>>(std::string key, models::ModelDescriptor)>
        add_custom_model;
    std::function<awaitable<Result<void>>(std::string key)> remove_custom_model;
};

/// Parses the settings table into a CredentialSet. OAuth tokens are not
/// part of it; they come from load_oauth.
auto credentials_from_settings(const SettingsMap& settings) -> providers::CredentialSet;

/// Loaders backed by the settings database and the custom JSON files.
/// All referenced objects must outlive the returned loaders.
auto make_store_loaders(SettingsStore& settings,
                        const CustomProviderFile& custom_providers,
                        const CustomModelFile& custom_models,
                        OAuthStore& oauth) -> StoreLoaders;

} // namespace llmgate::store
