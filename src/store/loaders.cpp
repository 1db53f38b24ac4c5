#include "llmgate/store/loaders.hpp"

#include "llmgate/core/logger.hpp"
#include "llmgate/models/catalog.hpp"

namespace llmgate::store {

namespace {

auto is_truthy(std::string_view value) -> bool {
    return value == "true" || value == "1";
}

auto strip_prefix(std::string_view key, std::string_view prefix) -> std::optional<std::string> {
    if (!key.starts_with(prefix) || key.size() == prefix.size()) {
        return std::nullopt;
    }
    return std::string(key.substr(prefix.size()));
}

// The coroutines below take their collaborators by reference; the loaders
// only forward to them so no coroutine frame refers to a std::function.

auto read_credentials(SettingsStore& settings) -> awaitable<Result<providers::CredentialSet>> {
    SettingsMap merged;
    for (auto prefix : {setting_keys::kApiKeyPrefix, setting_keys::kBaseUrlPrefix,
                        setting_keys::kCodingPlanPrefix, setting_keys::kInternationalPrefix}) {
        auto values = co_await settings.get_with_prefix(prefix);
        if (!values) {
            co_return make_fail(values.error());
        }
        merged.merge(*values);
    }
    co_return credentials_from_settings(merged);
}

auto read_custom_providers(const CustomProviderFile& file)
    -> awaitable<Result<std::vector<providers::CustomProviderConfig>>> {
    co_return file.list_enabled();
}

auto read_base_models(SettingsStore& settings) -> awaitable<Result<models::ModelCatalog>> {
    auto stored = co_await settings.get(setting_keys::kModelsConfigJson);
    if (!stored) {
        co_return make_fail(stored.error());
    }
    if (!*stored || (*stored)->empty()) {
        co_return models::builtin_model_catalog().models;
    }
    auto parsed = models::parse_models_configuration(**stored);
    if (!parsed) {
        co_return make_fail(parsed.error());
    }
    LOG_DEBUG("Using stored models configuration ({} models)", parsed->models.size());
    co_return std::move(parsed->models);
}

auto read_custom_models(const CustomModelFile& file) -> awaitable<Result<models::ModelCatalog>> {
    auto config = file.load();
    if (!config) {
        co_return make_fail(config.error());
    }
    co_return std::move(config->models);
}

auto read_oauth(OAuthStore& oauth, std::vector<std::string> provider_ids)
    -> awaitable<Result<OAuthTokens>> {
    OAuthTokens tokens;
    for (const auto& id : provider_ids) {
        auto bundle = co_await oauth.current(id);
        if (!bundle) {
            co_return make_fail(bundle.error());
        }
        if (*bundle) {
            tokens.emplace(id, std::move(**bundle));
        }
    }
    co_return tokens;
}

auto refresh_token(OAuthStore& oauth, std::string provider_id)
    -> awaitable<Result<providers::OAuthBundle>> {
    co_return co_await oauth.refresh(provider_id);
}

auto write_setting(SettingsStore& settings, std::string key, std::string value)
    -> awaitable<Result<void>> {
    if (value.empty()) {
        co_return co_await settings.remove(key);
    }
    co_return co_await settings.set(key, value);
}

auto write_custom_provider(const CustomProviderFile& file, providers::CustomProviderConfig config)
    -> awaitable<Result<void>> {
    co_return file.add(config);
}

auto replace_custom_provider(const CustomProviderFile& file, std::string id,
                             providers::CustomProviderConfig config)
    -> awaitable<Result<void>> {
    co_return file.update(id, std::move(config));
}

auto erase_custom_provider(const CustomProviderFile& file, std::string id)
    -> awaitable<Result<void>> {
    co_return file.remove(id);
}

auto write_custom_model(const CustomModelFile& file, std::string key,
                        models::ModelDescriptor model) -> awaitable<Result<void>> {
    co_return file.add(key, model);
}

auto erase_custom_model(const CustomModelFile& file, std::string key)
    -> awaitable<Result<void>> {
    co_return file.remove(key);
}

} // anonymous namespace

auto credentials_from_settings(const SettingsMap& settings) -> providers::CredentialSet {
    providers::CredentialSet creds;
    for (const auto& [key, value] : settings) {
        if (auto id = strip_prefix(key, setting_keys::kApiKeyPrefix)) {
            if (!value.empty()) creds.secrets[*id] = value;
        } else if (auto id = strip_prefix(key, setting_keys::kBaseUrlPrefix)) {
            if (!value.empty()) creds.base_url_overrides[*id] = value;
        } else if (auto id = strip_prefix(key, setting_keys::kCodingPlanPrefix)) {
            creds.alt_billing[*id] = is_truthy(value);
        } else if (auto id = strip_prefix(key, setting_keys::kInternationalPrefix)) {
            creds.international[*id] = is_truthy(value);
        }
    }
    return creds;
}

auto make_store_loaders(SettingsStore& settings,
                        const CustomProviderFile& custom_providers,
                        const CustomModelFile& custom_models,
                        OAuthStore& oauth) -> StoreLoaders {
    StoreLoaders loaders;

    loaders.load_credentials = [&settings]() { return read_credentials(settings); };
    loaders.load_custom_providers = [&custom_providers]() {
        return read_custom_providers(custom_providers);
    };
    loaders.load_base_models = [&settings]() { return read_base_models(settings); };
    loaders.load_custom_models = [&custom_models]() { return read_custom_models(custom_models); };
    loaders.load_oauth = [&oauth](std::vector<std::string> ids) {
        return read_oauth(oauth, std::move(ids));
    };
    loaders.refresh_oauth = [&oauth](std::string id) { return refresh_token(oauth, std::move(id)); };

    loaders.save_setting = [&settings](std::string key, std::string value) {
        return write_setting(settings, std::move(key), std::move(value));
    };
    loaders.add_custom_provider = [&custom_providers](providers::CustomProviderConfig config) {
        return write_custom_provider(custom_providers, std::move(config));
    };
    loaders.update_custom_provider = [&custom_providers](std::string id,
                                                         providers::CustomProviderConfig config) {
        return replace_custom_provider(custom_providers, std::move(id), std::move(config));
    };
    loaders.remove_custom_provider = [&custom_providers](std::string id) {
        return erase_custom_provider(custom_providers, std::move(id));
    };
    loaders.add_custom_model = [&custom_models](std::string key, models::ModelDescriptor model) {
        return write_custom_model(custom_models, std::move(key), std::move(model));
    };
    loaders.remove_custom_model = [&custom_models](std::string key) {
        return erase_custom_model(custom_models, std::move(key));
    };

    return loaders;
}

} // namespace llmgate::store
