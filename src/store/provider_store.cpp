#include "llmgate/store/provider_store.hpp"

#include "llmgate/core/logger.hpp"
#include "llmgate/core/utils.hpp"
#include "llmgate/models/catalog.hpp"
#include "llmgate/providers/registry.hpp"
#include "llmgate/store/settings.hpp"

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace llmgate::store {

namespace {

auto missing_loader(std::string_view name) -> Error {
    return make_error(ErrorCode::InternalError, "Loader not configured", std::string(name));
}

auto join(const std::vector<std::string>& parts, std::string_view sep) -> std::string {
    std::string out;
    for (const auto& part : parts) {
        if (!out.empty()) out += sep;
        out += part;
    }
    return out;
}

/// Runs one loader. Any failure is logged and replaced by `fallback`.
template <typename T, typename Fn, typename... Args>
auto load_or(std::string_view what, const Fn& loader, T fallback, Args... args)
    -> awaitable<T> {
    if (!loader) {
        co_return fallback;
    }
    std::string failure;
    try {
        auto result = co_await loader(std::move(args)...);
        if (result) {
            co_return std::move(*result);
        }
        failure = result.error().what();
    } catch (const std::exception& e) {
        failure = e.what();
    }
    auto err = make_error(ErrorCode::LoadFailed, "Failed to load " + std::string(what), failure);
    LOG_WARN("[{}] {}", error_code_to_string(err.code()), err.what());
    co_return fallback;
}

} // anonymous namespace

auto Snapshot::inputs(Timestamp now) const -> models::AvailabilityInputs {
    return models::AvailabilityInputs{credentials, registry, custom_providers, catalog, now};
}

ProviderStore::ProviderStore(boost::asio::any_io_executor executor, StoreLoaders loaders,
                             std::chrono::seconds refresh_buffer)
    : executor_(std::move(executor))
    , loaders_(std::move(loaders))
    , refresh_buffer_(refresh_buffer)
    , snapshot_(std::make_shared<const Snapshot>()) {}

auto ProviderStore::initialize() -> awaitable<Result<void>> {
    if (snapshot_->initialized) {
        co_return ok_result();
    }
    co_return co_await load();
}

auto ProviderStore::refresh() -> awaitable<Result<void>> {
    co_return co_await load();
}

auto ProviderStore::load() -> awaitable<Result<void>> {
    if (loading_) {
        LOG_DEBUG("Load already in flight, waiting for it");
        auto outcome = load_outcome_;
        co_await wait_for_load();
        if (outcome && *outcome) {
            co_return make_fail(**outcome);
        }
        co_return ok_result();
    }

    // Set before the first suspension so concurrent callers coalesce.
    loading_ = true;
    auto done = std::make_shared<boost::asio::steady_timer>(
        executor_, boost::asio::steady_timer::time_point::max());
    load_done_ = done;
    auto outcome = std::make_shared<std::optional<Error>>();
    load_outcome_ = outcome;

    std::optional<Error> failure;
    try {
        auto snap = co_await load_all();
        derive(snap, Clock::now());
        snap.initialized = true;
        publish(std::move(snap));
        ++load_count_;
    } catch (const std::exception& e) {
        failure = make_error(ErrorCode::InternalError, "Provider store load failed", e.what());
    } catch (...) {
        failure = make_error(ErrorCode::InternalError, "Provider store load failed",
                             "unknown exception");
    }

    *outcome = failure;
    loading_ = false;
    load_done_.reset();
    done->cancel();

    if (failure) {
        LOG_ERROR("{}", failure->what());
        co_return make_fail(*failure);
    }
    co_return ok_result();
}

auto ProviderStore::wait_for_load() -> awaitable<void> {
    auto timer = load_done_;
    if (!loading_ || !timer) {
        co_return;
    }
    boost::system::error_code ec;
    co_await timer->async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
}

auto ProviderStore::load_all() -> awaitable<Snapshot> {
    Snapshot snap;

    snap.credentials = co_await load_or("credentials", loaders_.load_credentials,
                                        providers::CredentialSet{});
    snap.custom_providers = co_await load_or("custom providers", loaders_.load_custom_providers,
                                             std::vector<providers::CustomProviderConfig>{});
    snap.base_models = co_await load_or("models configuration", loaders_.load_base_models,
                                        models::builtin_model_catalog().models);
    snap.custom_models = co_await load_or("custom models", loaders_.load_custom_models,
                                          models::ModelCatalog{});

    std::vector<std::string> oauth_ids;
    for (const auto& [id, def] : providers::build_provider_registry(snap.custom_providers)) {
        if (def.supports_oauth) {
            oauth_ids.push_back(id);
        }
    }
    auto tokens = co_await load_or("OAuth tokens", loaders_.load_oauth, OAuthTokens{},
                                   std::move(oauth_ids));
    for (auto& [id, bundle] : tokens) {
        snap.credentials.oauth[id] = std::move(bundle);
    }

    co_await refresh_expiring_tokens(snap.credentials);

    LOG_INFO("Loaded {} secrets, {} custom providers, {} custom models, {} OAuth tokens",
             snap.credentials.secrets.size(), snap.custom_providers.size(),
             snap.custom_models.size(), snap.credentials.oauth.size());
    co_return snap;
}

auto ProviderStore::refresh_expiring_tokens(providers::CredentialSet& credentials)
    -> awaitable<void> {
    if (!loaders_.refresh_oauth) {
        co_return;
    }
    auto now = Clock::now();
    for (auto& [id, bundle] : credentials.oauth) {
        if (!bundle.refresh_token || !bundle.expires_within(now, refresh_buffer_)) {
            continue;
        }
        bundle = co_await load_or("refreshed OAuth token for " + id, loaders_.refresh_oauth,
                                  bundle, id);
    }
}

void ProviderStore::derive(Snapshot& snap, Timestamp now) const {
    snap.registry = providers::build_provider_registry(snap.custom_providers);
    snap.catalog = models::merge_model_catalog(snap.base_models, snap.custom_models);
    snap.providers = providers::create_providers(snap.credentials, snap.registry,
                                                 snap.custom_providers, now,
                                                 loaders_.refresh_oauth, refresh_buffer_);
    snap.available_models = models::compute_available_models(snap.inputs(now));
    snap.built_at = now;
}

void ProviderStore::publish(Snapshot snap) {
    LOG_DEBUG("Publishing snapshot: {} providers, {} available models",
              snap.providers.size(), snap.available_models.size());
    snapshot_ = std::make_shared<const Snapshot>(std::move(snap));
}

void ProviderStore::rebuild_providers() {
    auto next = *snapshot_;
    derive(next, Clock::now());
    publish(std::move(next));
}

// -- Readers --

auto ProviderStore::get_provider_model(std::string_view identifier) const
    -> Result<providers::ModelHandle> {
    auto snap = snapshot_;
    auto provider = models::get_best_provider(identifier, snap->inputs(Clock::now()));
    if (!provider) {
        return std::unexpected(make_error(ErrorCode::NoProviderAvailable,
                                          "No provider available for model",
                                          std::string(identifier)));
    }

    auto it = snap->providers.find(*provider);
    if (it == snap->providers.end()) {
        LOG_ERROR("Provider {} selected for {} but has no factory", *provider, identifier);
        return std::unexpected(make_error(ErrorCode::ProviderNotInitialized,
                                          "Provider not initialized", *provider));
    }

    auto parsed = models::parse_model_identifier(identifier);
    auto model_name = models::resolve_provider_model_name(snap->catalog, parsed.model_key,
                                                          *provider);
    return it->second(model_name);
}

auto ProviderStore::is_model_available(std::string_view identifier) const -> bool {
    auto snap = snapshot_;
    return models::is_model_available(identifier, snap->inputs(Clock::now()));
}

auto ProviderStore::get_best_provider_for_model(std::string_view identifier) const
    -> std::optional<std::string> {
    auto snap = snapshot_;
    return models::get_best_provider(identifier, snap->inputs(Clock::now()));
}

auto ProviderStore::get_available_model() const -> std::optional<models::AvailableModel> {
    return models::cheapest_available_model(available_models());
}

auto ProviderStore::available_models() const -> std::vector<models::AvailableModel> {
    // Pairings were computed at the last rebuild; drop those whose OAuth
    // token has expired since.
    auto snap = snapshot_;
    auto now = Clock::now();
    std::vector<models::AvailableModel> live;
    live.reserve(snap->available_models.size());
    for (const auto& m : snap->available_models) {
        if (providers::is_provider_usable(m.provider, snap->credentials,
                                          snap->custom_providers, now)) {
            live.push_back(m);
        }
    }
    return live;
}

// -- Mutators --

template <typename Update>
auto ProviderStore::apply_setting(std::string key, std::string value, Update update)
    -> awaitable<Result<void>> {
    if (!loaders_.save_setting) {
        co_return make_fail(missing_loader("save_setting"));
    }
    auto saved = co_await loaders_.save_setting(key, value);
    if (!saved) {
        LOG_ERROR("Failed to save {}: {}", key, saved.error().what());
        co_return make_fail(saved.error());
    }

    co_await wait_for_load();
    if (!snapshot_->initialized) {
        co_return co_await load();
    }

    auto next = *snapshot_;
    update(next.credentials);
    derive(next, Clock::now());
    publish(std::move(next));
    co_return ok_result();
}

auto ProviderStore::set_api_key(std::string provider_id, std::string key)
    -> awaitable<Result<void>> {
    LOG_INFO("Setting API key for {}", provider_id);
    auto value = utils::trim(key);
    co_return co_await apply_setting(
        setting_keys::api_key(provider_id), value,
        [provider_id, value](providers::CredentialSet& creds) {
            if (value.empty()) {
                creds.secrets.erase(provider_id);
            } else {
                creds.secrets[provider_id] = value;
            }
        });
}

auto ProviderStore::set_base_url(std::string provider_id, std::string url)
    -> awaitable<Result<void>> {
    auto value = utils::trim(url);
    if (!value.empty() && !utils::is_http_url(value)) {
        co_return make_fail(make_error(ErrorCode::InvalidArgument,
                                       "Base URL must be a valid http(s) URL", value));
    }
    LOG_INFO("Setting base URL for {} to {}", provider_id, value.empty() ? "default" : value);
    co_return co_await apply_setting(
        setting_keys::base_url(provider_id), value,
        [provider_id, value](providers::CredentialSet& creds) {
            if (value.empty()) {
                creds.base_url_overrides.erase(provider_id);
            } else {
                creds.base_url_overrides[provider_id] = value;
            }
        });
}

auto ProviderStore::set_use_coding_plan(std::string provider_id, bool enabled)
    -> awaitable<Result<void>> {
    co_return co_await apply_setting(
        setting_keys::use_coding_plan(provider_id), enabled ? "true" : "false",
        [provider_id, enabled](providers::CredentialSet& creds) {
            creds.alt_billing[provider_id] = enabled;
        });
}

auto ProviderStore::set_use_international(std::string provider_id, bool enabled)
    -> awaitable<Result<void>> {
    co_return co_await apply_setting(
        setting_keys::use_international(provider_id), enabled ? "true" : "false",
        [provider_id, enabled](providers::CredentialSet& creds) {
            creds.international[provider_id] = enabled;
        });
}

auto ProviderStore::reload_after(Result<void> persisted) -> awaitable<Result<void>> {
    co_await wait_for_load();
    auto loaded = co_await load();
    if (!persisted) {
        co_return make_fail(persisted.error());
    }
    co_return loaded;
}

auto ProviderStore::add_custom_provider(providers::CustomProviderConfig config)
    -> awaitable<Result<std::string>> {
    auto validation = providers::validate_custom_provider(config);
    if (!validation.valid()) {
        co_return make_fail(make_error(ErrorCode::InvalidArgument, "Invalid custom provider",
                                       join(validation.errors, "; ")));
    }
    for (const auto& warning : validation.warnings) {
        LOG_WARN("Custom provider {}: {}", config.name.value_or(config.id), warning);
    }
    if (!loaders_.add_custom_provider) {
        co_return make_fail(missing_loader("add_custom_provider"));
    }

    if (config.id.empty()) {
        config.id = providers::generate_custom_provider_id(*config.type, *config.name);
    }
    auto id = config.id;
    LOG_INFO("Adding custom provider {}", id);

    auto result = co_await reload_after(co_await loaders_.add_custom_provider(std::move(config)));
    if (!result) {
        co_return make_fail(result.error());
    }
    co_return id;
}

auto ProviderStore::update_custom_provider(std::string id, providers::CustomProviderConfig config)
    -> awaitable<Result<void>> {
    config.id = id;
    auto validation = providers::validate_custom_provider(config, true);
    if (!validation.valid()) {
        co_return make_fail(make_error(ErrorCode::InvalidArgument, "Invalid custom provider",
                                       join(validation.errors, "; ")));
    }
    if (!loaders_.update_custom_provider) {
        co_return make_fail(missing_loader("update_custom_provider"));
    }
    LOG_INFO("Updating custom provider {}", id);
    co_return co_await reload_after(
        co_await loaders_.update_custom_provider(id, std::move(config)));
}

auto ProviderStore::remove_custom_provider(std::string id) -> awaitable<Result<void>> {
    if (!loaders_.remove_custom_provider) {
        co_return make_fail(missing_loader("remove_custom_provider"));
    }
    LOG_INFO("Removing custom provider {}", id);
    co_return co_await reload_after(co_await loaders_.remove_custom_provider(id));
}

auto ProviderStore::add_custom_model(std::string key, models::ModelDescriptor model)
    -> awaitable<Result<void>> {
    if (utils::trim(key).empty()) {
        co_return make_fail(make_error(ErrorCode::InvalidArgument, "Model key is required"));
    }
    if (model.providers.empty()) {
        co_return make_fail(make_error(ErrorCode::InvalidArgument,
                                       "Model must list at least one provider", key));
    }
    if (!loaders_.add_custom_model) {
        co_return make_fail(missing_loader("add_custom_model"));
    }
    if (model.name.empty()) {
        model.name = key;
    }
    LOG_INFO("Adding custom model {}", key);
    co_return co_await reload_after(co_await loaders_.add_custom_model(key, std::move(model)));
}

auto ProviderStore::remove_custom_model(std::string key) -> awaitable<Result<void>> {
    if (!loaders_.remove_custom_model) {
        co_return make_fail(missing_loader("remove_custom_model"));
    }
    LOG_INFO("Removing custom model {}", key);
    co_return co_await reload_after(co_await loaders_.remove_custom_model(key));
}

} // namespace llmgate::store
