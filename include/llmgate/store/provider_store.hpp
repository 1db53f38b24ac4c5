#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

#include "llmgate/core/error.hpp"
#include "llmgate/core/types.hpp"
#include "llmgate/models/availability.hpp"
#include "llmgate/models/model.hpp"
#include "llmgate/providers/credentials.hpp"
#include "llmgate/providers/definition.hpp"
#include "llmgate/providers/factory.hpp"
#include "llmgate/store/loaders.hpp"

namespace llmgate::store {

/// Everything derived from one load. Published as a whole and never
/// modified afterwards.
struct Snapshot {
    providers::CredentialSet credentials;
    std::vector<providers::CustomProviderConfig> custom_providers;
    providers::ProviderRegistry registry;
    models::ModelCatalog base_models;
    models::ModelCatalog custom_models;
    models::ModelCatalog catalog;
    providers::ProviderMap providers;
    std::vector<models::AvailableModel> available_models;
    Timestamp built_at{};
    bool initialized = false;

    [[nodiscard]] auto inputs(Timestamp now) const -> models::AvailabilityInputs;
};

/// Process-wide provider and model state. Construct once at the application
/// root and pass by reference.
///
/// Readers are synchronous and see one published Snapshot. Every load or
/// mutation builds a fresh Snapshot and swaps it in.
class ProviderStore {
public:
    ProviderStore(boost::asio::any_io_executor executor, StoreLoaders loaders,
                  std::chrono::seconds refresh_buffer = std::chrono::seconds{60});

    /// Loads everything once. Later calls return immediately; concurrent
    /// calls share the in-flight load. Loader failures degrade to empty or
    /// built-in data and never fail initialization.
    auto initialize() -> awaitable<Result<void>>;

    /// Reloads everything. Concurrent calls share the in-flight load and
    /// its outcome.
    auto refresh() -> awaitable<Result<void>>;

    /// Recomputes the provider map and availability from the current
    /// snapshot's inputs without touching persistence.
    void rebuild_providers();

    [[nodiscard]] auto initialized() const -> bool { return snapshot_->initialized; }
    [[nodiscard]] auto snapshot() const -> std::shared_ptr<const Snapshot> { return snapshot_; }

    /// Number of completed loads.
    [[nodiscard]] auto load_count() const -> std::size_t { return load_count_; }

    // -- Readers --

    /// Resolves "model" or "model@provider" into a handle. Fails with
    /// NoProviderAvailable when no usable provider serves the model and
    /// ProviderNotInitialized when the chosen provider has no factory.
    [[nodiscard]] auto get_provider_model(std::string_view identifier) const
        -> Result<providers::ModelHandle>;
    [[nodiscard]] auto is_model_available(std::string_view identifier) const -> bool;
    [[nodiscard]] auto get_best_provider_for_model(std::string_view identifier) const
        -> std::optional<std::string>;

    /// The available model with the lowest input price.
    [[nodiscard]] auto get_available_model() const -> std::optional<models::AvailableModel>;
    [[nodiscard]] auto available_models() const -> std::vector<models::AvailableModel>;

    // -- Mutators --

    /// An empty key removes the stored one.
    auto set_api_key(std::string provider_id, std::string key) -> awaitable<Result<void>>;
    /// An empty URL clears the override; anything else must be http(s).
    auto set_base_url(std::string provider_id, std::string url) -> awaitable<Result<void>>;
    auto set_use_coding_plan(std::string provider_id, bool enabled) -> awaitable<Result<void>>;
    auto set_use_international(std::string provider_id, bool enabled) -> awaitable<Result<void>>;

    /// Validates and stores a new custom provider, generating its id when
    /// empty. Returns the stored id.
    auto add_custom_provider(providers::CustomProviderConfig config)
        -> awaitable<Result<std::string>>;
    auto update_custom_provider(std::string id, providers::CustomProviderConfig config)
        -> awaitable<Result<void>>;
    auto remove_custom_provider(std::string id) -> awaitable<Result<void>>;

    auto add_custom_model(std::string key, models::ModelDescriptor model)
        -> awaitable<Result<void>>;
    auto remove_custom_model(std::string key) -> awaitable<Result<void>>;

private:
    /// Runs one load, or waits for the one already in flight.
    auto load() -> awaitable<Result<void>>;
    auto load_all() -> awaitable<Snapshot>;
    auto refresh_expiring_tokens(providers::CredentialSet& credentials) -> awaitable<void>;

    /// Derives registry, catalog, provider map and availability in place.
    void derive(Snapshot& snap, Timestamp now) const;
    void publish(Snapshot snap);

    /// Persists a setting then applies `update` to a copy of the credentials.
    template <typename Update>
    auto apply_setting(std::string key, std::string value, Update update)
        -> awaitable<Result<void>>;

    /// Finishes a document mutation: reloads and reports `persisted`.
    auto reload_after(Result<void> persisted) -> awaitable<Result<void>>;

    auto wait_for_load() -> awaitable<void>;

    boost::asio::any_io_executor executor_;
    StoreLoaders loaders_;
    std::chrono::seconds refresh_buffer_;
    std::shared_ptr<const Snapshot> snapshot_;
    bool loading_ = false;
    std::shared_ptr<boost::asio::steady_timer> load_done_;
    // Failure of the in-flight load, if any, for the callers that joined it.
    std::shared_ptr<std::optional<Error>> load_outcome_;
    std::size_t load_count_ = 0;
};

} // namespace llmgate::store
