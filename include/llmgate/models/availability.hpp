#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "llmgate/core/types.hpp"
#include "llmgate/models/model.hpp"
#include "llmgate/providers/credentials.hpp"
#include "llmgate/providers/definition.hpp"

namespace llmgate::models {

/// A model identifier split into its key and optional `@provider` suffix.
struct ModelIdentifier {
    std::string model_key;
    std::optional<std::string> provider;
};

/// Splits "model@provider" on the last '@'. An empty suffix or key leaves
/// the identifier unsplit.
auto parse_model_identifier(std::string_view identifier) -> ModelIdentifier;

/// Provider-side name of `model_key` on `provider_id`: the descriptor's
/// mapping when present, the key itself otherwise.
auto resolve_provider_model_name(const ModelCatalog& catalog, std::string_view model_key,
                                 std::string_view provider_id) -> std::string;

/// Everything a usability decision depends on.
struct AvailabilityInputs {
    const providers::CredentialSet& credentials;
    const providers::ProviderRegistry& registry;
    const std::vector<providers::CustomProviderConfig>& custom_providers;
    const ModelCatalog& catalog;
    Timestamp now;
};

/// Every (model, provider) pairing whose provider is registered and
/// usable. Models are visited in key order and providers in declared
/// order, so equal inputs always produce equal output.
auto compute_available_models(const AvailabilityInputs& in) -> std::vector<AvailableModel>;

/// The provider to use for `identifier`. An explicit, usable `@provider`
/// wins; otherwise the first usable provider in the model's declared list.
auto get_best_provider(std::string_view identifier, const AvailabilityInputs& in)
    -> std::optional<std::string>;

/// Equivalent to get_best_provider(identifier, in).has_value().
auto is_model_available(std::string_view identifier, const AvailabilityInputs& in) -> bool;

/// The entry with the lowest input price. Entries without pricing are
/// skipped and nullopt is returned when none is priced. Unparseable prices
/// count as zero; ties keep list order.
auto cheapest_available_model(const std::vector<AvailableModel>& models)
    -> std::optional<AvailableModel>;

} // namespace llmgate::models
