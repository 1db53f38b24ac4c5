#include "llmgate/models/availability.hpp"
#include "llmgate/core/logger.hpp"

#include <algorithm>
#include <charconv>
#include <set>

namespace llmgate::models {

namespace {

auto provider_usable(std::string_view provider_id, const AvailabilityInputs& in) -> bool {
    if (in.registry.find(provider_id) == in.registry.end()) {
        return false;
    }
    return providers::is_provider_usable(provider_id, in.credentials,
                                         in.custom_providers, in.now);
}

auto parse_price(const std::optional<std::string>& price) -> double {
    if (!price || price->empty()) return 0.0;
    double value = 0.0;
    const auto* first = price->data();
    const auto* last = price->data() + price->size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr == first) return 0.0;
    return value;
}

} // anonymous namespace

auto parse_model_identifier(std::string_view identifier) -> ModelIdentifier {
    auto at = identifier.rfind('@');
    if (at == std::string_view::npos || at == 0 || at + 1 == identifier.size()) {
        return {std::string(identifier), std::nullopt};
    }
    return {std::string(identifier.substr(0, at)), std::string(identifier.substr(at + 1))};
}

auto resolve_provider_model_name(const ModelCatalog& catalog, std::string_view model_key,
                                 std::string_view provider_id) -> std::string {
    auto it = catalog.find(model_key);
    if (it != catalog.end()) {
        auto mapped = it->second.provider_mappings.find(std::string(provider_id));
        if (mapped != it->second.provider_mappings.end() && !mapped->second.empty()) {
            return mapped->second;
        }
    }
    return std::string(model_key);
}

auto compute_available_models(const AvailabilityInputs& in) -> std::vector<AvailableModel> {
    std::vector<AvailableModel> result;

    for (const auto& [key, descriptor] : in.catalog) {
        std::set<std::string_view> seen;
        for (const auto& provider_id : descriptor.providers) {
            if (!seen.insert(provider_id).second) continue;
            if (!provider_usable(provider_id, in)) continue;

            const auto& def = in.registry.find(provider_id)->second;
            AvailableModel entry;
            entry.key = key;
            entry.name = descriptor.name.empty() ? key : descriptor.name;
            entry.provider = provider_id;
            entry.provider_name = def.name;
            entry.image_input = descriptor.image_input;
            entry.image_output = descriptor.image_output;
            entry.audio_input = descriptor.audio_input;
            entry.video_input = descriptor.video_input;
            if (descriptor.pricing) entry.input_pricing = descriptor.pricing->input;
            result.push_back(std::move(entry));
        }
    }

    LOG_DEBUG("Computed {} available model pairings from {} models",
              result.size(), in.catalog.size());
    return result;
}

auto get_best_provider(std::string_view identifier, const AvailabilityInputs& in)
    -> std::optional<std::string> {
    auto parsed = parse_model_identifier(identifier);

    if (parsed.provider && provider_usable(*parsed.provider, in)) {
        return parsed.provider;
    }

    auto it = in.catalog.find(parsed.model_key);
    if (it == in.catalog.end()) {
        return std::nullopt;
    }

    for (const auto& provider_id : it->second.providers) {
        if (provider_usable(provider_id, in)) {
            return provider_id;
        }
    }
    return std::nullopt;
}

auto is_model_available(std::string_view identifier, const AvailabilityInputs& in) -> bool {
    return get_best_provider(identifier, in).has_value();
}

auto cheapest_available_model(const std::vector<AvailableModel>& models)
    -> std::optional<AvailableModel> {
    const AvailableModel* best = nullptr;
    double best_price = 0.0;
    for (const auto& m : models) {
        // Unpriced pairings take no part in the comparison.
        if (!m.input_pricing) continue;
        auto price = parse_price(m.input_pricing);
        if (!best || price < best_price) {
            best = &m;
            best_price = price;
        }
    }
    if (!best) return std::nullopt;
    return *best;
}

} // namespace llmgate::models
