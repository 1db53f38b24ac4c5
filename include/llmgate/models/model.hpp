#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "llmgate/core/types.hpp"

namespace llmgate::models {

/// Per-token prices as quoted by the provider, kept as decimal strings.
struct ModelPricing {
    std::string input;
    std::string output;
    std::optional<std::string> cached_input;
    std::optional<std::string> cache_creation;
};

void to_json(json& j, const ModelPricing& p);
void from_json(const json& j, ModelPricing& p);

/// A logical model and the providers able to serve it.
///
/// `providers` is in authoring order and is a fixed priority list:
/// selection always picks the first usable entry.
struct ModelDescriptor {
    std::string name;
    bool image_input = false;
    bool image_output = false;
    bool audio_input = false;
    bool video_input = false;
    bool interleaved = false;
    std::vector<std::string> providers;
    /// Provider id -> provider-side model name.
    std::map<std::string, std::string> provider_mappings;
    std::optional<ModelPricing> pricing;
    std::optional<uint32_t> context_length;
};

void to_json(json& j, const ModelDescriptor& m);
void from_json(const json& j, ModelDescriptor& m);

/// Model key -> descriptor. Ordered so every scan is deterministic.
using ModelCatalog = std::map<std::string, ModelDescriptor, std::less<>>;

/// The models.json document.
struct ModelsConfiguration {
    std::string version;
    ModelCatalog models;
};

void to_json(json& j, const ModelsConfiguration& c);
void from_json(const json& j, ModelsConfiguration& c);

/// One (model, provider) pairing that can be used right now.
struct AvailableModel {
    std::string key;
    std::string name;
    std::string provider;
    std::string provider_name;
    bool image_input = false;
    bool image_output = false;
    bool audio_input = false;
    bool video_input = false;
    std::optional<std::string> input_pricing;

    auto operator==(const AvailableModel&) const -> bool = default;
};

void to_json(json& j, const AvailableModel& m);
void from_json(const json& j, AvailableModel& m);

} // namespace llmgate::models
