#pragma once

#include <string_view>

#include "llmgate/core/error.hpp"
#include "llmgate/models/model.hpp"

namespace llmgate::models {

/// The catalog shipped with llmgate.
auto builtin_model_catalog() -> const ModelsConfiguration&;

/// Parses a models.json document. Individual malformed models are skipped;
/// a document that is not a JSON object fails with SerializationError.
auto parse_models_configuration(std::string_view text) -> Result<ModelsConfiguration>;

/// Base catalog overlaid with custom models; a custom entry replaces a base
/// entry with the same key.
auto merge_model_catalog(const ModelCatalog& base, const ModelCatalog& custom) -> ModelCatalog;

} // namespace llmgate::models
