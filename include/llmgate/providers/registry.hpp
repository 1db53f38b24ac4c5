#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "llmgate/providers/definition.hpp"

namespace llmgate::providers {

/// The static table of providers shipped with llmgate.
auto builtin_providers() -> const ProviderRegistry&;

/// True for ids present in the built-in table.
auto is_builtin_provider(std::string_view id) -> bool;

/// Merges the built-in table with custom entries.
///
/// A custom id that collides with a built-in id overrides only the fields
/// it sets. A new custom id needs a type and a valid http(s) base URL;
/// entries that fail this are skipped with a warning. Disabled entries are
/// ignored. Pure: no I/O besides logging.
auto build_provider_registry(const std::vector<CustomProviderConfig>& custom)
    -> ProviderRegistry;

struct CustomProviderValidation {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    [[nodiscard]] auto valid() const noexcept -> bool { return errors.empty(); }
};

/// Checks a custom provider before it is persisted. `editing` skips the
/// built-in id conflict check, which only applies to new entries.
auto validate_custom_provider(const CustomProviderConfig& config, bool editing = false)
    -> CustomProviderValidation;

/// Derives a stable id from a provider type and display name, e.g.
/// ("openai-compatible", "My Server") -> "custom-openai-my-server".
auto generate_custom_provider_id(ProtocolType type, std::string_view name) -> std::string;

} // namespace llmgate::providers
