#pragma once

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include "llmgate/core/config.hpp"

// Version string; typically injected by CMake via -D, fallback to a default.
#ifndef LLMGATE_VERSION_STRING
#define LLMGATE_VERSION_STRING "0.1.0-dev"
#endif

namespace llmgate::cli {

/// Register the `models` subcommand.
/// Lists every (model, provider) pairing usable with the stored credentials.
void register_models_command(CLI::App& app, Config& config);

/// Register the `best` subcommand.
/// Prints the provider chosen for a model identifier.
void register_best_command(CLI::App& app, Config& config);

/// Register the `set-key` subcommand.
void register_set_key_command(CLI::App& app, Config& config);

/// Register the `set-base-url` subcommand.
void register_set_base_url_command(CLI::App& app, Config& config);

/// Register the `stream` subcommand.
/// Streams a prompt through the remote engine and prints the text as it arrives.
void register_stream_command(CLI::App& app, Config& config);

/// Register the `config` subcommand.
/// Prints the effective configuration with secrets redacted.
void register_config_command(CLI::App& app, Config& config);

/// Register the `version` subcommand.
void register_version_command(CLI::App& app);

/// Replaces the values of sensitive keys (tokens, keys, secrets) in place.
void redact_config_json(nlohmann::json& j);

} // namespace llmgate::cli
