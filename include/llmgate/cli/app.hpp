#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "llmgate/core/config.hpp"

namespace llmgate::cli {

/// Top-level CLI application.
///
/// Parses command-line arguments using CLI11 and dispatches to the
/// registered subcommands. Global options are applied before any
/// subcommand runs.
class App {
public:
    App();
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and execute the selected subcommand.
    /// @returns Process exit code (0 on success).
    auto run(int argc, char** argv) -> int;

    [[nodiscard]] auto cli() -> CLI::App&;
    [[nodiscard]] auto config() -> Config&;
    [[nodiscard]] auto config() const -> const Config&;

private:
    void setup_commands();

    CLI::App cli_;
    Config config_;
    std::string config_path_;
};

} // namespace llmgate::cli
