#include "llmgate/cli/app.hpp"
#include "llmgate/cli/commands.hpp"
#include "llmgate/core/logger.hpp"

#include <filesystem>

namespace llmgate::cli {

App::App()
    : cli_("llmgate", "Provider registry and streaming client for LLM engines")
    , config_(load_config_from_env())
{
    cli_.set_version_flag("--version", LLMGATE_VERSION_STRING, "Display version information");

    // Option callbacks run in declaration order and before any subcommand,
    // so --log-level overrides the level from --config.
    cli_.add_option_function<std::string>(
            "-c,--config",
            [this](const std::string& path) {
                config_path_ = path;
                config_ = load_config(std::filesystem::path(path));
            },
            "Path to configuration file (JSON)")
        ->envname("LLMGATE_CONFIG")
        ->check(CLI::ExistingFile);

    cli_.add_option("--log-level", config_.log_level,
                    "Log level (trace, debug, info, warn, error, critical)");

    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli_.exit(e);
    }
    Logger::flush();
    return 0;
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::config() -> Config& {
    return config_;
}

auto App::config() const -> const Config& {
    return config_;
}

void App::setup_commands() {
    register_models_command(cli_, config_);
    register_best_command(cli_, config_);
    register_set_key_command(cli_, config_);
    register_set_base_url_command(cli_, config_);
    register_stream_command(cli_, config_);
    register_config_command(cli_, config_);
    register_version_command(cli_);
}

} // namespace llmgate::cli
