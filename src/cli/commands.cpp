#include "llmgate/cli/commands.hpp"
#include "llmgate/core/logger.hpp"

#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "llmgate/ipc/ws_bus.hpp"
#include "llmgate/store/custom_files.hpp"
#include "llmgate/store/loaders.hpp"
#include "llmgate/store/oauth.hpp"
#include "llmgate/store/provider_store.hpp"
#include "llmgate/store/settings.hpp"
#include "llmgate/streaming/client.hpp"

namespace llmgate::cli {

using json = nlohmann::json;
namespace net = boost::asio;

namespace {

auto prepare_settings_db(const Config& config) -> std::string {
    auto path = resolve_settings_db(config);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    return path.string();
}

/// Persistence, bus and provider store wired together for one command.
struct StoreContext {
    StoreContext(const Config& config, net::io_context& ioc)
        : settings(prepare_settings_db(config))
        , providers_file(resolve_custom_providers_path(config))
        , models_file(resolve_custom_models_path(config))
        , bus(ioc)
        , client(bus)
        , oauth(settings, client)
        , store(ioc.get_executor(),
                store::make_store_loaders(settings, providers_file, models_file, oauth),
                std::chrono::seconds{config.oauth_refresh_buffer_seconds}) {}

    store::SqliteSettingsStore settings;
    store::CustomProviderFile providers_file;
    store::CustomModelFile models_file;
    ipc::WsBus bus;
    streaming::LlmClient client;
    store::SettingsOAuthStore oauth;
    store::ProviderStore store;
};

/// Runs `body` on a fresh io_context and returns its exit code.
template <typename Body>
auto run_command(const Config& config, Body body) -> int {
    Logger::init("llmgate", config.log_level);

    net::io_context ioc;
    int exit_code = 1;
    net::co_spawn(ioc, body(ioc),
        [&exit_code](std::exception_ptr ep, int code) {
            if (!ep) {
                exit_code = code;
                return;
            }
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                LOG_ERROR("Command failed: {}", e.what());
                std::cerr << "error: " << e.what() << "\n";
            }
        });
    ioc.run();
    Logger::flush();
    return exit_code;
}

/// Finishes a CLI11 callback with a non-zero exit code.
void exit_with(int code) {
    if (code != 0) {
        throw CLI::RuntimeError(code);
    }
}

auto format_price(const std::optional<std::string>& price) -> std::string {
    return price ? "$" + *price : "-";
}

} // anonymous namespace

void redact_config_json(json& j) {
    static const std::vector<std::string> sensitive_keys = {
        "api_key", "auth_token", "access_token", "refresh_token", "token", "secret",
    };

    if (j.is_object()) {
        for (auto it = j.begin(); it != j.end(); ++it) {
            bool is_sensitive = false;
            for (const auto& key : sensitive_keys) {
                if (it.key() == key) {
                    is_sensitive = true;
                    break;
                }
            }
            if (is_sensitive && it->is_string() && !it->get<std::string>().empty()) {
                *it = "***REDACTED***";
            } else {
                redact_config_json(*it);
            }
        }
    } else if (j.is_array()) {
        for (auto& elem : j) {
            redact_config_json(elem);
        }
    }
}

// ---------------------------------------------------------------------------
// models command
// ---------------------------------------------------------------------------

void register_models_command(CLI::App& app, Config& config) {
    auto* sub = app.add_subcommand("models", "List available models");

    auto as_json = std::make_shared<bool>(false);
    sub->add_flag("--json", *as_json, "Print the list as JSON");

    sub->callback([&config, as_json]() {
        exit_with(run_command(config, [&config, as_json](net::io_context& ioc)
                                          -> net::awaitable<int> {
            StoreContext ctx(config, ioc);
            auto init = co_await ctx.store.initialize();
            if (!init) {
                std::cerr << "error: " << init.error().what() << "\n";
                co_return 1;
            }

            auto models = ctx.store.available_models();
            if (*as_json) {
                std::cout << json(models).dump(2) << "\n";
                co_return 0;
            }
            if (models.empty()) {
                std::cout << "No models available. Configure a provider with set-key.\n";
                co_return 0;
            }
            for (const auto& m : models) {
                std::cout << std::left << std::setw(24) << m.key
                          << std::setw(18) << m.provider
                          << format_price(m.input_pricing) << "\n";
            }
            co_return 0;
        }));
    });
}

// ---------------------------------------------------------------------------
// best command
// ---------------------------------------------------------------------------

void register_best_command(CLI::App& app, Config& config) {
    auto* sub = app.add_subcommand("best", "Show the provider chosen for a model");

    auto model = std::make_shared<std::string>();
    sub->add_option("model", *model, "Model identifier (model or model@provider)")->required();

    auto describe = std::make_shared<bool>(false);
    sub->add_flag("--describe", *describe, "Print the resolved model handle");

    sub->callback([&config, model, describe]() {
        exit_with(run_command(config, [&config, model, describe](net::io_context& ioc)
                                          -> net::awaitable<int> {
            StoreContext ctx(config, ioc);
            auto init = co_await ctx.store.initialize();
            if (!init) {
                std::cerr << "error: " << init.error().what() << "\n";
                co_return 1;
            }

            auto handle = ctx.store.get_provider_model(*model);
            if (!handle) {
                std::cerr << handle.error().what() << "\n";
                co_return 1;
            }
            if (*describe) {
                std::cout << handle->describe().dump(2) << "\n";
            } else {
                std::cout << handle->provider_id << "\n";
            }
            co_return 0;
        }));
    });
}

// ---------------------------------------------------------------------------
// set-key / set-base-url commands
// ---------------------------------------------------------------------------

void register_set_key_command(CLI::App& app, Config& config) {
    auto* sub = app.add_subcommand("set-key", "Store an API key for a provider");

    auto provider = std::make_shared<std::string>();
    auto key = std::make_shared<std::string>();
    sub->add_option("provider", *provider, "Provider id")->required();
    sub->add_option("key", *key, "API key; empty removes the stored key")->required();

    sub->callback([&config, provider, key]() {
        exit_with(run_command(config, [&config, provider, key](net::io_context& ioc)
                                          -> net::awaitable<int> {
            StoreContext ctx(config, ioc);
            auto init = co_await ctx.store.initialize();
            if (!init) {
                std::cerr << "error: " << init.error().what() << "\n";
                co_return 1;
            }
            auto result = co_await ctx.store.set_api_key(*provider, *key);
            if (!result) {
                std::cerr << "error: " << result.error().what() << "\n";
                co_return 1;
            }
            std::cout << "API key for " << *provider << " saved.\n";
            co_return 0;
        }));
    });
}

void register_set_base_url_command(CLI::App& app, Config& config) {
    auto* sub = app.add_subcommand("set-base-url", "Override a provider's base URL");

    auto provider = std::make_shared<std::string>();
    auto url = std::make_shared<std::string>();
    sub->add_option("provider", *provider, "Provider id")->required();
    sub->add_option("url", *url, "Base URL; empty restores the default")->required();

    sub->callback([&config, provider, url]() {
        exit_with(run_command(config, [&config, provider, url](net::io_context& ioc)
                                          -> net::awaitable<int> {
            StoreContext ctx(config, ioc);
            auto init = co_await ctx.store.initialize();
            if (!init) {
                std::cerr << "error: " << init.error().what() << "\n";
                co_return 1;
            }
            auto result = co_await ctx.store.set_base_url(*provider, *url);
            if (!result) {
                std::cerr << "error: " << result.error().what() << "\n";
                co_return 1;
            }
            std::cout << "Base URL for " << *provider << " saved.\n";
            co_return 0;
        }));
    });
}

// ---------------------------------------------------------------------------
// stream command
// ---------------------------------------------------------------------------

void register_stream_command(CLI::App& app, Config& config) {
    auto* sub = app.add_subcommand("stream", "Stream a completion from the remote engine");

    struct Options {
        std::string model;
        std::string prompt;
        std::string system;
        double temperature = 0.0;
        bool has_temperature = false;
    };
    auto opts = std::make_shared<Options>();
    sub->add_option("model", opts->model, "Model identifier (model or model@provider)")
        ->required();
    sub->add_option("prompt", opts->prompt, "Prompt text")->required();
    sub->add_option("-s,--system", opts->system, "System prompt");
    sub->add_option("-t,--temperature", opts->temperature, "Sampling temperature")
        ->each([opts](const std::string&) { opts->has_temperature = true; });

    sub->callback([&config, opts]() {
        exit_with(run_command(config, [&config, opts](net::io_context& ioc)
                                          -> net::awaitable<int> {
            ipc::WsBus bus(ioc);
            if (config.bridge.auth_token) {
                bus.set_auth_token(*config.bridge.auth_token);
            }
            auto connected = co_await bus.connect(config.bridge.host,
                                                  std::to_string(config.bridge.port),
                                                  config.bridge.path);
            if (!connected) {
                std::cerr << "error: " << connected.error().what() << "\n";
                co_return 1;
            }

            streaming::CancellationSignal signal;
            net::signal_set signals(ioc, SIGINT, SIGTERM);
            signals.async_wait([signal](const boost::system::error_code& ec, int) mutable {
                if (!ec) {
                    LOG_INFO("Interrupted, cancelling stream");
                    signal.fire();
                }
            });

            auto request = streaming::build_prompt_request(
                opts->model, opts->prompt,
                opts->system.empty() ? std::nullopt : std::optional<std::string>(opts->system));
            if (opts->has_temperature) {
                request.temperature = opts->temperature;
            }

            streaming::LlmClient client(bus);
            auto stream = co_await client.stream_text(std::move(request), signal);
            if (!stream) {
                signals.cancel();
                co_await bus.disconnect();
                std::cerr << "error: " << stream.error().what() << "\n";
                co_return 1;
            }

            int code = 0;
            while (auto event = co_await stream->next()) {
                if (const auto* delta = std::get_if<streaming::TextDelta>(&*event)) {
                    std::cout << delta->text << std::flush;
                } else if (const auto* err = std::get_if<streaming::ErrorEvent>(&*event)) {
                    std::cerr << "\nerror: " << err->message << "\n";
                    code = 1;
                }
            }
            std::cout << "\n";
            if (stream->cancelled()) {
                std::cerr << "cancelled\n";
                code = 130;
            }

            signals.cancel();
            co_await bus.disconnect();
            co_return code;
        }));
    });
}

// ---------------------------------------------------------------------------
// config command
// ---------------------------------------------------------------------------

void register_config_command(CLI::App& app, Config& config) {
    auto* sub = app.add_subcommand("config", "Show the effective configuration");

    auto show_paths = std::make_shared<bool>(false);
    sub->add_flag("--paths", *show_paths, "Also print the resolved data file paths");

    sub->callback([&config, show_paths]() {
        json j = config;
        redact_config_json(j);
        if (*show_paths) {
            j["resolved_paths"] = {
                {"settings_db", resolve_settings_db(config).string()},
                {"custom_providers", resolve_custom_providers_path(config).string()},
                {"custom_models", resolve_custom_models_path(config).string()},
            };
        }
        std::cout << j.dump(2) << "\n";
    });
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

void register_version_command(CLI::App& app) {
    auto* sub = app.add_subcommand("version", "Print version information");

    sub->callback([]() {
        std::cout << "llmgate " << LLMGATE_VERSION_STRING << "\n";
        std::cout << "C++ standard: " << __cplusplus << "\n";
#if defined(__clang__)
        std::cout << "Compiler: clang " << __clang_major__ << "."
                  << __clang_minor__ << "." << __clang_patchlevel__ << "\n";
#elif defined(__GNUC__)
        std::cout << "Compiler: gcc " << __GNUC__ << "."
                  << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__ << "\n";
#else
        std::cout << "Compiler: unknown\n";
#endif
    });
}

} // namespace llmgate::cli
