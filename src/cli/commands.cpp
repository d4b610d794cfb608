#include "superagent/cli/commands.hpp"
#include "superagent/core/logger.hpp"
#include "superagent/core/utils.hpp"

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <nlohmann/json.hpp>

#include "superagent/agent/agent.hpp"
#include "superagent/agent/event_stream.hpp"
#include "superagent/providers/provider.hpp"

// Version string; typically injected by CMake via -D, fallback to a default.
#ifndef SUPERAGENT_VERSION_STRING
#define SUPERAGENT_VERSION_STRING "0.1.0-dev"
#endif

namespace superagent::cli {

using json = nlohmann::json;

namespace {

struct RunOptions {
    std::string prompt;
    int max_steps = 0;
};

auto is_sensitive_key(std::string_view key) -> bool {
    static constexpr std::string_view markers[] = {"key", "token", "secret", "password"};
    auto lowered = utils::to_lower(std::string(key));
    for (auto marker : markers) {
        if (lowered.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

} // anonymous namespace

void redact_config_json(json& j) {
    if (j.is_object()) {
        for (auto it = j.begin(); it != j.end(); ++it) {
            if (is_sensitive_key(it.key()) && it->is_string()
                && !it->get<std::string>().empty()) {
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

void CommandContext::prepare() {
    if (!config_path.empty()) {
        config = load_config(std::filesystem::path(config_path));
        apply_env_overrides(config);
    } else {
        config = load_config_from_env();
    }
    if (!log_level.empty()) {
        config.log_level = log_level;
    }
    Logger::init("superagent", config.log_level);
    if (!config_path.empty()) {
        LOG_INFO("Loaded configuration from: {}", config_path);
    }
}

// ---------------------------------------------------------------------------
// run command
// ---------------------------------------------------------------------------

void register_run_command(CLI::App& app, CommandContext& ctx) {
    auto* sub = app.add_subcommand("run", "Run the agent on a prompt and stream its events");

    auto opts = std::make_shared<RunOptions>();
    sub->add_option("prompt", opts->prompt, "The task for the agent")->required();
    sub->add_option("--max-steps", opts->max_steps, "Step budget (overrides config)")
        ->check(CLI::PositiveNumber);

    sub->callback([&ctx, opts]() {
        if (utils::trim(opts->prompt).empty()) {
            throw CLI::ValidationError("prompt", "must not be blank");
        }
        ctx.prepare();
        if (opts->max_steps > 0) {
            ctx.config.agent.max_steps = opts->max_steps;
        }

        auto valid = validate_config(ctx.config);
        if (!valid) {
            std::cerr << "Invalid configuration: " << valid.error().what() << "\n";
            throw CLI::RuntimeError(2);
        }

        boost::asio::io_context ioc;

        auto provider = providers::make_provider(ioc, ctx.config.provider);
        if (!provider) {
            std::cerr << "Cannot create provider: " << provider.error().what() << "\n";
            throw CLI::RuntimeError(2);
        }

        // Ctrl-C stops the run after the current event; cleanup still runs.
        auto interrupted = std::make_shared<std::atomic<bool>>(false);
        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([interrupted](auto ec, auto /*sig*/) {
            if (!ec) {
                LOG_INFO("Received shutdown signal");
                interrupted->store(true);
            }
        });

        int exit_code = 0;
        boost::asio::co_spawn(
            ioc,
            [&]() -> boost::asio::awaitable<void> {
                auto created = co_await agent::Agent::create(
                    ioc, ctx.config, std::move(*provider));
                if (!created) {
                    std::cout << "data: "
                              << agent::StreamEvent::error(created.error().what()).to_json().dump()
                              << "\n\n" << std::flush;
                    exit_code = 1;
                    signals.cancel();
                    co_return;
                }

                agent::EventStream stream(ioc.get_executor(), std::move(*created), opts->prompt);
                while (auto event = co_await stream.next()) {
                    std::cout << "data: " << event->to_json().dump() << "\n\n" << std::flush;
                    if (event->kind == agent::StreamEvent::Kind::Error) {
                        exit_code = 1;
                    }
                    if (interrupted->load()) {
                        co_await stream.close();
                        break;
                    }
                }
                signals.cancel();
            },
            [](std::exception_ptr e) {
                if (e) {
                    std::rethrow_exception(e);
                }
            });

        ioc.run();
        Logger::flush();

        if (exit_code != 0) {
            throw CLI::RuntimeError(exit_code);
        }
    });
}

// ---------------------------------------------------------------------------
// config command
// ---------------------------------------------------------------------------

void register_config_command(CLI::App& app, CommandContext& ctx) {
    auto* sub = app.add_subcommand("config", "Show or validate configuration");

    auto validate_only = std::make_shared<bool>(false);
    sub->add_flag("--validate", *validate_only,
                  "Validate configuration without printing");

    sub->callback([&ctx, validate_only]() {
        ctx.prepare();

        auto valid = validate_config(ctx.config);
        if (!valid) {
            std::cerr << "Invalid configuration: " << valid.error().what() << "\n";
            throw CLI::RuntimeError(2);
        }

        if (*validate_only) {
            std::cout << "Configuration is valid.\n";
            return;
        }

        // Pretty-print the configuration as JSON (with secrets redacted).
        json j = ctx.config;
        redact_config_json(j);
        std::cout << j.dump(2) << "\n";
    });
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

void register_version_command(CLI::App& app) {
    auto* sub = app.add_subcommand("version", "Print version information");

    sub->callback([]() {
        std::cout << "superagent " << SUPERAGENT_VERSION_STRING << "\n";
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

} // namespace superagent::cli
