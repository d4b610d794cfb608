#pragma once

#include <string>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include "superagent/core/config.hpp"

namespace superagent::cli {

/// State shared by the global options and every subcommand.
struct CommandContext {
    Config config;
    std::string config_path;
    std::string log_level;

    /// Load the config file (if any), apply environment and command-line
    /// overrides and start logging. Each command calls this before running,
    /// once CLI11 has parsed the global options.
    void prepare();
};

/// Mask every non-empty string whose key looks like a credential
/// (api_key, token, secret, password, env entries such as GITHUB_TOKEN).
void redact_config_json(nlohmann::json& j);

/// Register the `run` subcommand.
/// Runs the agent on a prompt and prints each event as a `data:` line.
void register_run_command(CLI::App& app, CommandContext& ctx);

/// Register the `config` subcommand.
/// Shows or validates the effective configuration.
void register_config_command(CLI::App& app, CommandContext& ctx);

/// Register the `version` subcommand.
/// Prints the build version and exits.
void register_version_command(CLI::App& app);

} // namespace superagent::cli
