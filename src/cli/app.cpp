#include "superagent/cli/app.hpp"
#include "superagent/core/logger.hpp"

#include <exception>

// Version string; typically injected by CMake via -DSUPERAGENT_VERSION_STRING=...
#ifndef SUPERAGENT_VERSION_STRING
#define SUPERAGENT_VERSION_STRING "0.1.0-dev"
#endif

namespace superagent::cli {

App::App()
    : cli_("superagent", "SuperAgent tool-using agent runner")
{
    cli_.set_version_flag("--version", SUPERAGENT_VERSION_STRING,
                          "Display version information");

    // Global option: config file path.
    cli_.add_option("-c,--config", ctx_.config_path,
                    "Path to configuration file (JSON)")
        ->envname("SUPERAGENT_CONFIG")
        ->check(CLI::ExistingFile);

    // Global option: log level override.
    cli_.add_option("--log-level", ctx_.log_level,
                    "Log level (trace, debug, info, warn, error, critical, off)");

    // Require a subcommand.
    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli_.exit(e);
    } catch (const std::exception& e) {
        LOG_FATAL("Fatal: {}", e.what());
        Logger::flush();
        return 1;
    }
    Logger::flush();
    return 0;
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::config() -> Config& {
    return ctx_.config;
}

auto App::config() const -> const Config& {
    return ctx_.config;
}

void App::setup_commands() {
    register_run_command(cli_, ctx_);
    register_config_command(cli_, ctx_);
    register_version_command(cli_);
}

} // namespace superagent::cli
