#include "mcptools/cli/app.hpp"
#include "mcptools/cli/commands.hpp"
#include "mcptools/core/logger.hpp"

#include <filesystem>

// Injected by CMake via -DMCPTOOLS_VERSION_STRING=...
#ifndef MCPTOOLS_VERSION_STRING
#define MCPTOOLS_VERSION_STRING "0.1.0-dev"
#endif

namespace mcptools::cli {

App::App()
    : cli_("mcptools", "MCP tool server over stdio")
{
    cli_.set_version_flag("--version", MCPTOOLS_VERSION_STRING,
                          "Display version information");

    cli_.add_option("-c,--config", config_path_,
                    "Path to configuration file (JSON)")
        ->envname("MCPTOOLS_CONFIG")
        ->check(CLI::ExistingFile);

    cli_.add_option("--log-level", log_level_,
                    "Log level (trace, debug, info, warn, error, critical)")
        ->envname("MCPTOOLS_LOG_LEVEL");

    cli_.require_subcommand(1);

    // Runs before the subcommand callbacks, so they see the loaded config.
    cli_.parse_complete_callback([this]() { load_effective_config(); });

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

void App::load_effective_config() {
    // Logging goes to stderr; stdout belongs to the protocol channel.
    Logger::init("mcptools", log_level_.empty() ? "info" : log_level_);

    if (!config_path_.empty()) {
        LOG_INFO("Loading configuration from: {}", config_path_);
        config_ = load_config(std::filesystem::path(config_path_));
    } else {
        config_ = default_config();
    }
    apply_env_overrides(config_);
    if (!log_level_.empty()) {
        config_.log_level = log_level_;
    }
    Logger::set_level(config_.log_level);
}

void App::setup_commands() {
    register_serve_command(cli_, config_);
    register_tools_command(cli_, config_);
    register_config_command(cli_, config_);
    register_version_command(cli_);
}

} // namespace mcptools::cli
