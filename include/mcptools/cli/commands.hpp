#pragma once

#include <CLI/CLI.hpp>

#include "mcptools/core/config.hpp"
#include "mcptools/core/types.hpp"

namespace mcptools::cli {

/// Register the `serve` subcommand.
/// Serves the tool catalog over stdin/stdout until EOF or a signal.
void register_serve_command(CLI::App& app, Config& config);

/// Register the `tools` subcommand.
/// Prints the catalog the server would advertise, as JSON.
void register_tools_command(CLI::App& app, Config& config);

/// Register the `config` subcommand.
/// Shows or validates the effective configuration.
void register_config_command(CLI::App& app, Config& config);

/// Register the `version` subcommand.
void register_version_command(CLI::App& app);

/// Replaces non-empty secret values (api_key, token, ...) in place.
auto redact_config_json(json& j) -> void;

} // namespace mcptools::cli
