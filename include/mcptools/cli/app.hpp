#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "mcptools/core/config.hpp"

namespace mcptools::cli {

/// Top-level CLI application.
///
/// Parses command-line arguments using CLI11, loads the configuration once
/// parsing completes, then runs the selected subcommand (serve, tools,
/// config, version).
class App {
public:
    App();
    ~App();

    // Non-copyable, non-movable.
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

    /// Config file, environment, then command-line overrides, in that order.
    void load_effective_config();

    CLI::App cli_;
    Config config_;
    std::string config_path_;
    std::string log_level_;
};

} // namespace mcptools::cli
