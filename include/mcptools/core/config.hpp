#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "mcptools/core/types.hpp"

namespace mcptools {

struct ServerConfig {
    std::string name = "mcptools";
    std::string version = "0.1.0";
    std::string protocol_version = "2024-11-05";
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ServerConfig, name, version, protocol_version)

struct TasksConfig {
    std::size_t worker_threads = 8;
    int shutdown_grace_ms = 5000;
    std::size_t max_output_bytes = 1024 * 1024;  // per stream, per task
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(TasksConfig, worker_threads, shutdown_grace_ms, max_output_bytes)

struct ShellToolConfig {
    bool enabled = true;
    int timeout_ms = 60000;
    std::string default_cwd;  // empty = server working directory
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ShellToolConfig, enabled, timeout_ms, default_cwd)

struct BackgroundToolConfig {
    bool enabled = true;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(BackgroundToolConfig, enabled)

struct SearchToolConfig {
    bool enabled = true;
    std::string api_key;
    std::string base_url = "https://api.search.brave.com";
    int timeout_seconds = 30;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(SearchToolConfig, enabled, api_key, base_url, timeout_seconds)

struct ScrapeToolConfig {
    bool enabled = true;
    std::string api_key;
    std::string base_url = "https://app.scrapingbee.com";
    int timeout_seconds = 30;
    bool render_js = true;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ScrapeToolConfig, enabled, api_key, base_url, timeout_seconds, render_js)

struct RegexReplaceToolConfig {
    bool enabled = true;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(RegexReplaceToolConfig, enabled)

struct AiderToolConfig {
    bool enabled = true;
    std::string binary = "aider";
    std::string api_key;
    std::string model;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(AiderToolConfig, enabled, binary, api_key, model)

struct TaskToolsConfig {
    bool enabled = true;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(TaskToolsConfig, enabled)

struct ToolsConfig {
    ShellToolConfig shell;
    BackgroundToolConfig background;
    SearchToolConfig search;
    ScrapeToolConfig scrape;
    RegexReplaceToolConfig regex_replace;
    AiderToolConfig aider;
    TaskToolsConfig task_tools;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ToolsConfig, shell, background, search, scrape, regex_replace, aider, task_tools)

struct Config {
    std::string log_level = "info";
    ServerConfig server;
    TasksConfig tasks;
    ToolsConfig tools;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, log_level, server, tasks, tools)

/// Reads a JSON config file. A missing or malformed file yields the
/// defaults (logged), never an error: the server must still come up.
auto load_config(const std::filesystem::path& path) -> Config;

/// Defaults overlaid with the process environment.
auto load_config_from_env() -> Config;

/// Overlays MCPTOOLS_* and provider key variables onto an existing config.
/// Values already set in the config win over the environment for API keys.
void apply_env_overrides(Config& config);

auto default_config() -> Config;

/// Resolves `${VAR}` environment variable references in a string.
/// Supports `$${VAR}` escape (literal `${VAR}`).
auto resolve_env_refs(std::string_view input) -> std::string;

} // namespace mcptools
