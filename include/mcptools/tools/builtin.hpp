#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "mcptools/core/config.hpp"
#include "mcptools/core/error.hpp"
#include "mcptools/tasks/manager.hpp"
#include "mcptools/tools/registry.hpp"
#include "mcptools/tools/tool.hpp"

namespace mcptools::tools {

// -- shell --

/// `bash`: runs a command through /bin/sh and returns its output.
auto make_bash_tool(const ShellToolConfig& config) -> ToolDescriptor;

// -- web --

/// `brave_search`: web search through the Brave Search API.
auto make_brave_search_tool(const SearchToolConfig& config) -> ToolDescriptor;

/// Formats a Brave `/res/v1/web/search` response body as readable text,
/// keeping at most `count` results.
auto format_search_results(const json& response, int count) -> std::string;

/// `scrape_url`: fetches a page through ScrapingBee and returns its text.
auto make_scrape_url_tool(const ScrapeToolConfig& config) -> ToolDescriptor;

// -- files --

/// `regex_replace`: single-match regex replacement inside a file.
auto make_regex_replace_tool() -> ToolDescriptor;

struct RegexReplaceOutcome {
    std::size_t matches = 0;
    bool replaced = false;
    std::string message;
};

/// Replaces `pattern` in the file only when it matches exactly once.
/// IoError when the file cannot be read or written, InvalidArgument for a
/// bad pattern.
auto regex_replace_in_file(const std::filesystem::path& path,
                           const std::string& pattern,
                           const std::string& replacement) -> Result<RegexReplaceOutcome>;

// -- background work (async) --

/// `run_background`: runs a shell command as a task, streaming output into
/// the task's progress.
auto make_run_background_tool(const TasksConfig& config) -> ToolDescriptor;

/// `aider`: runs the aider code-editing agent in a directory as a task.
auto make_aider_tool(const AiderToolConfig& config, const TasksConfig& task_config) -> ToolDescriptor;

/// Command line for one aider run.
auto aider_argv(const AiderToolConfig& config, std::string_view message,
                const std::vector<std::string>& options) -> std::vector<std::string>;

// -- task control --

/// `task_status`, `cancel_task`, `list_tasks`, `reap_task` for clients that
/// can only call tools.
auto make_task_tools(tasks::TaskManager& manager) -> std::vector<ToolDescriptor>;

/// Registers every tool the config enables. Search and scrape are skipped
/// (with a warning) when their API key is empty.
auto register_builtin_tools(ToolRegistry& registry, tasks::TaskManager& manager,
                            const Config& config) -> VoidResult;

} // namespace mcptools::tools
