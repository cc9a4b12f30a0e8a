#include "mcptools/tools/builtin.hpp"

#include "mcptools/core/logger.hpp"

namespace mcptools::tools {

auto register_builtin_tools(ToolRegistry& registry, tasks::TaskManager& manager,
                            const Config& config) -> VoidResult {
    const auto& tools = config.tools;
    std::vector<ToolDescriptor> enabled;

    if (tools.shell.enabled) {
        enabled.push_back(make_bash_tool(tools.shell));
    }

    if (tools.search.enabled) {
        if (tools.search.api_key.empty()) {
            LOG_WARN("brave_search disabled: no API key (set BRAVE_API_KEY)");
        } else {
            enabled.push_back(make_brave_search_tool(tools.search));
        }
    }

    if (tools.scrape.enabled) {
        if (tools.scrape.api_key.empty()) {
            LOG_WARN("scrape_url disabled: no API key (set SCRAPINGBEE_API_KEY)");
        } else {
            enabled.push_back(make_scrape_url_tool(tools.scrape));
        }
    }

    if (tools.regex_replace.enabled) {
        enabled.push_back(make_regex_replace_tool());
    }

    if (tools.background.enabled) {
        enabled.push_back(make_run_background_tool(config.tasks));
    }

    if (tools.aider.enabled) {
        enabled.push_back(make_aider_tool(tools.aider, config.tasks));
    }

    if (tools.task_tools.enabled) {
        for (auto& tool : make_task_tools(manager)) {
            enabled.push_back(std::move(tool));
        }
    }

    for (auto& tool : enabled) {
        if (auto registered = registry.register_tool(std::move(tool)); !registered) {
            return registered;
        }
    }

    LOG_INFO("{} tools registered", registry.size());
    return {};
}

} // namespace mcptools::tools
