#include "mcptools/dispatch/dispatcher.hpp"

#include "mcptools/core/logger.hpp"
#include "mcptools/schema/validator.hpp"

#include <type_traits>

namespace mcptools::dispatch {

Dispatcher::Dispatcher(const tools::ToolRegistry& registry, tasks::TaskManager& tasks)
    : registry_(registry), tasks_(tasks) {}

auto Dispatcher::dispatch(const Invocation& invocation) -> Result<DispatchOutcome> {
    const auto* tool = registry_.get(invocation.tool_name);
    if (!tool) {
        LOG_WARN("Unknown tool requested: {}", invocation.tool_name);
        return std::unexpected(make_error(
            ErrorCode::UnknownTool, "Unknown tool", invocation.tool_name));
    }

    if (auto valid = schema::validate(tool->parameters, invocation.arguments); !valid) {
        LOG_DEBUG("Arguments for '{}' rejected: {}", tool->name, valid.error().what());
        return std::unexpected(valid.error());
    }

    const json arguments = invocation.arguments.is_null() ? json::object()
                                                          : invocation.arguments;

    return std::visit([&](const auto& handler) -> Result<DispatchOutcome> {
        using H = std::decay_t<decltype(handler)>;
        if constexpr (std::is_same_v<H, tools::SyncHandler>) {
            return run_sync(*tool, arguments);
        } else {
            auto task_id = tasks_.spawn(tool->name, handler, arguments);
            if (!task_id) {
                return std::unexpected(task_id.error());
            }
            return DispatchOutcome{TaskAccepted{.task_id = std::move(*task_id)}};
        }
    }, tool->handler);
}

auto Dispatcher::run_sync(const tools::ToolDescriptor& tool, const json& arguments)
    -> Result<DispatchOutcome>
{
    const auto& handler = std::get<tools::SyncHandler>(tool.handler);
    LOG_DEBUG("Executing tool '{}'", tool.name);

    try {
        auto output = handler.fn(arguments);
        if (!output) {
            LOG_WARN("Tool '{}' failed: {}", tool.name, output.error().what());
            return std::unexpected(std::move(output.error()));
        }
        return DispatchOutcome{std::move(*output)};
    } catch (const std::exception& e) {
        LOG_ERROR("Tool '{}' threw exception: {}", tool.name, e.what());
        return std::unexpected(make_error(
            ErrorCode::HandlerFault,
            "Tool '" + tool.name + "' raised an exception: " + e.what()));
    } catch (...) {
        LOG_ERROR("Tool '{}' threw a non-standard exception", tool.name);
        return std::unexpected(make_error(
            ErrorCode::HandlerFault,
            "Tool '" + tool.name + "' raised a non-standard exception"));
    }
}

} // namespace mcptools::dispatch
