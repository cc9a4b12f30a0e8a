#pragma once

#include <string>
#include <variant>

#include "mcptools/core/error.hpp"
#include "mcptools/core/types.hpp"
#include "mcptools/tasks/manager.hpp"
#include "mcptools/tools/registry.hpp"

namespace mcptools::dispatch {

/// One request to execute a tool.
struct Invocation {
    std::string tool_name;
    json arguments = json::object();
};

/// An async tool was handed to the task manager.
struct TaskAccepted {
    std::string task_id;
};

using DispatchOutcome = std::variant<tools::ToolOutput, TaskAccepted>;

/// Resolves, validates and routes invocations.
///
/// Errors:
///   UnknownTool              - no tool with that name
///   MissingField/TypeMismatch - arguments fail the tool's schema
///   HandlerFault             - a sync handler threw
/// An error a sync handler returns is passed through unchanged.
class Dispatcher {
public:
    Dispatcher(const tools::ToolRegistry& registry, tasks::TaskManager& tasks);

    auto dispatch(const Invocation& invocation) -> Result<DispatchOutcome>;

private:
    auto run_sync(const tools::ToolDescriptor& tool, const json& arguments)
        -> Result<DispatchOutcome>;

    const tools::ToolRegistry& registry_;
    tasks::TaskManager& tasks_;
};

} // namespace mcptools::dispatch
