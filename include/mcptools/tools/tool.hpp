#pragma once

#include <functional>
#include <string>
#include <variant>

#include "mcptools/core/error.hpp"
#include "mcptools/core/types.hpp"
#include "mcptools/schema/validator.hpp"

namespace mcptools::tasks {
class TaskContext;
} // namespace mcptools::tasks

namespace mcptools::tools {

/// What a synchronous tool hands back. `is_error` marks a result the tool
/// itself considers a failure (a non-zero exit status, say) but which is
/// still a well-formed answer rather than a fault.
struct ToolOutput {
    json content;
    bool is_error = false;
};

/// Runs on the calling thread; the caller blocks until it returns.
struct SyncHandler {
    std::function<Result<ToolOutput>(const json& arguments)> fn;
};

/// Runs as a task on the worker pool. The returned value becomes the task
/// result; an error with ErrorCode::Cancelled ends the task as Cancelled.
struct AsyncHandler {
    std::function<Result<json>(const json& arguments, tasks::TaskContext& ctx)> fn;
};

using ToolHandler = std::variant<SyncHandler, AsyncHandler>;

/// Full definition of a tool, registered once at startup.
struct ToolDescriptor {
    std::string name;
    std::string description;
    schema::ParameterSchema parameters;
    ToolHandler handler;

    [[nodiscard]] auto is_async() const noexcept -> bool {
        return std::holds_alternative<AsyncHandler>(handler);
    }

    /// MCP discovery form: {"name", "description", "inputSchema"}.
    [[nodiscard]] auto to_json() const -> json;
};

} // namespace mcptools::tools
