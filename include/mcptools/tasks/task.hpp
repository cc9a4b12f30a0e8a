#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "mcptools/core/error.hpp"
#include "mcptools/core/types.hpp"

namespace mcptools::tasks {

enum class TaskStatus {
    Pending,
    Running,
    Completed,
    Failed,
    Cancelled,
};

NLOHMANN_JSON_SERIALIZE_ENUM(TaskStatus, {
    {TaskStatus::Pending, "pending"},
    {TaskStatus::Running, "running"},
    {TaskStatus::Completed, "completed"},
    {TaskStatus::Failed, "failed"},
    {TaskStatus::Cancelled, "cancelled"},
})

/// Completed, Failed and Cancelled are absorbing.
[[nodiscard]] constexpr auto is_terminal(TaskStatus status) noexcept -> bool {
    return status == TaskStatus::Completed ||
           status == TaskStatus::Failed ||
           status == TaskStatus::Cancelled;
}

auto status_to_string(TaskStatus status) -> std::string_view;

/// Parses "pending", "running", ... Fails with InvalidArgument otherwise.
auto parse_status(std::string_view name) -> Result<TaskStatus>;

/// Error payload of a Failed task.
struct TaskError {
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
};

/// Read-only copy of a task record at one instant.
struct TaskSnapshot {
    std::string id;
    std::string tool_name;
    TaskStatus status = TaskStatus::Pending;
    Timestamp created_at;
    Timestamp updated_at;
    std::optional<json> progress;
    std::optional<json> result;       // only when Completed
    std::optional<TaskError> error;   // only when Failed
    bool cancel_requested = false;

    [[nodiscard]] auto to_json() const -> json;
};

} // namespace mcptools::tasks
