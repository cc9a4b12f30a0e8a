#include "mcptools/tasks/task.hpp"

#include "mcptools/core/utils.hpp"

namespace mcptools::tasks {

auto status_to_string(TaskStatus status) -> std::string_view {
    switch (status) {
        case TaskStatus::Pending: return "pending";
        case TaskStatus::Running: return "running";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Failed: return "failed";
        case TaskStatus::Cancelled: return "cancelled";
    }
    return "pending";
}

auto parse_status(std::string_view name) -> Result<TaskStatus> {
    for (auto s : {TaskStatus::Pending, TaskStatus::Running, TaskStatus::Completed,
                   TaskStatus::Failed, TaskStatus::Cancelled}) {
        if (status_to_string(s) == name) return s;
    }
    return std::unexpected(make_error(
        ErrorCode::InvalidArgument, "Unknown task status", std::string(name)));
}

auto TaskSnapshot::to_json() const -> json {
    json j = {
        {"taskId", id},
        {"tool", tool_name},
        {"status", status},
        {"createdAt", utils::timestamp_iso(created_at)},
        {"updatedAt", utils::timestamp_iso(updated_at)},
        {"cancelRequested", cancel_requested},
    };
    if (progress) j["progress"] = *progress;
    if (result) j["result"] = *result;
    if (error) {
        j["error"] = {
            {"code", std::string(error_code_to_string(error->code))},
            {"message", error->message},
        };
    }
    return j;
}

} // namespace mcptools::tasks
