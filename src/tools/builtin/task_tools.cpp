#include "mcptools/tools/builtin.hpp"

#include "mcptools/core/utils.hpp"

namespace mcptools::tools {

namespace {

auto task_id_field() -> schema::FieldSpec {
    return {.name = "task_id", .kind = schema::FieldKind::String,
            .description = "Id returned when the task was started"};
}

auto not_found(const std::string& task_id) -> Error {
    return make_error(ErrorCode::TaskNotFound, "Task not found", task_id);
}

} // anonymous namespace

auto make_task_tools(tasks::TaskManager& manager) -> std::vector<ToolDescriptor> {
    std::vector<ToolDescriptor> tools;

    tools.push_back(ToolDescriptor{
        .name = "task_status",
        .description = "Get the status, progress and result of a background task.",
        .parameters = {.fields = {task_id_field()}},
        .handler = SyncHandler{
            [&manager](const json& args) -> Result<ToolOutput> {
                auto task_id = args.at("task_id").get<std::string>();
                auto snapshot = manager.status(task_id);
                if (!snapshot) {
                    return std::unexpected(not_found(task_id));
                }
                return ToolOutput{
                    .content = snapshot->to_json(),
                    .is_error = snapshot->status == tasks::TaskStatus::Failed,
                };
            }},
    });

    tools.push_back(ToolDescriptor{
        .name = "cancel_task",
        .description =
            "Ask a background task to stop. Cancellation is cooperative; the "
            "task ends as cancelled once it notices the request.",
        .parameters = {.fields = {task_id_field()}},
        .handler = SyncHandler{
            [&manager](const json& args) -> Result<ToolOutput> {
                auto task_id = args.at("task_id").get<std::string>();
                if (auto cancelled = manager.cancel(task_id); !cancelled) {
                    return std::unexpected(cancelled.error());
                }
                auto snapshot = manager.status(task_id);
                return ToolOutput{.content = json{
                    {"taskId", task_id},
                    {"cancelRequested", snapshot && snapshot->cancel_requested},
                    {"status", snapshot ? json(snapshot->status) : json(nullptr)},
                }};
            }},
    });

    tools.push_back(ToolDescriptor{
        .name = "list_tasks",
        .description = "List background tasks, optionally only those with a given status.",
        .parameters = {.fields = {
            {.name = "status", .kind = schema::FieldKind::String,
             .description = "Only list tasks in this state", .required = false,
             .enum_values = std::vector<std::string>{
                 "pending", "running", "completed", "failed", "cancelled"}},
        }},
        .handler = SyncHandler{
            [&manager](const json& args) -> Result<ToolOutput> {
                std::optional<tasks::TaskStatus> filter;
                if (auto status = args.value("status", ""); !status.empty()) {
                    auto parsed = tasks::parse_status(status);
                    if (!parsed) {
                        return std::unexpected(parsed.error());
                    }
                    filter = *parsed;
                }

                json list = json::array();
                for (const auto& snapshot : manager.list(filter)) {
                    list.push_back(json{
                        {"taskId", snapshot.id},
                        {"tool", snapshot.tool_name},
                        {"status", snapshot.status},
                        {"updatedAt", utils::timestamp_iso(snapshot.updated_at)},
                    });
                }
                return ToolOutput{.content = json{{"tasks", std::move(list)}}};
            }},
    });

    tools.push_back(ToolDescriptor{
        .name = "reap_task",
        .description = "Remove a finished background task and free its stored output.",
        .parameters = {.fields = {task_id_field()}},
        .handler = SyncHandler{
            [&manager](const json& args) -> Result<ToolOutput> {
                auto task_id = args.at("task_id").get<std::string>();
                if (auto reaped = manager.reap(task_id); !reaped) {
                    return std::unexpected(reaped.error());
                }
                return ToolOutput{.content = json{{"taskId", task_id}, {"reaped", true}}};
            }},
    });

    return tools;
}

} // namespace mcptools::tools
