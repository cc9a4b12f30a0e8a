#include "mcptools/tools/builtin.hpp"

#include <chrono>
#include <cstddef>
#include <string>

#include "mcptools/core/logger.hpp"
#include "mcptools/core/utils.hpp"
#include "mcptools/infra/process.hpp"

namespace mcptools::tools {

namespace {

/// Bytes of each stream kept in the progress value.
constexpr std::size_t kProgressTailBytes = 2048;

/// Minimum interval between progress publications.
constexpr auto kProgressInterval = std::chrono::milliseconds(250);

/// Accumulates streamed output and throttles progress updates.
class OutputProgress {
public:
    OutputProgress(tasks::TaskContext& ctx, std::size_t max_bytes)
        : ctx_(ctx), max_bytes_(max_bytes) {}

    void append(infra::OutputStream stream, std::string_view chunk) {
        auto& target = stream == infra::OutputStream::Stdout ? stdout_ : stderr_;
        target.append(chunk);
        if (target.size() > max_bytes_ * 2) {
            target.erase(0, target.size() - max_bytes_);
        }
        for (char c : chunk) {
            if (c == '\n') ++lines_;
        }

        auto now = std::chrono::steady_clock::now();
        if (now - last_report_ >= kProgressInterval) {
            publish();
            last_report_ = now;
        }
    }

    void publish() {
        ctx_.report_progress(json{
            {"stdout_tail", utils::tail(stdout_, kProgressTailBytes)},
            {"stderr_tail", utils::tail(stderr_, kProgressTailBytes)},
            {"lines", lines_},
        });
    }

private:
    tasks::TaskContext& ctx_;
    std::size_t max_bytes_;
    std::string stdout_;
    std::string stderr_;
    std::size_t lines_ = 0;
    std::chrono::steady_clock::time_point last_report_{};
};

} // anonymous namespace

auto make_run_background_tool(const TasksConfig& config) -> ToolDescriptor {
    return ToolDescriptor{
        .name = "run_background",
        .description =
            "Start a long-running shell command as a background task and "
            "return its task id immediately. Poll with task_status (or "
            "tasks/get) to see streamed stdout/stderr; stop it with "
            "cancel_task. Exit status 0 completes the task, anything else "
            "fails it.",
        .parameters = {.fields = {
            {.name = "command", .kind = schema::FieldKind::String,
             .description = "The command to run"},
            {.name = "cwd", .kind = schema::FieldKind::String,
             .description = "Working directory", .required = false},
            {.name = "reason", .kind = schema::FieldKind::String,
             .description = "Why this task is being started", .required = false},
        }},
        .handler = AsyncHandler{
            [max_bytes = config.max_output_bytes]
            (const json& args, tasks::TaskContext& ctx) -> Result<json> {
                auto command = args.at("command").get<std::string>();
                auto reason = args.value("reason", "");
                LOG_INFO("Task {}: running '{}'{}", ctx.task_id(), command,
                         reason.empty() ? "" : " (" + reason + ")");

                OutputProgress progress(ctx, max_bytes);
                progress.publish();

                auto capture = infra::run_process(infra::ProcessOptions{
                    .argv = infra::shell_argv(command),
                    .cwd = args.value("cwd", ""),
                    .should_cancel = [&ctx] { return ctx.cancel_requested(); },
                    .on_output = [&progress](infra::OutputStream stream, std::string_view chunk) {
                        progress.append(stream, chunk);
                    },
                    .max_output_bytes = max_bytes,
                });
                if (!capture) {
                    return std::unexpected(capture.error());
                }
                progress.publish();

                if (capture->cancelled) {
                    return std::unexpected(ctx.cancelled());
                }
                if (capture->exit_code != 0) {
                    return std::unexpected(make_error(
                        ErrorCode::ProcessError,
                        "Command exited with status " + std::to_string(capture->exit_code),
                        utils::tail(capture->stderr_text, kProgressTailBytes)));
                }

                return json{
                    {"exit_code", capture->exit_code},
                    {"stdout", capture->stdout_text},
                    {"stderr", capture->stderr_text},
                    {"duration_ms", capture->duration_ms},
                };
            }},
    };
}

} // namespace mcptools::tools
