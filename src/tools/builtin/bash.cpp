#include "mcptools/tools/builtin.hpp"

#include "mcptools/core/logger.hpp"
#include "mcptools/infra/process.hpp"

namespace mcptools::tools {

auto make_bash_tool(const ShellToolConfig& config) -> ToolDescriptor {
    return ToolDescriptor{
        .name = "bash",
        .description =
            "Execute a shell command and return its output. Runs /bin/sh -c in "
            "the given working directory. Commands that take longer than the "
            "configured timeout are killed; use run_background for long jobs.",
        .parameters = {.fields = {
            {.name = "command", .kind = schema::FieldKind::String,
             .description = "The command to run"},
            {.name = "cwd", .kind = schema::FieldKind::String,
             .description = "Working directory (defaults to the server's)",
             .required = false},
        }},
        .handler = SyncHandler{
            [config](const json& args) -> Result<ToolOutput> {
                auto command = args.at("command").get<std::string>();
                auto cwd = args.value("cwd", config.default_cwd);

                LOG_INFO("bash: {}", command);

                auto capture = infra::run_process(infra::ProcessOptions{
                    .argv = infra::shell_argv(command),
                    .cwd = cwd,
                    .timeout = std::chrono::milliseconds(config.timeout_ms),
                });
                if (!capture) {
                    return std::unexpected(capture.error());
                }

                std::string text;
                if (capture->timed_out) {
                    text += "Command timed out after " + std::to_string(config.timeout_ms) + " ms\n";
                }
                text += "Exit code: " + std::to_string(capture->exit_code) + "\n";
                if (!capture->stdout_text.empty()) {
                    text += "\nSTDOUT:\n" + capture->stdout_text;
                }
                if (!capture->stderr_text.empty()) {
                    text += "\nSTDERR:\n" + capture->stderr_text;
                }

                return ToolOutput{
                    .content = text,
                    .is_error = !capture->succeeded(),
                };
            }},
    };
}

} // namespace mcptools::tools
