#include "mcptools/tools/builtin.hpp"

#include "mcptools/core/logger.hpp"
#include "mcptools/core/utils.hpp"
#include "mcptools/infra/process.hpp"

namespace mcptools::tools {

auto aider_argv(const AiderToolConfig& config, std::string_view message,
                const std::vector<std::string>& options) -> std::vector<std::string> {
    std::vector<std::string> argv = {
        config.binary,
        "--message", std::string(message),
        "--yes-always",
        "--no-detect-urls",
    };

    if (!config.api_key.empty()) {
        argv.push_back("--api-key");
        argv.push_back("anthropic=" + config.api_key);
    }
    if (!config.model.empty()) {
        argv.push_back("--model");
        argv.push_back(config.model);
    }

    argv.insert(argv.end(), options.begin(), options.end());
    return argv;
}

auto make_aider_tool(const AiderToolConfig& config, const TasksConfig& task_config) -> ToolDescriptor {
    return ToolDescriptor{
        .name = "aider",
        .description =
            "Run aider, an AI pair-programming agent, against a directory with "
            "a natural-language instruction. Runs as a background task; the "
            "result holds aider's stdout and stderr. Give precise, "
            "self-contained instructions naming the files to change.",
        .parameters = {.fields = {
            {.name = "directory", .kind = schema::FieldKind::String,
             .description = "Directory to run aider in"},
            {.name = "message", .kind = schema::FieldKind::String,
             .description = "Instruction for aider"},
            {.name = "options", .kind = schema::FieldKind::Array,
             .description = "Extra command-line options passed to aider",
             .required = false},
        }},
        .handler = AsyncHandler{
            [config, max_bytes = task_config.max_output_bytes]
            (const json& args, tasks::TaskContext& ctx) -> Result<json> {
                auto directory = args.at("directory").get<std::string>();
                auto message = args.at("message").get<std::string>();

                std::error_code ec;
                if (!std::filesystem::is_directory(directory, ec)) {
                    return std::unexpected(make_error(
                        ErrorCode::InvalidArgument,
                        "Directory does not exist", directory));
                }
                if (utils::trim(message).empty()) {
                    return std::unexpected(make_error(
                        ErrorCode::InvalidArgument, "Message cannot be empty", "message"));
                }

                std::vector<std::string> options;
                for (const auto& opt : args.value("options", json::array())) {
                    if (!opt.is_string()) {
                        return std::unexpected(make_error(
                            ErrorCode::TypeMismatch, "options must be strings", "options"));
                    }
                    options.push_back(opt.get<std::string>());
                }

                LOG_INFO("Task {}: running aider in {}", ctx.task_id(), directory);
                ctx.report_progress("running aider in " + directory);

                auto capture = infra::run_process(infra::ProcessOptions{
                    .argv = aider_argv(config, message, options),
                    .cwd = directory,
                    .should_cancel = [&ctx] { return ctx.cancel_requested(); },
                    .max_output_bytes = max_bytes,
                });
                if (!capture) {
                    return std::unexpected(capture.error());
                }
                if (capture->cancelled) {
                    return std::unexpected(ctx.cancelled());
                }

                if (capture->exit_code != 0) {
                    LOG_WARN("Task {}: aider exited with {}", ctx.task_id(), capture->exit_code);
                    return std::unexpected(make_error(
                        ErrorCode::ProcessError,
                        "aider exited with status " + std::to_string(capture->exit_code),
                        utils::tail(capture->stderr_text, 2048)));
                }
                LOG_INFO("Task {}: aider finished", ctx.task_id());
                return json{
                    {"status", capture->exit_code},
                    {"stdout", capture->stdout_text},
                    {"stderr", capture->stderr_text},
                    {"directory", directory},
                    {"message", message},
                };
            }},
    };
}

} // namespace mcptools::tools
