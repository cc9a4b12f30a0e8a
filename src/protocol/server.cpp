#include "mcptools/protocol/server.hpp"

#include <algorithm>
#include <type_traits>

#include "mcptools/core/logger.hpp"
#include "mcptools/core/utils.hpp"

namespace mcptools::protocol {

namespace {

auto require_string(const json& params, std::string_view key) -> Result<std::string> {
    if (!params.is_object()) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument, "params must be an object"));
    }
    auto it = params.find(key);
    if (it == params.end() || !it->is_string() || it->get_ref<const std::string&>().empty()) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument,
            "missing or invalid '" + std::string(key) + "'", std::string(key)));
    }
    return it->get<std::string>();
}

auto error_response_for(const json& id, const Error& error) -> ResponseFrame {
    auto rpc_error = to_rpc_error(error);
    return make_error_response(id, rpc_error.code, std::move(rpc_error.message),
                               std::move(rpc_error.data));
}

} // anonymous namespace

auto text_result(std::string text, bool is_error) -> json {
    return json{
        {"content", json::array({
            json{{"type", "text"}, {"text", std::move(text)}},
        })},
        {"isError", is_error},
    };
}

auto render_content(const json& content) -> std::string {
    if (content.is_string()) {
        return content.get<std::string>();
    }
    return content.dump(2, ' ', false, json::error_handler_t::replace);
}

McpServer::McpServer(ServerConfig config,
                     const tools::ToolRegistry& registry,
                     dispatch::Dispatcher& dispatcher,
                     tasks::TaskManager& tasks)
    : config_(std::move(config))
    , registry_(registry)
    , dispatcher_(dispatcher)
    , tasks_(tasks)
    , protocol_version_(config_.protocol_version)
{
    register_builtins();
}

void McpServer::register_method(std::string name, MethodHandler handler,
                                std::string description) {
    LOG_DEBUG("Registering method: {}", name);
    methods_[name] = Entry{
        .handler = std::move(handler),
        .info = MethodInfo{
            .name = name,
            .description = std::move(description),
        },
    };
}

auto McpServer::has_method(std::string_view name) const -> bool {
    return methods_.contains(std::string(name));
}

auto McpServer::methods() const -> std::vector<MethodInfo> {
    std::vector<MethodInfo> result;
    result.reserve(methods_.size());
    for (const auto& [_, entry] : methods_) {
        result.push_back(entry.info);
    }
    std::ranges::sort(result, {}, &MethodInfo::name);
    return result;
}

auto McpServer::handle(const RequestFrame& request) -> std::optional<ResponseFrame> {
    auto it = methods_.find(request.method);

    if (request.is_notification()) {
        if (it == methods_.end()) {
            LOG_DEBUG("Ignoring notification: {}", request.method);
            return std::nullopt;
        }
        try {
            if (auto result = it->second.handler(request.params); !result) {
                LOG_WARN("Notification {} failed: {}", request.method, result.error().what());
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Notification {} threw exception: {}", request.method, e.what());
        }
        return std::nullopt;
    }

    const json& id = *request.id;

    if (it == methods_.end()) {
        LOG_WARN("Method not found: {}", request.method);
        return make_error_response(id, rpc::MethodNotFound,
                                   "Method not found: " + request.method);
    }

    try {
        auto result = it->second.handler(request.params);
        if (!result) {
            LOG_DEBUG("Method {} failed: {}", request.method, result.error().what());
            return error_response_for(id, result.error());
        }
        return make_response(id, std::move(*result));
    } catch (const std::exception& e) {
        LOG_ERROR("Method {} threw exception: {}", request.method, e.what());
        return make_error_response(id, rpc::InternalError, "Method execution failed",
                                   json{{"detail", e.what()}});
    }
}

auto McpServer::handle_line(std::string_view line) -> std::optional<std::string> {
    auto trimmed = utils::trim(line);
    if (trimmed.empty()) {
        return std::nullopt;
    }

    auto message = parse_json(trimmed);
    if (!message) {
        LOG_WARN("Rejecting unparseable message: {}", message.error().what());
        return serialize_response(
            make_error_response(nullptr, rpc::ParseError, "Parse error",
                                json{{"detail", std::string(message.error().detail())}}));
    }

    auto request = parse_request(*message);
    if (!request) {
        json id = nullptr;
        if (message->is_object() && message->contains("id")) {
            id = (*message)["id"];
        }
        return serialize_response(
            make_error_response(std::move(id), rpc::InvalidRequest,
                                std::string(request.error().message())));
    }

    auto response = handle(*request);
    if (!response) {
        return std::nullopt;
    }
    return serialize_response(*response);
}

// ---------------------------------------------------------------------------
// Built-in methods
// ---------------------------------------------------------------------------

void McpServer::register_builtins() {
    register_method("initialize",
        [this](const json& params) { return handle_initialize(params); },
        "Negotiate protocol version and capabilities");

    register_method("notifications/initialized",
        [this](const json&) -> Result<json> {
            LOG_INFO("Client finished initialization");
            return json::object();
        },
        "Client handshake complete");

    register_method("notifications/cancelled",
        [](const json& params) -> Result<json> {
            // Requests are served one at a time, so by the time this
            // arrives the request it names has already been answered.
            LOG_DEBUG("Client cancelled request {}", params.value("requestId", json()).dump());
            return json::object();
        },
        "Client abandoned a request");

    register_method("ping",
        [](const json&) -> Result<json> { return json::object(); },
        "Liveness check");

    register_method("tools/list",
        [this](const json& params) { return handle_tools_list(params); },
        "List available tools");

    register_method("tools/call",
        [this](const json& params) { return handle_tools_call(params); },
        "Invoke a tool");

    register_method("tasks/get",
        [this](const json& params) { return handle_tasks_get(params); },
        "Get the status of a background task");

    register_method("tasks/cancel",
        [this](const json& params) { return handle_tasks_cancel(params); },
        "Request cancellation of a background task");

    register_method("tasks/list",
        [this](const json& params) { return handle_tasks_list(params); },
        "List background tasks");

    register_method("tasks/reap",
        [this](const json& params) { return handle_tasks_reap(params); },
        "Remove a finished background task");
}

auto McpServer::handle_initialize(const json& params) -> Result<json> {
    std::string requested = config_.protocol_version;
    if (params.is_object()) {
        if (auto it = params.find("protocolVersion"); it != params.end()) {
            if (!it->is_string()) {
                return std::unexpected(make_error(
                    ErrorCode::InvalidArgument,
                    "protocolVersion must be a string", "protocolVersion"));
            }
            requested = it->get<std::string>();
        }

        if (auto it = params.find("clientInfo"); it != params.end() && it->is_object()) {
            client_info_ = ClientInfo{
                .name = it->value("name", ""),
                .version = it->value("version", ""),
            };
        }
    }

    if (std::ranges::find(kSupportedProtocolVersions, requested) ==
        kSupportedProtocolVersions.end()) {
        LOG_WARN("Client requested unsupported protocol version {}", requested);
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument,
            "Unsupported protocol version: " + requested, "protocolVersion"));
    }

    protocol_version_ = requested;
    initialized_ = true;

    LOG_INFO("Initialized session with {} {} (protocol {})",
             client_info_ ? client_info_->name : "unknown client",
             client_info_ ? client_info_->version : "",
             protocol_version_);

    return json{
        {"protocolVersion", protocol_version_},
        {"serverInfo", {
            {"name", config_.name},
            {"version", config_.version},
        }},
        {"capabilities", {
            {"tools", {{"listChanged", false}}},
        }},
    };
}

auto McpServer::handle_tools_list(const json&) -> Result<json> {
    return json{{"tools", registry_.to_json()}};
}

auto McpServer::handle_tools_call(const json& params) -> Result<json> {
    auto name = require_string(params, "name");
    if (!name) {
        return std::unexpected(name.error());
    }

    dispatch::Invocation invocation{
        .tool_name = std::move(*name),
        .arguments = params.value("arguments", json::object()),
    };

    auto outcome = dispatcher_.dispatch(invocation);
    if (!outcome) {
        // Only a bad invocation is a protocol error; anything the tool itself
        // reported goes back as an error result.
        switch (outcome.error().code()) {
            case ErrorCode::UnknownTool:
            case ErrorCode::MissingField:
            case ErrorCode::TypeMismatch:
                return std::unexpected(outcome.error());
            default:
                return text_result(std::string(outcome.error().message()), true);
        }
    }

    return std::visit([](auto& value) -> json {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, tools::ToolOutput>) {
            return text_result(render_content(value.content), value.is_error);
        } else {
            auto result = text_result("Task started with id: " + value.task_id);
            result["_meta"] = {{"taskId", value.task_id}};
            return result;
        }
    }, *outcome);
}

auto McpServer::handle_tasks_get(const json& params) -> Result<json> {
    auto task_id = require_string(params, "taskId");
    if (!task_id) {
        return std::unexpected(task_id.error());
    }

    auto snapshot = tasks_.status(*task_id);
    if (!snapshot) {
        return std::unexpected(make_error(
            ErrorCode::TaskNotFound, "Task not found", *task_id));
    }
    return snapshot->to_json();
}

auto McpServer::handle_tasks_cancel(const json& params) -> Result<json> {
    auto task_id = require_string(params, "taskId");
    if (!task_id) {
        return std::unexpected(task_id.error());
    }

    if (auto cancelled = tasks_.cancel(*task_id); !cancelled) {
        return std::unexpected(cancelled.error());
    }

    // A terminal task ignores the request, so report what the record holds.
    auto snapshot = tasks_.status(*task_id);
    if (!snapshot) {
        return json{{"taskId", *task_id}, {"cancelRequested", false}, {"status", nullptr}};
    }
    return json{
        {"taskId", *task_id},
        {"cancelRequested", snapshot->cancel_requested},
        {"status", snapshot->status},
    };
}

auto McpServer::handle_tasks_list(const json& params) -> Result<json> {
    std::optional<tasks::TaskStatus> filter;
    if (params.is_object()) {
        if (auto it = params.find("status"); it != params.end() && !it->is_null()) {
            if (!it->is_string()) {
                return std::unexpected(make_error(
                    ErrorCode::InvalidArgument, "status must be a string", "status"));
            }
            auto parsed = tasks::parse_status(it->get<std::string>());
            if (!parsed) {
                return std::unexpected(parsed.error());
            }
            filter = *parsed;
        }
    }

    json list = json::array();
    for (const auto& snapshot : tasks_.list(filter)) {
        list.push_back(snapshot.to_json());
    }
    return json{{"tasks", std::move(list)}};
}

auto McpServer::handle_tasks_reap(const json& params) -> Result<json> {
    auto task_id = require_string(params, "taskId");
    if (!task_id) {
        return std::unexpected(task_id.error());
    }

    if (auto reaped = tasks_.reap(*task_id); !reaped) {
        return std::unexpected(reaped.error());
    }
    return json{
        {"taskId", *task_id},
        {"reaped", true},
    };
}

} // namespace mcptools::protocol
