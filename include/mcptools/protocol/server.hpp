#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "mcptools/core/config.hpp"
#include "mcptools/core/error.hpp"
#include "mcptools/dispatch/dispatcher.hpp"
#include "mcptools/protocol/frame.hpp"
#include "mcptools/tasks/manager.hpp"
#include "mcptools/tools/registry.hpp"

namespace mcptools::protocol {

/// Protocol versions this server can speak, newest first.
inline const std::vector<std::string> kSupportedProtocolVersions = {
    "2024-11-05",
    "2024-10-07",
};

/// Signature for an RPC method handler.
/// Receives params as JSON, returns result as JSON.
using MethodHandler = std::function<Result<json>(const json& params)>;

/// Metadata about a registered RPC method.
struct MethodInfo {
    std::string name;
    std::string description;
};

struct ClientInfo {
    std::string name;
    std::string version;
};

/// JSON-RPC server speaking the Model Context Protocol tool surface.
///
/// Keeps a table of named methods and routes each request to its handler.
/// The built-ins cover the MCP handshake, tool discovery and invocation,
/// and task status/cancel/list/reap. Requests are served one at a time.
class McpServer {
public:
    McpServer(ServerConfig config,
              const tools::ToolRegistry& registry,
              dispatch::Dispatcher& dispatcher,
              tasks::TaskManager& tasks);

    /// Register a method handler, replacing any existing one.
    void register_method(std::string name, MethodHandler handler,
                         std::string description = "");

    /// Check whether a method is registered.
    [[nodiscard]] auto has_method(std::string_view name) const -> bool;

    /// List all registered methods, sorted by name.
    [[nodiscard]] auto methods() const -> std::vector<MethodInfo>;

    /// Route one request. Notifications produce no response.
    auto handle(const RequestFrame& request) -> std::optional<ResponseFrame>;

    /// Parse, route and serialize one input line.
    auto handle_line(std::string_view line) -> std::optional<std::string>;

    [[nodiscard]] auto initialized() const noexcept -> bool { return initialized_; }
    [[nodiscard]] auto client_info() const -> const std::optional<ClientInfo>& { return client_info_; }
    [[nodiscard]] auto protocol_version() const -> const std::string& { return protocol_version_; }

private:
    struct Entry {
        MethodHandler handler;
        MethodInfo info;
    };

    void register_builtins();

    auto handle_initialize(const json& params) -> Result<json>;
    auto handle_tools_list(const json& params) -> Result<json>;
    auto handle_tools_call(const json& params) -> Result<json>;
    auto handle_tasks_get(const json& params) -> Result<json>;
    auto handle_tasks_cancel(const json& params) -> Result<json>;
    auto handle_tasks_list(const json& params) -> Result<json>;
    auto handle_tasks_reap(const json& params) -> Result<json>;

    ServerConfig config_;
    const tools::ToolRegistry& registry_;
    dispatch::Dispatcher& dispatcher_;
    tasks::TaskManager& tasks_;

    std::unordered_map<std::string, Entry> methods_;
    bool initialized_ = false;
    std::optional<ClientInfo> client_info_;
    std::string protocol_version_;
};

/// CallToolResult body for plain text.
auto text_result(std::string text, bool is_error = false) -> json;

/// Renders a tool's JSON output as text: strings verbatim, anything else
/// pretty-printed.
auto render_content(const json& content) -> std::string;

} // namespace mcptools::protocol
