#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "mcptools/core/error.hpp"
#include "mcptools/core/types.hpp"

namespace mcptools::protocol {

inline constexpr const char* kJsonRpcVersion = "2.0";

/// JSON-RPC 2.0 error codes.
namespace rpc {
inline constexpr int ParseError = -32700;
inline constexpr int InvalidRequest = -32600;
inline constexpr int MethodNotFound = -32601;
inline constexpr int InvalidParams = -32602;
inline constexpr int InternalError = -32603;
} // namespace rpc

/// A request or notification sent from client to server.
struct RequestFrame {
    std::optional<json> id;   // absent for notifications
    std::string method;
    json params = json::object();

    [[nodiscard]] auto is_notification() const noexcept -> bool {
        return !id.has_value();
    }
};

void to_json(json& j, const RequestFrame& f);

struct RpcError {
    int code = rpc::InternalError;
    std::string message;
    std::optional<json> data;
};

void to_json(json& j, const RpcError& e);

/// A response sent from server to client. Exactly one of result/error.
struct ResponseFrame {
    json id;
    std::optional<json> result;
    std::optional<RpcError> error;

    [[nodiscard]] auto is_error() const noexcept -> bool {
        return error.has_value();
    }
};

void to_json(json& j, const ResponseFrame& f);

/// Parse one line of input into JSON. SerializationError when malformed.
auto parse_json(std::string_view data) -> Result<json>;

/// Interpret a parsed message as a request. ProtocolError when it is not a
/// JSON-RPC 2.0 request object.
auto parse_request(const json& message) -> Result<RequestFrame>;

/// Serialize a response as a single line (no trailing newline).
auto serialize_response(const ResponseFrame& frame) -> std::string;

/// Build a success ResponseFrame for a given request id.
auto make_response(json id, json result) -> ResponseFrame;

/// Build an error ResponseFrame for a given request id.
auto make_error_response(json id, int code, std::string message,
                         std::optional<json> data = std::nullopt) -> ResponseFrame;

/// Maps an internal error onto a JSON-RPC error:
///   UnknownTool, MissingField, TypeMismatch, InvalidArgument,
///   TaskNotFound, TaskStillRunning         -> InvalidParams
///   SerializationError                     -> ParseError
///   ProtocolError                          -> InvalidRequest
///   NotFound                               -> MethodNotFound
///   anything else                          -> InternalError
/// `data` carries the error code name and, when present, the detail.
auto to_rpc_error(const Error& error) -> RpcError;

} // namespace mcptools::protocol
