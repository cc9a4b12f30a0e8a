#include "mcptools/protocol/frame.hpp"

namespace mcptools::protocol {

// -- serialization --

void to_json(json& j, const RequestFrame& f) {
    j = json{
        {"jsonrpc", kJsonRpcVersion},
        {"method", f.method},
        {"params", f.params},
    };
    if (f.id) j["id"] = *f.id;
}

void to_json(json& j, const RpcError& e) {
    j = json{
        {"code", e.code},
        {"message", e.message},
    };
    if (e.data) j["data"] = *e.data;
}

void to_json(json& j, const ResponseFrame& f) {
    j = json{
        {"jsonrpc", kJsonRpcVersion},
        {"id", f.id},
    };
    if (f.error) {
        j["error"] = *f.error;
    } else {
        j["result"] = f.result.value_or(json::object());
    }
}

// -- parsing --

auto parse_json(std::string_view data) -> Result<json> {
    try {
        return json::parse(data);
    } catch (const json::parse_error& e) {
        return std::unexpected(
            make_error(ErrorCode::SerializationError,
                       "Parse error", e.what()));
    }
}

auto parse_request(const json& message) -> Result<RequestFrame> {
    if (!message.is_object()) {
        return std::unexpected(
            make_error(ErrorCode::ProtocolError,
                       "Request must be a JSON object"));
    }

    auto version = message.find("jsonrpc");
    if (version == message.end() || *version != kJsonRpcVersion) {
        return std::unexpected(
            make_error(ErrorCode::ProtocolError,
                       "Unsupported or missing jsonrpc version"));
    }

    auto method = message.find("method");
    if (method == message.end() || !method->is_string()) {
        return std::unexpected(
            make_error(ErrorCode::ProtocolError,
                       "Request method must be a string"));
    }

    RequestFrame frame;
    frame.method = method->get<std::string>();

    if (auto id = message.find("id"); id != message.end()) {
        if (!id->is_string() && !id->is_number_integer() && !id->is_null()) {
            return std::unexpected(
                make_error(ErrorCode::ProtocolError,
                           "Request id must be a string or integer"));
        }
        frame.id = *id;
    }

    if (auto params = message.find("params"); params != message.end() && !params->is_null()) {
        if (!params->is_object() && !params->is_array()) {
            return std::unexpected(
                make_error(ErrorCode::ProtocolError,
                           "Request params must be an object or array"));
        }
        frame.params = *params;
    }

    return frame;
}

auto serialize_response(const ResponseFrame& frame) -> std::string {
    json j = frame;
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

// -- factory helpers --

auto make_response(json id, json result) -> ResponseFrame {
    return ResponseFrame{
        .id = std::move(id),
        .result = std::move(result),
        .error = std::nullopt,
    };
}

auto make_error_response(json id, int code, std::string message,
                         std::optional<json> data) -> ResponseFrame {
    return ResponseFrame{
        .id = std::move(id),
        .result = std::nullopt,
        .error = RpcError{
            .code = code,
            .message = std::move(message),
            .data = std::move(data),
        },
    };
}

auto to_rpc_error(const Error& error) -> RpcError {
    int code = rpc::InternalError;
    switch (error.code()) {
        case ErrorCode::UnknownTool:
        case ErrorCode::MissingField:
        case ErrorCode::TypeMismatch:
        case ErrorCode::InvalidArgument:
        case ErrorCode::TaskNotFound:
        case ErrorCode::TaskStillRunning:
            code = rpc::InvalidParams;
            break;
        case ErrorCode::SerializationError:
            code = rpc::ParseError;
            break;
        case ErrorCode::ProtocolError:
            code = rpc::InvalidRequest;
            break;
        case ErrorCode::NotFound:
            code = rpc::MethodNotFound;
            break;
        default:
            break;
    }

    json data = {{"code", std::string(error_code_to_string(error.code()))}};
    if (!error.detail().empty()) {
        switch (error.code()) {
            case ErrorCode::MissingField:
            case ErrorCode::TypeMismatch:
                data["field"] = std::string(error.detail());
                break;
            case ErrorCode::UnknownTool:
                data["tool"] = std::string(error.detail());
                break;
            case ErrorCode::TaskNotFound:
            case ErrorCode::TaskStillRunning:
                data["taskId"] = std::string(error.detail());
                break;
            default:
                data["detail"] = std::string(error.detail());
                break;
        }
    }

    std::string message(error.message());
    if (error.code() == ErrorCode::MissingField || error.code() == ErrorCode::TypeMismatch ||
        error.code() == ErrorCode::UnknownTool) {
        message = error.what();
    }

    return RpcError{
        .code = code,
        .message = std::move(message),
        .data = std::move(data),
    };
}

} // namespace mcptools::protocol
