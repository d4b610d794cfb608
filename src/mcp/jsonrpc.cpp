#include "superagent/mcp/jsonrpc.hpp"

namespace superagent::mcp::jsonrpc {

auto make_request(int64_t id, std::string_view method, json params) -> json {
    json msg = {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method},
    };
    if (!params.is_null()) {
        msg["params"] = std::move(params);
    }
    return msg;
}

auto make_notification(std::string_view method, json params) -> json {
    json msg = {
        {"jsonrpc", "2.0"},
        {"method", method},
    };
    if (!params.is_null()) {
        msg["params"] = std::move(params);
    }
    return msg;
}

auto parse_response(const json& message) -> Result<Response> {
    if (!message.is_object() || !message.contains("jsonrpc")
        || message["jsonrpc"] != "2.0") {
        return std::unexpected(make_error(ErrorCode::ProtocolError,
                                          "Not a valid JSON-RPC 2.0 message",
                                          message.dump()));
    }

    Response response;
    if (message.contains("id")) {
        response.id = message["id"];
    }

    if (message.contains("result")) {
        response.result = message["result"];
    } else if (message.contains("error")) {
        const auto& err = message["error"];
        response.error = RpcError{
            .code = err.value("code", 0),
            .message = err.value("message", "Unknown error"),
            .data = err.value("data", json{}),
        };
    } else if (message.contains("method") && message["method"].is_string()) {
        response.method = message["method"].get<std::string>();
    } else {
        return std::unexpected(make_error(
            ErrorCode::ProtocolError,
            "JSON-RPC message has neither result, error, nor method"));
    }

    return response;
}

} // namespace superagent::mcp::jsonrpc
