#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "superagent/core/error.hpp"

namespace superagent::mcp::jsonrpc {

using json = nlohmann::json;

/// A JSON-RPC 2.0 error object.
struct RpcError {
    int code = 0;
    std::string message;
    json data;
};

/// A parsed JSON-RPC 2.0 message from the server. Notifications and
/// server-initiated requests carry a `method` and no `result`/`error`.
struct Response {
    json id;
    std::optional<json> result;
    std::optional<RpcError> error;
    std::optional<std::string> method;

    [[nodiscard]] auto is_success() const -> bool { return result.has_value(); }
    [[nodiscard]] auto is_notification() const -> bool {
        return method.has_value() && id.is_null();
    }
    [[nodiscard]] auto answers(int64_t request_id) const -> bool {
        return !method.has_value() && id.is_number_integer()
            && id.get<int64_t>() == request_id;
    }
};

/// Build a request: {"jsonrpc":"2.0","id":id,"method":method[,"params":params]}.
[[nodiscard]] auto make_request(int64_t id, std::string_view method, json params = nullptr)
    -> json;

/// Build a notification (no id).
[[nodiscard]] auto make_notification(std::string_view method, json params = nullptr) -> json;

/// Validate and split an incoming message. Fails with ProtocolError when the
/// message is not JSON-RPC 2.0 or carries none of result, error or method.
[[nodiscard]] auto parse_response(const json& message) -> Result<Response>;

} // namespace superagent::mcp::jsonrpc
