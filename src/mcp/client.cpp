#include "superagent/mcp/client.hpp"

#include <variant>

#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/steady_timer.hpp>

#include "superagent/core/logger.hpp"
#include "superagent/mcp/jsonrpc.hpp"

namespace superagent::mcp {

namespace net = boost::asio;
using namespace boost::asio::experimental::awaitable_operators;

McpClient::McpClient(std::unique_ptr<Transport> transport,
                     std::chrono::milliseconds handshake_timeout)
    : transport_(std::move(transport))
    , handshake_timeout_(handshake_timeout) {}

McpClient::~McpClient() = default;

auto McpClient::initialize() -> awaitable<Result<ServerInfo>> {
    if (!transport_->is_open()) {
        auto opened = co_await transport_->open();
        if (!opened) {
            co_return make_fail(opened.error());
        }
    }

    json params = {
        {"protocolVersion", kProtocolVersion},
        {"capabilities", json::object()},
        {"clientInfo", {{"name", "superagent"}, {"version", "0.1.0"}}},
    };

    auto result = co_await bounded_request("initialize", std::move(params));
    if (!result) {
        co_return make_fail(result.error());
    }

    const auto server_info = result->value("serverInfo", json::object());
    info_.name = server_info.value("name", "unknown");
    info_.version = server_info.value("version", "unknown");
    info_.protocol_version = result->value("protocolVersion", "");
    if (result->contains("capabilities") && (*result)["capabilities"].is_object()) {
        const auto& caps = (*result)["capabilities"];
        info_.has_tools = caps.contains("tools");
        info_.has_resources = caps.contains("resources");
        info_.has_prompts = caps.contains("prompts");
    }

    auto sent = co_await transport_->send(
        jsonrpc::make_notification("notifications/initialized"));
    if (!sent) {
        co_return make_fail(sent.error());
    }

    initialized_ = true;
    LOG_INFO("MCP server initialized: {} v{}", info_.name, info_.version);
    co_return info_;
}

auto McpClient::list_tools()
    -> awaitable<Result<std::vector<agent::ToolDefinition>>> {
    if (!initialized_) {
        co_return make_fail(make_error(ErrorCode::InvalidState,
                                       "MCP client not initialized"));
    }

    auto result = co_await bounded_request("tools/list");
    if (!result) {
        co_return make_fail(result.error());
    }

    std::vector<agent::ToolDefinition> tools;
    if (!result->contains("tools") || !(*result)["tools"].is_array()) {
        co_return tools;
    }

    for (const auto& t : (*result)["tools"]) {
        auto name = t.value("name", "");
        if (name.empty()) {
            LOG_WARN("MCP server {} advertised a tool without a name", info_.name);
            continue;
        }
        agent::ToolDefinition def;
        def.name = std::move(name);
        def.description = t.value("description", "");
        def.parameters = t.value("inputSchema",
                                 json{{"type", "object"}, {"properties", json::object()}});
        tools.push_back(std::move(def));
    }

    co_return tools;
}

auto McpClient::call_tool(std::string_view name, const json& arguments)
    -> awaitable<Result<agent::ToolResult>> {
    if (!initialized_) {
        co_return make_fail(make_error(ErrorCode::InvalidState,
                                       "MCP client not initialized"));
    }

    json params = {
        {"name", name},
        {"arguments", arguments.is_null() ? json::object() : arguments},
    };

    auto result = co_await send_request("tools/call", std::move(params));
    if (!result) {
        co_return make_fail(result.error());
    }

    // Only text blocks reach the model; images and resources are dropped.
    std::string content;
    std::size_t dropped = 0;
    if (result->contains("content") && (*result)["content"].is_array()) {
        for (const auto& item : (*result)["content"]) {
            if (item.value("type", "") != "text") {
                ++dropped;
                continue;
            }
            if (!content.empty()) {
                content += "\n";
            }
            content += item.value("text", "");
        }
    }

    bool is_error = result->value("isError", false);
    LOG_DEBUG("MCP tool '{}' returned {} bytes (isError: {}, dropped blocks: {})",
              std::string(name), content.size(), is_error, dropped);

    if (is_error) {
        co_return agent::ToolResult::failure(std::move(content));
    }
    if (dropped > 0) {
        co_return agent::ToolResult::partial(std::move(content));
    }
    co_return agent::ToolResult::success(std::move(content));
}

auto McpClient::close() -> awaitable<void> {
    initialized_ = false;
    co_await transport_->close();
}

auto McpClient::is_open() const -> bool {
    return transport_ && transport_->is_open();
}

auto McpClient::bounded_request(std::string_view method, json params)
    -> awaitable<Result<json>> {
    if (handshake_timeout_.count() <= 0) {
        co_return co_await send_request(method, std::move(params));
    }

    net::steady_timer deadline(co_await net::this_coro::executor, handshake_timeout_);
    auto winner = co_await (send_request(method, std::move(params))
                            || deadline.async_wait(net::use_awaitable));
    if (auto* result = std::get_if<0>(&winner)) {
        co_return std::move(*result);
    }

    LOG_WARN("MCP server did not answer {} within {} ms, closing it",
             std::string(method), handshake_timeout_.count());
    initialized_ = false;
    co_await transport_->close();
    co_return make_fail(make_error(ErrorCode::Timeout,
                                   "MCP server did not answer " + std::string(method),
                                   std::to_string(handshake_timeout_.count()) + " ms"));
}

auto McpClient::send_request(std::string_view method, json params)
    -> awaitable<Result<json>> {
    const auto id = next_id_++;

    auto sent = co_await transport_->send(
        jsonrpc::make_request(id, method, std::move(params)));
    if (!sent) {
        co_return make_fail(sent.error());
    }

    while (true) {
        auto msg = co_await transport_->receive();
        if (!msg) {
            co_return make_fail(msg.error());
        }

        auto resp = jsonrpc::parse_response(*msg);
        if (!resp) {
            co_return make_fail(resp.error());
        }
        // An error with a null id answers whatever we sent last.
        bool unaddressed_error = resp->error.has_value() && resp->id.is_null();
        if (!resp->answers(id) && !unaddressed_error) {
            LOG_TRACE("Skipping MCP message while waiting for id {}: {}", id, msg->dump());
            continue;
        }
        if (resp->error) {
            co_return make_fail(make_error(
                ErrorCode::ProtocolError,
                "RPC error " + std::to_string(resp->error->code) + " in " + std::string(method),
                resp->error->message));
        }
        co_return resp->result.value_or(json::object());
    }
}

} // namespace superagent::mcp
