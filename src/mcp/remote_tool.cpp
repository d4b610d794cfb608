#include "superagent/mcp/remote_tool.hpp"

#include "superagent/core/logger.hpp"

namespace superagent::mcp {

RemoteTool::RemoteTool(std::string server_id, agent::ToolDefinition def,
                       std::shared_ptr<McpClient> client)
    : server_id_(std::move(server_id))
    , def_(std::move(def))
    , client_(std::move(client)) {}

auto RemoteTool::definition() const -> agent::ToolDefinition {
    return def_;
}

auto RemoteTool::execute(json arguments) -> awaitable<Result<agent::ToolResult>> {
    if (!client_ || !client_->is_initialized()) {
        co_return make_fail(make_error(ErrorCode::ConnectionClosed,
                                       "MCP server session is closed",
                                       server_id_));
    }

    LOG_DEBUG("Calling remote tool {} on server {}", def_.name, server_id_);
    co_return co_await client_->call_tool(def_.name, arguments);
}

} // namespace superagent::mcp
