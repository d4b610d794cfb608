#pragma once

#include <memory>
#include <string>

#include "superagent/agent/tool.hpp"
#include "superagent/mcp/client.hpp"

namespace superagent::mcp {

/// Local proxy for a tool advertised by a remote MCP server. Execution is
/// forwarded over the server's client session.
class RemoteTool final : public agent::Tool {
public:
    RemoteTool(std::string server_id, agent::ToolDefinition def,
               std::shared_ptr<McpClient> client);

    [[nodiscard]] auto definition() const -> agent::ToolDefinition override;
    auto execute(json arguments) -> awaitable<Result<agent::ToolResult>> override;

    [[nodiscard]] auto server_id() const -> const std::string& { return server_id_; }

private:
    std::string server_id_;
    agent::ToolDefinition def_;
    std::shared_ptr<McpClient> client_;
};

} // namespace superagent::mcp
