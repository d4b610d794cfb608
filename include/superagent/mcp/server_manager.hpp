#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio.hpp>

#include "superagent/agent/tool_registry.hpp"
#include "superagent/core/config.hpp"
#include "superagent/core/error.hpp"
#include "superagent/mcp/client.hpp"
#include "superagent/mcp/transport.hpp"

namespace superagent::mcp {

/// Builds the transport for a server descriptor. Replaceable so sessions
/// can be faked in tests.
using TransportFactory =
    std::function<Result<std::unique_ptr<Transport>>(const RemoteServerDescriptor&)>;

/// Default factory: StdioTransport for Process, WebSocketTransport for Stream.
auto make_default_transport_factory(boost::asio::io_context& ioc,
                                    int connect_timeout_seconds = 30)
    -> TransportFactory;

/// Owns the client sessions to remote MCP servers and keeps the agent's
/// ToolRegistry in step with them: a connect registers every advertised
/// tool under the server id; a disconnect evicts exactly those tools.
class ServerManager {
public:
    ServerManager(boost::asio::io_context& ioc, agent::ToolRegistry& registry,
                  TransportFactory factory = {},
                  std::chrono::milliseconds handshake_timeout = kDefaultHandshakeTimeout);
    ~ServerManager();

    ServerManager(const ServerManager&) = delete;
    ServerManager& operator=(const ServerManager&) = delete;

    /// Open a session, run the MCP handshake and register the server's
    /// tools. An id that is already connected is disconnected first. An
    /// empty id falls back to the endpoint or command.
    auto connect(RemoteServerDescriptor descriptor) -> awaitable<VoidResult>;

    auto connect(std::string id, TransportKind transport,
                 std::string endpoint_or_command,
                 std::vector<std::string> args = {}) -> awaitable<VoidResult>;

    /// Close one session and evict its tools. Unknown ids are a no-op.
    auto disconnect(std::string_view id) -> awaitable<void>;

    /// Close every session and evict all remote tools. Local tools stay.
    auto disconnect_all() -> awaitable<void>;

    /// Connect each descriptor in order. Failures are logged and skipped.
    auto initialize_from_config(const std::vector<RemoteServerDescriptor>& servers)
        -> awaitable<void>;

    /// server id -> endpoint or command
    [[nodiscard]] auto connected_servers() const -> std::map<std::string, std::string>;
    [[nodiscard]] auto is_connected(std::string_view id) const -> bool;

    /// Names advertised by the server when it connected.
    [[nodiscard]] auto tools_of(std::string_view id) const -> std::vector<std::string>;

    [[nodiscard]] auto server_count() const noexcept -> std::size_t { return servers_.size(); }

private:
    struct ServerEntry {
        RemoteServerDescriptor descriptor;
        std::shared_ptr<McpClient> client;
        std::vector<std::string> tool_names;
    };

    auto find(std::string_view id) -> std::vector<ServerEntry>::iterator;
    auto find(std::string_view id) const -> std::vector<ServerEntry>::const_iterator;

    agent::ToolRegistry& registry_;
    TransportFactory factory_;
    std::chrono::milliseconds handshake_timeout_;
    std::vector<ServerEntry> servers_;
};

} // namespace superagent::mcp
