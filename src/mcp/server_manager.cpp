#include "superagent/mcp/server_manager.hpp"

#include <algorithm>

#include "superagent/core/logger.hpp"
#include "superagent/mcp/remote_tool.hpp"
#include "superagent/mcp/stdio_transport.hpp"
#include "superagent/mcp/websocket_transport.hpp"

namespace superagent::mcp {

auto make_default_transport_factory(boost::asio::io_context& ioc,
                                    int connect_timeout_seconds) -> TransportFactory {
    return [&ioc, connect_timeout_seconds](const RemoteServerDescriptor& desc)
               -> Result<std::unique_ptr<Transport>> {
        if (desc.endpoint_or_command.empty()) {
            return std::unexpected(make_error(ErrorCode::InvalidConfig,
                                              "MCP server has no endpoint or command",
                                              desc.id));
        }
        switch (desc.transport) {
            case TransportKind::Process:
                return std::make_unique<StdioTransport>(
                    ioc, ProcessConfig{
                             .command = desc.endpoint_or_command,
                             .args = desc.args,
                             .env = desc.env,
                         });
            case TransportKind::Stream:
                return std::make_unique<WebSocketTransport>(
                    ioc, desc.endpoint_or_command, connect_timeout_seconds);
            case TransportKind::Invalid:
                break;
        }
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
                                          "Unknown MCP transport", desc.id));
    };
}

ServerManager::ServerManager(boost::asio::io_context& ioc, agent::ToolRegistry& registry,
                             TransportFactory factory,
                             std::chrono::milliseconds handshake_timeout)
    : registry_(registry)
    , factory_(factory ? std::move(factory) : make_default_transport_factory(ioc))
    , handshake_timeout_(handshake_timeout) {}

ServerManager::~ServerManager() {
    if (!servers_.empty()) {
        LOG_DEBUG("ServerManager destroyed with {} open session(s)", servers_.size());
    }
}

auto ServerManager::find(std::string_view id) -> std::vector<ServerEntry>::iterator {
    return std::find_if(servers_.begin(), servers_.end(),
                        [id](const ServerEntry& e) { return e.descriptor.id == id; });
}

auto ServerManager::find(std::string_view id) const
    -> std::vector<ServerEntry>::const_iterator {
    return std::find_if(servers_.begin(), servers_.end(),
                        [id](const ServerEntry& e) { return e.descriptor.id == id; });
}

auto ServerManager::connect(RemoteServerDescriptor descriptor) -> awaitable<VoidResult> {
    if (descriptor.id.empty()) {
        descriptor.id = descriptor.endpoint_or_command;
    }
    if (descriptor.id.empty()) {
        co_return make_fail(make_error(ErrorCode::InvalidArgument,
                                       "MCP server needs an id or endpoint"));
    }

    if (find(descriptor.id) != servers_.end()) {
        LOG_INFO("Reconnecting MCP server {}", descriptor.id);
        co_await disconnect(descriptor.id);
    }

    auto transport = factory_(descriptor);
    if (!transport) {
        co_return make_fail(transport.error());
    }

    auto client = std::make_shared<McpClient>(std::move(*transport), handshake_timeout_);

    auto info = co_await client->initialize();
    if (!info) {
        co_await client->close();
        co_return make_fail(wrap_error(ErrorCode::ConnectionFailed,
                                       "Failed to initialize MCP server " + descriptor.id,
                                       info.error()));
    }

    auto tools = co_await client->list_tools();
    if (!tools) {
        co_await client->close();
        co_return make_fail(wrap_error(ErrorCode::ConnectionFailed,
                                       "Failed to list tools of MCP server " + descriptor.id,
                                       tools.error()));
    }

    ServerEntry entry;
    entry.descriptor = descriptor;
    entry.client = client;
    for (auto& def : *tools) {
        entry.tool_names.push_back(def.name);
        registry_.add_tool(
            std::make_unique<RemoteTool>(descriptor.id, std::move(def), client),
            descriptor.id);
    }

    LOG_INFO("Connected to MCP server {} ({}) with {} tool(s)",
             descriptor.id, descriptor.endpoint_or_command, entry.tool_names.size());
    servers_.push_back(std::move(entry));
    co_return ok_result();
}

auto ServerManager::connect(std::string id, TransportKind transport,
                            std::string endpoint_or_command,
                            std::vector<std::string> args) -> awaitable<VoidResult> {
    RemoteServerDescriptor desc;
    desc.id = std::move(id);
    desc.transport = transport;
    desc.endpoint_or_command = std::move(endpoint_or_command);
    desc.args = std::move(args);
    co_return co_await connect(std::move(desc));
}

auto ServerManager::disconnect(std::string_view id) -> awaitable<void> {
    auto it = find(id);
    if (it == servers_.end()) {
        co_return;
    }

    auto client = it->client;
    auto server_id = it->descriptor.id;
    servers_.erase(it);

    auto removed = registry_.remove_by_owner(server_id);
    co_await client->close();
    LOG_INFO("Disconnected MCP server {} ({} tool(s) removed)", server_id, removed);
}

auto ServerManager::disconnect_all() -> awaitable<void> {
    auto servers = std::move(servers_);
    servers_.clear();

    for (auto& entry : servers) {
        co_await entry.client->close();
        LOG_INFO("Disconnected MCP server {}", entry.descriptor.id);
    }

    auto removed = registry_.remove_remote();
    if (removed > 0) {
        LOG_DEBUG("Removed {} remote tool(s)", removed);
    }
}

auto ServerManager::initialize_from_config(
    const std::vector<RemoteServerDescriptor>& servers) -> awaitable<void> {
    for (const auto& desc : servers) {
        try {
            auto result = co_await connect(desc);
            if (!result) {
                LOG_ERROR("Failed to connect to MCP server {}: {}",
                          desc.id, result.error().what());
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to connect to MCP server {}: {}", desc.id, e.what());
        }
    }
}

auto ServerManager::connected_servers() const -> std::map<std::string, std::string> {
    std::map<std::string, std::string> out;
    for (const auto& e : servers_) {
        out.emplace(e.descriptor.id, e.descriptor.endpoint_or_command);
    }
    return out;
}

auto ServerManager::is_connected(std::string_view id) const -> bool {
    return find(id) != servers_.end();
}

auto ServerManager::tools_of(std::string_view id) const -> std::vector<std::string> {
    auto it = find(id);
    if (it == servers_.end()) {
        return {};
    }
    return it->tool_names;
}

} // namespace superagent::mcp
