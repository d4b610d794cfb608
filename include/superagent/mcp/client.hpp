#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio.hpp>
#include <nlohmann/json.hpp>

#include "superagent/agent/tool.hpp"
#include "superagent/core/error.hpp"
#include "superagent/mcp/transport.hpp"

namespace superagent::mcp {

inline constexpr std::string_view kProtocolVersion = "2024-11-05";
inline constexpr std::chrono::milliseconds kDefaultHandshakeTimeout{30'000};

/// What the server reported in its initialize result.
struct ServerInfo {
    std::string name;
    std::string version;
    std::string protocol_version;
    bool has_tools = false;
    bool has_resources = false;
    bool has_prompts = false;
};

/// A client session with one MCP server.
///
/// Drives the lifecycle over a Transport: initialize, list tools, call
/// tools. Requests are issued one at a time; notifications and
/// server-initiated messages that arrive while waiting for a response are
/// skipped.
///
/// initialize and tools/list must be answered within the handshake timeout;
/// a server that stays silent is closed and reported as Timeout. tools/call
/// is not bounded.
class McpClient {
public:
    explicit McpClient(std::unique_ptr<Transport> transport,
                       std::chrono::milliseconds handshake_timeout = kDefaultHandshakeTimeout);
    ~McpClient();

    McpClient(const McpClient&) = delete;
    McpClient& operator=(const McpClient&) = delete;

    /// Open the transport and perform the initialize handshake, followed by
    /// notifications/initialized.
    auto initialize() -> awaitable<Result<ServerInfo>>;

    /// tools/list
    auto list_tools() -> awaitable<Result<std::vector<agent::ToolDefinition>>>;

    /// tools/call. A result flagged `isError` is a failed ToolResult, not an
    /// error; transport and protocol failures are errors.
    auto call_tool(std::string_view name, const json& arguments)
        -> awaitable<Result<agent::ToolResult>>;

    /// Close the transport. Safe to call more than once.
    auto close() -> awaitable<void>;

    [[nodiscard]] auto info() const -> const ServerInfo& { return info_; }
    [[nodiscard]] auto is_initialized() const -> bool { return initialized_; }
    [[nodiscard]] auto is_open() const -> bool;

private:
    auto send_request(std::string_view method, json params = nullptr)
        -> awaitable<Result<json>>;

    /// send_request raced against the handshake deadline (0 = no deadline).
    auto bounded_request(std::string_view method, json params = nullptr)
        -> awaitable<Result<json>>;

    std::unique_ptr<Transport> transport_;
    std::chrono::milliseconds handshake_timeout_;
    ServerInfo info_;
    int64_t next_id_ = 1;
    bool initialized_ = false;
};

} // namespace superagent::mcp
