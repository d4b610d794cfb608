#pragma once

#include <memory>
#include <string>

#include <boost/asio.hpp>

#include "superagent/mcp/transport.hpp"

namespace superagent::mcp {

/// Transport to a long-lived MCP server session over a WebSocket
/// (`ws://host:port/path`), one JSON-RPC message per text frame.
class WebSocketTransport final : public Transport {
public:
    WebSocketTransport(boost::asio::io_context& ioc, std::string url,
                       int connect_timeout_seconds = 30);
    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    auto open() -> awaitable<VoidResult> override;
    auto send(const json& message) -> awaitable<VoidResult> override;
    auto receive() -> awaitable<Result<json>> override;
    auto close() -> awaitable<void> override;
    [[nodiscard]] auto is_open() const -> bool override;

    [[nodiscard]] auto url() const -> const std::string&;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace superagent::mcp
