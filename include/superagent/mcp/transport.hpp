#pragma once

#include <boost/asio.hpp>
#include <nlohmann/json.hpp>

#include "superagent/core/error.hpp"

namespace superagent::mcp {

using json = nlohmann::json;
using boost::asio::awaitable;

/// A bidirectional message channel to one MCP server.
///
/// Messages are whole JSON values; framing (newline-delimited lines or
/// WebSocket frames) is the transport's business. One request is in
/// flight at a time, so receive() is only called by the awaiting client.
class Transport {
public:
    virtual ~Transport() = default;

    /// Establish the connection (spawn the process, perform the handshake).
    virtual auto open() -> awaitable<VoidResult> = 0;

    virtual auto send(const json& message) -> awaitable<VoidResult> = 0;

    /// Wait for the next message from the server.
    virtual auto receive() -> awaitable<Result<json>> = 0;

    /// Close the connection. Safe to call more than once.
    virtual auto close() -> awaitable<void> = 0;

    [[nodiscard]] virtual auto is_open() const -> bool = 0;
};

} // namespace superagent::mcp
