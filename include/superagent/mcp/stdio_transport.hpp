#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio.hpp>

#include "superagent/mcp/transport.hpp"

namespace superagent::mcp {

/// How to launch an MCP server process.
struct ProcessConfig {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;  // Added to the inherited environment
};

/// Transport to an MCP server spawned as a child process, speaking
/// newline-delimited JSON-RPC over its stdin/stdout. The child's stderr is
/// inherited.
class StdioTransport final : public Transport {
public:
    StdioTransport(boost::asio::io_context& ioc, ProcessConfig config);
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    auto open() -> awaitable<VoidResult> override;
    auto send(const json& message) -> awaitable<VoidResult> override;
    auto receive() -> awaitable<Result<json>> override;
    auto close() -> awaitable<void> override;
    [[nodiscard]] auto is_open() const -> bool override;

    /// Child process id, or -1 when not running.
    [[nodiscard]] auto pid() const -> int;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace superagent::mcp
