#include <catch2/catch_test_macros.hpp>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <memory>
#include <string>

#include <boost/asio.hpp>

#include "superagent/mcp/client.hpp"
#include "superagent/mcp/server_manager.hpp"
#include "superagent/mcp/stdio_transport.hpp"
#include "../support/fakes.hpp"

using namespace superagent;
using namespace superagent::mcp;
using superagent::testing::run_sync;

namespace {

/// A small MCP server written in sh. Replies use McpClient's request ids:
/// initialize is 1, tools/list is 2, the first tools/call is 3. The
/// tools/call reply ends in CRLF.
auto shell_server(const std::string& preamble = "", bool exit_after_list = false)
    -> ProcessConfig {
    std::string script = preamble + R"SH(
while IFS= read -r line; do
  case "$line" in
    *'"method":"initialize"'*)
      printf '%s\n' '{"jsonrpc":"2.0","id":1,"result":{"protocolVersion":"2024-11-05","serverInfo":{"name":"sh-server","version":"1.0"},"capabilities":{"tools":{}}}}' ;;
    *'"method":"tools/list"'*)
      printf '%s\n' '{"jsonrpc":"2.0","id":2,"result":{"tools":[{"name":"greet","description":"says hello","inputSchema":{"type":"object"}}]}}'
)SH";
    if (exit_after_list) {
        script += "      exit 0\n";
    }
    script += R"SH(      ;;
    *'"method":"tools/call"'*)
      printf '{"jsonrpc":"2.0","id":3,"result":{"content":[{"type":"text","text":"hello %s"}]}}\r\n' "${GREETING:-world}" ;;
  esac
done
)SH";
    return ProcessConfig{.command = "/bin/sh", .args = {"-c", script}};
}

auto process_descriptor(std::string id, ProcessConfig config) -> RemoteServerDescriptor {
    RemoteServerDescriptor desc;
    desc.id = std::move(id);
    desc.transport = TransportKind::Process;
    desc.endpoint_or_command = std::move(config.command);
    desc.args = std::move(config.args);
    desc.env = std::move(config.env);
    return desc;
}

void wait_for(boost::asio::io_context& ioc, std::chrono::milliseconds delay) {
    run_sync(ioc, [&ioc, delay]() -> awaitable<void> {
        boost::asio::steady_timer timer(ioc, delay);
        co_await timer.async_wait(boost::asio::use_awaitable);
    }());
}

auto process_gone(int pid) -> bool {
    return ::kill(pid, 0) == -1 && errno == ESRCH;
}

} // anonymous namespace

TEST_CASE("StdioTransport talks MCP to a child process", "[mcp][stdio]") {
    boost::asio::io_context ioc;
    // Banner and blank line on stdout before the first reply.
    auto transport = std::make_unique<StdioTransport>(
        ioc, shell_server("echo 'sh-server starting'\necho\n"));
    auto* raw = transport.get();
    McpClient client(std::move(transport));

    auto info = run_sync(ioc, client.initialize());
    REQUIRE(info.has_value());
    CHECK(info->name == "sh-server");
    CHECK(info->has_tools);
    CHECK(raw->is_open());
    CHECK(raw->pid() > 0);

    auto tools = run_sync(ioc, client.list_tools());
    REQUIRE(tools.has_value());
    REQUIRE(tools->size() == 1);
    CHECK((*tools)[0].name == "greet");

    auto called = run_sync(ioc, client.call_tool("greet", {}));
    REQUIRE(called.has_value());
    CHECK(called->is_success());
    CHECK(called->content == "hello world");

    auto pid = raw->pid();
    run_sync(ioc, client.close());
    CHECK_FALSE(raw->is_open());
    CHECK(raw->pid() == -1);
    CHECK(process_gone(pid));
}

TEST_CASE("StdioTransport adds configured variables to the environment", "[mcp][stdio]") {
    boost::asio::io_context ioc;
    auto config = shell_server();
    config.env = {{"GREETING", "superagent"}};
    McpClient client(std::make_unique<StdioTransport>(ioc, std::move(config)));

    REQUIRE(run_sync(ioc, client.initialize()).has_value());
    REQUIRE(run_sync(ioc, client.list_tools()).has_value());

    auto called = run_sync(ioc, client.call_tool("greet", {}));
    REQUIRE(called.has_value());
    CHECK(called->content == "hello superagent");

    run_sync(ioc, client.close());
}

TEST_CASE("StdioTransport reports a child that closes stdout", "[mcp][stdio]") {
    boost::asio::io_context ioc;
    StdioTransport transport(ioc, {.command = "/bin/sh", .args = {"-c", "echo not-json"}});

    REQUIRE(run_sync(ioc, transport.open()).has_value());

    auto received = run_sync(ioc, transport.receive());
    REQUIRE_FALSE(received.has_value());
    CHECK(received.error().code() == ErrorCode::ConnectionClosed);
    CHECK_FALSE(transport.is_open());

    run_sync(ioc, transport.close());
    CHECK(transport.pid() == -1);
}

TEST_CASE("StdioTransport reaps the child it started", "[mcp][stdio]") {
    boost::asio::io_context ioc;

    SECTION("close terminates and reaps") {
        StdioTransport transport(ioc, {.command = "sleep", .args = {"30"}});
        REQUIRE(run_sync(ioc, transport.open()).has_value());
        auto pid = transport.pid();
        REQUIRE(pid > 0);

        run_sync(ioc, transport.close());
        CHECK(transport.pid() == -1);
        CHECK_FALSE(transport.is_open());
        CHECK(process_gone(pid));

        // Second close is a no-op.
        run_sync(ioc, transport.close());
        CHECK(transport.pid() == -1);
    }

    SECTION("destruction kills and reaps") {
        int pid = -1;
        {
            StdioTransport transport(ioc, {.command = "sleep", .args = {"30"}});
            REQUIRE(run_sync(ioc, transport.open()).has_value());
            pid = transport.pid();
        }
        REQUIRE(pid > 0);
        CHECK(process_gone(pid));
    }
}

TEST_CASE("StdioTransport fails to open a missing command", "[mcp][stdio]") {
    boost::asio::io_context ioc;
    StdioTransport transport(ioc, {.command = "/nonexistent/superagent-mcp-server"});

    auto opened = run_sync(ioc, transport.open());
    REQUIRE_FALSE(opened.has_value());
    CHECK(opened.error().code() == ErrorCode::ConnectionFailed);
    CHECK_FALSE(transport.is_open());
    CHECK(transport.pid() == -1);
}

TEST_CASE("A tool call to an exited server fails without killing the agent", "[mcp][stdio]") {
    boost::asio::io_context ioc;
    agent::ToolRegistry registry;
    ServerManager manager(ioc, registry);

    auto connected = run_sync(ioc, manager.connect(
        process_descriptor("short-lived", shell_server("", true))));
    REQUIRE(connected.has_value());
    REQUIRE(registry.contains("greet"));

    // Give the child time to exit so the next write hits a closed pipe.
    wait_for(ioc, std::chrono::milliseconds(300));

    auto result = run_sync(ioc, registry.execute("greet", {}));
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::ConnectionClosed);

    auto again = run_sync(ioc, registry.execute("greet", {}));
    REQUIRE_FALSE(again.has_value());

    run_sync(ioc, manager.disconnect_all());
    CHECK(registry.size() == 0);
}

TEST_CASE("A silent server times out its handshake", "[mcp][stdio]") {
    boost::asio::io_context ioc;

    SECTION("McpClient gives up and stops the child") {
        auto transport = std::make_unique<StdioTransport>(
            ioc, ProcessConfig{.command = "sleep", .args = {"30"}});
        auto* raw = transport.get();
        McpClient client(std::move(transport), std::chrono::milliseconds(200));

        auto info = run_sync(ioc, client.initialize());
        REQUIRE_FALSE(info.has_value());
        CHECK(info.error().code() == ErrorCode::Timeout);
        CHECK_FALSE(client.is_initialized());
        CHECK(raw->pid() == -1);
    }

    SECTION("later servers still connect") {
        agent::ToolRegistry registry;
        ServerManager manager(ioc, registry, {}, std::chrono::milliseconds(300));

        auto started = std::chrono::steady_clock::now();
        run_sync(ioc, manager.initialize_from_config({
            process_descriptor("silent", {.command = "sleep", .args = {"30"}}),
            process_descriptor("good", shell_server()),
        }));
        auto elapsed = std::chrono::steady_clock::now() - started;

        CHECK_FALSE(manager.is_connected("silent"));
        CHECK(manager.is_connected("good"));
        CHECK(registry.owner_of("greet") == "good");
        CHECK(elapsed < std::chrono::seconds(10));

        run_sync(ioc, manager.disconnect_all());
    }
}
