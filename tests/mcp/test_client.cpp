#include <catch2/catch_test_macros.hpp>

#include <memory>

#include "superagent/mcp/client.hpp"
#include "../support/fakes.hpp"

using namespace superagent;
using namespace superagent::mcp;
using superagent::testing::FakeMcpServer;
using superagent::testing::run_sync;

TEST_CASE("McpClient performs the initialize handshake", "[mcp][client]") {
    auto server = std::make_unique<FakeMcpServer>();
    auto state = server->state;
    McpClient client(std::move(server));

    auto info = run_sync(client.initialize());
    REQUIRE(info.has_value());
    CHECK(info->name == "fake");
    CHECK(info->version == "1.0");
    CHECK(info->protocol_version == kProtocolVersion);
    CHECK(info->has_tools);
    CHECK_FALSE(info->has_prompts);
    CHECK(client.is_initialized());
    CHECK(state->opens == 1);

    REQUIRE(state->sent.size() == 2);
    CHECK(state->sent[0]["method"] == "initialize");
    CHECK(state->sent[0]["params"]["protocolVersion"] == kProtocolVersion);
    CHECK(state->sent[0]["params"]["clientInfo"]["name"] == "superagent");
    CHECK(state->sent[1]["method"] == "notifications/initialized");
    CHECK_FALSE(state->sent[1].contains("id"));
}

TEST_CASE("McpClient refuses work before initialize", "[mcp][client]") {
    McpClient client(std::make_unique<FakeMcpServer>());

    auto tools = run_sync(client.list_tools());
    REQUIRE_FALSE(tools.has_value());
    CHECK(tools.error().code() == ErrorCode::InvalidState);

    auto called = run_sync(client.call_tool("echo", {}));
    REQUIRE_FALSE(called.has_value());
    CHECK(called.error().code() == ErrorCode::InvalidState);
}

TEST_CASE("McpClient surfaces open failures", "[mcp][client]") {
    auto server = std::make_unique<FakeMcpServer>();
    server->fail_open = true;
    McpClient client(std::move(server));

    auto info = run_sync(client.initialize());
    REQUIRE_FALSE(info.has_value());
    CHECK(info.error().code() == ErrorCode::ConnectionFailed);
    CHECK_FALSE(client.is_initialized());
}

TEST_CASE("McpClient lists tools", "[mcp][client]") {
    auto server = std::make_unique<FakeMcpServer>();
    server->tools = {
        FakeMcpServer::tool("read_file", "Read a file"),
        nlohmann::json{{"description", "nameless"}},
        nlohmann::json{{"name", "ping"}},
    };
    McpClient client(std::move(server));

    boost::asio::io_context ioc;
    REQUIRE(run_sync(ioc, client.initialize()).has_value());
    auto tools = run_sync(ioc, client.list_tools());

    REQUIRE(tools.has_value());
    REQUIRE(tools->size() == 2);
    CHECK((*tools)[0].name == "read_file");
    CHECK((*tools)[0].description == "Read a file");
    CHECK((*tools)[0].parameters["type"] == "object");
    CHECK((*tools)[1].name == "ping");
    CHECK((*tools)[1].parameters["type"] == "object");
}

TEST_CASE("McpClient calls tools", "[mcp][client]") {
    auto server = std::make_unique<FakeMcpServer>();
    server->call_results["cat"] = FakeMcpServer::text_result({"a", "b"});
    server->call_results["fail"] = FakeMcpServer::text_result({"no such file"}, true);
    auto state = server->state;
    McpClient client(std::move(server));

    boost::asio::io_context ioc;
    REQUIRE(run_sync(ioc, client.initialize()).has_value());

    SECTION("text parts are joined with newlines") {
        auto result = run_sync(ioc, client.call_tool("cat", {{"path", "/tmp/x"}}));
        REQUIRE(result.has_value());
        CHECK(result->is_success());
        CHECK(result->content == "a\nb");

        const auto& sent = state->sent.back();
        CHECK(sent["method"] == "tools/call");
        CHECK(sent["params"]["name"] == "cat");
        CHECK(sent["params"]["arguments"]["path"] == "/tmp/x");
    }

    SECTION("isError becomes a failed result") {
        auto result = run_sync(ioc, client.call_tool("fail", nullptr));
        REQUIRE(result.has_value());
        CHECK_FALSE(result->is_success());
        CHECK(result->content == "no such file");
        CHECK(state->sent.back()["params"]["arguments"].is_object());
    }

    SECTION("non-text blocks make the result partial") {
        auto mixed = std::make_unique<FakeMcpServer>();
        auto shot = FakeMcpServer::text_result({"page rendered"});
        shot["content"].push_back({{"type", "image"}, {"data", "iVBOR"}, {"mimeType", "image/png"}});
        mixed->call_results["screenshot"] = shot;
        McpClient other(std::move(mixed));
        REQUIRE(run_sync(ioc, other.initialize()).has_value());

        auto result = run_sync(ioc, other.call_tool("screenshot", {}));
        REQUIRE(result.has_value());
        CHECK(result->status == agent::ToolStatus::Partial);
        CHECK_FALSE(result->is_success());
        CHECK(result->content == "page rendered");
    }

    SECTION("a dropped connection is an error") {
        auto broken = std::make_unique<FakeMcpServer>();
        broken->broken_tools = {"hang"};
        McpClient other(std::move(broken));
        REQUIRE(run_sync(ioc, other.initialize()).has_value());

        auto result = run_sync(ioc, other.call_tool("hang", {}));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == ErrorCode::ConnectionClosed);
    }
}

TEST_CASE("McpClient skips interleaved notifications", "[mcp][client]") {
    auto server = std::make_unique<FakeMcpServer>();
    server->notify_before_reply = true;
    server->tools = {FakeMcpServer::tool("echo")};
    McpClient client(std::move(server));

    boost::asio::io_context ioc;
    REQUIRE(run_sync(ioc, client.initialize()).has_value());
    auto tools = run_sync(ioc, client.list_tools());
    REQUIRE(tools.has_value());
    CHECK(tools->size() == 1);
}

TEST_CASE("McpClient maps RPC errors", "[mcp][client]") {
    auto server = std::make_unique<FakeMcpServer>();
    server->fail_list = true;
    McpClient client(std::move(server));

    boost::asio::io_context ioc;
    REQUIRE(run_sync(ioc, client.initialize()).has_value());
    auto tools = run_sync(ioc, client.list_tools());

    REQUIRE_FALSE(tools.has_value());
    CHECK(tools.error().code() == ErrorCode::ProtocolError);
    CHECK(tools.error().message().find("-32603") != std::string_view::npos);
    CHECK(tools.error().detail() == "list failed");
}

TEST_CASE("McpClient close is repeatable", "[mcp][client]") {
    auto server = std::make_unique<FakeMcpServer>();
    auto state = server->state;
    McpClient client(std::move(server));

    boost::asio::io_context ioc;
    REQUIRE(run_sync(ioc, client.initialize()).has_value());
    run_sync(ioc, client.close());
    run_sync(ioc, client.close());

    CHECK_FALSE(client.is_open());
    CHECK_FALSE(client.is_initialized());
    CHECK(state->closes == 1);
}
