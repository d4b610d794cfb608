#include <catch2/catch_test_macros.hpp>

#include "superagent/mcp/jsonrpc.hpp"

using namespace superagent;
using namespace superagent::mcp::jsonrpc;

TEST_CASE("Requests and notifications", "[mcp][jsonrpc]") {
    auto req = make_request(7, "tools/list");
    CHECK(req["jsonrpc"] == "2.0");
    CHECK(req["id"] == 7);
    CHECK(req["method"] == "tools/list");
    CHECK_FALSE(req.contains("params"));

    auto with_params = make_request(8, "tools/call", {{"name", "echo"}});
    CHECK(with_params["params"]["name"] == "echo");

    auto note = make_notification("notifications/initialized");
    CHECK_FALSE(note.contains("id"));
    CHECK(note["method"] == "notifications/initialized");
}

TEST_CASE("Parsing a result", "[mcp][jsonrpc]") {
    auto resp = parse_response({{"jsonrpc", "2.0"}, {"id", 3}, {"result", {{"ok", true}}}});
    REQUIRE(resp.has_value());
    CHECK(resp->is_success());
    CHECK(resp->answers(3));
    CHECK_FALSE(resp->answers(4));
    CHECK((*resp->result)["ok"] == true);
}

TEST_CASE("Parsing an error", "[mcp][jsonrpc]") {
    auto resp = parse_response({
        {"jsonrpc", "2.0"}, {"id", 1},
        {"error", {{"code", -32601}, {"message", "Method not found"}}},
    });
    REQUIRE(resp.has_value());
    CHECK_FALSE(resp->is_success());
    REQUIRE(resp->error.has_value());
    CHECK(resp->error->code == -32601);
    CHECK(resp->error->message == "Method not found");
}

TEST_CASE("Notifications and server requests never answer", "[mcp][jsonrpc]") {
    auto note = parse_response({{"jsonrpc", "2.0"}, {"method", "notifications/progress"}});
    REQUIRE(note.has_value());
    CHECK(note->is_notification());
    CHECK_FALSE(note->answers(1));

    // A server-initiated request that happens to reuse our id.
    auto ping = parse_response({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "ping"}});
    REQUIRE(ping.has_value());
    CHECK_FALSE(ping->is_notification());
    CHECK_FALSE(ping->answers(1));
}

TEST_CASE("Malformed messages are protocol errors", "[mcp][jsonrpc]") {
    auto wrong_version = parse_response({{"jsonrpc", "1.0"}, {"id", 1}, {"result", 1}});
    REQUIRE_FALSE(wrong_version.has_value());
    CHECK(wrong_version.error().code() == ErrorCode::ProtocolError);

    auto empty = parse_response({{"jsonrpc", "2.0"}, {"id", 1}});
    REQUIRE_FALSE(empty.has_value());
    CHECK(empty.error().code() == ErrorCode::ProtocolError);

    CHECK_FALSE(parse_response(nlohmann::json::array()).has_value());
}
