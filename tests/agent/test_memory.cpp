#include <catch2/catch_test_macros.hpp>

#include "superagent/agent/memory.hpp"

using superagent::Message;
using superagent::Role;
using superagent::agent::Memory;

TEST_CASE("Memory appends in order", "[agent][memory]") {
    Memory mem;
    CHECK(mem.empty());
    CHECK(mem.last() == nullptr);
    CHECK(mem.last_assistant() == nullptr);

    mem.add(Message::user("hi"));
    mem.add(Message::assistant("thinking", {{"c1", "search", {{"q", "x"}}}}));
    mem.add(Message::tool("result", "c1", "search"));

    REQUIRE(mem.size() == 3);
    auto all = mem.messages();
    CHECK(all[0].role == Role::User);
    CHECK(all[1].role == Role::Assistant);
    CHECK(all[2].role == Role::Tool);
    CHECK(all[2].tool_call_id == "c1");

    REQUIRE(mem.last_assistant() != nullptr);
    CHECK(mem.last_assistant()->content == "thinking");
    CHECK(mem.last()->content == "result");
}

TEST_CASE("Memory recent returns the tail", "[agent][memory]") {
    Memory mem;
    for (int i = 0; i < 5; ++i) {
        mem.add(Message::user(std::to_string(i)));
    }

    auto tail = mem.recent(3);
    REQUIRE(tail.size() == 3);
    CHECK(tail[0].content == "2");
    CHECK(tail[2].content == "4");

    CHECK(mem.recent(10).size() == 5);
}

TEST_CASE("Memory drops oldest entries over the cap", "[agent][memory]") {
    Memory mem(2);
    mem.add(Message::user("a"));
    mem.add(Message::user("b"));
    mem.add(Message::user("c"));

    REQUIRE(mem.size() == 2);
    CHECK(mem.messages()[0].content == "b");
}

TEST_CASE("Memory content_size counts content and arguments", "[agent][memory]") {
    Memory mem;
    mem.add(Message::user("abcd"));
    CHECK(mem.content_size() == 4);

    mem.add(Message::assistant("", {{"c1", "t", {{"k", 1}}}}));
    // "t" + {"k":1}
    CHECK(mem.content_size() == 4 + 1 + 7);
}

TEST_CASE("Message serializes to the wire shape", "[agent][memory]") {
    auto msg = Message::assistant("ok", {{"c1", "terminate", {{"status", "success"}}}});
    nlohmann::json j = msg;

    CHECK(j["role"] == "assistant");
    CHECK(j["content"] == "ok");
    REQUIRE(j["tool_calls"].size() == 1);
    CHECK(j["tool_calls"][0]["name"] == "terminate");
    CHECK(j["tool_calls"][0]["arguments"]["status"] == "success");
}
