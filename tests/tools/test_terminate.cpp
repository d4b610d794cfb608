#include <catch2/catch_test_macros.hpp>

#include "superagent/tools/terminate.hpp"
#include "../support/fakes.hpp"

using namespace superagent;
using superagent::testing::run_sync;
using superagent::tools::TerminateTool;

TEST_CASE("Terminate definition", "[tools][terminate]") {
    TerminateTool tool;
    auto def = tool.definition();
    CHECK(def.name == "terminate");
    CHECK(def.parameters["required"] == nlohmann::json::array({"status"}));
    CHECK(def.parameters["properties"]["status"]["type"] == "string");
    CHECK_FALSE(tool.stateful());
}

TEST_CASE("Terminate results", "[tools][terminate]") {
    TerminateTool tool;

    SECTION("success carries the sentinel") {
        auto result = run_sync(tool.execute({{"status", "success"}}));
        REQUIRE(result.has_value());
        CHECK(result->is_success());
        CHECK(result->content == R"({"status":"success"})");
    }

    SECTION("missing status defaults to success") {
        auto result = run_sync(tool.execute(nlohmann::json::object()));
        REQUIRE(result.has_value());
        CHECK(result->content == TerminateTool::kSentinel);
    }

    SECTION("a failed interaction still ends it") {
        auto result = run_sync(tool.execute({{"status", "failure"}}));
        REQUIRE(result.has_value());
        CHECK(result->is_success());
        CHECK(result->content == TerminateTool::kSentinel);
    }

    SECTION("anything else is rejected") {
        auto result = run_sync(tool.execute({{"status", "maybe"}}));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == ErrorCode::InvalidArgument);
    }
}
