#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include "superagent/cli/commands.hpp"
#include "superagent/core/config.hpp"

using json = nlohmann::json;
using superagent::cli::redact_config_json;

TEST_CASE("Config value redaction", "[cli][redaction]") {
    SECTION("Redacts the provider key") {
        json config = {{"provider", {{"name", "openai"}, {"api_key", "sk-12345"}}}};
        redact_config_json(config);
        CHECK(config["provider"]["api_key"] == "***REDACTED***");
        CHECK(config["provider"]["name"] == "openai");
    }
    SECTION("Redacts credentials in server environments") {
        json config = {{"mcp", {{"servers", json::array({
            {{"id", "github"}, {"env", {{"GITHUB_TOKEN", "ghp_abc"}, {"LOG", "1"}}}},
        })}}}};
        redact_config_json(config);
        CHECK(config["mcp"]["servers"][0]["env"]["GITHUB_TOKEN"] == "***REDACTED***");
        CHECK(config["mcp"]["servers"][0]["env"]["LOG"] == "1");
        CHECK(config["mcp"]["servers"][0]["id"] == "github");
    }
    SECTION("Leaves empty values alone") {
        json config = {{"api_key", ""}};
        redact_config_json(config);
        CHECK(config["api_key"] == "");
    }
    SECTION("Leaves non-string values alone") {
        json config = {{"token_budget", 4096}};
        redact_config_json(config);
        CHECK(config["token_budget"] == 4096);
    }
    SECTION("Redacts a serialized Config") {
        superagent::Config cfg;
        cfg.provider.api_key = "sk-live";
        json j = cfg;
        redact_config_json(j);
        CHECK(j["provider"]["api_key"] == "***REDACTED***");
        CHECK(j["agent"]["max_steps"] == cfg.agent.max_steps);
    }
}
