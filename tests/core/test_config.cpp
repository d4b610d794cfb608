#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "superagent/core/config.hpp"

namespace {

// RAII helper: writes a temporary config file and removes it on destruction.
struct TmpConfigFile {
    std::filesystem::path path;

    TmpConfigFile(const std::string& name, const std::string& content)
        : path(std::filesystem::temp_directory_path() / name) {
        std::ofstream out(path);
        out << content;
    }

    ~TmpConfigFile() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }
};

} // anonymous namespace

TEST_CASE("default_config returns sane defaults", "[config]") {
    auto cfg = superagent::default_config();

    SECTION("agent defaults") {
        CHECK(cfg.agent.max_steps == 10);
        CHECK(cfg.agent.max_stuck_count == 3);
        CHECK(cfg.agent.max_observe == 10000);
        CHECK(cfg.agent.max_context_chars == 0);
        CHECK(cfg.agent.special_tool_names == std::vector<std::string>{"terminate"});
        CHECK_FALSE(cfg.agent.system_prompt.has_value());
    }

    SECTION("provider defaults") {
        CHECK(cfg.provider.name == "openai");
        CHECK(cfg.provider.api_key.empty());
        CHECK_FALSE(cfg.provider.model.has_value());
    }

    SECTION("no remote servers by default") {
        CHECK(cfg.mcp.servers.empty());
        CHECK(cfg.mcp.connect_timeout_seconds == 30);
        CHECK(cfg.log_level == "info");
    }
}

TEST_CASE("load_config parses JSON file correctly", "[config]") {
    TmpConfigFile file("superagent_test_config.json", R"({
        "agent": {"max_steps": 20, "max_observe": 500},
        "log_level": "debug",
        "provider": {"model": "gpt-4o-mini", "base_url": "http://localhost:8080/v1"},
        "mcp": {
            "servers": [
                {"id": "files", "transport": "stdio", "endpoint_or_command": "mcp-files",
                 "args": ["--root", "/tmp"]},
                {"id": "search", "transport": "sse", "endpoint_or_command": "ws://127.0.0.1:9000/mcp"}
            ]
        }
    })");

    auto cfg = superagent::load_config(file.path);

    CHECK(cfg.agent.max_steps == 20);
    CHECK(cfg.agent.max_observe == 500);
    CHECK(cfg.agent.max_stuck_count == 3);  // Not specified, keeps default
    CHECK(cfg.log_level == "debug");
    CHECK(cfg.provider.model == "gpt-4o-mini");

    REQUIRE(cfg.mcp.servers.size() == 2);
    CHECK(cfg.mcp.servers[0].id == "files");
    CHECK(cfg.mcp.servers[0].transport == superagent::TransportKind::Process);
    CHECK(cfg.mcp.servers[0].args == std::vector<std::string>{"--root", "/tmp"});
    CHECK(cfg.mcp.servers[1].transport == superagent::TransportKind::Stream);
}

TEST_CASE("load_config accepts a top-level mcp_servers table", "[config]") {
    TmpConfigFile file("superagent_test_legacy.json", R"({
        "mcp_servers": [
            {"id": "git", "transport": "process", "endpoint_or_command": "mcp-git"}
        ]
    })");

    auto cfg = superagent::load_config(file.path);

    REQUIRE(cfg.mcp.servers.size() == 1);
    CHECK(cfg.mcp.servers[0].id == "git");
}

TEST_CASE("load_config keeps a misspelled transport detectable", "[config]") {
    TmpConfigFile file("superagent_test_transport.json", R"({
        "mcp": {"servers": [
            {"id": "typo", "transport": "proces", "endpoint_or_command": "mcp-git"},
            {"id": "plain", "endpoint_or_command": "mcp-files"}
        ]}
    })");

    auto cfg = superagent::load_config(file.path);

    REQUIRE(cfg.mcp.servers.size() == 2);
    CHECK(cfg.mcp.servers[0].transport == superagent::TransportKind::Invalid);
    CHECK(cfg.mcp.servers[1].transport == superagent::TransportKind::Process);

    auto valid = superagent::validate_config(cfg);
    REQUIRE_FALSE(valid.has_value());
    CHECK(valid.error().code() == superagent::ErrorCode::InvalidConfig);
    CHECK(valid.error().detail() == "typo");
}

TEST_CASE("load_config expands environment references in servers", "[config]") {
    ::setenv("SUPERAGENT_TEST_TOKEN", "s3cret", 1);
    TmpConfigFile file("superagent_test_env.json", R"({
        "provider": {"api_key": "${SUPERAGENT_TEST_TOKEN}"},
        "mcp": {"servers": [
            {"id": "gh", "endpoint_or_command": "mcp-github",
             "args": ["--token=${SUPERAGENT_TEST_TOKEN}"],
             "env": {"GH_TOKEN": "${SUPERAGENT_TEST_TOKEN}"}}
        ]}
    })");

    auto cfg = superagent::load_config(file.path);
    ::unsetenv("SUPERAGENT_TEST_TOKEN");

    CHECK(cfg.provider.api_key == "s3cret");
    REQUIRE(cfg.mcp.servers.size() == 1);
    CHECK(cfg.mcp.servers[0].args[0] == "--token=s3cret");
    CHECK(cfg.mcp.servers[0].env.at("GH_TOKEN") == "s3cret");
}

TEST_CASE("load_config returns defaults for missing or malformed file", "[config]") {
    SECTION("missing") {
        auto cfg = superagent::load_config("/nonexistent/path/config.json");
        CHECK(cfg.agent.max_steps == 10);
        CHECK(cfg.log_level == "info");
    }

    SECTION("malformed") {
        TmpConfigFile file("superagent_test_bad.json", "{ not json");
        auto cfg = superagent::load_config(file.path);
        CHECK(cfg.agent.max_steps == 10);
    }
}

TEST_CASE("load_config_from_env reads environment variables", "[config]") {
    ::setenv("SUPERAGENT_LOG_LEVEL", "trace", 1);
    ::setenv("SUPERAGENT_MAX_STEPS", "7", 1);
    ::setenv("SUPERAGENT_MODEL", "local-model", 1);

    auto cfg = superagent::load_config_from_env();

    CHECK(cfg.log_level == "trace");
    CHECK(cfg.agent.max_steps == 7);
    CHECK(cfg.provider.model == "local-model");

    ::unsetenv("SUPERAGENT_LOG_LEVEL");
    ::unsetenv("SUPERAGENT_MAX_STEPS");
    ::unsetenv("SUPERAGENT_MODEL");
}

TEST_CASE("resolve_env_refs expands and escapes", "[config]") {
    ::setenv("SUPERAGENT_TEST_HOME", "/home/agent", 1);

    CHECK(superagent::resolve_env_refs("${SUPERAGENT_TEST_HOME}/bin") == "/home/agent/bin");
    CHECK(superagent::resolve_env_refs("$${SUPERAGENT_TEST_HOME}") == "${SUPERAGENT_TEST_HOME}");
    CHECK(superagent::resolve_env_refs("plain") == "plain");

    ::unsetenv("SUPERAGENT_TEST_HOME");
}

TEST_CASE("validate_config rejects unusable settings", "[config]") {
    auto cfg = superagent::default_config();
    REQUIRE(superagent::validate_config(cfg).has_value());

    SECTION("zero step budget") {
        cfg.agent.max_steps = 0;
        auto r = superagent::validate_config(cfg);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == superagent::ErrorCode::InvalidConfig);
    }

    SECTION("zero stuck threshold") {
        cfg.agent.max_stuck_count = 0;
        CHECK_FALSE(superagent::validate_config(cfg).has_value());
    }

    SECTION("duplicate server ids") {
        superagent::RemoteServerDescriptor a;
        a.id = "dup";
        a.endpoint_or_command = "one";
        auto b = a;
        b.endpoint_or_command = "two";
        cfg.mcp.servers = {a, b};
        CHECK_FALSE(superagent::validate_config(cfg).has_value());
    }

    SECTION("server without endpoint") {
        superagent::RemoteServerDescriptor a;
        a.id = "empty";
        cfg.mcp.servers = {a};
        CHECK_FALSE(superagent::validate_config(cfg).has_value());
    }

    SECTION("unknown transport") {
        superagent::RemoteServerDescriptor a;
        a.id = "odd";
        a.transport = superagent::TransportKind::Invalid;
        a.endpoint_or_command = "mcp-odd";
        cfg.mcp.servers = {a};
        CHECK_FALSE(superagent::validate_config(cfg).has_value());
    }

    SECTION("zero connect timeout") {
        cfg.mcp.connect_timeout_seconds = 0;
        CHECK_FALSE(superagent::validate_config(cfg).has_value());
    }
}

TEST_CASE("Config round-trips through JSON", "[config]") {
    superagent::Config cfg;
    cfg.agent.max_steps = 4;
    cfg.log_level = "warn";
    cfg.agent.special_tool_names = {"terminate", "finish"};

    superagent::json j = cfg;
    auto restored = j.get<superagent::Config>();

    CHECK(restored.agent.max_steps == 4);
    CHECK(restored.log_level == "warn");
    CHECK(restored.agent.special_tool_names.size() == 2);
    CHECK(restored.agent.max_stuck_count == 3);
}
