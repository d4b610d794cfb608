#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "superagent/core/error.hpp"
#include "superagent/core/types.hpp"

// std::optional serializer for nlohmann/json; enables NLOHMANN_DEFINE macros
// to work with optional fields via j.value("key", default_val)
namespace nlohmann {
template <typename T>
struct adl_serializer<std::optional<T>> {
    static void to_json(json& j, const std::optional<T>& opt) {
        if (opt.has_value()) {
            j = *opt;
        } else {
            j = nullptr;
        }
    }

    static void from_json(const json& j, std::optional<T>& opt) {
        if (j.is_null()) {
            opt = std::nullopt;
        } else {
            opt = j.get<T>();
        }
    }
};
} // namespace nlohmann

namespace superagent {

/// Limits and prompts for one agent instance. Fixed at construction.
struct AgentConfig {
    int max_steps = 10;
    int max_stuck_count = 3;
    size_t max_observe = 10000;        // Tool output ceiling in bytes (0 = unlimited)
    size_t max_context_chars = 0;      // Conversation budget (0 = unlimited)
    size_t max_messages = 100;         // Memory cap, oldest dropped first (0 = unlimited)
    std::vector<std::string> special_tool_names = {"terminate"};
    std::optional<std::string> system_prompt;
    std::optional<std::string> next_step_prompt;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(AgentConfig, max_steps, max_stuck_count, max_observe, max_context_chars, max_messages, special_tool_names, system_prompt, next_step_prompt)

struct ProviderConfig {
    std::string name = "openai";
    std::string api_key;
    std::optional<std::string> base_url;
    std::optional<std::string> model;
    std::optional<double> temperature;
    std::optional<int> max_tokens;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ProviderConfig, name, api_key, base_url, model, temperature, max_tokens)

enum class TransportKind {
    Invalid,  // Unrecognised name in the config; rejected by validate_config
    Stream,   // Long-lived WebSocket session
    Process,  // Spawned child speaking over stdin/stdout
};

// "sse" and "stdio" are accepted as aliases on input. Any other name maps to
// the first entry.
NLOHMANN_JSON_SERIALIZE_ENUM(TransportKind, {
    {TransportKind::Invalid, nullptr},
    {TransportKind::Stream, "stream"},
    {TransportKind::Process, "process"},
    {TransportKind::Stream, "sse"},
    {TransportKind::Process, "stdio"},
})

struct RemoteServerDescriptor {
    std::string id;
    TransportKind transport = TransportKind::Process;
    std::string endpoint_or_command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(RemoteServerDescriptor, id, transport, endpoint_or_command, args, env)

struct McpConfig {
    std::vector<RemoteServerDescriptor> servers;
    int connect_timeout_seconds = 30;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(McpConfig, servers, connect_timeout_seconds)

struct Config {
    AgentConfig agent;
    ProviderConfig provider;
    McpConfig mcp;
    std::string log_level = "info";
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, agent, provider, mcp, log_level)

auto load_config(const std::filesystem::path& path) -> Config;
auto load_config_from_env() -> Config;
auto default_config() -> Config;

/// Apply environment overrides on top of an existing configuration.
void apply_env_overrides(Config& config);

/// Check the limits and server table for values the agent cannot run with.
auto validate_config(const Config& config) -> VoidResult;

/// Resolves `${VAR}` environment variable references in a string.
/// Supports `$${VAR}` escape (literal `${VAR}`).
auto resolve_env_refs(std::string_view input) -> std::string;

} // namespace superagent
