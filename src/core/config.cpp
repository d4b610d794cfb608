#include "superagent/core/config.hpp"
#include "superagent/core/logger.hpp"

#include <fstream>
#include <set>

namespace superagent {

namespace {

void resolve_server_refs(RemoteServerDescriptor& server) {
    server.endpoint_or_command = resolve_env_refs(server.endpoint_or_command);
    for (auto& arg : server.args) {
        arg = resolve_env_refs(arg);
    }
    for (auto& [key, value] : server.env) {
        value = resolve_env_refs(value);
    }
}

} // anonymous namespace

auto load_config(const std::filesystem::path& path) -> Config {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        json j = json::parse(file);

        // Older files keep the server table at the top level.
        if (j.contains("mcp_servers") && !j.contains("mcp")) {
            j["mcp"] = json{{"servers", j["mcp_servers"]}};
            j.erase("mcp_servers");
            LOG_DEBUG("Config: moved top-level mcp_servers under mcp.servers");
        }

        auto config = j.get<Config>();
        config.provider.api_key = resolve_env_refs(config.provider.api_key);
        for (auto& server : config.mcp.servers) {
            resolve_server_refs(server);
        }
        return config;
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return default_config();
    }
}

void apply_env_overrides(Config& config) {
    if (auto* val = std::getenv("SUPERAGENT_LOG_LEVEL")) {
        config.log_level = val;
    }
    if (auto* val = std::getenv("SUPERAGENT_MAX_STEPS")) {
        try {
            config.agent.max_steps = std::stoi(val);
        } catch (const std::exception&) {
            LOG_WARN("Ignoring invalid SUPERAGENT_MAX_STEPS: {}", val);
        }
    }
    if (auto* val = std::getenv("SUPERAGENT_MODEL")) {
        config.provider.model = val;
    }
    if (auto* val = std::getenv("OPENAI_API_KEY")) {
        if (config.provider.api_key.empty()) {
            config.provider.api_key = val;
        }
    }
    if (auto* val = std::getenv("OPENAI_BASE_URL")) {
        config.provider.base_url = val;
    }
}

auto load_config_from_env() -> Config {
    Config config;
    apply_env_overrides(config);
    return config;
}

auto default_config() -> Config {
    return Config{};
}

auto validate_config(const Config& config) -> VoidResult {
    if (config.agent.max_steps < 1) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig, "agent.max_steps must be at least 1"));
    }
    if (config.agent.max_stuck_count < 1) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig, "agent.max_stuck_count must be at least 1"));
    }

    std::set<std::string> seen;
    for (const auto& server : config.mcp.servers) {
        if (server.id.empty()) {
            return std::unexpected(make_error(
                ErrorCode::InvalidConfig, "MCP server entry without id"));
        }
        if (!seen.insert(server.id).second) {
            return std::unexpected(make_error(
                ErrorCode::InvalidConfig, "Duplicate MCP server id", server.id));
        }
        if (server.endpoint_or_command.empty()) {
            return std::unexpected(make_error(
                ErrorCode::InvalidConfig,
                "MCP server has no endpoint or command", server.id));
        }
        if (server.transport == TransportKind::Invalid) {
            return std::unexpected(make_error(
                ErrorCode::InvalidConfig,
                "MCP server has an unknown transport", server.id));
        }
    }
    if (config.mcp.connect_timeout_seconds < 1) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig, "mcp.connect_timeout_seconds must be at least 1"));
    }
    return {};
}

auto resolve_env_refs(std::string_view input) -> std::string {
    std::string result;
    result.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        // Check for $$ escape
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '$') {
            // Escaped: $${VAR} -> literal ${VAR}
            result += '$';
            i += 2;
            continue;
        }

        // Check for ${VAR} pattern
        if (i + 2 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            auto close = input.find('}', i + 2);
            if (close != std::string_view::npos) {
                auto var_name = input.substr(i + 2, close - i - 2);
                std::string var_name_str(var_name);

                if (auto* val = std::getenv(var_name_str.c_str())) {
                    result += val;
                } else {
                    // Preserve unresolved refs
                    result += input.substr(i, close - i + 1);
                    LOG_DEBUG("Config: unresolved env ref ${{{}}}", var_name);
                }
                i = close + 1;
                continue;
            }
        }

        result += input[i];
        ++i;
    }

    return result;
}

} // namespace superagent
