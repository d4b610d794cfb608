#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace superagent {

using json = nlohmann::json;
using Clock = std::chrono::system_clock;
using Timestamp = std::chrono::time_point<Clock>;

enum class Role {
    User,
    Assistant,
    System,
    Tool,
};

NLOHMANN_JSON_SERIALIZE_ENUM(Role, {
    {Role::User, "user"},
    {Role::Assistant, "assistant"},
    {Role::System, "system"},
    {Role::Tool, "tool"},
})

/// A single tool invocation requested by the model.
struct ToolCall {
    std::string id;
    std::string name;
    json arguments = json::object();
};

void to_json(json& j, const ToolCall& c);
void from_json(const json& j, ToolCall& c);

/// One conversation entry. Never modified after it is added to memory.
struct Message {
    std::string id;
    Role role = Role::User;
    std::string content;
    std::vector<ToolCall> tool_calls;
    std::optional<std::string> tool_call_id;  // Tool messages: the call answered
    std::optional<std::string> name;          // Tool messages: the tool name
    Timestamp created_at;

    [[nodiscard]] auto has_tool_calls() const noexcept -> bool {
        return !tool_calls.empty();
    }

    static auto user(std::string content) -> Message;
    static auto system(std::string content) -> Message;
    static auto assistant(std::string content, std::vector<ToolCall> calls = {}) -> Message;
    static auto tool(std::string content, std::string tool_call_id, std::string name) -> Message;
};

void to_json(json& j, const Message& m);
void from_json(const json& j, Message& m);

} // namespace superagent
