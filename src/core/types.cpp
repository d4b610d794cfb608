#include "superagent/core/types.hpp"
#include "superagent/core/utils.hpp"

namespace superagent {

void to_json(json& j, const ToolCall& c) {
    j = json{{"name", c.name}, {"arguments", c.arguments}};
    if (!c.id.empty()) j["id"] = c.id;
}

void from_json(const json& j, ToolCall& c) {
    j.at("name").get_to(c.name);
    c.id = j.value("id", "");
    c.arguments = j.value("arguments", json::object());
}

auto Message::user(std::string content) -> Message {
    Message m;
    m.id = utils::generate_id();
    m.role = Role::User;
    m.content = std::move(content);
    m.created_at = Clock::now();
    return m;
}

auto Message::system(std::string content) -> Message {
    Message m;
    m.id = utils::generate_id();
    m.role = Role::System;
    m.content = std::move(content);
    m.created_at = Clock::now();
    return m;
}

auto Message::assistant(std::string content, std::vector<ToolCall> calls) -> Message {
    Message m;
    m.id = utils::generate_id();
    m.role = Role::Assistant;
    m.content = std::move(content);
    m.tool_calls = std::move(calls);
    m.created_at = Clock::now();
    return m;
}

auto Message::tool(std::string content, std::string tool_call_id, std::string name) -> Message {
    Message m;
    m.id = utils::generate_id();
    m.role = Role::Tool;
    m.content = std::move(content);
    m.tool_call_id = std::move(tool_call_id);
    m.name = std::move(name);
    m.created_at = Clock::now();
    return m;
}

void to_json(json& j, const Message& m) {
    j = json{
        {"role", m.role},
        {"content", m.content},
        {"tool_calls", m.tool_calls},
    };
    if (m.tool_call_id) j["tool_call_id"] = *m.tool_call_id;
    if (m.name) j["name"] = *m.name;
}

void from_json(const json& j, Message& m) {
    j.at("role").get_to(m.role);
    if (j.contains("content") && j["content"].is_string()) {
        j.at("content").get_to(m.content);
    }
    if (j.contains("tool_calls") && j["tool_calls"].is_array()) {
        j.at("tool_calls").get_to(m.tool_calls);
    }
    if (j.contains("tool_call_id")) m.tool_call_id = j.at("tool_call_id").get<std::string>();
    if (j.contains("name")) m.name = j.at("name").get<std::string>();
    m.id = j.value("id", utils::generate_id());
    m.created_at = Clock::now();
}

} // namespace superagent
