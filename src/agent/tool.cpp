#include "superagent/agent/tool.hpp"

namespace superagent::agent {

auto ToolDefinition::from_parameters(std::string name, std::string description,
                                     const std::vector<ToolParameter>& params)
    -> ToolDefinition {
    json schema;
    schema["type"] = "object";

    json properties = json::object();
    json required_params = json::array();

    for (const auto& param : params) {
        json prop;
        prop["type"] = param.type;
        prop["description"] = param.description;

        if (param.default_value.has_value()) {
            prop["default"] = *param.default_value;
        }
        if (param.enum_values.has_value()) {
            prop["enum"] = *param.enum_values;
        }

        properties[param.name] = prop;

        if (param.required) {
            required_params.push_back(param.name);
        }
    }

    schema["properties"] = properties;
    if (!required_params.empty()) {
        schema["required"] = required_params;
    }

    return ToolDefinition{
        .name = std::move(name),
        .description = std::move(description),
        .parameters = std::move(schema),
    };
}

auto ToolDefinition::to_json() const -> json {
    return json{
        {"name", name},
        {"description", description},
        {"parameters", parameters},
    };
}

auto ToolDefinition::to_openai_json() const -> json {
    // {
    //   "type": "function",
    //   "function": { "name": "...", "description": "...", "parameters": {...} }
    // }
    json j;
    j["type"] = "function";
    j["function"] = to_json();
    return j;
}

auto ToolResult::success(std::string content) -> ToolResult {
    return ToolResult{std::move(content), ToolStatus::Success};
}

auto ToolResult::failure(std::string content) -> ToolResult {
    return ToolResult{std::move(content), ToolStatus::Failure};
}

auto ToolResult::partial(std::string content) -> ToolResult {
    return ToolResult{std::move(content), ToolStatus::Partial};
}

auto Tool::context_prompt(std::string base_prompt) -> awaitable<Result<std::string>> {
    co_return base_prompt;
}

auto Tool::release() -> awaitable<void> {
    co_return;
}

} // namespace superagent::agent
