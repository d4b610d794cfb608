#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio.hpp>
#include <nlohmann/json.hpp>

#include "superagent/core/error.hpp"

namespace superagent::agent {

using json = nlohmann::json;
using boost::asio::awaitable;

/// Describes a single parameter for a locally defined tool.
struct ToolParameter {
    std::string name;
    std::string type;         // JSON Schema type: "string", "number", "boolean", "object", "array"
    std::string description;
    bool required = true;
    std::optional<json> default_value;
    std::optional<std::vector<std::string>> enum_values;
};

/// Name, description and JSON-schema parameters of a tool, as shown to the model.
struct ToolDefinition {
    std::string name;
    std::string description;
    json parameters = json{{"type", "object"}, {"properties", json::object()}};

    /// Build a definition whose schema is generated from a parameter list.
    static auto from_parameters(std::string name, std::string description,
                                const std::vector<ToolParameter>& params) -> ToolDefinition;

    /// {"name", "description", "parameters"}
    [[nodiscard]] auto to_json() const -> json;

    /// OpenAI function tool format.
    [[nodiscard]] auto to_openai_json() const -> json;
};

enum class ToolStatus {
    Success,
    Failure,
    Partial,
};

NLOHMANN_JSON_SERIALIZE_ENUM(ToolStatus, {
    {ToolStatus::Success, "success"},
    {ToolStatus::Failure, "failure"},
    {ToolStatus::Partial, "partial"},
})

/// Outcome of a tool execution. `status` is the machine-readable signal;
/// `content` is what the model gets to read.
struct ToolResult {
    std::string content;
    ToolStatus status = ToolStatus::Success;

    static auto success(std::string content) -> ToolResult;
    static auto failure(std::string content) -> ToolResult;
    static auto partial(std::string content) -> ToolResult;

    [[nodiscard]] auto is_success() const noexcept -> bool {
        return status == ToolStatus::Success;
    }
};

/// Abstract base class for tools that can be invoked by the agent.
///
/// Local tools and remote proxies share this interface, so the agent never
/// needs to know where a tool runs. Tools that hold a live session (an
/// interactive browser, a shell) report `stateful()` and may contribute
/// extra prompt context while they are in use.
class Tool {
public:
    virtual ~Tool() = default;

    /// Return the tool's definition for registration and provider communication.
    [[nodiscard]] virtual auto definition() const -> ToolDefinition = 0;

    /// Execute the tool with the given arguments.
    virtual auto execute(json arguments) -> awaitable<Result<ToolResult>> = 0;

    /// True for tools that keep resources alive between calls.
    [[nodiscard]] virtual auto stateful() const -> bool { return false; }

    /// Produce the next-step prompt to use while this tool is in use.
    /// The default returns `base_prompt` unchanged.
    virtual auto context_prompt(std::string base_prompt) -> awaitable<Result<std::string>>;

    /// Release any resources held between calls. Must be safe to call repeatedly.
    virtual auto release() -> awaitable<void>;
};

} // namespace superagent::agent
