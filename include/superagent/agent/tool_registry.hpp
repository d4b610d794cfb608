#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <boost/asio.hpp>

#include "superagent/agent/tool.hpp"
#include "superagent/core/error.hpp"

namespace superagent::agent {

/// Ordered collection of the tools available to one agent.
///
/// Enumeration order is insertion order, so the tool catalogue sent to the
/// model is reproducible. Names are unique: adding a name that is already
/// present replaces that entry in place and keeps its position.
///
/// Each entry carries an owner tag. Local tools have an empty owner; tools
/// advertised by a remote server carry the server id, which is how a
/// disconnect evicts exactly that server's tools.
class ToolRegistry {
public:
    /// Read-only view of one registry entry.
    struct Entry {
        std::string name;
        std::string owner;
        const Tool* tool = nullptr;
    };

    using Predicate = std::function<bool(const Entry&)>;

    ToolRegistry() = default;
    ~ToolRegistry() = default;

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;
    ToolRegistry(ToolRegistry&&) = default;
    ToolRegistry& operator=(ToolRegistry&&) = default;

    /// Register a tool under `owner` (empty for local tools). The registry
    /// takes ownership.
    void add_tool(std::unique_ptr<Tool> tool, std::string owner = {});

    /// Register several local tools in order.
    template <typename... Tools>
    void add_tools(std::unique_ptr<Tools>... tools) {
        (add_tool(std::move(tools)), ...);
    }

    /// Look up a tool by name. Returns nullptr if not found.
    [[nodiscard]] auto lookup(std::string_view name) -> Tool*;
    [[nodiscard]] auto lookup(std::string_view name) const -> const Tool*;

    /// Owner tag of a registered tool, or nullopt if the name is unknown.
    [[nodiscard]] auto owner_of(std::string_view name) const -> std::optional<std::string>;

    /// Definitions of all tools, in insertion order.
    [[nodiscard]] auto list_specs() const -> std::vector<ToolDefinition>;

    /// Registered names, in insertion order.
    [[nodiscard]] auto names() const -> std::vector<std::string>;

    /// Definitions in OpenAI function tool format, in insertion order.
    [[nodiscard]] auto to_openai_json() const -> std::vector<json>;

    /// Execute a tool by name. Unknown names fail with ToolNotFound.
    auto execute(std::string_view name, json arguments)
        -> boost::asio::awaitable<Result<ToolResult>>;

    /// Remove every entry matching `pred`. Returns the number removed.
    auto remove_tools(const Predicate& pred) -> std::size_t;

    /// Remove the tools owned by `owner`. Local tools are never matched.
    auto remove_by_owner(std::string_view owner) -> std::size_t;

    /// Remove every remote-owned tool, keeping local ones.
    auto remove_remote() -> std::size_t;

    /// Remove a tool by name. Returns true if the tool was found and removed.
    auto remove(std::string_view name) -> bool;

    [[nodiscard]] auto size() const noexcept -> std::size_t;
    [[nodiscard]] auto contains(std::string_view name) const -> bool;

    /// Tools reporting `stateful()`, in insertion order.
    [[nodiscard]] auto stateful_tools() -> std::vector<Tool*>;

private:
    struct Slot {
        std::string name;
        std::string owner;
        std::unique_ptr<Tool> tool;
    };

    void reindex();

    std::vector<Slot> slots_;
    std::unordered_map<std::string, std::size_t> index_;
};

} // namespace superagent::agent
