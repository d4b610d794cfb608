#include "superagent/agent/tool_registry.hpp"

#include "superagent/core/logger.hpp"

namespace superagent::agent {

void ToolRegistry::add_tool(std::unique_ptr<Tool> tool, std::string owner) {
    if (!tool) {
        LOG_WARN("Attempted to register a null tool");
        return;
    }

    auto name = tool->definition().name;

    if (auto it = index_.find(name); it != index_.end()) {
        auto& slot = slots_[it->second];
        if (slot.owner != owner) {
            // Last write wins; make the shadowing visible.
            LOG_WARN("Tool name collision: '{}' from {} replaces the one from {}",
                     name,
                     owner.empty() ? "local" : "server '" + owner + "'",
                     slot.owner.empty() ? "local" : "server '" + slot.owner + "'");
        } else {
            LOG_DEBUG("Replacing existing tool: {}", name);
        }
        slot.owner = std::move(owner);
        slot.tool = std::move(tool);
        return;
    }

    LOG_DEBUG("Registered tool: {}{}", name,
              owner.empty() ? "" : " (server '" + owner + "')");
    index_.emplace(name, slots_.size());
    slots_.push_back(Slot{std::move(name), std::move(owner), std::move(tool)});
}

auto ToolRegistry::lookup(std::string_view name) -> Tool* {
    auto it = index_.find(std::string(name));
    if (it != index_.end()) {
        return slots_[it->second].tool.get();
    }
    return nullptr;
}

auto ToolRegistry::lookup(std::string_view name) const -> const Tool* {
    auto it = index_.find(std::string(name));
    if (it != index_.end()) {
        return slots_[it->second].tool.get();
    }
    return nullptr;
}

auto ToolRegistry::owner_of(std::string_view name) const -> std::optional<std::string> {
    auto it = index_.find(std::string(name));
    if (it == index_.end()) {
        return std::nullopt;
    }
    return slots_[it->second].owner;
}

auto ToolRegistry::list_specs() const -> std::vector<ToolDefinition> {
    std::vector<ToolDefinition> defs;
    defs.reserve(slots_.size());

    for (const auto& slot : slots_) {
        defs.push_back(slot.tool->definition());
    }

    return defs;
}

auto ToolRegistry::names() const -> std::vector<std::string> {
    std::vector<std::string> result;
    result.reserve(slots_.size());

    for (const auto& slot : slots_) {
        result.push_back(slot.name);
    }

    return result;
}

auto ToolRegistry::to_openai_json() const -> std::vector<json> {
    std::vector<json> result;
    result.reserve(slots_.size());

    for (const auto& slot : slots_) {
        result.push_back(slot.tool->definition().to_openai_json());
    }

    return result;
}

auto ToolRegistry::execute(std::string_view name, json arguments)
    -> boost::asio::awaitable<Result<ToolResult>> {

    auto* tool = lookup(name);
    if (!tool) {
        co_return make_fail(make_error(
            ErrorCode::ToolNotFound,
            "Tool not found",
            std::string(name)));
    }

    LOG_DEBUG("Executing tool: {} with arguments: {}", name, arguments.dump());

    auto result = co_await tool->execute(std::move(arguments));

    if (result.has_value()) {
        LOG_DEBUG("Tool {} executed ({})", name, json(result->status).get<std::string>());
    } else {
        LOG_WARN("Tool {} execution failed: {}", name, result.error().what());
    }

    co_return result;
}

auto ToolRegistry::remove_tools(const Predicate& pred) -> std::size_t {
    auto before = slots_.size();

    std::erase_if(slots_, [&pred](const Slot& slot) {
        return pred(Entry{slot.name, slot.owner, slot.tool.get()});
    });

    auto removed = before - slots_.size();
    if (removed > 0) {
        reindex();
        LOG_DEBUG("Removed {} tool(s)", removed);
    }
    return removed;
}

auto ToolRegistry::remove_by_owner(std::string_view owner) -> std::size_t {
    if (owner.empty()) {
        return 0;
    }
    return remove_tools([owner](const Entry& e) { return e.owner == owner; });
}

auto ToolRegistry::remove_remote() -> std::size_t {
    return remove_tools([](const Entry& e) { return !e.owner.empty(); });
}

auto ToolRegistry::remove(std::string_view name) -> bool {
    return remove_tools([name](const Entry& e) { return e.name == name; }) > 0;
}

auto ToolRegistry::size() const noexcept -> std::size_t {
    return slots_.size();
}

auto ToolRegistry::contains(std::string_view name) const -> bool {
    return index_.contains(std::string(name));
}

auto ToolRegistry::stateful_tools() -> std::vector<Tool*> {
    std::vector<Tool*> result;
    for (auto& slot : slots_) {
        if (slot.tool->stateful()) {
            result.push_back(slot.tool.get());
        }
    }
    return result;
}

void ToolRegistry::reindex() {
    index_.clear();
    for (std::size_t i = 0; i < slots_.size(); ++i) {
        index_.emplace(slots_[i].name, i);
    }
}

} // namespace superagent::agent
