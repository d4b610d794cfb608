#include "superagent/agent/memory.hpp"

namespace superagent::agent {

void Memory::add(Message msg) {
    messages_.push_back(std::move(msg));
    if (max_messages_ > 0) {
        while (messages_.size() > max_messages_) {
            messages_.pop_front();
        }
    }
}

auto Memory::messages() const -> std::vector<Message> {
    return {messages_.begin(), messages_.end()};
}

auto Memory::recent(std::size_t n) const -> std::vector<Message> {
    auto start = messages_.size() > n ? messages_.size() - n : 0;
    return {messages_.begin() + static_cast<std::ptrdiff_t>(start), messages_.end()};
}

auto Memory::last_assistant() const -> const Message* {
    for (auto it = messages_.rbegin(); it != messages_.rend(); ++it) {
        if (it->role == Role::Assistant) {
            return &*it;
        }
    }
    return nullptr;
}

auto Memory::last() const -> const Message* {
    if (messages_.empty()) {
        return nullptr;
    }
    return &messages_.back();
}

auto Memory::content_size() const -> std::size_t {
    std::size_t total = 0;
    for (const auto& msg : messages_) {
        total += msg.content.size();
        for (const auto& call : msg.tool_calls) {
            total += call.name.size() + call.arguments.dump().size();
        }
    }
    return total;
}

} // namespace superagent::agent
