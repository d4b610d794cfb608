#pragma once

#include <cstddef>
#include <deque>
#include <vector>

#include "superagent/core/types.hpp"

namespace superagent::agent {

/// Append-only conversation history owned by a single agent.
///
/// Entries are never edited once added. When `max_messages` is non-zero the
/// oldest entries are dropped from the front to stay within the cap.
class Memory {
public:
    explicit Memory(std::size_t max_messages = 0) : max_messages_(max_messages) {}

    void add(Message msg);

    [[nodiscard]] auto messages() const -> std::vector<Message>;

    /// The last `n` entries (fewer if the history is shorter).
    [[nodiscard]] auto recent(std::size_t n) const -> std::vector<Message>;

    /// Most recent assistant entry, or nullptr.
    [[nodiscard]] auto last_assistant() const -> const Message*;

    /// Most recent entry, or nullptr when empty.
    [[nodiscard]] auto last() const -> const Message*;

    /// Total characters of content and tool-call arguments held.
    [[nodiscard]] auto content_size() const -> std::size_t;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return messages_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return messages_.empty(); }

private:
    std::deque<Message> messages_;
    std::size_t max_messages_;
};

} // namespace superagent::agent
