#pragma once

#include <deque>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio.hpp>
#include <nlohmann/json.hpp>

#include "superagent/agent/agent.hpp"

namespace superagent::agent {

/// One item delivered to the stream consumer.
struct StreamEvent {
    enum class Kind {
        Content,
        Error,
        Done,  // Always last; payload is the finish reason name
    };

    Kind kind = Kind::Content;
    std::string payload;

    static auto content(std::string text) -> StreamEvent;
    static auto error(std::string message) -> StreamEvent;
    static auto done(std::string reason) -> StreamEvent;

    /// {"content": ...}, {"error": ...} or {"done": ...}
    [[nodiscard]] auto to_json() const -> nlohmann::json;
};

/// Drives one agent run and hands out its events one at a time.
///
/// A step is executed only when the consumer asks for an event and nothing
/// is buffered, so the run advances at the consumer's pace. Cleanup of the
/// agent runs exactly once: when the run ends, when the consumer calls
/// close(), or (scheduled on the executor) when the stream is destroyed
/// early.
class EventStream {
public:
    EventStream(boost::asio::any_io_executor executor, std::shared_ptr<Agent> agent,
                std::string prompt);
    ~EventStream();

    EventStream(const EventStream&) = delete;
    EventStream& operator=(const EventStream&) = delete;

    /// The next event, or nullopt after `done` (or after close()).
    auto next() -> boost::asio::awaitable<std::optional<StreamEvent>>;

    /// Stop early: cancel the run and clean up. Buffered events are dropped.
    auto close() -> boost::asio::awaitable<void>;

    [[nodiscard]] auto ended() const noexcept -> bool { return ended_; }
    [[nodiscard]] auto agent() const -> const std::shared_ptr<Agent>& { return agent_; }

private:
    auto pull() -> boost::asio::awaitable<void>;
    auto end(bool flush, std::optional<FinishReason> reason = std::nullopt)
        -> boost::asio::awaitable<void>;
    auto run_cleanup() -> boost::asio::awaitable<void>;

    boost::asio::any_io_executor executor_;
    std::shared_ptr<Agent> agent_;
    std::string prompt_;
    std::optional<AgentRun> run_;
    std::deque<StreamEvent> buffer_;
    bool started_ = false;
    bool ended_ = false;
    bool cleaned_ = false;
};

} // namespace superagent::agent
