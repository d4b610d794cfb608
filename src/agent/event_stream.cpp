#include "superagent/agent/event_stream.hpp"

#include <exception>

#include "superagent/core/logger.hpp"

namespace superagent::agent {

auto StreamEvent::content(std::string text) -> StreamEvent {
    return StreamEvent{Kind::Content, std::move(text)};
}

auto StreamEvent::error(std::string message) -> StreamEvent {
    return StreamEvent{Kind::Error, std::move(message)};
}

auto StreamEvent::done(std::string reason) -> StreamEvent {
    return StreamEvent{Kind::Done, std::move(reason)};
}

auto StreamEvent::to_json() const -> nlohmann::json {
    switch (kind) {
        case Kind::Content: return {{"content", payload}};
        case Kind::Error: return {{"error", payload}};
        case Kind::Done: return {{"done", payload}};
    }
    return nlohmann::json::object();
}

EventStream::EventStream(boost::asio::any_io_executor executor,
                         std::shared_ptr<Agent> agent, std::string prompt)
    : executor_(std::move(executor))
    , agent_(std::move(agent))
    , prompt_(std::move(prompt)) {}

EventStream::~EventStream() {
    if (cleaned_ || !agent_) {
        return;
    }

    // Abandoned mid-run: stop the agent and release its resources in the
    // background. The coroutine keeps the agent alive until it finishes.
    agent_->cancel();
    boost::asio::co_spawn(
        executor_,
        [agent = agent_]() -> boost::asio::awaitable<void> {
            co_await agent->cleanup();
        },
        [id = agent_->id()](std::exception_ptr e) {
            if (!e) {
                return;
            }
            try {
                std::rethrow_exception(e);
            } catch (const std::exception& ex) {
                LOG_ERROR("Deferred cleanup of agent {} failed: {}", id, ex.what());
            }
        });
}

auto EventStream::next() -> boost::asio::awaitable<std::optional<StreamEvent>> {
    if (buffer_.empty() && !ended_) {
        co_await pull();
    }
    if (buffer_.empty()) {
        co_return std::nullopt;
    }
    auto event = std::move(buffer_.front());
    buffer_.pop_front();
    co_return event;
}

auto EventStream::pull() -> boost::asio::awaitable<void> {
    if (!started_) {
        started_ = true;
        auto run = agent_->run(prompt_);
        if (!run) {
            // The agent belongs to another run; its resources are not ours to release.
            cleaned_ = true;
            ended_ = true;
            buffer_.push_back(StreamEvent::error(run.error().what()));
            buffer_.push_back(StreamEvent::done(std::string(to_string(FinishReason::Error))));
            co_return;
        }
        run_.emplace(std::move(*run));
    }

    while (buffer_.empty() && !ended_) {
        std::optional<Result<StepOutcome>> step;
        try {
            step = co_await run_->next();
        } catch (const std::exception& e) {
            Result<StepOutcome> failed = make_fail(
                make_error(ErrorCode::InternalError, "Unexpected failure", e.what()));
            step = std::move(failed);
        }

        if (!step) {
            co_await end(true);
            break;
        }
        if (!step->has_value()) {
            LOG_ERROR("Stream for agent {} stopped: {}", agent_->id(), step->error().what());
            buffer_.push_back(StreamEvent::error(step->error().what()));
            co_await end(false, FinishReason::Error);
            break;
        }

        for (auto& observation : (*step)->observations) {
            if (!observation.empty()) {
                buffer_.push_back(StreamEvent::content(std::move(observation)));
            }
        }
    }
}

auto EventStream::end(bool flush, std::optional<FinishReason> reason)
    -> boost::asio::awaitable<void> {
    ended_ = true;
    co_await run_cleanup();

    if (flush) {
        const auto* last = agent_->memory().last_assistant();
        if (last && !last->content.empty()) {
            buffer_.push_back(StreamEvent::content(last->content));
        }
    }
    buffer_.push_back(StreamEvent::done(
        std::string(to_string(reason.value_or(agent_->finish_reason())))));
}

auto EventStream::close() -> boost::asio::awaitable<void> {
    if (!ended_) {
        agent_->cancel();
        ended_ = true;
    }
    buffer_.clear();
    co_await run_cleanup();
}

auto EventStream::run_cleanup() -> boost::asio::awaitable<void> {
    if (cleaned_) {
        co_return;
    }
    cleaned_ = true;
    co_await agent_->cleanup();
}

} // namespace superagent::agent
