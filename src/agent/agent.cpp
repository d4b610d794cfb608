#include "superagent/agent/agent.hpp"

#include <chrono>
#include <utility>

#include "superagent/agent/prompts.hpp"
#include "superagent/core/logger.hpp"
#include "superagent/core/utils.hpp"
#include "superagent/tools/terminate.hpp"

namespace superagent::agent {

namespace {

constexpr std::size_t kStatefulLookback = 3;

/// Swaps a prompt for the duration of a scope and puts the original back
/// on every exit path.
class PromptOverride {
public:
    PromptOverride(std::string& slot, std::string replacement)
        : slot_(slot), saved_(std::exchange(slot, std::move(replacement))) {}

    ~PromptOverride() { slot_ = std::move(saved_); }

    PromptOverride(const PromptOverride&) = delete;
    PromptOverride& operator=(const PromptOverride&) = delete;

private:
    std::string& slot_;
    std::string saved_;
};

/// Identity of a step's assistant output for stuck detection.
auto fingerprint(const Message& msg) -> std::string {
    std::string fp = msg.content;
    for (const auto& call : msg.tool_calls) {
        fp += '\x1f';
        fp += call.name;
        fp += '\x1e';
        fp += call.arguments.dump();
    }
    return fp;
}

} // anonymous namespace

auto to_string(AgentState state) -> std::string_view {
    switch (state) {
        case AgentState::Idle: return "IDLE";
        case AgentState::Running: return "RUNNING";
        case AgentState::Finished: return "FINISHED";
        case AgentState::Error: return "ERROR";
    }
    return "UNKNOWN";
}

auto to_string(FinishReason reason) -> std::string_view {
    switch (reason) {
        case FinishReason::None: return "none";
        case FinishReason::Terminated: return "terminated";
        case FinishReason::NoAction: return "no_action";
        case FinishReason::BudgetExhausted: return "budget_exhausted";
        case FinishReason::Stuck: return "stuck";
        case FinishReason::Error: return "error";
        case FinishReason::Cancelled: return "cancelled";
    }
    return "none";
}

// ---------------------------------------------------------------------------
// AgentRun
// ---------------------------------------------------------------------------

auto AgentRun::next() -> boost::asio::awaitable<std::optional<Result<StepOutcome>>> {
    if (done_ || agent_->state() != AgentState::Running) {
        done_ = true;
        co_return std::nullopt;
    }

    auto outcome = co_await agent_->step();
    if (!outcome || outcome->finish.has_value()) {
        done_ = true;
    }
    co_return std::optional<Result<StepOutcome>>(std::move(outcome));
}

// ---------------------------------------------------------------------------
// Agent
// ---------------------------------------------------------------------------

Agent::Agent(boost::asio::io_context& ioc, Config config,
             std::shared_ptr<providers::Provider> provider,
             mcp::TransportFactory transport_factory)
    : id_(utils::generate_id(12))
    , config_(std::move(config))
    , provider_(std::move(provider))
    , system_prompt_(config_.agent.system_prompt.value_or(std::string(kDefaultSystemPrompt)))
    , next_step_prompt_(config_.agent.next_step_prompt.value_or(std::string(kDefaultNextStepPrompt)))
    , memory_(config_.agent.max_messages)
    , servers_(ioc, tools_,
               transport_factory
                   ? std::move(transport_factory)
                   : mcp::make_default_transport_factory(ioc, config_.mcp.connect_timeout_seconds),
               std::chrono::seconds(config_.mcp.connect_timeout_seconds))
    , stuck_(config_.agent.max_stuck_count)
{
    tools_.add_tool(std::make_unique<tools::TerminateTool>());
    LOG_DEBUG("Agent {} created (max_steps={}, max_stuck_count={})",
              id_, config_.agent.max_steps, config_.agent.max_stuck_count);
}

Agent::~Agent() = default;

auto Agent::create(boost::asio::io_context& ioc, Config config,
                   std::shared_ptr<providers::Provider> provider,
                   mcp::TransportFactory transport_factory)
    -> boost::asio::awaitable<Result<std::shared_ptr<Agent>>> {
    if (!provider) {
        co_return make_fail(make_error(ErrorCode::InvalidArgument,
                                       "Agent requires a provider"));
    }
    auto valid = validate_config(config);
    if (!valid) {
        co_return make_fail(valid.error());
    }

    auto agent = std::make_shared<Agent>(ioc, std::move(config), std::move(provider),
                                         std::move(transport_factory));
    co_await agent->initialize();
    co_return agent;
}

auto Agent::initialize() -> boost::asio::awaitable<void> {
    if (initialized_) {
        co_return;
    }
    co_await servers_.initialize_from_config(config_.mcp.servers);
    initialized_ = true;
    LOG_INFO("Agent {} initialized with {} tool(s) from {} server(s)",
             id_, tools_.size(), servers_.server_count());
}

auto Agent::run(std::string prompt) -> Result<AgentRun> {
    if (state_ != AgentState::Idle) {
        return std::unexpected(make_error(ErrorCode::InvalidState,
                                          "Agent is not idle",
                                          std::string(to_string(state_))));
    }

    state_ = AgentState::Running;
    memory_.add(Message::user(std::move(prompt)));
    LOG_INFO("Agent {} running", id_);
    return AgentRun(*this);
}

auto Agent::step() -> boost::asio::awaitable<Result<StepOutcome>> {
    if (state_ != AgentState::Running) {
        co_return make_fail(make_error(ErrorCode::InvalidState,
                                       "Agent is not running",
                                       std::string(to_string(state_))));
    }

    ++current_step_;
    StepOutcome outcome;
    outcome.step = current_step_;
    LOG_DEBUG("Agent {} step {}/{}", id_, current_step_, config_.agent.max_steps);

    try {
        auto thought = co_await think();
        if (!thought) {
            co_return make_fail(fail(thought.error()));
        }
        if (const auto* last = memory_.last_assistant()) {
            outcome.assistant_content = last->content;
        }
        if (!*thought) {
            finish(FinishReason::NoAction);
            outcome.finish = finish_reason_;
            co_return outcome;
        }

        auto acted = co_await act();
        if (!acted) {
            co_return make_fail(fail(acted.error()));
        }
        outcome.observations = std::move(*acted);
        outcome.acted = true;

        auto observed = observe();
        if (!observed) {
            co_return make_fail(fail(observed.error()));
        }

        if (state_ == AgentState::Finished) {
            outcome.finish = finish_reason_;
            co_return outcome;
        }

        if (const auto* last = memory_.last_assistant()) {
            stuck_.observe(fingerprint(*last));
        }
        if (stuck_.should_abort()) {
            LOG_WARN("Agent {} repeated the same output {} times, stopping",
                     id_, stuck_.count());
            finish(FinishReason::Stuck);
        } else if (current_step_ >= config_.agent.max_steps) {
            LOG_WARN("Agent {} reached max steps ({})", id_, config_.agent.max_steps);
            finish(FinishReason::BudgetExhausted);
        }
        if (state_ == AgentState::Finished) {
            outcome.finish = finish_reason_;
        }
        co_return outcome;
    } catch (const std::exception& e) {
        co_return make_fail(fail(make_error(ErrorCode::InternalError,
                                            "Unexpected failure in step", e.what())));
    }
}

auto Agent::active_stateful_tool() -> Tool* {
    for (const auto& msg : memory_.recent(kStatefulLookback)) {
        for (const auto& call : msg.tool_calls) {
            auto* tool = tools_.lookup(call.name);
            if (tool && tool->stateful()) {
                return tool;
            }
        }
    }
    return nullptr;
}

auto Agent::think() -> boost::asio::awaitable<Result<bool>> {
    if (!initialized_) {
        co_await initialize();
    }

    std::optional<PromptOverride> prompt_guard;
    if (auto* tool = active_stateful_tool()) {
        auto prompt = co_await tool->context_prompt(next_step_prompt_);
        if (prompt) {
            prompt_guard.emplace(next_step_prompt_, std::move(*prompt));
        } else {
            LOG_WARN("Tool {} could not build its context prompt: {}",
                     tool->definition().name, prompt.error().what());
        }
    }

    providers::CompletionRequest req;
    req.model = config_.provider.model.value_or("");
    req.system_prompt = system_prompt_;
    req.messages = memory_.messages();
    req.next_step_prompt = next_step_prompt_;
    req.tools = tools_.list_specs();
    req.temperature = config_.provider.temperature;
    req.max_tokens = config_.provider.max_tokens;

    auto response = co_await provider_->complete(std::move(req));
    if (!response) {
        co_return make_fail(response.error());
    }

    auto& reply = response->message;
    LOG_INFO("Agent {} selected {} tool(s)", id_, reply.tool_calls.size());
    if (!reply.content.empty()) {
        LOG_DEBUG("Agent {} thoughts: {}", id_, reply.content);
    }

    bool has_calls = reply.has_tool_calls();
    memory_.add(std::move(reply));
    co_return has_calls;
}

auto Agent::act() -> boost::asio::awaitable<Result<std::vector<std::string>>> {
    std::vector<std::string> observations;

    const auto* assistant = memory_.last_assistant();
    if (!assistant || !assistant->has_tool_calls()) {
        co_return observations;
    }
    // Memory may drop old entries while we append, so work on a copy.
    auto calls = assistant->tool_calls;

    for (auto& call : calls) {
        json arguments = call.arguments;
        if (arguments.is_string()) {
            auto raw = arguments.get<std::string>();
            arguments = raw.empty() ? json::object() : json::parse(raw, nullptr, false);
            if (arguments.is_discarded()) {
                auto text = "Error: failed to parse arguments for " + call.name
                            + ": invalid JSON";
                LOG_WARN("Tool call {} has malformed arguments: {}", call.name, raw);
                memory_.add(Message::tool(text, call.id, call.name));
                observations.push_back(std::move(text));
                continue;
            }
        } else if (arguments.is_null()) {
            arguments = json::object();
        }

        auto* tool = tools_.lookup(call.name);
        if (!tool) {
            co_return make_fail(make_error(ErrorCode::ToolNotFound,
                                           "Unknown tool", call.name));
        }

        LOG_INFO("Activating tool: {}", call.name);
        auto result = co_await tool->execute(std::move(arguments));
        if (!result) {
            co_return make_fail(wrap_error(ErrorCode::ToolExecutionFailed,
                                           "Tool '" + call.name + "' failed",
                                           result.error()));
        }

        const bool terminates = is_special_tool(call.name) && result->is_success()
                                && result->content == tools::TerminateTool::kSentinel;
        auto content = utils::truncate_utf8(result->content, config_.agent.max_observe);
        if (!result->is_success()) {
            LOG_WARN("Tool {} reported {}: {}", call.name,
                     json(result->status).get<std::string>(), content);
        }
        memory_.add(Message::tool(content, call.id, call.name));
        observations.push_back(std::move(content));

        if (terminates) {
            LOG_INFO("Special tool {} completed the task", call.name);
            finish(FinishReason::Terminated);
            break;
        }
    }

    co_return observations;
}

auto Agent::observe() -> VoidResult {
    const auto limit = config_.agent.max_context_chars;
    if (limit > 0 && memory_.content_size() > limit) {
        return std::unexpected(make_error(
            ErrorCode::ContextBudgetExceeded,
            "Conversation exceeds the context budget",
            std::to_string(memory_.content_size()) + " > " + std::to_string(limit)));
    }
    return {};
}

auto Agent::cleanup() -> boost::asio::awaitable<void> {
    for (auto* tool : tools_.stateful_tools()) {
        co_await tool->release();
    }
    if (initialized_) {
        co_await servers_.disconnect_all();
        initialized_ = false;
    }
    LOG_DEBUG("Agent {} cleaned up", id_);
}

void Agent::cancel() {
    if (state_ == AgentState::Running) {
        LOG_INFO("Agent {} cancelled at step {}", id_, current_step_);
        finish(FinishReason::Cancelled);
    }
}

void Agent::finish(FinishReason reason) {
    state_ = AgentState::Finished;
    finish_reason_ = reason;
    LOG_INFO("Agent {} finished: {}", id_, to_string(reason));
}

auto Agent::fail(Error error) -> Error {
    LOG_ERROR("Agent {} step {} failed: {}", id_, current_step_, error.what());
    state_ = AgentState::Error;
    finish_reason_ = FinishReason::Error;
    last_error_ = error;
    return error;
}

auto Agent::is_special_tool(std::string_view name) const -> bool {
    auto lowered = utils::to_lower(name);
    for (const auto& special : config_.agent.special_tool_names) {
        if (utils::to_lower(special) == lowered) {
            return true;
        }
    }
    return false;
}

} // namespace superagent::agent
