#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio.hpp>

#include "superagent/agent/memory.hpp"
#include "superagent/agent/stuck_detector.hpp"
#include "superagent/agent/tool_registry.hpp"
#include "superagent/core/config.hpp"
#include "superagent/core/error.hpp"
#include "superagent/mcp/server_manager.hpp"
#include "superagent/providers/provider.hpp"

namespace superagent::agent {

enum class AgentState {
    Idle,
    Running,
    Finished,
    Error,
};

/// Why a run stopped.
enum class FinishReason {
    None,
    Terminated,       // A special tool reported success
    NoAction,         // The model replied without tool calls
    BudgetExhausted,  // max_steps reached
    Stuck,            // Same assistant output too many steps in a row
    Error,
    Cancelled,
};

[[nodiscard]] auto to_string(AgentState state) -> std::string_view;
[[nodiscard]] auto to_string(FinishReason reason) -> std::string_view;

/// What one think/act/observe cycle produced.
struct StepOutcome {
    int step = 0;
    std::vector<std::string> observations;  // Tool outputs, already clipped
    std::string assistant_content;
    bool acted = false;
    std::optional<FinishReason> finish;     // Set on the step that ended the run
};

class Agent;

/// Lazy sequence of step outcomes for one run. Each next() performs at most
/// one step; the sequence ends after a failed step or the finishing step.
class AgentRun {
public:
    explicit AgentRun(Agent& agent) : agent_(&agent) {}

    /// The next step's outcome, or nullopt once the run is over.
    auto next() -> boost::asio::awaitable<std::optional<Result<StepOutcome>>>;

    [[nodiscard]] auto done() const noexcept -> bool { return done_; }

private:
    Agent* agent_;
    bool done_ = false;
};

/// The reasoning loop: think (ask the model), act (run the requested
/// tools), observe (check the conversation budget), repeated until a
/// special tool reports success, the model stops calling tools, the step
/// budget runs out, the loop gets stuck, or something fails.
///
/// An agent serves exactly one run. State only moves forward:
/// IDLE -> RUNNING -> FINISHED | ERROR.
class Agent {
public:
    Agent(boost::asio::io_context& ioc, Config config,
          std::shared_ptr<providers::Provider> provider,
          mcp::TransportFactory transport_factory = {});
    ~Agent();

    Agent(const Agent&) = delete;
    Agent& operator=(const Agent&) = delete;

    /// Construct an agent and connect the configured remote servers.
    /// Servers that fail to connect are skipped.
    static auto create(boost::asio::io_context& ioc, Config config,
                       std::shared_ptr<providers::Provider> provider,
                       mcp::TransportFactory transport_factory = {})
        -> boost::asio::awaitable<Result<std::shared_ptr<Agent>>>;

    /// Connect the configured remote servers. Runs once; later calls are
    /// no-ops until cleanup().
    auto initialize() -> boost::asio::awaitable<void>;

    /// Start the run: IDLE -> RUNNING with `prompt` as the first user message.
    auto run(std::string prompt) -> Result<AgentRun>;

    /// One full cycle including the budget and stuck checks.
    auto step() -> boost::asio::awaitable<Result<StepOutcome>>;

    /// Ask the model for the next assistant message. Yields false when the
    /// reply carries no tool calls.
    auto think() -> boost::asio::awaitable<Result<bool>>;

    /// Execute the tool calls of the latest assistant message. Yields the
    /// observations in call order.
    auto act() -> boost::asio::awaitable<Result<std::vector<std::string>>>;

    /// Post-step check of the conversation against the context budget.
    auto observe() -> VoidResult;

    /// Release stateful tools and disconnect every remote server.
    /// Idempotent.
    auto cleanup() -> boost::asio::awaitable<void>;

    /// Stop a running agent: RUNNING -> FINISHED (cancelled).
    void cancel();

    [[nodiscard]] auto id() const -> const std::string& { return id_; }
    [[nodiscard]] auto state() const noexcept -> AgentState { return state_; }
    [[nodiscard]] auto finish_reason() const noexcept -> FinishReason { return finish_reason_; }
    [[nodiscard]] auto current_step() const noexcept -> int { return current_step_; }
    [[nodiscard]] auto is_initialized() const noexcept -> bool { return initialized_; }
    [[nodiscard]] auto config() const -> const Config& { return config_; }
    [[nodiscard]] auto memory() const -> const Memory& { return memory_; }
    [[nodiscard]] auto tools() -> ToolRegistry& { return tools_; }
    [[nodiscard]] auto tools() const -> const ToolRegistry& { return tools_; }
    [[nodiscard]] auto servers() -> mcp::ServerManager& { return servers_; }

    /// The next-step prompt outside of any stateful-tool override.
    [[nodiscard]] auto next_step_prompt() const -> const std::string& {
        return next_step_prompt_;
    }

    /// The last error recorded by a failed step.
    [[nodiscard]] auto last_error() const -> const std::optional<Error>& { return last_error_; }

private:
    void finish(FinishReason reason);
    auto fail(Error error) -> Error;
    [[nodiscard]] auto is_special_tool(std::string_view name) const -> bool;
    [[nodiscard]] auto active_stateful_tool() -> Tool*;

    std::string id_;
    Config config_;
    std::shared_ptr<providers::Provider> provider_;
    std::string system_prompt_;
    std::string next_step_prompt_;

    Memory memory_;
    ToolRegistry tools_;
    mcp::ServerManager servers_;
    StuckDetector stuck_;

    AgentState state_ = AgentState::Idle;
    FinishReason finish_reason_ = FinishReason::None;
    int current_step_ = 0;
    bool initialized_ = false;
    std::optional<Error> last_error_;
};

} // namespace superagent::agent
