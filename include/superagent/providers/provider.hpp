#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio.hpp>
#include <nlohmann/json.hpp>

#include "superagent/agent/tool.hpp"
#include "superagent/core/config.hpp"
#include "superagent/core/error.hpp"
#include "superagent/core/types.hpp"

namespace superagent::providers {

using json = nlohmann::json;
using boost::asio::awaitable;

/// Everything the model sees for one reasoning step.
struct CompletionRequest {
    std::string model;
    std::optional<std::string> system_prompt;
    std::vector<Message> messages;
    /// Appended as a trailing user turn; never stored in memory.
    std::optional<std::string> next_step_prompt;
    std::vector<agent::ToolDefinition> tools;
    std::optional<double> temperature;
    std::optional<int> max_tokens;
};

/// Full completion response from a provider.
struct CompletionResponse {
    Message message;
    std::string model;
    int input_tokens = 0;
    int output_tokens = 0;
    std::string stop_reason;
};

/// The model inference collaborator: given the conversation so far,
/// produce the next assistant message (possibly carrying tool calls).
///
/// Implementations report an oversized conversation with
/// ErrorCode::ContextBudgetExceeded so the agent can fail the run with
/// that distinct kind.
class Provider {
public:
    virtual ~Provider() = default;

    /// Perform a non-streaming completion request.
    virtual auto complete(CompletionRequest req)
        -> awaitable<Result<CompletionResponse>> = 0;

    /// Return the provider name (e.g. "openai").
    [[nodiscard]] virtual auto name() const -> std::string_view = 0;
};

/// Create the provider named by `config.name`. Unknown names fail with
/// InvalidConfig.
auto make_provider(boost::asio::io_context& ioc, const ProviderConfig& config)
    -> Result<std::shared_ptr<Provider>>;

} // namespace superagent::providers
