#pragma once

#include "superagent/agent/tool.hpp"

namespace superagent::tools {

using json = nlohmann::json;
using boost::asio::awaitable;

/// Ends the interaction. Its successful result carries the termination
/// sentinel `{"status":"success"}`.
class TerminateTool final : public agent::Tool {
public:
    static constexpr auto kName = "terminate";
    static constexpr auto kSentinel = R"({"status":"success"})";

    [[nodiscard]] auto definition() const -> agent::ToolDefinition override;
    auto execute(json arguments) -> awaitable<Result<agent::ToolResult>> override;
};

} // namespace superagent::tools
