#pragma once

#include <string>
#include <string_view>

#include <boost/asio.hpp>

#include "superagent/core/config.hpp"
#include "superagent/infra/http_client.hpp"
#include "superagent/providers/provider.hpp"

namespace superagent::providers {

/// OpenAI-compatible Chat Completions provider.
///
/// Talks to `<base_url>/chat/completions` with function/tool calling.
/// base_url may carry a path prefix (default "https://api.openai.com/v1"),
/// which makes it usable with any OpenAI-compatible endpoint.
class OpenAIProvider final : public Provider {
public:
    OpenAIProvider(boost::asio::io_context& ioc, const ProviderConfig& config);
    ~OpenAIProvider() override;

    OpenAIProvider(const OpenAIProvider&) = delete;
    OpenAIProvider& operator=(const OpenAIProvider&) = delete;

    auto complete(CompletionRequest req)
        -> boost::asio::awaitable<Result<CompletionResponse>> override;

    [[nodiscard]] auto name() const -> std::string_view override;

    /// Build the JSON request body for the Chat Completions API.
    [[nodiscard]] auto build_request_body(const CompletionRequest& req) const -> json;

    /// Parse a response body (or an error body with `status`) into a
    /// CompletionResponse.
    [[nodiscard]] auto parse_response(int status, const std::string& body) const
        -> Result<CompletionResponse>;

    /// Path requests are posted to, e.g. "/v1/chat/completions".
    [[nodiscard]] auto chat_path() const -> const std::string& { return chat_path_; }

private:
    auto convert_message(const Message& msg) const -> json;

    std::string api_key_;
    std::string default_model_;
    std::optional<double> temperature_;
    std::optional<int> max_tokens_;
    std::string chat_path_;
    infra::HttpClient http_;
};

} // namespace superagent::providers
