#include "superagent/providers/openai.hpp"

#include <string>
#include <utility>

#include "superagent/core/logger.hpp"
#include "superagent/core/utils.hpp"

namespace superagent::providers {

namespace {

constexpr auto kDefaultBaseUrl = "https://api.openai.com/v1";
constexpr auto kDefaultModel = "gpt-4o";
constexpr auto kChatSuffix = "/chat/completions";

/// Split "https://host:port/v1" into {"https://host:port", "/v1"}.
auto split_base_url(const std::string& url) -> std::pair<std::string, std::string> {
    auto scheme_end = url.find("://");
    auto host_start = scheme_end == std::string::npos ? 0 : scheme_end + 3;
    auto path_start = url.find('/', host_start);
    if (path_start == std::string::npos) {
        return {url, ""};
    }
    auto prefix = url.substr(path_start);
    while (!prefix.empty() && prefix.back() == '/') {
        prefix.pop_back();
    }
    return {url.substr(0, path_start), prefix};
}

auto role_to_string(Role role) -> std::string {
    switch (role) {
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
        case Role::System: return "system";
        case Role::Tool: return "tool";
        default: return "user";
    }
}

auto error_from_body(int status, const std::string& body) -> Error {
    std::string detail = "HTTP " + std::to_string(status) + ": " + body;
    std::string code;
    if (auto j = json::parse(body, nullptr, false); !j.is_discarded()
        && j.contains("error") && j["error"].is_object()) {
        const auto& err = j["error"];
        detail = err.value("message", detail);
        if (err.contains("code") && err["code"].is_string()) {
            code = err["code"].get<std::string>();
        }
    }

    if (code == "context_length_exceeded") {
        return make_error(ErrorCode::ContextBudgetExceeded,
                          "Conversation exceeds the model context window", detail);
    }
    return make_error(ErrorCode::ProviderError,
                      "OpenAI API error (HTTP " + std::to_string(status) + ")",
                      detail);
}

} // anonymous namespace

OpenAIProvider::OpenAIProvider(boost::asio::io_context& ioc,
                               const ProviderConfig& config)
    : api_key_(config.api_key)
    , default_model_(config.model.value_or(kDefaultModel))
    , temperature_(config.temperature)
    , max_tokens_(config.max_tokens)
    , chat_path_(split_base_url(config.base_url.value_or(kDefaultBaseUrl)).second
                 + kChatSuffix)
    , http_(ioc, infra::HttpClientConfig{
          .base_url = split_base_url(config.base_url.value_or(kDefaultBaseUrl)).first,
          .timeout_seconds = 120,
          .default_headers = {
              {"Authorization", "Bearer " + config.api_key},
          },
      })
{
    LOG_INFO("OpenAI provider initialized (model: {}, endpoint: {}{})",
             default_model_, http_.base_url(), chat_path_);
}

OpenAIProvider::~OpenAIProvider() = default;

auto OpenAIProvider::convert_message(const Message& msg) const -> json {
    json j;
    j["role"] = role_to_string(msg.role);
    j["content"] = msg.content;

    if (msg.role == Role::Tool) {
        j["tool_call_id"] = msg.tool_call_id.value_or("");
        if (msg.name) {
            j["name"] = *msg.name;
        }
        return j;
    }

    if (msg.role == Role::Assistant && msg.has_tool_calls()) {
        json calls = json::array();
        for (const auto& call : msg.tool_calls) {
            calls.push_back({
                {"id", call.id},
                {"type", "function"},
                {"function", {
                    {"name", call.name},
                    {"arguments", call.arguments.is_string()
                                      ? call.arguments.get<std::string>()
                                      : call.arguments.dump()},
                }},
            });
        }
        j["tool_calls"] = std::move(calls);
        if (msg.content.empty()) {
            j["content"] = nullptr;
        }
    }

    return j;
}

auto OpenAIProvider::build_request_body(const CompletionRequest& req) const -> json {
    json body;
    body["model"] = req.model.empty() ? default_model_ : req.model;

    json messages = json::array();
    if (req.system_prompt.has_value() && !req.system_prompt->empty()) {
        messages.push_back({{"role", "system"}, {"content", *req.system_prompt}});
    }
    for (const auto& msg : req.messages) {
        messages.push_back(convert_message(msg));
    }
    if (req.next_step_prompt.has_value() && !req.next_step_prompt->empty()) {
        messages.push_back({{"role", "user"}, {"content", *req.next_step_prompt}});
    }
    body["messages"] = std::move(messages);

    if (auto temp = req.temperature ? req.temperature : temperature_) {
        body["temperature"] = *temp;
    }
    if (auto max = req.max_tokens ? req.max_tokens : max_tokens_) {
        body["max_tokens"] = *max;
    }

    if (!req.tools.empty()) {
        json tools = json::array();
        for (const auto& def : req.tools) {
            tools.push_back(def.to_openai_json());
        }
        body["tools"] = std::move(tools);
        body["tool_choice"] = "auto";
    }

    return body;
}

auto OpenAIProvider::parse_response(int status, const std::string& body) const
    -> Result<CompletionResponse> {
    if (status < 200 || status >= 300) {
        return std::unexpected(error_from_body(status, body));
    }

    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        return std::unexpected(make_error(ErrorCode::SerializationError,
                                          "Failed to parse OpenAI response",
                                          e.what()));
    }

    if (j.contains("error")) {
        return std::unexpected(error_from_body(status, body));
    }
    if (!j.contains("choices") || !j["choices"].is_array() || j["choices"].empty()) {
        return std::unexpected(make_error(ErrorCode::ProviderError,
                                          "OpenAI response has no choices"));
    }

    CompletionResponse response;
    response.model = j.value("model", "");
    if (j.contains("usage") && j["usage"].is_object()) {
        response.input_tokens = j["usage"].value("prompt_tokens", 0);
        response.output_tokens = j["usage"].value("completion_tokens", 0);
    }

    const auto& choice = j["choices"][0];
    response.stop_reason = choice.value("finish_reason", "stop");

    const auto& msg = choice.contains("message") ? choice["message"] : json::object();
    std::string content;
    if (msg.contains("content") && msg["content"].is_string()) {
        content = msg["content"].get<std::string>();
    }

    std::vector<ToolCall> calls;
    if (msg.contains("tool_calls") && msg["tool_calls"].is_array()) {
        for (const auto& tc : msg["tool_calls"]) {
            ToolCall call;
            call.id = tc.value("id", utils::generate_id(12));
            if (tc.contains("function") && tc["function"].is_object()) {
                const auto& fn = tc["function"];
                call.name = fn.value("name", "");
                // Arguments arrive as a JSON-encoded string; the agent decodes them.
                if (fn.contains("arguments")) {
                    call.arguments = fn["arguments"];
                }
            }
            calls.push_back(std::move(call));
        }
    }

    response.message = Message::assistant(std::move(content), std::move(calls));
    return response;
}

auto OpenAIProvider::complete(CompletionRequest req)
    -> boost::asio::awaitable<Result<CompletionResponse>> {
    auto body = build_request_body(req);

    LOG_DEBUG("OpenAI complete request: model={} messages={} tools={}",
              body.value("model", ""), body["messages"].size(), req.tools.size());

    auto result = co_await http_.post(chat_path_, body.dump());
    if (!result.has_value()) {
        co_return make_fail(wrap_error(ErrorCode::ConnectionFailed,
                                       "OpenAI API request failed", result.error()));
    }

    co_return parse_response(result->status, result->body);
}

auto OpenAIProvider::name() const -> std::string_view {
    return "openai";
}

} // namespace superagent::providers
