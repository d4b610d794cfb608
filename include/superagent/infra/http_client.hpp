#pragma once

#include <map>
#include <memory>
#include <string>
#include <string_view>

#include <boost/asio.hpp>

#include "superagent/core/error.hpp"

namespace superagent::infra {

/// HTTP response from the client.
struct HttpResponse {
    int status = 0;
    std::map<std::string, std::string> headers;
    std::string body;

    /// Returns true if the status code indicates success (2xx).
    [[nodiscard]] auto is_success() const noexcept -> bool {
        return status >= 200 && status < 300;
    }
};

/// Configuration for the HTTP client.
struct HttpClientConfig {
    std::string base_url;  // scheme://host[:port], no path
    int timeout_seconds = 120;
    bool verify_ssl = true;
    std::map<std::string, std::string> default_headers;
};

/// Asynchronous HTTP client wrapping cpp-httplib.
///
/// Each request runs on a background thread with its own httplib::Client
/// (the client is not thread-safe); the awaiting coroutine is suspended on a
/// timer and resumed on its executor when the request finishes, so the
/// io_context keeps serving other work meanwhile.
class HttpClient {
public:
    HttpClient(boost::asio::io_context& ioc, HttpClientConfig config);
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;
    HttpClient(HttpClient&&) noexcept;
    HttpClient& operator=(HttpClient&&) noexcept;

    /// Performs an asynchronous HTTP POST request.
    auto post(std::string_view path,
              std::string_view body,
              std::string_view content_type = "application/json",
              const std::map<std::string, std::string>& headers = {})
        -> boost::asio::awaitable<Result<HttpResponse>>;

    /// Sets a default header that will be sent with every request.
    void set_default_header(std::string key, std::string value);

    /// Returns the base URL.
    [[nodiscard]] auto base_url() const -> const std::string&;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace superagent::infra
