#include "superagent/infra/http_client.hpp"
#include "superagent/core/logger.hpp"

#include <httplib.h>

#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace superagent::infra {

namespace {

auto describe(httplib::Error err) -> std::string {
    switch (err) {
        case httplib::Error::Connection: return "Connection failed";
        case httplib::Error::BindIPAddress: return "Bind IP address failed";
        case httplib::Error::Read: return "Read error";
        case httplib::Error::Write: return "Write error";
        case httplib::Error::ExceedRedirectCount: return "Exceeded redirect count";
        case httplib::Error::Canceled: return "Request canceled";
        case httplib::Error::SSLConnection: return "SSL connection error";
        case httplib::Error::SSLLoadingCerts: return "SSL certificate loading error";
        case httplib::Error::SSLServerVerification: return "SSL server verification failed";
        default: return "httplib error code " + std::to_string(static_cast<int>(err));
    }
}

auto to_http_response(const httplib::Result& result) -> Result<HttpResponse> {
    if (!result) {
        auto err = result.error();
        if (err == httplib::Error::ConnectionTimeout) {
            return std::unexpected(make_error(ErrorCode::Timeout,
                                              "HTTP request timed out",
                                              "Connection timeout"));
        }
        return std::unexpected(make_error(ErrorCode::ConnectionFailed,
                                          "HTTP request failed", describe(err)));
    }

    HttpResponse response;
    response.status = result->status;
    response.body = result->body;

    for (const auto& [key, value] : result->headers) {
        response.headers[key] = value;
    }

    return response;
}

} // anonymous namespace

struct HttpClient::Impl {
    boost::asio::io_context& ioc;
    HttpClientConfig config;

    Impl(boost::asio::io_context& ioc_, HttpClientConfig config_)
        : ioc(ioc_), config(std::move(config_)) {
        LOG_DEBUG("HTTP client created for {}", config.base_url);
    }

    auto to_headers(const std::map<std::string, std::string>& extra) const
        -> httplib::Headers {
        httplib::Headers hdrs;
        for (const auto& [k, v] : config.default_headers) {
            hdrs.emplace(k, v);
        }
        for (const auto& [k, v] : extra) {
            hdrs.emplace(k, v);
        }
        return hdrs;
    }
};

HttpClient::HttpClient(boost::asio::io_context& ioc, HttpClientConfig config)
    : impl_(std::make_unique<Impl>(ioc, std::move(config))) {}

HttpClient::~HttpClient() = default;

HttpClient::HttpClient(HttpClient&&) noexcept = default;
HttpClient& HttpClient::operator=(HttpClient&&) noexcept = default;

auto HttpClient::post(std::string_view path,
                      std::string_view body,
                      std::string_view content_type,
                      const std::map<std::string, std::string>& headers)
    -> boost::asio::awaitable<Result<HttpResponse>> {

    // Shared state between background thread and coroutine.
    struct RequestState {
        std::mutex mtx;
        std::optional<Result<HttpResponse>> result;
    };

    auto state = std::make_shared<RequestState>();
    auto timer = std::make_shared<boost::asio::steady_timer>(
        impl_->ioc, boost::asio::steady_timer::time_point::max());

    std::thread([
        state, timer,
        base_url = impl_->config.base_url,
        timeout = impl_->config.timeout_seconds,
        verify_ssl = impl_->config.verify_ssl,
        hdrs = impl_->to_headers(headers),
        p = std::string(path),
        b = std::string(body),
        ct = std::string(content_type)
    ]() {
        LOG_DEBUG("POST {}{}", base_url, p);

        httplib::Client client(base_url);
        client.set_connection_timeout(timeout);
        client.set_read_timeout(timeout);
        client.set_write_timeout(timeout);
        if (!verify_ssl) {
            client.enable_server_certificate_verification(false);
        }

        auto result = to_http_response(client.Post(p, hdrs, b, ct));

        {
            std::lock_guard lock(state->mtx);
            state->result = std::move(result);
        }
        // Post cancel to the timer's executor for thread safety.
        boost::asio::post(timer->get_executor(), [timer] { timer->cancel(); });
    }).detach();

    // Suspend coroutine until background thread completes.
    boost::system::error_code ec;
    co_await timer->async_wait(
        boost::asio::redirect_error(boost::asio::use_awaitable, ec));

    std::lock_guard lock(state->mtx);
    if (!state->result) {
        co_return make_fail(make_error(ErrorCode::InternalError,
                                       "HTTP request finished without a result"));
    }
    co_return std::move(*state->result);
}

void HttpClient::set_default_header(std::string key, std::string value) {
    impl_->config.default_headers[std::move(key)] = std::move(value);
}

auto HttpClient::base_url() const -> const std::string& {
    return impl_->config.base_url;
}

} // namespace superagent::infra
