#include "superagent/mcp/websocket_transport.hpp"
#include "superagent/core/logger.hpp"

#include <chrono>

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

namespace superagent::mcp {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

struct WsTarget {
    std::string host;
    std::string port;
    std::string path;
};

auto parse_ws_url(const std::string& url) -> Result<WsTarget> {
    std::size_t start = 0;
    if (url.starts_with("ws://")) {
        start = 5;
    } else if (url.starts_with("wss://")) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                          "TLS WebSocket endpoints are not supported",
                                          url));
    } else if (url.starts_with("http://")) {
        start = 7;
    }

    WsTarget target;
    auto path_pos = url.find('/', start);
    auto host_port = url.substr(start, path_pos == std::string::npos
                                           ? std::string::npos
                                           : path_pos - start);
    target.path = path_pos != std::string::npos ? url.substr(path_pos) : "/";

    auto colon_pos = host_port.find(':');
    if (colon_pos != std::string::npos) {
        target.host = host_port.substr(0, colon_pos);
        target.port = host_port.substr(colon_pos + 1);
    } else {
        target.host = host_port;
        target.port = "80";
    }

    if (target.host.empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                          "WebSocket URL has no host", url));
    }
    return target;
}

} // anonymous namespace

struct WebSocketTransport::Impl {
    net::io_context& ioc;
    std::string url;
    int connect_timeout_seconds;
    std::unique_ptr<websocket::stream<beast::tcp_stream>> ws;
    beast::flat_buffer buffer;
    bool open = false;

    Impl(net::io_context& ctx, std::string url_, int timeout)
        : ioc(ctx), url(std::move(url_)), connect_timeout_seconds(timeout) {}
};

WebSocketTransport::WebSocketTransport(net::io_context& ioc, std::string url,
                                       int connect_timeout_seconds)
    : impl_(std::make_unique<Impl>(ioc, std::move(url), connect_timeout_seconds)) {}

WebSocketTransport::~WebSocketTransport() {
    if (impl_ && impl_->open && impl_->ws) {
        // Best-effort close
        beast::error_code ec;
        beast::get_lowest_layer(*impl_->ws).socket().close(ec);
        impl_->open = false;
    }
}

auto WebSocketTransport::open() -> awaitable<VoidResult> {
    auto target = parse_ws_url(impl_->url);
    if (!target) {
        co_return make_fail(target.error());
    }

    try {
        tcp::resolver resolver(impl_->ioc);
        auto results = co_await resolver.async_resolve(
            target->host, target->port, net::use_awaitable);

        impl_->ws = std::make_unique<websocket::stream<beast::tcp_stream>>(impl_->ioc);

        beast::get_lowest_layer(*impl_->ws).expires_after(
            std::chrono::seconds(impl_->connect_timeout_seconds));

        auto ep = co_await beast::get_lowest_layer(*impl_->ws).async_connect(
            results, net::use_awaitable);

        auto host_str = target->host + ":" + std::to_string(ep.port());

        // Handshake still runs under the connect deadline; the stream then
        // switches to WebSocket ping/pong timeouts.
        impl_->ws->set_option(websocket::stream_base::decorator(
            [](websocket::request_type& req) {
                req.set(beast::http::field::user_agent, "superagent-mcp/1.0");
            }));

        co_await impl_->ws->async_handshake(host_str, target->path,
                                            net::use_awaitable);

        beast::get_lowest_layer(*impl_->ws).expires_never();
        impl_->ws->set_option(websocket::stream_base::timeout::suggested(
            beast::role_type::client));
        impl_->ws->text(true);

        impl_->open = true;
        LOG_INFO("MCP WebSocket connected to {}", impl_->url);
        co_return ok_result();
    } catch (const beast::system_error& se) {
        co_return make_fail(make_error(ErrorCode::ConnectionFailed,
                                       "Failed to connect to MCP server",
                                       impl_->url + ": " + se.what()));
    }
}

auto WebSocketTransport::send(const json& message) -> awaitable<VoidResult> {
    if (!impl_->open) {
        co_return make_fail(make_error(ErrorCode::ConnectionClosed,
                                       "WebSocket transport not open"));
    }

    auto data = message.dump();
    boost::system::error_code ec;
    co_await impl_->ws->async_write(net::buffer(data),
                                    net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        impl_->open = false;
        co_return make_fail(make_error(ErrorCode::ConnectionClosed,
                                       "Failed to send to MCP server", ec.message()));
    }
    co_return ok_result();
}

auto WebSocketTransport::receive() -> awaitable<Result<json>> {
    while (true) {
        if (!impl_->open) {
            co_return make_fail(make_error(ErrorCode::ConnectionClosed,
                                           "WebSocket transport not open"));
        }

        boost::system::error_code ec;
        co_await impl_->ws->async_read(impl_->buffer,
                                       net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            impl_->open = false;
            if (ec != websocket::error::closed) {
                LOG_ERROR("MCP WebSocket read error: {}", ec.message());
            }
            co_return make_fail(make_error(ErrorCode::ConnectionClosed,
                                           "MCP WebSocket closed", ec.message()));
        }

        auto msg = beast::buffers_to_string(impl_->buffer.data());
        impl_->buffer.consume(impl_->buffer.size());

        auto parsed = json::parse(msg, nullptr, false);
        if (parsed.is_discarded()) {
            LOG_WARN("Failed to parse MCP message from {}", impl_->url);
            continue;
        }
        co_return parsed;
    }
}

auto WebSocketTransport::close() -> awaitable<void> {
    if (!impl_->open) {
        co_return;
    }
    impl_->open = false;

    boost::system::error_code ec;
    co_await impl_->ws->async_close(websocket::close_code::normal,
                                    net::redirect_error(net::use_awaitable, ec));
    if (ec && ec != websocket::error::closed) {
        LOG_DEBUG("MCP WebSocket close error: {}", ec.message());
    }

    LOG_INFO("MCP WebSocket disconnected from {}", impl_->url);
}

auto WebSocketTransport::is_open() const -> bool {
    return impl_ && impl_->open;
}

auto WebSocketTransport::url() const -> const std::string& {
    return impl_->url;
}

} // namespace superagent::mcp
