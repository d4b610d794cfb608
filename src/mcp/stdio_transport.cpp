#include "superagent/mcp/stdio_transport.hpp"
#include "superagent/core/logger.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <mutex>
#include <string_view>
#include <utility>

#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/write.hpp>

#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace superagent::mcp {

namespace net = boost::asio;

namespace {

constexpr int kReapAttempts = 50;
constexpr auto kReapInterval = std::chrono::milliseconds(10);

/// Writes to a server that has exited must fail with EPIPE instead of
/// killing the agent.
void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
}

/// Inherited environment with `overrides` replacing same-named entries.
auto build_environment(const std::map<std::string, std::string>& overrides)
    -> std::vector<std::string> {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string_view entry(*e);
        auto key = entry.substr(0, entry.find('='));
        if (!overrides.contains(std::string(key))) {
            env.emplace_back(entry);
        }
    }
    for (const auto& [key, value] : overrides) {
        env.push_back(key + "=" + value);
    }
    return env;
}

auto to_pointers(std::vector<std::string>& strings) -> std::vector<char*> {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) {
        out.push_back(s.data());
    }
    out.push_back(nullptr);
    return out;
}

void close_pipe(int fds[2]) {
    ::close(fds[0]);
    ::close(fds[1]);
}

/// Non-blocking reap. True once the child is gone.
auto try_reap(pid_t pid) -> bool {
    int status = 0;
    return ::waitpid(pid, &status, WNOHANG) != 0;
}

void kill_and_reap(pid_t pid) {
    int status = 0;
    ::kill(pid, SIGKILL);
    ::waitpid(pid, &status, 0);
}

} // anonymous namespace

struct StdioTransport::Impl {
    net::io_context& ioc;
    ProcessConfig config;
    pid_t pid = -1;
    std::unique_ptr<net::posix::stream_descriptor> in;   // child's stdin
    std::unique_ptr<net::posix::stream_descriptor> out;  // child's stdout
    std::string read_buffer;
    bool open = false;

    Impl(net::io_context& ioc_, ProcessConfig config_)
        : ioc(ioc_), config(std::move(config_)) {}

    void close_pipes() {
        open = false;
        boost::system::error_code ec;
        if (in) {
            in->close(ec);
            in.reset();
        }
        if (out) {
            out->close(ec);
            out.reset();
        }
    }

    /// SIGTERM, then poll for exit on a timer so the io_context keeps
    /// running; SIGKILL if the child outlives the grace period.
    auto stop_child() -> awaitable<void> {
        if (pid <= 0) {
            co_return;
        }
        auto child = std::exchange(pid, -1);
        ::kill(child, SIGTERM);

        net::steady_timer timer(ioc);
        for (int i = 0; i < kReapAttempts; ++i) {
            if (try_reap(child)) {
                co_return;
            }
            timer.expires_after(kReapInterval);
            boost::system::error_code ec;
            co_await timer.async_wait(net::redirect_error(net::use_awaitable, ec));
        }
        LOG_WARN("MCP server process {} ignored SIGTERM, killing it", child);
        kill_and_reap(child);
    }
};

StdioTransport::StdioTransport(net::io_context& ioc, ProcessConfig config)
    : impl_(std::make_unique<Impl>(ioc, std::move(config))) {}

StdioTransport::~StdioTransport() {
    if (!impl_) {
        return;
    }
    impl_->close_pipes();
    if (impl_->pid > 0) {
        kill_and_reap(std::exchange(impl_->pid, -1));
    }
}

auto StdioTransport::open() -> awaitable<VoidResult> {
    if (impl_->open) {
        co_return make_fail(make_error(ErrorCode::InvalidState,
                                       "Transport already open"));
    }
    ignore_sigpipe();

    int stdin_pipe[2];
    int stdout_pipe[2];
    if (::pipe2(stdin_pipe, O_CLOEXEC) != 0) {
        co_return make_fail(make_error(ErrorCode::IoError,
                                       "Failed to create stdin pipe",
                                       std::strerror(errno)));
    }
    if (::pipe2(stdout_pipe, O_CLOEXEC) != 0) {
        close_pipe(stdin_pipe);
        co_return make_fail(make_error(ErrorCode::IoError,
                                       "Failed to create stdout pipe",
                                       std::strerror(errno)));
    }

    // Everything the child needs is built here; posix_spawn runs no code of
    // ours between fork and exec.
    std::vector<std::string> argv_storage;
    argv_storage.push_back(impl_->config.command);
    argv_storage.insert(argv_storage.end(),
                        impl_->config.args.begin(), impl_->config.args.end());
    auto argv = to_pointers(argv_storage);
    auto env_storage = build_environment(impl_->config.env);
    auto envp = to_pointers(env_storage);

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdin_pipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdout_pipe[1], STDOUT_FILENO);

    pid_t pid = -1;
    int rc = ::posix_spawnp(&pid, impl_->config.command.c_str(), &actions, nullptr,
                            argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);

    ::close(stdin_pipe[0]);
    ::close(stdout_pipe[1]);

    if (rc != 0) {
        ::close(stdin_pipe[1]);
        ::close(stdout_pipe[0]);
        co_return make_fail(make_error(ErrorCode::ConnectionFailed,
                                       "Failed to spawn MCP server process",
                                       impl_->config.command + ": " + std::strerror(rc)));
    }

    impl_->pid = pid;
    impl_->in = std::make_unique<net::posix::stream_descriptor>(impl_->ioc, stdin_pipe[1]);
    impl_->out = std::make_unique<net::posix::stream_descriptor>(impl_->ioc, stdout_pipe[0]);
    impl_->read_buffer.clear();
    impl_->open = true;

    LOG_INFO("MCP server process started: {} (pid={})", impl_->config.command, pid);
    co_return ok_result();
}

auto StdioTransport::send(const json& message) -> awaitable<VoidResult> {
    if (!impl_->open) {
        co_return make_fail(make_error(ErrorCode::ConnectionClosed,
                                       "Transport not open"));
    }

    auto data = message.dump() + "\n";
    boost::system::error_code ec;
    co_await net::async_write(*impl_->in, net::buffer(data),
                              net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        impl_->open = false;
        co_return make_fail(make_error(ErrorCode::ConnectionClosed,
                                       "Failed to write to MCP server stdin",
                                       ec.message()));
    }
    co_return ok_result();
}

auto StdioTransport::receive() -> awaitable<Result<json>> {
    while (true) {
        if (!impl_->open) {
            co_return make_fail(make_error(ErrorCode::ConnectionClosed,
                                           "Transport not open"));
        }

        boost::system::error_code ec;
        auto n = co_await net::async_read_until(
            *impl_->out, net::dynamic_buffer(impl_->read_buffer), '\n',
            net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            impl_->open = false;
            co_return make_fail(make_error(ErrorCode::ConnectionClosed,
                                           "MCP server stdout closed",
                                           ec.message()));
        }

        auto line = impl_->read_buffer.substr(0, n - 1);
        impl_->read_buffer.erase(0, n);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }

        auto parsed = json::parse(line, nullptr, false);
        if (parsed.is_discarded()) {
            // Servers sometimes print banners on stdout; skip non-JSON lines.
            LOG_DEBUG("Skipping non-JSON line from MCP server: {}", line);
            continue;
        }
        co_return parsed;
    }
}

auto StdioTransport::close() -> awaitable<void> {
    if (impl_->pid > 0 || impl_->open) {
        impl_->close_pipes();
        co_await impl_->stop_child();
        LOG_DEBUG("MCP process transport closed: {}", impl_->config.command);
    }
}

auto StdioTransport::is_open() const -> bool {
    return impl_ && impl_->open;
}

auto StdioTransport::pid() const -> int {
    return impl_->pid;
}

} // namespace superagent::mcp
