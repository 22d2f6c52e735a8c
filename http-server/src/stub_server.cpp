#include "stub_server.hpp"

#include <charconv>
#include <chrono>
#include <exception>
#include <map>
#include <mutex>
#include <string_view>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/version.hpp>

#include <fmt/core.h>

namespace httpretry::server {

// ═══════════════════════════════════════════════════════════════════════════
// DEFAULT ROUTES
// ═══════════════════════════════════════════════════════════════════════════

namespace {

auto parse_unsigned(std::string_view text) -> std::optional<unsigned> {
    unsigned value = 0;
    const auto* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), last, value);
    if (ec != std::errc{} || ptr != last || text.empty()) {
        return std::nullopt;
    }
    return value;
}

auto strip_prefix(std::string_view text, std::string_view prefix) -> std::optional<std::string_view> {
    if (text.substr(0, prefix.size()) != prefix) {
        return std::nullopt;
    }
    return text.substr(prefix.size());
}

/// Hits per flaky path, shared by every copy of the handler.
class FlakyCounter {
public:
    auto hit(const std::string& path) -> unsigned {
        std::lock_guard lock{mutex_};
        return ++hits_[path];
    }

private:
    std::mutex mutex_;
    std::map<std::string, unsigned> hits_;
};

}  // namespace

auto default_routes() -> Handler {
    auto counter = std::make_shared<FlakyCounter>();

    return [counter](const StubRequest& req) -> StubReply {
        std::string_view target{req.target};
        std::string_view path = target.substr(0, target.find('?'));

        if (auto code = strip_prefix(path, "/status/")) {
            auto value = parse_unsigned(*code);
            if (!value || *value < 100 || *value > 999) {
                return StubReply{400, "bad status code\n", {}};
            }
            return StubReply{*value, fmt::format("status {}\n", *value), {}};
        }

        if (path == "/echo") {
            return StubReply{200, fmt::format("{} {}\n{}", req.method, req.user_agent, req.body), {}};
        }

        if (auto count = strip_prefix(path, "/flaky/")) {
            auto failures = parse_unsigned(*count);
            if (!failures) {
                return StubReply{400, "bad failure count\n", {}};
            }
            const auto hit = counter->hit(std::string{path});
            if (hit <= *failures) {
                return StubReply{503, fmt::format("failure {} of {}\n", hit, *failures), {}};
            }
            return StubReply{200, fmt::format("ok after {} failures\n", *failures), {}};
        }

        if (path == "/redirect") {
            auto to = strip_prefix(target, "/redirect?to=");
            if (!to || to->empty()) {
                return StubReply{400, "missing to=\n", {}};
            }
            return StubReply{302, {}, std::string{*to}};
        }

        if (path == "/loop") {
            return StubReply{302, {}, "/loop"};
        }

        return StubReply{404, "not found\n", {}};
    };
}


// ═══════════════════════════════════════════════════════════════════════════
// RULE OF SIX IMPLEMENTATION
// ═══════════════════════════════════════════════════════════════════════════

StubServer::StubServer(asio::io_context& ioc, const config::ListenConfig& cfg, Handler handler)
    : ioc_{ioc}
    , acceptor_{ioc}
    , cfg_{cfg}
    , handler_{std::move(handler)}
{
    if (!handler_) {
        handler_ = default_routes();
    }

    tcp::endpoint endpoint{asio::ip::make_address(cfg_.host()), cfg_.port()};
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
}

StubServer::~StubServer() {
    if (running_.load(std::memory_order_acquire)) {
        stop();
    }
}

StubServer::StubServer(StubServer&& other) noexcept
    : ioc_{other.ioc_}
    , acceptor_{std::move(other.acceptor_)}
    , cfg_{std::move(other.cfg_)}
    , handler_{std::move(other.handler_)}
    , running_{other.running_.exchange(false)}
    , served_{other.served_.exchange(0)}
{}

StubServer& StubServer::operator=(StubServer&& other) noexcept {
    if (this != &other) {
        if (running_.load(std::memory_order_acquire)) {
            stop();
        }

        // ioc_ stays bound to this server's context.
        acceptor_ = std::move(other.acceptor_);
        cfg_ = std::move(other.cfg_);
        handler_ = std::move(other.handler_);
        running_.store(other.running_.exchange(false), std::memory_order_release);
        served_.store(other.served_.exchange(0), std::memory_order_release);
    }
    return *this;
}


// ═══════════════════════════════════════════════════════════════════════════
// SERVER OPERATIONS
// ═══════════════════════════════════════════════════════════════════════════

void StubServer::run() {
    running_.store(true, std::memory_order_release);
    fmt::print("[STUB] Listening on {}:{}\n", cfg_.host(), port());

    asio::co_spawn(ioc_, accept_loop(), asio::detached);
}

void StubServer::stop() {
    running_.store(false, std::memory_order_release);

    beast::error_code ec;
    acceptor_.close(ec);

    if (ec) {
        fmt::print("[STUB] Error closing acceptor: {}\n", ec.message());
    } else {
        fmt::print("[STUB] Stopped\n");
    }
}

auto StubServer::port() const -> std::uint16_t {
    return acceptor_.local_endpoint().port();
}


// ═══════════════════════════════════════════════════════════════════════════
// COROUTINE HANDLERS
// ═══════════════════════════════════════════════════════════════════════════

auto StubServer::accept_loop() -> asio::awaitable<void> {
    while (running_.load(std::memory_order_acquire)) {
        beast::error_code ec;
        tcp::socket socket = co_await acceptor_.async_accept(asio::redirect_error(asio::use_awaitable, ec));

        if (ec) {
            if (!running_.load(std::memory_order_acquire)) {
                break;
            }
            fmt::print("[STUB] Accept error: {}\n", ec.message());
            continue;
        }

        asio::co_spawn(ioc_, handle_session(std::move(socket)), asio::detached);
    }
}

auto StubServer::handle_session(tcp::socket socket) -> asio::awaitable<void> {
    beast::tcp_stream stream{std::move(socket)};
    beast::flat_buffer buffer;
    beast::error_code ec;

    for (;;) {
        stream.expires_after(std::chrono::seconds{30});

        http::request<http::string_body> req;
        co_await http::async_read(stream, buffer, req, asio::redirect_error(asio::use_awaitable, ec));
        if (ec == http::error::end_of_stream) {
            break;
        }
        if (ec) {
            fmt::print("[STUB] Read error: {}\n", ec.message());
            break;
        }

        auto res = build_response(req);
        served_.fetch_add(1, std::memory_order_acq_rel);

        co_await http::async_write(stream, res, asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            fmt::print("[STUB] Write error: {}\n", ec.message());
            break;
        }
        if (!res.keep_alive()) {
            break;
        }
    }

    // Client may already be gone.
    stream.socket().shutdown(tcp::socket::shutdown_send, ec);
}

auto StubServer::build_response(const http::request<http::string_body>& req)
    -> http::response<http::string_body>
{
    const auto method = req.method_string();
    const auto target = req.target();
    const auto user_agent = req[http::field::user_agent];

    StubRequest in{
        std::string(method.data(), method.size()),
        std::string(target.data(), target.size()),
        std::string(user_agent.data(), user_agent.size()),
        req.body()
    };

    StubReply out;
    try {
        out = handler_(in);
    } catch (const std::exception& e) {
        fmt::print("[STUB] Handler exception: {}\n", e.what());
        out = StubReply{500, fmt::format("handler failed: {}\n", e.what()), {}};
    }

    fmt::print("[STUB] {} {} -> {}\n", in.method, in.target, out.status);

    http::response<http::string_body> res;
    res.version(req.version());
    res.result(out.status);
    res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
    res.set(http::field::content_type, "text/plain");
    if (!out.location.empty()) {
        res.set(http::field::location, out.location);
    }
    res.keep_alive(req.keep_alive());
    if (req.method() == http::verb::head) {
        // Length of the entity a GET would return, no payload bytes.
        res.content_length(out.body.size());
        return res;
    }
    res.body() = std::move(out.body);
    res.prepare_payload();
    return res;
}

}  // namespace httpretry::server
