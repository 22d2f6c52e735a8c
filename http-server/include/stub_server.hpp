#pragma once

/// @file stub_server.hpp
/// @brief Plain-HTTP stub server for exercising the client end to end.
///
/// Demonstrates:
/// - Rule of Six: Move-only resource class
/// - Perfect forwarding factory method
/// - Runtime strategy for request handling (std::function)
/// - Asio awaitable coroutines

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "client_config.hpp"

namespace httpretry::server {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;


/// What a handler sees of an incoming request.
struct StubRequest {
    std::string method;
    std::string target;
    std::string user_agent;
    std::string body;
};

/// What a handler sends back. A non-empty location becomes a Location header.
struct StubReply {
    unsigned status{200};
    std::string body;
    std::string location;
};

using Handler = std::function<StubReply(const StubRequest&)>;

/// Routes served by `httpretry-stub`:
/// - `/status/<code>`: replies with that status
/// - `/echo`: 200 with "<method> <user-agent>\n<body>"
/// - `/flaky/<n>`: 503 for the first n hits on that path, then 200
/// - `/redirect?to=<target>`: 302 to target
/// - `/loop`: 302 to itself
/// - anything else: 404
///
/// Hit counters live in the returned handler; copies share them.
[[nodiscard]] auto default_routes() -> Handler;


// ═══════════════════════════════════════════════════════════════════════════
// StubServer — Move-Only Resource Class
// ═══════════════════════════════════════════════════════════════════════════
//
// RULE OF SIX RATIONALE:
//
// This class manages unique resources:
// • TCP acceptor (socket handle, cannot be duplicated)
// • io_context reference (external lifetime, not owned)
//
// DECISION: Move-only semantics
// • Default ctor: Deleted (requires valid io_context)
// • Destructor: Closes acceptor
// • Copy ops: DELETED: acceptor cannot be duplicated
// • Move ops: Transfer ownership, source left stopped
//
// Moving a server after run() is not supported: the accept loop holds `this`.
//
// ═══════════════════════════════════════════════════════════════════════════

/// Connection-per-request HTTP/1.1 server.
///
/// @par Thread Safety
/// Not thread-safe. Run from a single thread; stop() must be called from
/// the thread running the io_context, or after it has stopped.
///
/// @par Example
/// @code
/// auto server = StubServer::create(ioc, config::ListenConfig::loopback(), default_routes());
/// server->run();
/// auto url = fmt::format("http://127.0.0.1:{}/status/503", server->port());
/// ioc.run();
/// @endcode
class StubServer {
public:
    // ───────────────────────────────────────────────────────────────────────
    // RULE OF SIX: Move-Only Pattern
    // ───────────────────────────────────────────────────────────────────────

    StubServer() = delete;
    ~StubServer();

    StubServer(const StubServer&) = delete;
    StubServer& operator=(const StubServer&) = delete;

    StubServer(StubServer&& other) noexcept;
    StubServer& operator=(StubServer&& other) noexcept;

    // ───────────────────────────────────────────────────────────────────────
    // Factory Methods
    // ───────────────────────────────────────────────────────────────────────

    /// Bind and listen.
    /// @throws boost::system::system_error if the address is invalid or
    ///         bind/listen fails
    template<typename... Args>
    [[nodiscard]] static auto create(Args&&... args) -> std::unique_ptr<StubServer> {
        return std::unique_ptr<StubServer>(new StubServer(std::forward<Args>(args)...));
    }

    // ───────────────────────────────────────────────────────────────────────
    // Server Operations
    // ───────────────────────────────────────────────────────────────────────

    /// Spawn the accept loop. Returns immediately.
    void run();

    /// Close the acceptor. Sessions in flight finish their exchange.
    void stop();

    [[nodiscard]] auto is_running() const noexcept -> bool {
        return running_.load(std::memory_order_acquire);
    }

    /// Bound port (the ephemeral one when configured with port 0).
    [[nodiscard]] auto port() const -> std::uint16_t;

    /// Requests served so far.
    [[nodiscard]] auto requests_served() const noexcept -> std::size_t {
        return served_.load(std::memory_order_acquire);
    }

private:
    explicit StubServer(asio::io_context& ioc, const config::ListenConfig& cfg, Handler handler);

    auto accept_loop() -> asio::awaitable<void>;
    auto handle_session(tcp::socket socket) -> asio::awaitable<void>;

    [[nodiscard]] auto build_response(const http::request<http::string_body>& req)
        -> http::response<http::string_body>;

    asio::io_context& ioc_;
    tcp::acceptor acceptor_;
    config::ListenConfig cfg_;
    Handler handler_;
    std::atomic<bool> running_{false};
    std::atomic<std::size_t> served_{0};
};

}  // namespace httpretry::server
