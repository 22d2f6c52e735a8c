#pragma once

/// @file beast_transport.hpp
/// @brief HTTP/1.1 transport over Boost.Beast (plain TCP or TLS).
///
/// Demonstrates:
/// - Non-copyable resource class shared through std::shared_ptr
/// - Asio awaitable coroutines with per-exchange stream ownership
/// - Error-code to exception mapping at each I/O stage

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include "client_config.hpp"
#include "request.hpp"
#include "transport.hpp"
#include "url.hpp"

namespace httpretry::client {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;


// ═══════════════════════════════════════════════════════════════════════════
// BeastTransport — Shared, Non-Movable Resource Class
// ═══════════════════════════════════════════════════════════════════════════
//
// RULE OF SIX RATIONALE:
//
// This class owns:
// • SSL context (OpenSSL state, one per transport, shared by every exchange)
// • ClientConfig (value type)
//
// DECISION: Non-copyable, non-movable, held by shared_ptr
// • Requesters share one transport; coroutines in flight keep it alive
//   through the requester that owns the shared_ptr
// • Each exchange owns its socket/stream inside the coroutine frame, so
//   no per-request state lives here and concurrent send() calls are safe
//
// ═══════════════════════════════════════════════════════════════════════════

/// Connection-per-request HTTP/1.1 client.
///
/// @par Redirects
/// 301/302/303/307/308 with a Location header are followed up to
/// ClientConfig::max_redirects(). 301/302/303 turn any method other than
/// GET/HEAD into a body-less GET. With max_redirects() == 0 the 3xx is
/// returned as is.
///
/// @par Example
/// @code
/// auto transport = BeastTransport::create(config::ClientConfig{"my-bot/1.0"});
/// auto res = co_await transport->send("GET", "https://example.com/", "");
/// @endcode
class BeastTransport final : public ITransport {
public:
    ~BeastTransport() override = default;

    /// Build a transport.
    /// @throws TransportInitError if the identity is not a valid header value
    ///         or the TLS context cannot load its trust store
    [[nodiscard]] static auto create(config::ClientConfig cfg) -> std::shared_ptr<BeastTransport>;

    /// Perform one exchange, following redirects.
    /// @throws TransportError on any failure to obtain a final response
    auto send(std::string method, std::string url, std::string body)
        -> asio::awaitable<TransportResponse> override;

    [[nodiscard]] auto client_config() const noexcept -> const config::ClientConfig& { return cfg_; }

private:
    explicit BeastTransport(config::ClientConfig cfg);

    using Request = http::request<http::string_body>;
    using Response = http::response<http::string_body>;

    [[nodiscard]] auto make_request(const Url& url, const std::string& method, const std::string& body) const
        -> Request;

    /// One connection, one request, one response.
    auto exchange(const Url& url, const std::string& method, const std::string& body)
        -> asio::awaitable<Response>;

    config::ClientConfig cfg_;
    std::unique_ptr<ssl::context> ssl_ctx_;
};

/// True if @p value can be sent as an HTTP header field value.
[[nodiscard]] auto is_valid_header_value(std::string_view value) noexcept -> bool;

/// True if @p host is an IPv4 or IPv6 address rather than a DNS name.
[[nodiscard]] auto is_ip_literal(const std::string& host) noexcept -> bool;

}  // namespace httpretry::client
