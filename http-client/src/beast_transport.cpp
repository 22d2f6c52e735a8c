#include "beast_transport.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <exception>
#include <utility>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>

#include <fmt/core.h>

#include "errors.hpp"

namespace httpretry::client {

namespace {

auto stage_error(TransportErrorKind kind, const Url& url, const beast::error_code& ec) -> TransportError {
    if (ec == beast::error::timeout) {
        kind = TransportErrorKind::Timeout;
    }
    return TransportError{kind, url.to_string(), ec.message(), ec};
}

[[nodiscard]] constexpr auto is_redirect(unsigned status) noexcept -> bool {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

template<typename TcpStream>
auto connect_stream(TcpStream& stream,
                    const tcp::resolver::results_type& endpoints,
                    const Url& url,
                    std::chrono::milliseconds timeout) -> asio::awaitable<void>
{
    stream.expires_after(timeout);

    beast::error_code ec;
    co_await stream.async_connect(endpoints, asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        throw stage_error(TransportErrorKind::Connect, url, ec);
    }
}

template<typename Stream, typename Request, typename Response>
auto write_and_read(Stream& stream,
                    Request& req,
                    const Url& url,
                    const config::ClientConfig& cfg) -> asio::awaitable<Response>
{
    beast::get_lowest_layer(stream).expires_after(cfg.request_timeout());

    beast::error_code ec;
    co_await http::async_write(stream, req, asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        throw stage_error(TransportErrorKind::Write, url, ec);
    }

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(cfg.max_body_bytes());
    // A HEAD response advertises a Content-Length but carries no body.
    if (req.method() == http::verb::head) {
        parser.skip(true);
    }

    co_await http::async_read(stream, buffer, parser, asio::redirect_error(asio::use_awaitable, ec));
    if (ec == http::error::body_limit) {
        throw TransportError{TransportErrorKind::BodyTooLarge, url.to_string(),
                             fmt::format("response body exceeds {} bytes", cfg.max_body_bytes()), ec};
    }
    if (ec) {
        throw stage_error(TransportErrorKind::Read, url, ec);
    }

    co_return parser.release();
}

}  // namespace

auto is_valid_header_value(std::string_view value) noexcept -> bool {
    return std::none_of(value.begin(), value.end(), [](char c) {
        const auto uc = static_cast<unsigned char>(c);
        return (uc < 0x20 && uc != '\t') || uc == 0x7f;
    });
}

auto is_ip_literal(const std::string& host) noexcept -> bool {
    boost::system::error_code ec;
    (void)asio::ip::make_address(host, ec);
    return !ec;
}


// ═══════════════════════════════════════════════════════════════════════════
// CONSTRUCTION
// ═══════════════════════════════════════════════════════════════════════════

BeastTransport::BeastTransport(config::ClientConfig cfg)
    : cfg_{std::move(cfg)}
{
    if (!is_valid_header_value(cfg_.identity())) {
        throw TransportInitError{"client identity contains control characters"};
    }

    try {
        ssl_ctx_ = std::make_unique<ssl::context>(ssl::context::tls_client);
        ssl_ctx_->set_options(
            ssl::context::default_workarounds |
            ssl::context::no_sslv2 |
            ssl::context::no_sslv3 |
            ssl::context::no_tlsv1 |
            ssl::context::no_tlsv1_1
        );

        if (cfg_.tls().verify_peer) {
            ssl_ctx_->set_verify_mode(ssl::verify_peer);
            if (cfg_.tls().ca_file.empty()) {
                ssl_ctx_->set_default_verify_paths();
            } else {
                ssl_ctx_->load_verify_file(cfg_.tls().ca_file.string());
            }
        } else {
            ssl_ctx_->set_verify_mode(ssl::verify_none);
        }
    } catch (const boost::system::system_error& e) {
        throw TransportInitError{fmt::format("TLS context setup failed: {}", e.what())};
    }
}

auto BeastTransport::create(config::ClientConfig cfg) -> std::shared_ptr<BeastTransport> {
    return std::shared_ptr<BeastTransport>(new BeastTransport(std::move(cfg)));
}


// ═══════════════════════════════════════════════════════════════════════════
// REQUEST PIPELINE
// ═══════════════════════════════════════════════════════════════════════════

auto BeastTransport::send(std::string method, std::string url, std::string body)
    -> asio::awaitable<TransportResponse>
{
    if (!is_valid_method_token(method)) {
        throw TransportError{TransportErrorKind::InvalidMethod, url,
                             fmt::format("'{}' is not an HTTP method token", method)};
    }

    auto target = Url::parse(url);
    if (!target) {
        throw TransportError{TransportErrorKind::InvalidUrl, url, "not an absolute http(s) URL"};
    }

    for (std::size_t hop = 0;; ++hop) {
        auto res = co_await exchange(*target, method, body);
        const auto status = static_cast<std::uint16_t>(res.result_int());

        const auto location = res[http::field::location];
        if (!is_redirect(status) || location.empty() || cfg_.max_redirects() == 0) {
            co_return TransportResponse{status, std::move(res.body())};
        }

        if (hop + 1 > cfg_.max_redirects()) {
            throw TransportError{TransportErrorKind::TooManyRedirects, target->to_string(),
                                 fmt::format("stopped after {} redirects", cfg_.max_redirects())};
        }

        auto next = target->resolve(std::string_view{location.data(), location.size()});
        if (!next) {
            throw TransportError{TransportErrorKind::InvalidUrl, std::string(location.data(), location.size()),
                                 "unusable redirect location"};
        }

        if ((status == 301 || status == 302 || status == 303) && method != "GET" && method != "HEAD") {
            method = "GET";
            body.clear();
        }
        target = std::move(next);
    }
}

auto BeastTransport::make_request(const Url& url, const std::string& method, const std::string& body) const
    -> Request
{
    Request req;
    const auto verb = http::string_to_verb(method);
    if (verb == http::verb::unknown) {
        req.method_string(method);
    } else {
        req.method(verb);
    }
    req.target(url.target);
    req.version(11);
    req.set(http::field::host, url.host_header());
    req.set(http::field::user_agent, cfg_.identity());
    req.set(http::field::accept, "*/*");
    // Connection is not reused.
    req.keep_alive(false);
    req.body() = body;
    req.prepare_payload();
    return req;
}

auto BeastTransport::exchange(const Url& url, const std::string& method, const std::string& body)
    -> asio::awaitable<Response>
{
    auto executor = co_await asio::this_coro::executor;
    beast::error_code ec;

    tcp::resolver resolver{executor};
    const auto endpoints = co_await resolver.async_resolve(
        url.host,
        std::to_string(url.port),
        asio::redirect_error(asio::use_awaitable, ec)
    );
    if (ec) {
        throw stage_error(TransportErrorKind::Resolve, url, ec);
    }

    auto req = make_request(url, method, body);

    if (!url.is_tls()) {
        beast::tcp_stream stream{executor};
        co_await connect_stream(stream, endpoints, url, cfg_.connect_timeout());

        auto res = co_await write_and_read<beast::tcp_stream, Request, Response>(stream, req, url, cfg_);

        // Peer may already have closed; the response is complete either way.
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        co_return res;
    }

    beast::ssl_stream<beast::tcp_stream> stream{executor, *ssl_ctx_};

    // SNI carries DNS names only, never address literals (RFC 6066 section 3).
    if (!is_ip_literal(url.host) && !SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
        beast::error_code sni_ec{static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()};
        throw stage_error(TransportErrorKind::Tls, url, sni_ec);
    }
    if (cfg_.tls().verify_peer) {
        stream.set_verify_callback(ssl::host_name_verification(url.host));
    }

    co_await connect_stream(beast::get_lowest_layer(stream), endpoints, url, cfg_.connect_timeout());

    beast::get_lowest_layer(stream).expires_after(cfg_.request_timeout());
    co_await stream.async_handshake(ssl::stream_base::client, asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        throw stage_error(TransportErrorKind::Tls, url, ec);
    }

    auto res = co_await write_and_read<beast::ssl_stream<beast::tcp_stream>, Request, Response>(
        stream, req, url, cfg_);

    // No close_notify round trip: the stream is dropped and the socket closed.
    beast::get_lowest_layer(stream).close();
    co_return res;
}

}  // namespace httpretry::client
