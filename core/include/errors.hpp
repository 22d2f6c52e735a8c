#pragma once

/// @file errors.hpp
/// @brief Error taxonomy.
///
/// Transport-level failures are exceptions; status outcomes are data.
/// The HttpStatusError family exists for host adapters that want to turn
/// a StatusCode outcome into an exception at their own boundary.

#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include <boost/system/error_code.hpp>

#include "request.hpp"

namespace httpretry {

// ═══════════════════════════════════════════════════════════════════════════
// TransportErrorKind
// ═══════════════════════════════════════════════════════════════════════════

/// Stage at which an exchange failed.
enum class TransportErrorKind : std::uint8_t {
    InvalidMethod    = 0,
    InvalidUrl       = 1,
    Resolve          = 2,
    Connect          = 3,
    Tls              = 4,
    Write            = 5,
    Read             = 6,
    Timeout          = 7,
    TooManyRedirects = 8,
    BodyTooLarge     = 9
};

[[nodiscard]] constexpr auto to_string(TransportErrorKind k) noexcept -> std::string_view {
    constexpr std::array<std::string_view, 10> names = {
        "invalid method", "invalid url", "resolve", "connect", "tls",
        "write", "read", "timeout", "too many redirects", "body too large"
    };
    const auto idx = static_cast<std::size_t>(k);
    return idx < names.size() ? names[idx] : "unknown";
}


// ═══════════════════════════════════════════════════════════════════════════
// Transport Errors
// ═══════════════════════════════════════════════════════════════════════════

/// Construction-time failure to build the underlying transport.
class TransportInitError : public std::runtime_error {
public:
    explicit TransportInitError(const std::string& what)
        : std::runtime_error{what}
    {}
};

/// Failure to complete a request/response exchange. Never retried by the
/// requester.
class TransportError : public std::runtime_error {
public:
    TransportError(TransportErrorKind kind,
                   std::string url,
                   const std::string& detail,
                   boost::system::error_code cause = {});

    [[nodiscard]] auto kind() const noexcept -> TransportErrorKind { return kind_; }
    [[nodiscard]] auto url() const noexcept -> const std::string& { return url_; }
    [[nodiscard]] auto cause() const noexcept -> const boost::system::error_code& { return cause_; }

private:
    TransportErrorKind kind_;
    std::string url_;
    boost::system::error_code cause_;
};


// ═══════════════════════════════════════════════════════════════════════════
// Status Errors (host adapter side)
// ═══════════════════════════════════════════════════════════════════════════

/// Non-success status surfaced as an exception by a host adapter.
class HttpStatusError : public std::runtime_error {
public:
    HttpStatusError(std::uint16_t status, std::string url, const std::string& message);

    [[nodiscard]] auto status() const noexcept -> std::uint16_t { return status_; }
    [[nodiscard]] auto url() const noexcept -> const std::string& { return url_; }

private:
    std::uint16_t status_;
    std::string url_;
};

class BadRequest : public HttpStatusError {
public:
    using HttpStatusError::HttpStatusError;
};

class Unauthorized : public HttpStatusError {
public:
    using HttpStatusError::HttpStatusError;
};

class Forbidden : public HttpStatusError {
public:
    using HttpStatusError::HttpStatusError;
};

class NotFound : public HttpStatusError {
public:
    using HttpStatusError::HttpStatusError;
};

/// Any 5xx that outlived the retry policy.
class ServiceUnavailable : public HttpStatusError {
public:
    using HttpStatusError::HttpStatusError;
};

/// Throw the HttpStatusError subclass matching @p status.
[[noreturn]] void throw_for_status(std::uint16_t status, std::string url, std::string_view reason = {});

/// Return the body of a Body outcome, or throw the matching status error.
///
/// A StatusCode outcome keeps only the code, not the response body, so the
/// message carries no server-supplied reason (such as a JSON "reason"
/// field). Callers that need one call throw_for_status() with the reason
/// they extracted themselves.
[[nodiscard]] auto body_or_throw(const RequestOutcome& outcome, std::string_view url) -> std::string;

}  // namespace httpretry
