#pragma once

/// @file transport.hpp
/// @brief Abstract HTTP transport consumed by the requester.

#include <string>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include "request.hpp"

namespace httpretry::client {

namespace asio = boost::asio;

// ═══════════════════════════════════════════════════════════════════════════
// ITransport — Runtime Strategy Interface
// ═══════════════════════════════════════════════════════════════════════════

/// One request/response exchange per call.
///
/// Implementations own their connection management, TLS and timeouts, must
/// be safe for concurrent send() calls, and report every failure to obtain
/// a response by throwing httpretry::TransportError.
class ITransport {
public:
    virtual ~ITransport() = default;

    virtual auto send(std::string method, std::string url, std::string body)
        -> asio::awaitable<TransportResponse> = 0;

    // Non-copyable, non-movable (interface class)
    ITransport(const ITransport&) = delete;
    ITransport& operator=(const ITransport&) = delete;
    ITransport(ITransport&&) = delete;
    ITransport& operator=(ITransport&&) = delete;

protected:
    ITransport() = default;
};

}  // namespace httpretry::client
