#pragma once

/// @file retrying_requester.hpp
/// @brief Single HTTP request with a status-driven retry policy.
///
/// Demonstrates:
/// - Policy-based design (backoff + logging chosen at compile time)
/// - Runtime strategy for the transport (ITransport)
/// - Perfect forwarding factory methods

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include "beast_transport.hpp"
#include "client_config.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "request.hpp"
#include "retry.hpp"
#include "transport.hpp"

namespace httpretry::client {

// ═══════════════════════════════════════════════════════════════════════════
// BasicRetryingRequester — Value Class Sharing One Transport
// ═══════════════════════════════════════════════════════════════════════════
//
// RULE OF SIX RATIONALE:
// • shared_ptr<ITransport>: copies share the transport, which is safe for
//   concurrent use by contract
// • RetryExecutor: value type holding immutable policies
// • No per-call state is stored, so copies are independent requesters
//
// ═══════════════════════════════════════════════════════════════════════════

/// Issues one request, retrying server errors up to the policy's cutoff.
///
/// @tparam BackoffPolicyT Pause between server-error retries
/// @tparam LoggingPolicyT Where per-attempt lines go (silent by default)
///
/// @par Example
/// @code
/// auto requester = RetryingRequester::create("my-bot/1.0");
/// auto outcome = co_await requester->execute_with_retry(
///     RequestSpec{"https://api.example.com/v0/users/me", "GET", std::nullopt});
/// if (outcome.is_body()) {
///     consume(outcome.body());
/// }
/// @endcode
template<retry::BackoffPolicy BackoffPolicyT = retry::NoBackoffPolicy,
         LoggingPolicy LoggingPolicyT = SilentLoggingPolicy>
class BasicRetryingRequester {
public:
    using Executor = retry::RetryExecutor<BackoffPolicyT, LoggingPolicyT>;

    // ───────────────────────────────────────────────────────────────────────
    // RULE OF SIX: Transport required, everything else defaulted
    // ───────────────────────────────────────────────────────────────────────

    BasicRetryingRequester() = delete;
    ~BasicRetryingRequester() = default;
    BasicRetryingRequester(const BasicRetryingRequester&) = default;
    BasicRetryingRequester& operator=(const BasicRetryingRequester&) = default;
    BasicRetryingRequester(BasicRetryingRequester&&) noexcept = default;
    BasicRetryingRequester& operator=(BasicRetryingRequester&&) noexcept = default;

    /// Wrap an existing transport.
    /// @throws std::invalid_argument if @p transport is null
    explicit BasicRetryingRequester(std::shared_ptr<ITransport> transport,
                                    retry::RetryPolicy policy = retry::RetryPolicy{},
                                    BackoffPolicyT backoff = BackoffPolicyT{},
                                    LoggingPolicyT logging = LoggingPolicyT{})
        : transport_{std::move(transport)}
        , executor_{std::move(policy), std::move(backoff), std::move(logging)}
    {
        if (!transport_) {
            throw std::invalid_argument("BasicRetryingRequester: transport must not be null");
        }
    }

    // ───────────────────────────────────────────────────────────────────────
    // Factory Methods
    // ───────────────────────────────────────────────────────────────────────

    /// Requester over a BeastTransport identifying itself as @p identity,
    /// with the default policy (3 attempts, server-error cutoff at index 1).
    /// @throws TransportInitError if the transport cannot be built
    [[nodiscard]] static auto create(std::string identity) -> std::unique_ptr<BasicRetryingRequester> {
        return create(config::ClientConfig{std::move(identity)});
    }

    /// Requester over a BeastTransport built from @p cfg.
    /// @throws TransportInitError if the transport cannot be built
    template<typename... PolicyArgs>
    [[nodiscard]] static auto create(config::ClientConfig cfg, PolicyArgs&&... policy_args)
        -> std::unique_ptr<BasicRetryingRequester>
    {
        return std::make_unique<BasicRetryingRequester>(
            BeastTransport::create(std::move(cfg)),
            std::forward<PolicyArgs>(policy_args)...
        );
    }

    // ───────────────────────────────────────────────────────────────────────
    // Operations
    // ───────────────────────────────────────────────────────────────────────

    /// Perform the request/retry loop.
    ///
    /// @return Body for 2xx, StatusCode for 4xx or for a 5xx that reached the
    ///         cutoff (or exhausted the budget)
    /// @throws TransportError on an invalid method token (before any network
    ///         activity) or on any transport failure (never retried)
    [[nodiscard]] auto execute_with_retry(RequestSpec spec) const -> asio::awaitable<RequestOutcome> {
        auto result = co_await execute_with_retry_detailed(std::move(spec));
        co_return std::move(result.outcome);
    }

    /// Same loop, also reporting attempt count and backoff time.
    [[nodiscard]] auto execute_with_retry_detailed(RequestSpec spec) const
        -> asio::awaitable<retry::RetryResult>
    {
        if (!is_valid_method_token(spec.method)) {
            throw TransportError{TransportErrorKind::InvalidMethod, spec.url,
                                 "'" + spec.method + "' is not an HTTP method token"};
        }

        const std::string body = spec.body_or_empty();
        co_return co_await executor_.execute([this, &spec, &body](std::size_t /*attempt*/) {
            return transport_->send(spec.method, spec.url, body);
        });
    }

    // ───────────────────────────────────────────────────────────────────────
    // Accessors
    // ───────────────────────────────────────────────────────────────────────

    [[nodiscard]] auto policy() const noexcept -> const retry::RetryPolicy& { return executor_.policy(); }
    [[nodiscard]] auto transport() const noexcept -> const std::shared_ptr<ITransport>& { return transport_; }

private:
    std::shared_ptr<ITransport> transport_;
    Executor executor_;
};


// ───────────────────────────────────────────────────────────────────────────
// Type Aliases
// ───────────────────────────────────────────────────────────────────────────

/// Immediate retries, no output.
using RetryingRequester = BasicRetryingRequester<retry::NoBackoffPolicy, SilentLoggingPolicy>;

/// Fixed pause between retries, per-attempt lines on stderr.
using VerboseRetryingRequester = BasicRetryingRequester<retry::FixedBackoffPolicy, ConsoleLoggingPolicy>;

}  // namespace httpretry::client
