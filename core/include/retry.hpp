#pragma once

/// @file retry.hpp
/// @brief Status-driven retry loop with policy-based backoff.
///
/// Demonstrates:
/// - Policy-based design for backoff and logging
/// - Asio coroutine integration
/// - Rule of Six for value-type policies

#include <algorithm>
#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <random>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <fmt/core.h>

#include "logging.hpp"
#include "request.hpp"

namespace httpretry::retry {

namespace asio = boost::asio;
using namespace std::chrono_literals;


// ═══════════════════════════════════════════════════════════════════════════
// Defaults
// ═══════════════════════════════════════════════════════════════════════════

using Duration = std::chrono::milliseconds;

constexpr std::size_t kDefaultMaxAttempts = 3;
constexpr std::size_t kDefaultServerErrorCutoff = 1;
constexpr Duration kDefaultInitialDelay = 100ms;
constexpr Duration kDefaultMaxDelay = 30s;
constexpr double kDefaultMultiplier = 2.0;
constexpr double kDefaultJitterFactor = 0.1;


// ═══════════════════════════════════════════════════════════════════════════
// RetryPolicy — Validated Value Class
// ═══════════════════════════════════════════════════════════════════════════
//
// RULE OF SIX RATIONALE:
// • Two size_t members, trivially copyable
// • Invariant (max_attempts >= 1) enforced by every constructor/builder
//
// ═══════════════════════════════════════════════════════════════════════════

/// How many attempts a call may make, and at which attempt index server
/// errors stop being retried. The two are independent knobs: with the
/// defaults (3, 1) a 5xx streak ends after the second attempt.
class RetryPolicy {
public:
    RetryPolicy() = default;
    ~RetryPolicy() = default;
    RetryPolicy(const RetryPolicy&) = default;
    RetryPolicy& operator=(const RetryPolicy&) = default;
    RetryPolicy(RetryPolicy&&) noexcept = default;
    RetryPolicy& operator=(RetryPolicy&&) noexcept = default;

    /// @throws std::invalid_argument if @p max_attempts is zero
    explicit RetryPolicy(std::size_t max_attempts,
                         std::size_t server_error_cutoff = kDefaultServerErrorCutoff)
        : max_attempts_{checked(max_attempts)}
        , server_error_cutoff_{server_error_cutoff}
    {}

    [[nodiscard]] auto with_max_attempts(std::size_t n) && -> RetryPolicy {
        max_attempts_ = checked(n);
        return std::move(*this);
    }

    [[nodiscard]] auto with_server_error_cutoff(std::size_t attempt_index) && -> RetryPolicy {
        server_error_cutoff_ = attempt_index;
        return std::move(*this);
    }

    [[nodiscard]] auto max_attempts() const noexcept -> std::size_t { return max_attempts_; }
    [[nodiscard]] auto server_error_cutoff() const noexcept -> std::size_t { return server_error_cutoff_; }

private:
    static auto checked(std::size_t n) -> std::size_t {
        if (n == 0) {
            throw std::invalid_argument("RetryPolicy: max_attempts must be at least 1");
        }
        return n;
    }

    std::size_t max_attempts_{kDefaultMaxAttempts};
    std::size_t server_error_cutoff_{kDefaultServerErrorCutoff};
};


// ═══════════════════════════════════════════════════════════════════════════
// BackoffConfig — Configuration Value Class
// ═══════════════════════════════════════════════════════════════════════════

/// Parameters for exponential backoff between server-error retries.
struct BackoffConfig {
    Duration initial_delay{kDefaultInitialDelay};
    Duration max_delay{kDefaultMaxDelay};
    double multiplier{kDefaultMultiplier};

    /// Jitter factor (0.0 - 1.0) to randomize delays.
    double jitter_factor{kDefaultJitterFactor};

    [[nodiscard]] auto with_initial_delay(Duration d) && -> BackoffConfig {
        initial_delay = d;
        return std::move(*this);
    }

    [[nodiscard]] auto with_max_delay(Duration d) && -> BackoffConfig {
        max_delay = d;
        return std::move(*this);
    }

    [[nodiscard]] auto with_multiplier(double m) && -> BackoffConfig {
        multiplier = m;
        return std::move(*this);
    }

    [[nodiscard]] auto with_jitter(double j) && -> BackoffConfig {
        jitter_factor = j;
        return std::move(*this);
    }
};


// ═══════════════════════════════════════════════════════════════════════════
// BACKOFF POLICY CONCEPT
// ═══════════════════════════════════════════════════════════════════════════

/// Concept for backoff delay calculation policies.
template<typename P>
concept BackoffPolicy = requires(const P policy, std::size_t attempt) {
    { policy.delay_for(attempt) } -> std::convertible_to<Duration>;
};

/// Retry immediately. The loop skips the timer entirely.
struct NoBackoffPolicy {
    [[nodiscard]] auto delay_for(std::size_t /*attempt*/) const noexcept -> Duration {
        return Duration::zero();
    }
};

/// Same delay before every retry.
class FixedBackoffPolicy {
public:
    FixedBackoffPolicy() = default;

    explicit FixedBackoffPolicy(Duration delay)
        : delay_{delay}
    {}

    [[nodiscard]] auto delay_for(std::size_t /*attempt*/) const noexcept -> Duration {
        return delay_;
    }

private:
    Duration delay_{Duration::zero()};
};

/// Exponential backoff with optional jitter.
///
/// delay = min(initial * (multiplier ^ attempt) * (1 ± jitter), max_delay)
///
/// Holds no PRNG state: concurrent calls share the policy, so the generator
/// is thread_local.
class ExponentialBackoffPolicy {
public:
    ExponentialBackoffPolicy() = default;

    explicit ExponentialBackoffPolicy(const BackoffConfig& config)
        : config_{config}
    {}

    [[nodiscard]] auto delay_for(std::size_t attempt) const -> Duration {
        const auto cap = static_cast<double>(config_.max_delay.count());
        double base_ms = static_cast<double>(config_.initial_delay.count());
        for (std::size_t i = 0; i < attempt && base_ms < cap; ++i) {
            base_ms *= config_.multiplier;
        }

        if (config_.jitter_factor > 0.0) {
            thread_local std::mt19937 rng{std::random_device{}()};
            std::uniform_real_distribution<double> dist(1.0 - config_.jitter_factor,
                                                        1.0 + config_.jitter_factor);
            base_ms *= dist(rng);
        }

        return Duration{static_cast<Duration::rep>(std::min(base_ms, cap))};
    }

    [[nodiscard]] auto config() const noexcept -> const BackoffConfig& { return config_; }

private:
    BackoffConfig config_;
};


// ═══════════════════════════════════════════════════════════════════════════
// RetryResult — Outcome with Attempt Metadata
// ═══════════════════════════════════════════════════════════════════════════

struct RetryResult {
    RequestOutcome outcome;
    std::size_t attempts{0};          ///< Transport calls made
    Duration total_delay{0};          ///< Time spent in backoff
    AttemptResult last_attempt{AttemptResult::Success};
};


// ═══════════════════════════════════════════════════════════════════════════
// RetryExecutor — Coroutine-Based Status Retry Loop
// ═══════════════════════════════════════════════════════════════════════════
//
// RULE OF SIX RATIONALE:
// • Policies are value types with correct special members
// • No executor is stored: timers bind to the calling coroutine's executor,
//   so one RetryExecutor can serve any number of io_contexts
//
// ═══════════════════════════════════════════════════════════════════════════

/// Runs attempts until the status classification says stop.
///
/// Per attempt:
/// - 2xx returns a Body outcome
/// - 4xx (and any non-2xx/5xx) returns a StatusCode outcome
/// - 5xx returns a StatusCode outcome at the cutoff index, otherwise retries
/// - an exception from the attempt propagates unchanged, never retried
///
/// Exhausting max_attempts returns the last status seen.
///
/// @par Example
/// @code
/// RetryExecutor<> executor{RetryPolicy{3}};
/// auto result = co_await executor.execute([&](std::size_t) {
///     return transport.send("GET", url, "");
/// });
/// @endcode
template<BackoffPolicy BackoffPolicyT = NoBackoffPolicy,
         LoggingPolicy LoggingPolicyT = SilentLoggingPolicy>
class RetryExecutor {
public:
    RetryExecutor() = default;
    ~RetryExecutor() = default;
    RetryExecutor(const RetryExecutor&) = default;
    RetryExecutor& operator=(const RetryExecutor&) = default;
    RetryExecutor(RetryExecutor&&) noexcept = default;
    RetryExecutor& operator=(RetryExecutor&&) noexcept = default;

    explicit RetryExecutor(RetryPolicy policy,
                           BackoffPolicyT backoff = BackoffPolicyT{},
                           LoggingPolicyT logging = LoggingPolicyT{})
        : policy_{std::move(policy)}
        , backoff_{std::move(backoff)}
        , logging_{std::move(logging)}
    {}

    /// Execute @p attempt_fn under the policy.
    ///
    /// @p attempt_fn is called with the zero-based attempt index and must
    /// return asio::awaitable<TransportResponse>.
    template<typename F>
        requires std::invocable<F&, std::size_t> &&
                 std::same_as<std::invoke_result_t<F&, std::size_t>, asio::awaitable<TransportResponse>>
    [[nodiscard]] auto execute(F&& attempt_fn) const -> asio::awaitable<RetryResult> {
        RetryResult result;
        std::uint16_t last_status = 0;

        for (std::size_t attempt = 0; attempt < policy_.max_attempts(); ++attempt) {
            result.attempts = attempt + 1;

            TransportResponse response;
            try {
                response = co_await std::invoke(attempt_fn, attempt);
            } catch (const std::exception& e) {
                logging_.log(fmt::format("attempt {}: {} ({})", attempt,
                                         to_string(AttemptResult::TransportFailure), e.what()));
                throw;
            }

            result.last_attempt = classify(response.status);
            logging_.log(fmt::format("attempt {}: status {} -> {}", attempt,
                                     response.status, to_string(result.last_attempt)));

            switch (result.last_attempt) {
                case AttemptResult::Success:
                    result.outcome = RequestOutcome::from_body(std::move(response.body));
                    co_return result;

                case AttemptResult::ClientError:
                    result.outcome = RequestOutcome::from_status(response.status);
                    co_return result;

                case AttemptResult::ServerError:
                    last_status = response.status;
                    if (attempt == policy_.server_error_cutoff()) {
                        result.outcome = RequestOutcome::from_status(response.status);
                        co_return result;
                    }
                    break;

                case AttemptResult::TransportFailure:
                    break;
            }

            // Don't delay after last attempt
            if (attempt + 1 < policy_.max_attempts()) {
                const Duration delay = backoff_.delay_for(attempt);
                if (delay > Duration::zero()) {
                    result.total_delay += delay;
                    asio::steady_timer timer{co_await asio::this_coro::executor, delay};
                    co_await timer.async_wait(asio::use_awaitable);
                }
            }
        }

        logging_.log(fmt::format("retry budget of {} exhausted, returning status {}",
                                 policy_.max_attempts(), last_status));
        result.outcome = RequestOutcome::from_status(last_status);
        co_return result;
    }

    [[nodiscard]] auto policy() const noexcept -> const RetryPolicy& { return policy_; }
    [[nodiscard]] auto backoff() const noexcept -> const BackoffPolicyT& { return backoff_; }
    [[nodiscard]] auto logging() const noexcept -> const LoggingPolicyT& { return logging_; }

private:
    RetryPolicy policy_;
    BackoffPolicyT backoff_;
    LoggingPolicyT logging_;
};


// ───────────────────────────────────────────────────────────────────────────
// Type Aliases
// ───────────────────────────────────────────────────────────────────────────

/// Immediate retries, no output.
using DefaultRetryExecutor = RetryExecutor<NoBackoffPolicy, SilentLoggingPolicy>;

/// Fixed pause between retries, console output.
using VerboseRetryExecutor = RetryExecutor<FixedBackoffPolicy, ConsoleLoggingPolicy>;

}  // namespace httpretry::retry
