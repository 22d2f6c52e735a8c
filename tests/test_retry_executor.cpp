#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

#include "logging.hpp"
#include "retry.hpp"
#include "test_support.hpp"

using namespace httpretry;
using namespace httpretry::retry;
using namespace std::chrono_literals;
using httpretry::test_support::run_sync;

namespace {

/// Attempt function replaying a list of statuses, one per attempt.
struct StatusSequence {
    std::vector<std::uint16_t> statuses;
    std::vector<std::size_t>* seen;

    auto operator()(std::size_t attempt) const -> boost::asio::awaitable<TransportResponse> {
        seen->push_back(attempt);
        const auto idx = std::min(attempt, statuses.size() - 1);
        co_return TransportResponse{statuses[idx], "body " + std::to_string(attempt)};
    }
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Backoff policies
// ═══════════════════════════════════════════════════════════════════════════

TEST(BackoffPolicyTest, NoBackoffIsZero) {
    NoBackoffPolicy policy;
    EXPECT_EQ(policy.delay_for(0), Duration::zero());
    EXPECT_EQ(policy.delay_for(10), Duration::zero());
}

TEST(BackoffPolicyTest, FixedIsConstant) {
    FixedBackoffPolicy policy{250ms};
    EXPECT_EQ(policy.delay_for(0), 250ms);
    EXPECT_EQ(policy.delay_for(7), 250ms);
}

TEST(BackoffPolicyTest, ExponentialGrowsWithoutJitter) {
    ExponentialBackoffPolicy policy{BackoffConfig{}.with_initial_delay(100ms).with_jitter(0.0)};
    EXPECT_EQ(policy.delay_for(0), 100ms);
    EXPECT_EQ(policy.delay_for(1), 200ms);
    EXPECT_EQ(policy.delay_for(2), 400ms);
    EXPECT_EQ(policy.delay_for(3), 800ms);
}

TEST(BackoffPolicyTest, ExponentialIsCapped) {
    ExponentialBackoffPolicy policy{
        BackoffConfig{}.with_initial_delay(1s).with_max_delay(5s).with_jitter(0.0)};
    EXPECT_EQ(policy.delay_for(2), 4s);
    EXPECT_EQ(policy.delay_for(3), 5s);
    EXPECT_EQ(policy.delay_for(60), 5s);
}

TEST(BackoffPolicyTest, JitterStaysInBand) {
    ExponentialBackoffPolicy policy{BackoffConfig{}.with_initial_delay(1000ms).with_jitter(0.1)};
    for (int i = 0; i < 100; ++i) {
        const auto d = policy.delay_for(0);
        EXPECT_GE(d, 900ms);
        EXPECT_LE(d, 1100ms);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// RetryExecutor
// ═══════════════════════════════════════════════════════════════════════════

TEST(RetryExecutorTest, StopsAtServerErrorCutoff) {
    std::vector<std::size_t> seen;
    DefaultRetryExecutor executor{RetryPolicy{5}};

    auto result = run_sync(executor.execute(StatusSequence{{503}, &seen}));

    EXPECT_EQ(seen, (std::vector<std::size_t>{0, 1}));
    EXPECT_EQ(result.attempts, 2u);
    EXPECT_EQ(result.last_attempt, AttemptResult::ServerError);
    EXPECT_EQ(result.outcome, RequestOutcome::from_status(503));
}

TEST(RetryExecutorTest, CutoffZeroReturnsFirstServerError) {
    std::vector<std::size_t> seen;
    DefaultRetryExecutor executor{RetryPolicy{3, 0}};

    auto result = run_sync(executor.execute(StatusSequence{{500}, &seen}));

    EXPECT_EQ(result.attempts, 1u);
    EXPECT_EQ(result.outcome, RequestOutcome::from_status(500));
}

TEST(RetryExecutorTest, LaterCutoffAllowsMoreRetries) {
    std::vector<std::size_t> seen;
    DefaultRetryExecutor executor{RetryPolicy{5, 3}};

    auto result = run_sync(executor.execute(StatusSequence{{500, 502, 503, 200}, &seen}));

    EXPECT_EQ(result.attempts, 4u);
    EXPECT_EQ(result.outcome, RequestOutcome::from_body("body 3"));
}

TEST(RetryExecutorTest, ExhaustedBudgetReturnsLastStatus) {
    std::vector<std::size_t> seen;
    DefaultRetryExecutor executor{RetryPolicy{2, 10}};

    auto result = run_sync(executor.execute(StatusSequence{{500, 502}, &seen}));

    EXPECT_EQ(result.attempts, 2u);
    EXPECT_EQ(result.outcome, RequestOutcome::from_status(502));
}

TEST(RetryExecutorTest, BackoffOnlyBetweenAttempts) {
    std::vector<std::size_t> seen;
    RetryExecutor<FixedBackoffPolicy> executor{RetryPolicy{3}, FixedBackoffPolicy{5ms}};

    auto result = run_sync(executor.execute(StatusSequence{{503}, &seen}));

    EXPECT_EQ(result.attempts, 2u);
    EXPECT_EQ(result.total_delay, 5ms);
}

TEST(RetryExecutorTest, NoBackoffAfterTerminalOutcome) {
    std::vector<std::size_t> seen;
    RetryExecutor<FixedBackoffPolicy> executor{RetryPolicy{3}, FixedBackoffPolicy{5ms}};

    auto result = run_sync(executor.execute(StatusSequence{{404}, &seen}));

    EXPECT_EQ(result.attempts, 1u);
    EXPECT_EQ(result.total_delay, Duration::zero());
}

TEST(RetryExecutorTest, LogsEveryAttempt) {
    std::vector<std::string> lines;
    RetryExecutor<NoBackoffPolicy, CallbackLoggingPolicy> executor{
        RetryPolicy{3},
        NoBackoffPolicy{},
        CallbackLoggingPolicy{[&lines](std::string_view line) { lines.emplace_back(line); }}
    };
    std::vector<std::size_t> seen;

    (void)run_sync(executor.execute(StatusSequence{{500, 200}, &seen}));

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "attempt 0: status 500 -> SERVER_ERROR");
    EXPECT_EQ(lines[1], "attempt 1: status 200 -> SUCCESS");
}

TEST(RetryExecutorTest, LogsBudgetExhaustion) {
    std::vector<std::string> lines;
    RetryExecutor<NoBackoffPolicy, CallbackLoggingPolicy> executor{
        RetryPolicy{1},
        NoBackoffPolicy{},
        CallbackLoggingPolicy{[&lines](std::string_view line) { lines.emplace_back(line); }}
    };
    std::vector<std::size_t> seen;

    auto result = run_sync(executor.execute(StatusSequence{{500}, &seen}));

    EXPECT_EQ(result.outcome, RequestOutcome::from_status(500));
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[1], "retry budget of 1 exhausted, returning status 500");
}

TEST(RetryExecutorTest, ExceptionIsLoggedAndRethrown) {
    std::vector<std::string> lines;
    RetryExecutor<NoBackoffPolicy, CallbackLoggingPolicy> executor{
        RetryPolicy{3},
        NoBackoffPolicy{},
        CallbackLoggingPolicy{[&lines](std::string_view line) { lines.emplace_back(line); }}
    };
    std::size_t calls = 0;

    auto failing = [&calls](std::size_t) -> boost::asio::awaitable<TransportResponse> {
        ++calls;
        throw TransportError{TransportErrorKind::Read, "http://x/", "reset"};
        co_return TransportResponse{};
    };

    EXPECT_THROW(run_sync(executor.execute(failing)), TransportError);
    EXPECT_EQ(calls, 1u);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("TRANSPORT_FAILURE"), std::string::npos);
}
