#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "request.hpp"
#include "retry.hpp"

using namespace httpretry;

// ═══════════════════════════════════════════════════════════════════════════
// Status classification
// ═══════════════════════════════════════════════════════════════════════════

TEST(ClassifyTest, SuccessRange) {
    EXPECT_EQ(classify(200), AttemptResult::Success);
    EXPECT_EQ(classify(204), AttemptResult::Success);
    EXPECT_EQ(classify(299), AttemptResult::Success);
}

TEST(ClassifyTest, ClientErrorRange) {
    EXPECT_EQ(classify(400), AttemptResult::ClientError);
    EXPECT_EQ(classify(404), AttemptResult::ClientError);
    EXPECT_EQ(classify(429), AttemptResult::ClientError);
    EXPECT_EQ(classify(499), AttemptResult::ClientError);
}

TEST(ClassifyTest, ServerErrorRange) {
    EXPECT_EQ(classify(500), AttemptResult::ServerError);
    EXPECT_EQ(classify(503), AttemptResult::ServerError);
    EXPECT_EQ(classify(599), AttemptResult::ServerError);
}

TEST(ClassifyTest, InformationalAndRedirectAreTerminal) {
    EXPECT_EQ(classify(100), AttemptResult::ClientError);
    EXPECT_EQ(classify(199), AttemptResult::ClientError);
    EXPECT_EQ(classify(301), AttemptResult::ClientError);
    EXPECT_EQ(classify(304), AttemptResult::ClientError);
    EXPECT_EQ(classify(600), AttemptResult::ClientError);
}

TEST(ClassifyTest, Names) {
    EXPECT_EQ(to_string(AttemptResult::Success), "SUCCESS");
    EXPECT_EQ(to_string(AttemptResult::ServerError), "SERVER_ERROR");
    EXPECT_EQ(to_string(AttemptResult::TransportFailure), "TRANSPORT_FAILURE");
}

// ═══════════════════════════════════════════════════════════════════════════
// Method tokens
// ═══════════════════════════════════════════════════════════════════════════

TEST(MethodTokenTest, StandardVerbs) {
    for (const auto* m : {"GET", "POST", "PUT", "PATCH", "DELETE", "HEAD", "OPTIONS"}) {
        EXPECT_TRUE(is_valid_method_token(m)) << m;
    }
}

TEST(MethodTokenTest, ExtensionVerbs) {
    EXPECT_TRUE(is_valid_method_token("PROPFIND"));
    EXPECT_TRUE(is_valid_method_token("X-CUSTOM"));
    EXPECT_TRUE(is_valid_method_token("get"));
}

TEST(MethodTokenTest, Rejected) {
    EXPECT_FALSE(is_valid_method_token(""));
    EXPECT_FALSE(is_valid_method_token("GE T"));
    EXPECT_FALSE(is_valid_method_token("GET\r\n"));
    EXPECT_FALSE(is_valid_method_token("POST/"));
    EXPECT_FALSE(is_valid_method_token("(GET)"));
}

// ═══════════════════════════════════════════════════════════════════════════
// RequestSpec / RequestOutcome
// ═══════════════════════════════════════════════════════════════════════════

TEST(RequestSpecTest, Defaults) {
    RequestSpec spec{"http://example.com/"};
    EXPECT_EQ(spec.method, "GET");
    EXPECT_FALSE(spec.body.has_value());
    EXPECT_EQ(spec.body_or_empty(), "");

    spec.body = "payload";
    EXPECT_EQ(spec.body_or_empty(), "payload");
}

TEST(RequestOutcomeTest, BodyVariant) {
    auto outcome = RequestOutcome::from_body("hello");
    ASSERT_TRUE(outcome.is_body());
    EXPECT_FALSE(outcome.is_status());
    EXPECT_EQ(outcome.body(), "hello");
    EXPECT_THROW((void)outcome.status(), std::bad_variant_access);

    auto text = std::move(outcome).take_body();
    EXPECT_EQ(text, "hello");
}

TEST(RequestOutcomeTest, StatusVariant) {
    auto outcome = RequestOutcome::from_status(503);
    ASSERT_TRUE(outcome.is_status());
    EXPECT_EQ(outcome.status(), 503);
    EXPECT_THROW((void)outcome.body(), std::bad_variant_access);
}

TEST(RequestOutcomeTest, SuccessStatusIsNotATerminalStatus) {
    EXPECT_THROW((void)RequestOutcome::from_status(200), std::invalid_argument);
    EXPECT_THROW((void)RequestOutcome::from_status(299), std::invalid_argument);
    EXPECT_NO_THROW((void)RequestOutcome::from_status(301));
}

TEST(RequestOutcomeTest, Equality) {
    EXPECT_EQ(RequestOutcome::from_body("a"), RequestOutcome::from_body("a"));
    EXPECT_NE(RequestOutcome::from_body("a"), RequestOutcome::from_body("b"));
    EXPECT_EQ(RequestOutcome::from_status(404), RequestOutcome::from_status(404));
    EXPECT_NE(RequestOutcome::from_status(404), RequestOutcome::from_status(500));
}

// ═══════════════════════════════════════════════════════════════════════════
// RetryPolicy
// ═══════════════════════════════════════════════════════════════════════════

TEST(RetryPolicyTest, Defaults) {
    retry::RetryPolicy policy;
    EXPECT_EQ(policy.max_attempts(), 3u);
    EXPECT_EQ(policy.server_error_cutoff(), 1u);
}

TEST(RetryPolicyTest, ZeroAttemptsRejected) {
    EXPECT_THROW(retry::RetryPolicy{0}, std::invalid_argument);
    EXPECT_THROW((void)retry::RetryPolicy{}.with_max_attempts(0), std::invalid_argument);
}

TEST(RetryPolicyTest, Builders) {
    auto policy = retry::RetryPolicy{}.with_max_attempts(5).with_server_error_cutoff(3);
    EXPECT_EQ(policy.max_attempts(), 5u);
    EXPECT_EQ(policy.server_error_cutoff(), 3u);
}
