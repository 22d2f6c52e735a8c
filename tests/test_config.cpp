#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <stdexcept>

#include "client_config.hpp"

using namespace httpretry::config;
using namespace std::chrono_literals;

namespace {

constexpr const char* kVars[] = {
    "HTTPRETRY_IDENTITY", "HTTPRETRY_TIMEOUT_MS", "HTTPRETRY_MAX_REDIRECTS",
    "HTTPRETRY_CA_FILE", "HTTPRETRY_STUB_HOST", "HTTPRETRY_STUB_PORT"
};

}  // namespace

class ConfigEnvTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        for (const auto* name : kVars) {
            ::unsetenv(name);
        }
    }
};

TEST_F(ConfigEnvTest, ClientDefaults) {
    auto cfg = ClientConfig::from_env_defaults();
    EXPECT_EQ(cfg.identity(), "httpretry/1.0");
    EXPECT_EQ(cfg.connect_timeout(), 10s);
    EXPECT_EQ(cfg.request_timeout(), 30s);
    EXPECT_EQ(cfg.max_redirects(), 10u);
    EXPECT_EQ(cfg.max_body_bytes(), 64u * 1024u * 1024u);
    EXPECT_TRUE(cfg.tls().ca_file.empty());
    EXPECT_TRUE(cfg.tls().verify_peer);
}

TEST_F(ConfigEnvTest, ExplicitIdentity) {
    auto cfg = ClientConfig::from_env_defaults("my-bot/2.1");
    EXPECT_EQ(cfg.identity(), "my-bot/2.1");
}

TEST_F(ConfigEnvTest, EnvironmentOverrides) {
    ::setenv("HTTPRETRY_IDENTITY", "env-bot/1.0", 1);
    ::setenv("HTTPRETRY_TIMEOUT_MS", "2500", 1);
    ::setenv("HTTPRETRY_MAX_REDIRECTS", "0", 1);
    ::setenv("HTTPRETRY_CA_FILE", "/etc/ssl/custom.pem", 1);

    auto cfg = ClientConfig::from_env_defaults("ignored/1.0");
    EXPECT_EQ(cfg.identity(), "env-bot/1.0");
    EXPECT_EQ(cfg.request_timeout(), 2500ms);
    EXPECT_EQ(cfg.max_redirects(), 0u);
    EXPECT_EQ(cfg.tls().ca_file.string(), "/etc/ssl/custom.pem");
}

TEST_F(ConfigEnvTest, MalformedNumberThrows) {
    ::setenv("HTTPRETRY_TIMEOUT_MS", "soon", 1);
    EXPECT_THROW((void)ClientConfig::from_env_defaults(), std::invalid_argument);

    ::setenv("HTTPRETRY_TIMEOUT_MS", "-5", 1);
    EXPECT_THROW((void)ClientConfig::from_env_defaults(), std::invalid_argument);
}

TEST_F(ConfigEnvTest, TimeoutBeyondDurationRangeThrows) {
    ::setenv("HTTPRETRY_TIMEOUT_MS", "18446744073709551615", 1);
    EXPECT_THROW((void)ClientConfig::from_env_defaults(), std::invalid_argument);
}

TEST(MillisTest, ConvertsInRangeCounts) {
    EXPECT_EQ(to_millis(0, "x"), 0ms);
    EXPECT_EQ(to_millis(1500, "x"), 1500ms);
    constexpr auto largest = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    EXPECT_EQ(to_millis(largest, "x").count(), std::numeric_limits<std::int64_t>::max());
}

TEST(MillisTest, RejectsCountsThatWouldWrapNegative) {
    constexpr auto first_bad = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()) + 1;
    EXPECT_THROW((void)to_millis(first_bad, "--backoff-ms"), std::invalid_argument);
    EXPECT_THROW((void)to_millis(std::numeric_limits<std::uint64_t>::max(), "--backoff-ms"), std::invalid_argument);
}

TEST_F(ConfigEnvTest, Builders) {
    auto cfg = ClientConfig{"b/1"}
                   .with_connect_timeout(1s)
                   .with_request_timeout(2s)
                   .with_max_redirects(3)
                   .with_max_body_bytes(1024)
                   .with_tls(TlsConfig{"/tmp/ca.pem", false});
    EXPECT_EQ(cfg.identity(), "b/1");
    EXPECT_EQ(cfg.connect_timeout(), 1s);
    EXPECT_EQ(cfg.request_timeout(), 2s);
    EXPECT_EQ(cfg.max_redirects(), 3u);
    EXPECT_EQ(cfg.max_body_bytes(), 1024u);
    EXPECT_EQ(cfg.tls().ca_file.string(), "/tmp/ca.pem");
    EXPECT_FALSE(cfg.tls().verify_peer);
}

TEST_F(ConfigEnvTest, ListenDefaultsAndOverrides) {
    auto cfg = ListenConfig::from_env_defaults("127.0.0.1", 8080);
    EXPECT_EQ(cfg.addr(), "127.0.0.1:8080");

    ::setenv("HTTPRETRY_STUB_HOST", "0.0.0.0", 1);
    ::setenv("HTTPRETRY_STUB_PORT", "9090", 1);
    cfg = ListenConfig::from_env_defaults("127.0.0.1", 8080);
    EXPECT_EQ(cfg.host(), "0.0.0.0");
    EXPECT_EQ(cfg.port(), 9090);
}

TEST_F(ConfigEnvTest, ListenPortOutOfRangeThrows) {
    ::setenv("HTTPRETRY_STUB_PORT", "70000", 1);
    EXPECT_THROW((void)ListenConfig::from_env_defaults("127.0.0.1", 8080), std::invalid_argument);
}

TEST(ListenConfigTest, Loopback) {
    auto cfg = ListenConfig::loopback();
    EXPECT_EQ(cfg.host(), "127.0.0.1");
    EXPECT_EQ(cfg.port(), 0);
}
