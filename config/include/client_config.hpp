#pragma once

/// @file client_config.hpp
/// @brief Client and listener configuration following Rule of Six patterns.
///
/// Value classes with rvalue builder methods and environment-backed
/// named constructors.

#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace httpretry::config {

using namespace std::chrono_literals;

constexpr std::string_view kDefaultIdentity = "httpretry/1.0";
constexpr std::chrono::milliseconds kDefaultConnectTimeout = 10s;
constexpr std::chrono::milliseconds kDefaultRequestTimeout = 30s;
constexpr std::size_t kDefaultMaxRedirects = 10;
constexpr std::uint64_t kDefaultMaxBodyBytes = 64ULL * 1024 * 1024;


// ═══════════════════════════════════════════════════════════════════════════
// Environment Helpers
// ═══════════════════════════════════════════════════════════════════════════

/// Read a non-empty environment variable.
[[nodiscard]] inline auto env_string(const char* name) -> std::optional<std::string> {
    const char* env = std::getenv(name);
    if (env && *env) {
        return std::string{env};
    }
    return std::nullopt;
}

/// Read an unsigned environment variable.
/// @throws std::invalid_argument if the variable is set but not a number
template<typename Unsigned>
[[nodiscard]] auto env_unsigned(const char* name) -> std::optional<Unsigned> {
    auto text = env_string(name);
    if (!text) {
        return std::nullopt;
    }

    Unsigned value{};
    const auto* first = text->data();
    const auto* last = text->data() + text->size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        throw std::invalid_argument(std::string{name} + ": expected an unsigned integer, got '" + *text + "'");
    }
    return value;
}

/// Convert an unsigned millisecond count into a duration.
/// @throws std::invalid_argument if @p count does not fit the duration's rep
[[nodiscard]] inline auto to_millis(std::uint64_t count, std::string_view what) -> std::chrono::milliseconds {
    constexpr auto limit = static_cast<std::uint64_t>(std::numeric_limits<std::chrono::milliseconds::rep>::max());
    if (count > limit) {
        throw std::invalid_argument(std::string{what} + ": " + std::to_string(count) + " ms is out of range");
    }
    return std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(count)};
}


// ═══════════════════════════════════════════════════════════════════════════
// TlsConfig — Trivial Class Pattern (All Default)
// ═══════════════════════════════════════════════════════════════════════════
//
// RULE OF SIX RATIONALE:
// • std::filesystem::path and bool members (value types)
// • No raw pointers, handles, or unique resources
// • Compiler-generated operations are correct
//
// ═══════════════════════════════════════════════════════════════════════════

/// Trust-store settings for https targets.
class TlsConfig {
public:
    TlsConfig() = default;
    ~TlsConfig() = default;
    TlsConfig(const TlsConfig&) = default;
    TlsConfig& operator=(const TlsConfig&) = default;
    TlsConfig(TlsConfig&&) noexcept = default;
    TlsConfig& operator=(TlsConfig&&) noexcept = default;

    explicit TlsConfig(std::filesystem::path ca, bool verify = true)
        : ca_file{std::move(ca)}
        , verify_peer{verify}
    {}

    /// Uses HTTPRETRY_CA_FILE, falls back to the system trust store.
    [[nodiscard]] static auto from_env() -> TlsConfig {
        TlsConfig tls;
        if (auto ca = env_string("HTTPRETRY_CA_FILE")) {
            tls.ca_file = std::move(*ca);
        }
        return tls;
    }

    /// Empty => system default verify paths.
    std::filesystem::path ca_file;
    bool verify_peer{true};
};


// ═══════════════════════════════════════════════════════════════════════════
// ClientConfig — Value Class with Builder Methods
// ═══════════════════════════════════════════════════════════════════════════

/// Everything a transport needs to know before its first request.
///
/// @par Example Usage
/// @code
/// auto cfg = ClientConfig::from_env_defaults("my-bot/2.1")
///                .with_request_timeout(5s)
///                .with_max_redirects(0);
/// @endcode
class ClientConfig {
public:
    // ───────────────────────────────────────────────────────────────────────
    // RULE OF SIX: All Defaulted
    // ───────────────────────────────────────────────────────────────────────

    ClientConfig() = default;
    ~ClientConfig() = default;
    ClientConfig(const ClientConfig&) = default;
    ClientConfig& operator=(const ClientConfig&) = default;
    ClientConfig(ClientConfig&&) noexcept = default;
    ClientConfig& operator=(ClientConfig&&) noexcept = default;

    explicit ClientConfig(std::string identity)
        : identity_{std::move(identity)}
    {}

    // ───────────────────────────────────────────────────────────────────────
    // Factory Methods (Named Constructors)
    // ───────────────────────────────────────────────────────────────────────

    /// Start from @p identity, then apply HTTPRETRY_IDENTITY,
    /// HTTPRETRY_TIMEOUT_MS, HTTPRETRY_MAX_REDIRECTS and HTTPRETRY_CA_FILE.
    /// @throws std::invalid_argument on malformed numeric variables
    [[nodiscard]] static auto from_env_defaults(std::string identity = std::string{kDefaultIdentity})
        -> ClientConfig
    {
        ClientConfig cfg{std::move(identity)};
        if (auto id = env_string("HTTPRETRY_IDENTITY")) {
            cfg.identity_ = std::move(*id);
        }
        if (auto ms = env_unsigned<std::uint64_t>("HTTPRETRY_TIMEOUT_MS")) {
            cfg.request_timeout_ = to_millis(*ms, "HTTPRETRY_TIMEOUT_MS");
        }
        if (auto n = env_unsigned<std::size_t>("HTTPRETRY_MAX_REDIRECTS")) {
            cfg.max_redirects_ = *n;
        }
        cfg.tls_ = TlsConfig::from_env();
        return cfg;
    }

    // ───────────────────────────────────────────────────────────────────────
    // Builder Methods (Fluent Interface)
    // ───────────────────────────────────────────────────────────────────────

    [[nodiscard]] auto with_identity(std::string identity) && -> ClientConfig {
        identity_ = std::move(identity);
        return std::move(*this);
    }

    [[nodiscard]] auto with_connect_timeout(std::chrono::milliseconds t) && -> ClientConfig {
        connect_timeout_ = t;
        return std::move(*this);
    }

    [[nodiscard]] auto with_request_timeout(std::chrono::milliseconds t) && -> ClientConfig {
        request_timeout_ = t;
        return std::move(*this);
    }

    [[nodiscard]] auto with_max_redirects(std::size_t n) && -> ClientConfig {
        max_redirects_ = n;
        return std::move(*this);
    }

    [[nodiscard]] auto with_max_body_bytes(std::uint64_t n) && -> ClientConfig {
        max_body_bytes_ = n;
        return std::move(*this);
    }

    [[nodiscard]] auto with_tls(TlsConfig tls) && -> ClientConfig {
        tls_ = std::move(tls);
        return std::move(*this);
    }

    // ───────────────────────────────────────────────────────────────────────
    // Accessors
    // ───────────────────────────────────────────────────────────────────────

    [[nodiscard]] auto identity() const noexcept -> const std::string& { return identity_; }
    [[nodiscard]] auto connect_timeout() const noexcept -> std::chrono::milliseconds { return connect_timeout_; }
    [[nodiscard]] auto request_timeout() const noexcept -> std::chrono::milliseconds { return request_timeout_; }
    [[nodiscard]] auto max_redirects() const noexcept -> std::size_t { return max_redirects_; }
    [[nodiscard]] auto max_body_bytes() const noexcept -> std::uint64_t { return max_body_bytes_; }
    [[nodiscard]] auto tls() const noexcept -> const TlsConfig& { return tls_; }

private:
    std::string identity_{kDefaultIdentity};
    std::chrono::milliseconds connect_timeout_{kDefaultConnectTimeout};
    std::chrono::milliseconds request_timeout_{kDefaultRequestTimeout};
    std::size_t max_redirects_{kDefaultMaxRedirects};
    std::uint64_t max_body_bytes_{kDefaultMaxBodyBytes};
    TlsConfig tls_;
};


// ═══════════════════════════════════════════════════════════════════════════
// ListenConfig — Trivial Class Pattern
// ═══════════════════════════════════════════════════════════════════════════

/// Address the stub server binds to. Port 0 picks an ephemeral port.
class ListenConfig {
public:
    ListenConfig() = default;

    ListenConfig(std::string host, std::uint16_t port)
        : host_{std::move(host)}
        , port_{port}
    {}

    /// HTTPRETRY_STUB_HOST / HTTPRETRY_STUB_PORT override the arguments.
    [[nodiscard]] static auto from_env_defaults(std::string host, std::uint16_t port)
        -> ListenConfig
    {
        ListenConfig cfg{std::move(host), port};
        if (auto h = env_string("HTTPRETRY_STUB_HOST")) {
            cfg.host_ = std::move(*h);
        }
        if (auto p = env_unsigned<std::uint16_t>("HTTPRETRY_STUB_PORT")) {
            cfg.port_ = *p;
        }
        return cfg;
    }

    /// Loopback, ephemeral port.
    [[nodiscard]] static auto loopback() -> ListenConfig {
        return ListenConfig{"127.0.0.1", 0};
    }

    [[nodiscard]] auto host() const noexcept -> const std::string& { return host_; }
    [[nodiscard]] auto port() const noexcept -> std::uint16_t { return port_; }

    [[nodiscard]] auto addr() const -> std::string {
        return host_ + ":" + std::to_string(port_);
    }

private:
    std::string host_{"127.0.0.1"};
    std::uint16_t port_{8080};
};

}  // namespace httpretry::config
