#pragma once

/// @file request.hpp
/// @brief Request/outcome data model and status classification.
///
/// Covers:
/// - RequestSpec: what to send
/// - TransportResponse: what one exchange produced
/// - RequestOutcome: the two-variant result handed back to callers
/// - AttemptResult: per-attempt classification driving the retry loop

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace httpretry {

// ═══════════════════════════════════════════════════════════════════════════
// AttemptResult — Enum Class with String Conversion
// ═══════════════════════════════════════════════════════════════════════════

/// Classification of a single attempt.
enum class AttemptResult : std::uint8_t {
    Success          = 0,   ///< 2xx
    ClientError      = 1,   ///< 4xx, and any status outside 2xx/4xx/5xx
    ServerError      = 2,   ///< 5xx
    TransportFailure = 3    ///< no response at all
};

/// Convert attempt result to string representation.
[[nodiscard]] constexpr auto to_string(AttemptResult r) noexcept -> std::string_view {
    constexpr std::array<std::string_view, 4> names = {
        "SUCCESS", "CLIENT_ERROR", "SERVER_ERROR", "TRANSPORT_FAILURE"
    };
    const auto idx = static_cast<std::size_t>(r);
    return idx < names.size() ? names[idx] : "UNKNOWN";
}

[[nodiscard]] constexpr auto is_success_status(std::uint16_t status) noexcept -> bool {
    return status >= 200 && status < 300;
}

[[nodiscard]] constexpr auto is_client_error_status(std::uint16_t status) noexcept -> bool {
    return status >= 400 && status < 500;
}

[[nodiscard]] constexpr auto is_server_error_status(std::uint16_t status) noexcept -> bool {
    return status >= 500 && status < 600;
}

/// Classify a received status code.
///
/// Redirects are followed by the transport before a status gets here, so
/// 1xx/3xx (and anything else unassigned) are terminal and never retried:
/// they share the ClientError branch.
[[nodiscard]] constexpr auto classify(std::uint16_t status) noexcept -> AttemptResult {
    if (is_success_status(status)) return AttemptResult::Success;
    if (is_server_error_status(status)) return AttemptResult::ServerError;
    return AttemptResult::ClientError;
}


// ═══════════════════════════════════════════════════════════════════════════
// Method Tokens
// ═══════════════════════════════════════════════════════════════════════════

/// True if @p method is a non-empty HTTP `token` (RFC 9110 §5.6.2).
[[nodiscard]] constexpr auto is_valid_method_token(std::string_view method) noexcept -> bool {
    if (method.empty()) {
        return false;
    }
    for (const char c : method) {
        const bool alnum = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
        if (alnum) {
            continue;
        }
        switch (c) {
            case '!': case '#': case '$': case '%': case '&': case '\'':
            case '*': case '+': case '-': case '.': case '^': case '_':
            case '`': case '|': case '~':
                continue;
            default:
                return false;
        }
    }
    return true;
}


// ═══════════════════════════════════════════════════════════════════════════
// RequestSpec — Value Class (All Default)
// ═══════════════════════════════════════════════════════════════════════════

/// Description of one logical request. Immutable for the duration of a call.
struct RequestSpec {
    std::string url;
    std::string method{"GET"};
    std::optional<std::string> body;

    /// Body to put on the wire; an absent body is sent empty.
    [[nodiscard]] auto body_or_empty() const -> std::string {
        return body.value_or(std::string{});
    }
};


/// Raw result of one request/response exchange.
struct TransportResponse {
    std::uint16_t status{0};
    std::string body;
};


// ═══════════════════════════════════════════════════════════════════════════
// RequestOutcome — Tagged Union with Rule of Six (All Default)
// ═══════════════════════════════════════════════════════════════════════════
//
// RULE OF SIX RATIONALE:
// • Wraps std::variant of two value types
// • Compiler-generated operations are correct
// • Default construction yields an empty Body (needed by co_spawn, which
//   default-constructs the result when the coroutine throws)
//
// ═══════════════════════════════════════════════════════════════════════════

/// Successful response payload.
struct ResponseBody {
    std::string text;

    friend auto operator==(const ResponseBody&, const ResponseBody&) -> bool = default;
};

/// Terminal non-success status.
struct StatusCode {
    std::uint16_t code{0};

    friend auto operator==(const StatusCode&, const StatusCode&) -> bool = default;
};

/// Final data result of a call: either a success body or a terminal status.
class RequestOutcome {
public:
    using Value = std::variant<ResponseBody, StatusCode>;

    // Rule of Six: All Default
    RequestOutcome() = default;
    ~RequestOutcome() = default;
    RequestOutcome(const RequestOutcome&) = default;
    RequestOutcome& operator=(const RequestOutcome&) = default;
    RequestOutcome(RequestOutcome&&) noexcept = default;
    RequestOutcome& operator=(RequestOutcome&&) noexcept = default;

    /// Build a Body outcome.
    [[nodiscard]] static auto from_body(std::string text) -> RequestOutcome {
        return RequestOutcome{ResponseBody{std::move(text)}};
    }

    /// Build a StatusCode outcome.
    /// @throws std::invalid_argument if @p code is a success code
    [[nodiscard]] static auto from_status(std::uint16_t code) -> RequestOutcome {
        if (is_success_status(code)) {
            throw std::invalid_argument("success status " + std::to_string(code) +
                                        " cannot be a terminal status outcome");
        }
        return RequestOutcome{StatusCode{code}};
    }

    [[nodiscard]] auto is_body() const noexcept -> bool {
        return std::holds_alternative<ResponseBody>(value_);
    }

    [[nodiscard]] auto is_status() const noexcept -> bool {
        return std::holds_alternative<StatusCode>(value_);
    }

    /// @throws std::bad_variant_access if this is a StatusCode outcome
    [[nodiscard]] auto body() const -> const std::string& {
        return std::get<ResponseBody>(value_).text;
    }

    /// @throws std::bad_variant_access if this is a Body outcome
    [[nodiscard]] auto status() const -> std::uint16_t {
        return std::get<StatusCode>(value_).code;
    }

    [[nodiscard]] auto value() const noexcept -> const Value& {
        return value_;
    }

    /// Move the body out (for large payloads).
    [[nodiscard]] auto take_body() && -> std::string {
        return std::move(std::get<ResponseBody>(value_).text);
    }

    friend auto operator==(const RequestOutcome&, const RequestOutcome&) -> bool = default;

private:
    explicit RequestOutcome(Value v)
        : value_{std::move(v)}
    {}

    Value value_;
};

}  // namespace httpretry
