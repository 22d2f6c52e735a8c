#pragma once

/// @file route.hpp
/// @brief Fluent URL builder for REST-style APIs.

#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace httpretry {

/// Percent-encode @p value. Unreserved characters and '/' pass through.
[[nodiscard]] auto percent_encode(std::string_view value) -> std::string;

// ═══════════════════════════════════════════════════════════════════════════
// Route — Value Class with Builder Methods
// ═══════════════════════════════════════════════════════════════════════════

/// Immutable route: every builder call returns a new Route.
///
/// @par Example
/// @code
/// Route api{"https://api.example.com/v0"};
/// auto url = api.path("channels").arg(channel_id).path("messages").url();
/// // https://api.example.com/v0/channels/<id>/messages
/// @endcode
class Route {
public:
    // Rule of Six: All Default
    Route() = default;
    ~Route() = default;
    Route(const Route&) = default;
    Route& operator=(const Route&) = default;
    Route(Route&&) noexcept = default;
    Route& operator=(Route&&) noexcept = default;

    explicit Route(std::string base_url, std::string route = {})
        : base_url_{std::move(base_url)}
        , route_{std::move(route)}
    {}

    /// Append a literal path segment.
    [[nodiscard]] auto path(std::string_view segment) const -> Route {
        return Route{base_url_, route_ + "/" + std::string{segment}};
    }

    /// Append a value segment (percent-encoded).
    [[nodiscard]] auto arg(std::string_view value) const -> Route {
        return Route{base_url_, route_ + "/" + percent_encode(value)};
    }

    template<typename Integral>
        requires std::is_integral_v<Integral>
    [[nodiscard]] auto arg(Integral value) const -> Route {
        return arg(std::to_string(value));
    }

    [[nodiscard]] auto url() const -> std::string { return base_url_ + route_; }
    [[nodiscard]] auto route() const noexcept -> const std::string& { return route_; }

private:
    std::string base_url_;
    std::string route_;
};

}  // namespace httpretry
