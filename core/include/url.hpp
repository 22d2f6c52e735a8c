#pragma once

/// @file url.hpp
/// @brief Absolute-URL model for http/https targets, parsed and resolved
///        through libcurl's URL API.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace httpretry {

/// Parsed http(s) URL.
///
/// @par Example
/// @code
/// auto u = Url::parse("https://api.example.com/v0/users?id=1");
/// // u->host == "api.example.com", u->port == 443, u->target == "/v0/users?id=1"
/// @endcode
struct Url {
    std::string scheme;   ///< "http" or "https", lower-case
    std::string host;     ///< without IPv6 brackets
    std::uint16_t port{0};
    std::string target{"/"};  ///< path + query, never empty

    /// Parse an absolute URL. Returns nullopt for anything that is not a
    /// well-formed http/https URL. Userinfo and fragment are dropped.
    [[nodiscard]] static auto parse(std::string_view text) -> std::optional<Url>;

    /// Resolve a redirect Location against this URL (RFC 3986 section 5.2,
    /// dot segments removed).
    [[nodiscard]] auto resolve(std::string_view location) const -> std::optional<Url>;

    [[nodiscard]] auto is_tls() const noexcept -> bool { return scheme == "https"; }

    [[nodiscard]] auto default_port() const noexcept -> std::uint16_t {
        return is_tls() ? 443 : 80;
    }

    /// Value for the Host header (port omitted when it is the default).
    [[nodiscard]] auto host_header() const -> std::string;

    [[nodiscard]] auto to_string() const -> std::string;

    friend auto operator==(const Url&, const Url&) -> bool = default;
};

}  // namespace httpretry
