#include "url.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <memory>
#include <new>
#include <system_error>

#include <curl/curl.h>

namespace httpretry {

namespace {

using curl_url_ptr = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;
using curl_str_ptr = std::unique_ptr<char, decltype(&curl_free)>;

auto has_forbidden_chars(std::string_view sv) noexcept -> bool {
    return std::any_of(sv.begin(), sv.end(), [](char c) {
        const auto uc = static_cast<unsigned char>(c);
        return uc <= 0x20 || uc == 0x7f;
    });
}

auto to_lower(std::string_view sv) -> std::string {
    std::string out{sv};
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

/// Read one component. Returns nullopt when the component is absent.
auto get_part(CURLU* handle, CURLUPart part, unsigned flags = 0) -> std::optional<std::string> {
    char* raw = nullptr;
    if (curl_url_get(handle, part, &raw, flags) != CURLUE_OK || raw == nullptr) {
        return std::nullopt;
    }
    curl_str_ptr owned{raw, &curl_free};
    return std::string{owned.get()};
}

auto parse_port(std::string_view sv, std::uint16_t& out) noexcept -> bool {
    unsigned value = 0;
    const auto* first = sv.data();
    const auto* last = sv.data() + sv.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last || value == 0 || value > 65535) {
        return false;
    }
    out = static_cast<std::uint16_t>(value);
    return true;
}

/// Project a parsed handle onto Url. libcurl has already removed dot
/// segments and validated the authority; only http/https survive here.
auto from_handle(CURLU* handle) -> std::optional<Url> {
    const auto scheme = get_part(handle, CURLUPART_SCHEME);
    const auto host = get_part(handle, CURLUPART_HOST);
    const auto port = get_part(handle, CURLUPART_PORT, CURLU_DEFAULT_PORT);
    const auto path = get_part(handle, CURLUPART_PATH);
    if (!scheme || !host || !port || !path) {
        return std::nullopt;
    }

    Url url;
    url.scheme = to_lower(*scheme);
    if (url.scheme != "http" && url.scheme != "https") {
        return std::nullopt;
    }

    url.host = to_lower(*host);
    if (url.host.size() >= 2 && url.host.front() == '[' && url.host.back() == ']') {
        url.host = url.host.substr(1, url.host.size() - 2);
    }
    if (url.host.empty() || !parse_port(*port, url.port)) {
        return std::nullopt;
    }

    url.target = path->empty() ? "/" : *path;
    if (const auto query = get_part(handle, CURLUPART_QUERY)) {
        url.target += "?" + *query;
    }
    return url;
}

auto make_handle() -> curl_url_ptr {
    curl_url_ptr handle{curl_url(), &curl_url_cleanup};
    if (!handle) {
        throw std::bad_alloc{};
    }
    return handle;
}

}  // namespace

auto Url::parse(std::string_view text) -> std::optional<Url> {
    if (text.empty() || has_forbidden_chars(text)) {
        return std::nullopt;
    }

    auto handle = make_handle();
    if (curl_url_set(handle.get(), CURLUPART_URL, std::string{text}.c_str(), 0) != CURLUE_OK) {
        return std::nullopt;
    }
    return from_handle(handle.get());
}

auto Url::resolve(std::string_view location) const -> std::optional<Url> {
    if (location.empty() || has_forbidden_chars(location)) {
        return std::nullopt;
    }

    // Setting a URL on a handle that already holds one applies RFC 3986
    // reference resolution, including dot-segment removal.
    auto handle = make_handle();
    if (curl_url_set(handle.get(), CURLUPART_URL, to_string().c_str(), 0) != CURLUE_OK) {
        return std::nullopt;
    }
    if (curl_url_set(handle.get(), CURLUPART_URL, std::string{location}.c_str(), 0) != CURLUE_OK) {
        return std::nullopt;
    }
    return from_handle(handle.get());
}

auto Url::host_header() const -> std::string {
    std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    if (port != default_port()) {
        h += ":" + std::to_string(port);
    }
    return h;
}

auto Url::to_string() const -> std::string {
    return scheme + "://" + host_header() + target;
}

}  // namespace httpretry
