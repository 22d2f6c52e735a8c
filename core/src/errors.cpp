#include "errors.hpp"

#include <fmt/core.h>

namespace httpretry {

TransportError::TransportError(TransportErrorKind kind,
                               std::string url,
                               const std::string& detail,
                               boost::system::error_code cause)
    : std::runtime_error{fmt::format("{} error for {}: {}", to_string(kind), url, detail)}
    , kind_{kind}
    , url_{std::move(url)}
    , cause_{cause}
{}

HttpStatusError::HttpStatusError(std::uint16_t status, std::string url, const std::string& message)
    : std::runtime_error{message}
    , status_{status}
    , url_{std::move(url)}
{}

void throw_for_status(std::uint16_t status, std::string url, std::string_view reason) {
    auto msg = fmt::format("HTTP {} from {}", status, url);
    if (!reason.empty()) {
        msg += fmt::format(": {}", reason);
    }

    switch (status) {
        case 400: throw BadRequest{status, std::move(url), msg};
        case 401: throw Unauthorized{status, std::move(url), msg};
        case 403: throw Forbidden{status, std::move(url), msg};
        case 404: throw NotFound{status, std::move(url), msg};
        default:
            break;
    }

    if (is_server_error_status(status)) {
        throw ServiceUnavailable{status, std::move(url), msg};
    }
    throw HttpStatusError{status, std::move(url), msg};
}

auto body_or_throw(const RequestOutcome& outcome, std::string_view url) -> std::string {
    if (outcome.is_body()) {
        return outcome.body();
    }
    throw_for_status(outcome.status(), std::string{url});
}

}  // namespace httpretry
