#include "route.hpp"

#include <fmt/core.h>

namespace httpretry {

auto percent_encode(std::string_view value) -> std::string {
    std::string out;
    out.reserve(value.size());

    for (const char c : value) {
        const auto uc = static_cast<unsigned char>(c);
        const bool unreserved = (uc >= '0' && uc <= '9') || (uc >= 'a' && uc <= 'z') ||
                                (uc >= 'A' && uc <= 'Z') || uc == '-' || uc == '.' ||
                                uc == '_' || uc == '~' || uc == '/';
        if (unreserved) {
            out.push_back(c);
        } else {
            out += fmt::format("%{:02X}", uc);
        }
    }
    return out;
}

}  // namespace httpretry
