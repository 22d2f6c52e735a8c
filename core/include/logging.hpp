#pragma once

/// @file logging.hpp
/// @brief Compile-time logging policies.
///
/// Instead of a logger object threaded through every call, components take a
/// logging policy as a template parameter. The silent policy compiles away.

#include <concepts>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>

namespace httpretry {

/// Concept for logging policies.
template<typename P>
concept LoggingPolicy = requires(const P policy, std::string_view msg) {
    { policy.log(msg) } -> std::same_as<void>;
};

/// Silent logging policy (no-op). Default for library components.
struct SilentLoggingPolicy {
    void log(std::string_view) const noexcept {}
};

/// Console logging policy with a bracketed prefix.
class ConsoleLoggingPolicy {
public:
    ConsoleLoggingPolicy() = default;

    explicit ConsoleLoggingPolicy(std::string prefix)
        : prefix_{std::move(prefix)}
    {}

    void log(std::string_view msg) const {
        fmt::print(stderr, "[{}] {}\n", prefix_, msg);
    }

private:
    std::string prefix_{"HTTPRETRY"};
};

/// Forwards every line to a user callback.
class CallbackLoggingPolicy {
public:
    using Callback = std::function<void(std::string_view)>;

    // Rule of Six: All Default (std::function handles own resources)
    CallbackLoggingPolicy() = default;
    ~CallbackLoggingPolicy() = default;
    CallbackLoggingPolicy(const CallbackLoggingPolicy&) = default;
    CallbackLoggingPolicy& operator=(const CallbackLoggingPolicy&) = default;
    CallbackLoggingPolicy(CallbackLoggingPolicy&&) noexcept = default;
    CallbackLoggingPolicy& operator=(CallbackLoggingPolicy&&) noexcept = default;

    explicit CallbackLoggingPolicy(Callback sink)
        : sink_{std::move(sink)}
    {}

    void log(std::string_view msg) const {
        if (sink_) sink_(msg);
    }

private:
    Callback sink_;
};

}  // namespace httpretry
