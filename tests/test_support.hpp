#pragma once

/// @file test_support.hpp
/// @brief Shared helpers: synchronous coroutine driver and an in-memory
///        transport that replays a script.

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>

#include "errors.hpp"
#include "request.hpp"
#include "transport.hpp"

namespace httpretry::test_support {

namespace asio = boost::asio;

/// Drive @p aw to completion on a private io_context and return its value.
/// Exceptions thrown inside the coroutine are rethrown here.
template<typename T>
auto run_sync(asio::awaitable<T> aw) -> T {
    asio::io_context ioc;
    auto future = asio::co_spawn(ioc, std::move(aw), asio::use_future);
    ioc.run();
    return future.get();
}

/// One scripted transport reaction: a status (with body) or a failure.
struct Reply {
    std::uint16_t status{200};
    std::string body;
};

struct Failure {
    TransportErrorKind kind{TransportErrorKind::Connect};
};

using Step = std::variant<Reply, Failure>;

struct RecordedCall {
    std::string method;
    std::string url;
    std::string body;
};

/// Replays a fixed sequence of steps. With repeat_last set, the final step
/// answers every call after the script runs out.
class ScriptedTransport final : public client::ITransport {
public:
    explicit ScriptedTransport(std::vector<Step> script, bool repeat_last = false)
        : script_{script.begin(), script.end()}
        , repeat_last_{repeat_last}
    {}

    /// Same status on every call.
    [[nodiscard]] static auto always(std::uint16_t status, std::string body = {})
        -> std::shared_ptr<ScriptedTransport>
    {
        return std::make_shared<ScriptedTransport>(std::vector<Step>{Reply{status, std::move(body)}}, true);
    }

    [[nodiscard]] static auto sequence(std::vector<Step> script) -> std::shared_ptr<ScriptedTransport> {
        return std::make_shared<ScriptedTransport>(std::move(script));
    }

    auto send(std::string method, std::string url, std::string body)
        -> asio::awaitable<TransportResponse> override
    {
        Step step = next_step({method, url, body});

        if (delay_ > std::chrono::milliseconds::zero()) {
            asio::steady_timer timer{co_await asio::this_coro::executor, delay_};
            co_await timer.async_wait(asio::use_awaitable);
        }

        if (const auto* failure = std::get_if<Failure>(&step)) {
            throw TransportError{failure->kind, url, "scripted failure"};
        }
        const auto& reply = std::get<Reply>(step);
        co_return TransportResponse{reply.status, reply.body};
    }

    /// Suspend each call on a timer so concurrent calls interleave.
    void set_delay(std::chrono::milliseconds delay) { delay_ = delay; }

    [[nodiscard]] auto call_count() const -> std::size_t {
        std::lock_guard lock{mutex_};
        return calls_.size();
    }

    [[nodiscard]] auto calls() const -> std::vector<RecordedCall> {
        std::lock_guard lock{mutex_};
        return calls_;
    }

private:
    auto next_step(RecordedCall call) -> Step {
        std::lock_guard lock{mutex_};
        calls_.push_back(std::move(call));
        if (script_.empty()) {
            throw std::logic_error("ScriptedTransport: script exhausted");
        }
        Step step = script_.front();
        if (script_.size() > 1 || !repeat_last_) {
            script_.pop_front();
        }
        return step;
    }

    mutable std::mutex mutex_;
    std::deque<Step> script_;
    bool repeat_last_{false};
    std::chrono::milliseconds delay_{0};
    std::vector<RecordedCall> calls_;
};

}  // namespace httpretry::test_support
