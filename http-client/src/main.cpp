#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <future>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/asio.hpp>
#include <boost/program_options.hpp>
#include <fmt/core.h>

#include "client_config.hpp"
#include "errors.hpp"
#include "retrying_requester.hpp"

namespace po = boost::program_options;

namespace {

constexpr int kExitStatusOutcome = 22;
constexpr int kExitTransport = 1;
constexpr int kExitUsage = 2;
constexpr int kExitInterrupted = 130;

boost::asio::io_context* g_ioc = nullptr;

void signal_handler(int sig) {
    fmt::print(stderr, "\n[MAIN] Received signal {}, aborting request...\n", sig);
    if (g_ioc) {
        g_ioc->stop();
    }
}

struct CliOptions {
    httpretry::RequestSpec spec;
    std::string user_agent;
    std::size_t max_attempts{httpretry::retry::kDefaultMaxAttempts};
    std::size_t cutoff{httpretry::retry::kDefaultServerErrorCutoff};
    std::chrono::milliseconds backoff{0};
    std::optional<std::chrono::milliseconds> timeout_ms;
    std::optional<std::size_t> max_redirects;
    std::string ca_file;
    bool insecure{false};
    bool verbose{false};
};

auto parse_args(int argc, char* argv[], CliOptions& opts) -> std::optional<int> {
    std::string data;
    std::uint64_t backoff_ms{0};

    po::options_description desc("httpretry options");
    desc.add_options()
        ("help,h", "Show this help message")
        ("url", po::value<std::string>(&opts.spec.url)->required(), "Absolute http(s) URL")
        ("method,X", po::value<std::string>(&opts.spec.method)->default_value("GET"), "HTTP method token")
        ("data,d", po::value<std::string>(&data), "Request body")
        ("user-agent,A", po::value<std::string>(&opts.user_agent), "Client identity (User-Agent)")
        ("max-attempts", po::value<std::size_t>(&opts.max_attempts)->default_value(opts.max_attempts), "Attempt budget")
        ("cutoff", po::value<std::size_t>(&opts.cutoff)->default_value(opts.cutoff), "Attempt index at which server errors stop retrying")
        ("backoff-ms", po::value<std::uint64_t>(&backoff_ms)->default_value(0), "Pause between server-error retries")
        ("timeout-ms", po::value<std::uint64_t>(), "Per-exchange timeout")
        ("max-redirects", po::value<std::size_t>(), "Redirects to follow (0 returns the 3xx)")
        ("ca-file", po::value<std::string>(&opts.ca_file), "CA bundle for https")
        ("insecure,k", po::bool_switch(&opts.insecure), "Skip TLS peer verification")
        ("verbose,v", po::bool_switch(&opts.verbose), "Log every attempt to stderr")
    ;

    po::positional_options_description pos;
    pos.add("url", 1);

    try {
        po::variables_map vm;
        po::store(po::command_line_parser(argc, argv).options(desc).positional(pos).run(), vm);

        if (vm.count("help")) {
            std::cout << desc << std::endl;
            return EXIT_SUCCESS;
        }

        po::notify(vm);

        if (vm.count("data")) {
            opts.spec.body = data;
        }
        if (vm.count("timeout-ms")) {
            opts.timeout_ms = httpretry::config::to_millis(vm["timeout-ms"].as<std::uint64_t>(), "--timeout-ms");
        }
        opts.backoff = httpretry::config::to_millis(backoff_ms, "--backoff-ms");
        if (vm.count("max-redirects")) {
            opts.max_redirects = vm["max-redirects"].as<std::size_t>();
        }
    } catch (const po::error& e) {
        fmt::print(stderr, "[MAIN] {}\n{}\n", e.what(), fmt::format("Usage: {} [options] <url>", argv[0]));
        return kExitUsage;
    } catch (const std::invalid_argument& e) {
        fmt::print(stderr, "[MAIN] {}\n", e.what());
        return kExitUsage;
    }

    return std::nullopt;
}

auto build_config(const CliOptions& opts) -> httpretry::config::ClientConfig {
    auto cfg = httpretry::config::ClientConfig::from_env_defaults();
    if (!opts.user_agent.empty()) {
        cfg = std::move(cfg).with_identity(opts.user_agent);
    }
    if (opts.timeout_ms) {
        cfg = std::move(cfg).with_request_timeout(*opts.timeout_ms);
    }
    if (opts.max_redirects) {
        cfg = std::move(cfg).with_max_redirects(*opts.max_redirects);
    }
    if (!opts.ca_file.empty() || opts.insecure) {
        auto tls = cfg.tls();
        if (!opts.ca_file.empty()) {
            tls.ca_file = opts.ca_file;
        }
        tls.verify_peer = !opts.insecure;
        cfg = std::move(cfg).with_tls(std::move(tls));
    }
    return cfg;
}

template<typename Requester>
auto run(Requester& requester, httpretry::RequestSpec spec) -> int {
    boost::asio::io_context ioc{1};
    g_ioc = &ioc;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto future = boost::asio::co_spawn(ioc, requester.execute_with_retry(std::move(spec)),
                                        boost::asio::use_future);
    ioc.run();
    g_ioc = nullptr;

    if (future.wait_for(std::chrono::seconds{0}) != std::future_status::ready) {
        fmt::print(stderr, "[MAIN] Interrupted\n");
        return kExitInterrupted;
    }

    const auto outcome = future.get();
    if (outcome.is_body()) {
        fmt::print("{}", outcome.body());
        return EXIT_SUCCESS;
    }

    fmt::print(stderr, "[MAIN] HTTP {}\n", outcome.status());
    return kExitStatusOutcome;
}

}  // namespace

int main(int argc, char* argv[]) {
    CliOptions opts;
    if (auto code = parse_args(argc, argv, opts)) {
        return *code;
    }

    try {
        const auto cfg = build_config(opts);
        const httpretry::retry::RetryPolicy policy{opts.max_attempts, opts.cutoff};

        if (opts.verbose) {
            fmt::print(stderr, "[MAIN] {} {} as '{}'\n", opts.spec.method, opts.spec.url, cfg.identity());
            auto requester = httpretry::client::VerboseRetryingRequester::create(
                cfg,
                policy,
                httpretry::retry::FixedBackoffPolicy{opts.backoff},
                httpretry::ConsoleLoggingPolicy{"ATTEMPT"}
            );
            return run(*requester, std::move(opts.spec));
        }

        using QuietRequester = httpretry::client::BasicRetryingRequester<httpretry::retry::FixedBackoffPolicy>;
        auto requester = QuietRequester::create(
            cfg,
            policy,
            httpretry::retry::FixedBackoffPolicy{opts.backoff}
        );
        return run(*requester, std::move(opts.spec));

    } catch (const httpretry::TransportInitError& e) {
        fmt::print(stderr, "[MAIN] Cannot build client: {}\n", e.what());
        return kExitTransport;
    } catch (const httpretry::TransportError& e) {
        fmt::print(stderr, "[MAIN] Request failed: {}\n", e.what());
        return kExitTransport;
    } catch (const std::invalid_argument& e) {
        fmt::print(stderr, "[MAIN] Invalid configuration: {}\n", e.what());
        return kExitUsage;
    } catch (const std::exception& e) {
        fmt::print(stderr, "[MAIN] Fatal error: {}\n", e.what());
        return kExitTransport;
    }
}
