#include <csignal>
#include <cstdlib>
#include <exception>
#include <utility>

#include <boost/asio.hpp>
#include <fmt/core.h>

#include "client_config.hpp"
#include "stub_server.hpp"

namespace {

boost::asio::io_context* g_ioc = nullptr;

void signal_handler(int sig) {
    fmt::print("\n[MAIN] Received signal {}, shutting down...\n", sig);
    if (g_ioc) {
        g_ioc->stop();
    }
}

}  // namespace

int main() {
    try {
        auto cfg = httpretry::config::ListenConfig::from_env_defaults("127.0.0.1", 8080);

        fmt::print("[MAIN] Starting stub HTTP server\n");
        fmt::print("[MAIN] Routes: /status/<code> /echo /flaky/<n> /redirect?to=<target> /loop\n");

        boost::asio::io_context ioc{1};
        g_ioc = &ioc;

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        auto server = httpretry::server::StubServer::create(ioc, cfg, httpretry::server::default_routes());
        server->run();

        ioc.run();

        fmt::print("[MAIN] Served {} requests\n", server->requests_served());
        server->stop();

        fmt::print("[MAIN] Server shutdown complete\n");
        return EXIT_SUCCESS;

    } catch (const std::exception& e) {
        fmt::print(stderr, "[MAIN] Fatal error: {}\n", e.what());
        return EXIT_FAILURE;
    }
}
