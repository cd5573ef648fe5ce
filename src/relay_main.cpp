/**
 * tunnel-relay: signaling relay entry point.
 *
 *   tunnel-relay [config.json]
 *
 * Listens on relay.port (overridable with SERVER_PORT) and pairs senders
 * with receivers by rendezvous code. File bytes never pass through here.
 */

#include <cstdlib>
#include <filesystem>
#include <string>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "common/config.h"
#include "rendezvous/relay_server.h"

int main(int argc, char* argv[]) {
    std::string config_path = (argc > 1) ? argv[1] : "config.json";

    SessionConfig config;
    try {
        if (argc > 1 || std::filesystem::exists(config_path)) {
            config = load_config(config_path);
            spdlog::info("Loaded config from {}", config_path);
        }
    } catch (const std::invalid_argument& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
    spdlog::set_level(spdlog::level::from_str(config.log.level));

    uint16_t port = config.relay.port;
    if (const char* env = std::getenv("SERVER_PORT")) {
        try {
            port = static_cast<uint16_t>(std::stoul(env));
        } catch (const std::exception&) {
            spdlog::error("SERVER_PORT is not a port number: {}", env);
            return 1;
        }
    }

    asio::io_context io;
    try {
        RelayServer server(io, asio::ip::tcp::endpoint(asio::ip::tcp::v4(), port),
                           config.relay.registration_ttl);
        server.start();

        asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&](const asio::error_code&, int) {
            spdlog::info("Signaling relay shutting down");
            server.stop();
        });

        io.run();
    } catch (const std::system_error& e) {
        spdlog::error("Relay failed: {}", e.what());
        return 1;
    }
    return 0;
}
