#pragma once

#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/framing.h"
#include "rendezvous/relay_registry.h"

/**
 * One client link on the relay: reads length-prefixed JSON frames, hands
 * them to the registry, writes whatever the registry delivers back.
 */
class RelayConnection : public RelayPeer,
                        public std::enable_shared_from_this<RelayConnection> {
public:
    RelayConnection(asio::ip::tcp::socket socket, RelayRegistry& registry);

    void start();
    void close();

    void deliver(const nlohmann::json& message) override;

private:
    void read_header();
    void read_body(uint32_t length);
    void handle_message(const nlohmann::json& message);
    void handle_register(const nlohmann::json& message);
    void write_next();
    void shutdown();

    asio::ip::tcp::socket socket_;
    RelayRegistry& registry_;
    FrameHeader header_{};
    std::vector<uint8_t> body_;
    std::deque<Bytes> outbox_;
    bool close_after_write_ = false;
    bool closed_ = false;
};

/**
 * Async TCP signaling relay. Never sees file content, only negotiation
 * metadata.
 */
class RelayServer {
public:
    RelayServer(asio::io_context& io,
                const asio::ip::tcp::endpoint& endpoint,
                std::chrono::seconds registration_ttl);

    void start();
    void stop();

    /// Bound port, useful when listening on port 0.
    [[nodiscard]] uint16_t port() const;

    RelayRegistry& registry() { return registry_; }

private:
    void do_accept();
    void schedule_expiry();

    asio::ip::tcp::acceptor acceptor_;
    asio::steady_timer expiry_timer_;
    RelayRegistry registry_;
    std::vector<std::weak_ptr<RelayConnection>> connections_;
    bool running_ = false;
};
