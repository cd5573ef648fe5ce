#pragma once

#include <asio.hpp>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/errors.h"
#include "common/framing.h"
#include "rendezvous/code_generator.h"

/**
 * TCP client for the signaling relay.
 *
 * All handlers run on the io_context that owns the socket. Relay
 * notifications that are not replies to register/join are handed to the
 * message callback in arrival order.
 */
class RendezvousClient : public std::enable_shared_from_this<RendezvousClient> {
public:
    using RegisterHandler = std::function<void(TransferError, const std::string& code)>;
    using JoinHandler     = std::function<void(TransferError, const nlohmann::json& metadata)>;
    using MessageCallback = std::function<void(const nlohmann::json& message)>;
    using ClosedCallback  = std::function<void()>;

    RendezvousClient(asio::io_context& io,
                     std::string host,
                     uint16_t port,
                     int max_code_attempts,
                     CodeGenerator generator = CodeGenerator());

    /// Connect, mint a code and announce the sender with its metadata.
    /// Retries with a fresh code while the relay answers code_busy.
    void register_sender(const nlohmann::json& metadata, RegisterHandler handler);

    /// Connect and pair with the sender registered under `code`.
    /// Completes once the sender's metadata has arrived.
    void join(const std::string& code, JoinHandler handler);

    /// Send a negotiation message to the other peer; "session" is filled in.
    void relay(nlohmann::json message);

    void set_on_message(MessageCallback cb);
    void set_on_closed(ClosedCallback cb);

    /// Stop callbacks, flush queued frames, then close the link.
    void close();

    [[nodiscard]] const std::string& code() const { return code_; }
    [[nodiscard]] bool is_open() const { return connected_ && !closed_ && !closing_; }

private:
    enum class Pending { none, register_sender, join_response, join_metadata };

    void connect(std::function<void(const asio::error_code&)> handler);
    void send_register();
    void read_header();
    void read_body(uint32_t length);
    void handle_frame(const nlohmann::json& frame);
    void handle_response(const nlohmann::json& frame);
    void send(const nlohmann::json& message);
    void write_next();
    void fail_pending(TransferError error);
    void on_link_lost();
    void shutdown();

    asio::ip::tcp::resolver resolver_;
    asio::ip::tcp::socket socket_;
    std::string host_;
    uint16_t port_;
    int max_code_attempts_;
    int attempts_ = 0;
    CodeGenerator generator_;

    std::string code_;
    nlohmann::json metadata_;
    Pending pending_ = Pending::none;
    RegisterHandler register_handler_;
    JoinHandler join_handler_;
    MessageCallback on_message_;
    ClosedCallback on_closed_;

    FrameHeader header_{};
    std::vector<uint8_t> body_;
    std::deque<Bytes> outbox_;
    bool connected_ = false;
    bool closing_ = false;
    bool closed_ = false;
};
