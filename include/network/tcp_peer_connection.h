#pragma once

#include <asio.hpp>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/config.h"
#include "common/framing.h"
#include "network/peer_connection.h"

/**
 * DataChannel over one TCP stream, one length-prefixed frame per message.
 *
 * buffered_amount() counts message bytes accepted by send() whose write
 * has not completed yet.
 */
class TcpDataChannel : public DataChannel,
                       public std::enable_shared_from_this<TcpDataChannel> {
public:
    TcpDataChannel(asio::io_context& io, std::string label);

    /// Take ownership of a connected socket and open the channel.
    void attach(asio::ip::tcp::socket socket);

    void send(Bytes message) override;
    [[nodiscard]] std::size_t buffered_amount() const override { return buffered_; }
    void set_buffered_amount_low_threshold(std::size_t threshold) override { low_threshold_ = threshold; }

    void set_on_open(OpenCallback cb) override { on_open_ = std::move(cb); }
    void set_on_message(MessageCallback cb) override { on_message_ = std::move(cb); }
    void set_on_close(CloseCallback cb) override { on_close_ = std::move(cb); }
    void set_on_buffered_amount_low(LowCallback cb) override { on_low_ = std::move(cb); }

    [[nodiscard]] bool is_open() const override { return open_ && !closing_; }
    [[nodiscard]] std::string label() const override { return label_; }

    void close() override;

private:
    void read_header();
    void read_body(uint32_t length);
    void write_next();
    void shutdown();

    asio::ip::tcp::socket socket_;
    std::string label_;
    FrameHeader header_{};
    Bytes body_;
    std::deque<Bytes> outbox_;
    std::size_t buffered_ = 0;
    std::size_t low_threshold_ = 0;
    bool above_threshold_ = false;
    bool open_ = false;
    bool closing_ = false;
    bool closed_ = false;

    OpenCallback on_open_;
    MessageCallback on_message_;
    CloseCallback on_close_;
    LowCallback on_low_;
};

/**
 * Direct TCP peer connection.
 *
 * The offerer listens on an ephemeral port and advertises its host
 * addresses as candidates; the answerer dials candidates in arrival order
 * and proves itself with the offer's random token. No NAT traversal.
 */
class TcpPeerConnection : public PeerConnection,
                          public std::enable_shared_from_this<TcpPeerConnection> {
public:
    TcpPeerConnection(asio::io_context& io, PeerConfig config);
    ~TcpPeerConnection() override;

    std::shared_ptr<DataChannel> create_data_channel(const std::string& label) override;
    std::string create_offer() override;
    std::string create_answer() override;
    void set_remote_description(const std::string& description) override;
    void add_remote_candidate(const std::string& candidate) override;

    void set_on_local_candidate(CandidateCallback cb) override { on_candidate_ = std::move(cb); }
    void set_on_data_channel(DataChannelCallback cb) override { on_data_channel_ = std::move(cb); }
    void set_on_state_change(StateCallback cb) override { on_state_ = std::move(cb); }

    void close() override;

    [[nodiscard]] State state() const { return state_; }

private:
    struct Handshake {
        explicit Handshake(asio::io_context& io) : socket(io) {}
        asio::ip::tcp::socket socket;
        FrameHeader header{};
        Bytes body;
    };

    void gather_candidates();
    std::vector<std::string> local_addresses();
    void do_accept();
    void read_hello(std::shared_ptr<Handshake> handshake);
    void on_authenticated(asio::ip::tcp::socket socket);
    void try_connect(const asio::ip::tcp::endpoint& endpoint);
    void check_failed();
    void set_state(State state);

    asio::io_context& io_;
    PeerConfig config_;
    asio::ip::tcp::acceptor acceptor_;
    std::shared_ptr<TcpDataChannel> channel_;
    std::string label_;
    std::string token_;
    bool offerer_ = false;
    bool remote_set_ = false;
    bool connected_ = false;
    bool end_of_candidates_ = false;
    bool closed_ = false;
    int attempts_in_flight_ = 0;
    std::vector<std::string> pending_candidates_;
    std::vector<std::shared_ptr<asio::ip::tcp::socket>> attempts_;
    std::optional<asio::ip::tcp::socket> pending_socket_;
    State state_ = State::fresh;

    CandidateCallback on_candidate_;
    DataChannelCallback on_data_channel_;
    StateCallback on_state_;
};

/// Factory used by sessions unless a test substitutes its own.
std::shared_ptr<PeerConnection> make_tcp_peer_connection(asio::io_context& io,
                                                         const PeerConfig& config);
