#pragma once

#include <asio.hpp>
#include <functional>
#include <memory>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "common/config.h"
#include "common/errors.h"
#include "network/peer_connection.h"
#include "rendezvous/relay_protocol.h"
#include "rendezvous/rendezvous_client.h"
#include "session/session_state.h"
#include "transfer/progress_tracker.h"
#include "transfer/transfer_header.h"

/**
 * One side of a transfer: rendezvous, negotiation, streaming, verification.
 *
 * A session lives on a single io_context thread. Relay frames, channel
 * events and deadlines are all handlers on that context, so they are
 * processed one at a time in arrival order.
 */
class Session : public std::enable_shared_from_this<Session> {
public:
    using FinishedCallback      = std::function<void(SessionState state, TransferError cause)>;
    using PeerConnectionFactory = std::function<std::shared_ptr<PeerConnection>()>;

    virtual ~Session() = default;

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    virtual void start() = 0;

    /// Local abort. Closing the channel and the relay link is the only
    /// signal the remote side gets.
    void cancel();

    void set_on_finished(FinishedCallback cb) { on_finished_ = std::move(cb); }

    [[nodiscard]] RelayRole role() const { return role_; }
    [[nodiscard]] SessionState state() const { return machine_.state(); }
    [[nodiscard]] SessionState last_active_state() const { return machine_.last_active(); }
    [[nodiscard]] TransferError cause() const { return machine_.cause(); }
    [[nodiscard]] const std::string& code() const { return code_; }
    [[nodiscard]] bool channel_opened() const { return channel_opened_; }

    ProgressTracker& progress() { return progress_; }
    [[nodiscard]] const SessionConfig& config() const { return config_; }

protected:
    Session(asio::io_context& io,
            RelayRole role,
            SessionConfig config,
            PeerConnectionFactory factory);

    void advance(SessionState next);
    void fail(TransferError cause, const std::string& detail);
    void succeed();

    void arm_negotiation_deadline();
    void disarm_negotiation_deadline();
    /// Restart the chunk inactivity deadline. When it fires, a drop in
    /// channel_->buffered_amount() since the last touch restarts it again.
    void touch_inactivity_deadline();
    void disarm_inactivity_deadline();

    /// Route relay frames and relay loss into this session.
    void wire_relay();

    /// Route channel events into this session.
    void attach_channel(std::shared_ptr<DataChannel> channel);

    /// Route peer-connection state changes into this session.
    void watch_peer_connection();

    void drop(const std::string& what) const;

    /// Send a relay candidate message for `target`.
    void relay_candidate(const std::string& target, const std::string& candidate);

    /// Run `fn`; TransferException fails with its cause, any other
    /// std::exception fails with `fallback`.
    template <typename Fn>
    bool guarded(TransferError fallback, Fn&& fn) {
        try {
            fn();
            return true;
        } catch (const TransferException& e) {
            fail(e.cause(), e.what());
        } catch (const std::exception& e) {
            fail(fallback, e.what());
        }
        return false;
    }

    virtual void on_relay_message(const nlohmann::json& message) = 0;
    virtual void on_channel_open() = 0;
    virtual void on_channel_message(DecodedMessage decoded) = 0;
    virtual void on_channel_drained() {}

    asio::io_context& io_;
    RelayRole role_;
    SessionConfig config_;
    PeerConnectionFactory factory_;
    std::shared_ptr<RendezvousClient> rendezvous_;
    std::shared_ptr<PeerConnection> peer_;
    std::shared_ptr<DataChannel> channel_;
    ProgressTracker progress_;
    std::string code_;

private:
    void on_channel_closed();
    void on_relay_closed();
    void release();
    void notify_finished();

    SessionStateMachine machine_;
    asio::steady_timer negotiation_timer_;
    asio::steady_timer inactivity_timer_;
    std::size_t buffered_at_touch_ = 0;
    FinishedCallback on_finished_;
    bool channel_opened_ = false;
};
