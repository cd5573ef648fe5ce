/**
 * Session: lifecycle, deadlines and resource release shared by both roles.
 */

#include "session/session.h"

#include <spdlog/spdlog.h>

#include "network/tcp_peer_connection.h"

using json = nlohmann::json;

Session::Session(asio::io_context& io,
                 RelayRole role,
                 SessionConfig config,
                 PeerConnectionFactory factory)
    : io_(io),
      role_(role),
      config_(std::move(config)),
      factory_(std::move(factory)),
      negotiation_timer_(io),
      inactivity_timer_(io) {
    config_.validate();

    if (!factory_) {
        PeerConfig peer_config = config_.peer;
        factory_ = [&io, peer_config] { return make_tcp_peer_connection(io, peer_config); };
    }
    rendezvous_ = std::make_shared<RendezvousClient>(io, config_.relay.host, config_.relay.port,
                                                     config_.relay.max_code_attempts);
}

void Session::cancel() {
    auto self = shared_from_this();
    asio::post(io_, [self] {
        self->fail(TransferError::transfer_cancelled, "cancelled locally");
    });
}

void Session::advance(SessionState next) {
    machine_.advance(next);
    progress_.set_state(next);
    spdlog::debug("[{}] {} -> {}", code_, to_string(role_), to_string(next));
}

void Session::fail(TransferError cause, const std::string& detail) {
    SessionState from = machine_.state();
    if (!machine_.fail(cause)) {
        return;
    }
    progress_.set_state(SessionState::failed);
    spdlog::error("[{}] {} failed in {}: {}", code_, to_string(role_), to_string(from),
                  detail.empty() ? to_string(cause) : detail);
    release();
    notify_finished();
}

void Session::succeed() {
    advance(SessionState::done);
    spdlog::info("[{}] transfer finished: {} verified", code_,
                 human_readable_size(progress_.bytes()));
    release();
    notify_finished();
}

void Session::arm_negotiation_deadline() {
    negotiation_timer_.expires_after(config_.transfer.negotiation_timeout);
    std::weak_ptr<Session> weak = shared_from_this();
    negotiation_timer_.async_wait([weak](const asio::error_code& ec) {
        auto self = weak.lock();
        if (ec || !self) {
            return;
        }
        SessionState state = self->state();
        if (state == SessionState::signaling || state == SessionState::connecting) {
            self->fail(TransferError::negotiation_timeout,
                       "no data channel within " +
                       std::to_string(self->config_.transfer.negotiation_timeout.count()) + "s");
        }
    });
}

void Session::disarm_negotiation_deadline() {
    negotiation_timer_.cancel();
}

void Session::touch_inactivity_deadline() {
    buffered_at_touch_ = channel_ ? channel_->buffered_amount() : 0;
    inactivity_timer_.expires_after(config_.transfer.chunk_inactivity_timeout);
    std::weak_ptr<Session> weak = shared_from_this();
    inactivity_timer_.async_wait([weak](const asio::error_code& ec) {
        auto self = weak.lock();
        if (ec || !self) {
            return;
        }
        SessionState state = self->state();
        if (state == SessionState::channel_open || state == SessionState::transferring ||
            state == SessionState::verifying) {
            // Outgoing bytes still leaving on a slow link count as activity.
            if (self->channel_ && self->channel_->buffered_amount() < self->buffered_at_touch_) {
                self->touch_inactivity_deadline();
                return;
            }
            self->fail(TransferError::chunk_inactivity_timeout,
                       "channel idle for " +
                       std::to_string(self->config_.transfer.chunk_inactivity_timeout.count()) + "s");
        }
    });
}

void Session::disarm_inactivity_deadline() {
    inactivity_timer_.cancel();
}

void Session::wire_relay() {
    std::weak_ptr<Session> weak = shared_from_this();
    rendezvous_->set_on_message([weak](const json& message) {
        if (auto self = weak.lock()) {
            if (!self->machine_.terminal()) {
                self->on_relay_message(message);
            }
        }
    });
    rendezvous_->set_on_closed([weak] {
        if (auto self = weak.lock()) {
            self->on_relay_closed();
        }
    });
}

void Session::attach_channel(std::shared_ptr<DataChannel> channel) {
    channel_ = std::move(channel);
    std::weak_ptr<Session> weak = shared_from_this();

    channel_->set_on_open([weak] {
        if (auto self = weak.lock()) {
            if (self->machine_.terminal()) {
                return;
            }
            self->channel_opened_ = true;
            self->on_channel_open();
        }
    });
    channel_->set_on_message([weak](Bytes bytes) {
        auto self = weak.lock();
        if (!self || self->machine_.terminal()) {
            return;
        }
        DecodedMessage decoded;
        if (self->guarded(TransferError::protocol_violation,
                          [&] { decoded = MessageCodec::decode(std::move(bytes)); })) {
            self->on_channel_message(std::move(decoded));
        }
    });
    channel_->set_on_close([weak] {
        if (auto self = weak.lock()) {
            self->on_channel_closed();
        }
    });
    channel_->set_on_buffered_amount_low([weak] {
        if (auto self = weak.lock()) {
            if (!self->machine_.terminal()) {
                self->on_channel_drained();
            }
        }
    });
}

void Session::watch_peer_connection() {
    std::weak_ptr<Session> weak = shared_from_this();
    peer_->set_on_state_change([weak](PeerConnection::State state) {
        auto self = weak.lock();
        if (!self) {
            return;
        }
        spdlog::debug("[{}] peer connection {}", self->code_, to_string(state));
        if (state == PeerConnection::State::failed &&
            self->state() < SessionState::channel_open) {
            self->fail(TransferError::connectivity_failure, "no route to the peer");
        }
    });
}

void Session::drop(const std::string& what) const {
    spdlog::warn("[{}] dropping {} received in state {}", code_, what, to_string(machine_.state()));
}

void Session::relay_candidate(const std::string& target, const std::string& candidate) {
    rendezvous_->relay({{"action", RelayAction::kCandidate},
                        {"target", target},
                        {"candidate", candidate}});
}

void Session::on_channel_closed() {
    if (machine_.terminal()) {
        return;
    }
    fail(TransferError::channel_closed_early,
         std::string("data channel closed by the peer during ") + to_string(machine_.state()));
}

void Session::on_relay_closed() {
    if (machine_.terminal()) {
        return;
    }
    if (machine_.state() < SessionState::channel_open) {
        fail(TransferError::relay_unreachable, "relay connection lost during negotiation");
        return;
    }
    spdlog::debug("[{}] relay link closed, transfer continues peer to peer", code_);
}

void Session::release() {
    disarm_negotiation_deadline();
    disarm_inactivity_deadline();

    if (channel_) {
        channel_->close();
    }
    if (peer_) {
        peer_->close();
    }
    rendezvous_->close();
}

void Session::notify_finished() {
    if (on_finished_) {
        auto callback = std::move(on_finished_);
        callback(machine_.state(), machine_.cause());
    }
}
