/**
 * SenderSession: register -> offer -> stream -> await verdict.
 */

#include "session/sender_session.h"

#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace {

constexpr const char* kChannelLabel = "filetransfer";

} // namespace

std::shared_ptr<SenderSession> SenderSession::create(asio::io_context& io,
                                                     SessionConfig config,
                                                     std::unique_ptr<ByteSource> source,
                                                     PeerConnectionFactory factory) {
    return std::shared_ptr<SenderSession>(
        new SenderSession(io, std::move(config), std::move(source), std::move(factory)));
}

SenderSession::SenderSession(asio::io_context& io,
                             SessionConfig config,
                             std::unique_ptr<ByteSource> source,
                             PeerConnectionFactory factory)
    : Session(io, RelayRole::sender, std::move(config), std::move(factory)),
      source_(std::move(source)) {}

std::shared_ptr<SenderSession> SenderSession::self() {
    return std::static_pointer_cast<SenderSession>(shared_from_this());
}

void SenderSession::start() {
    advance(SessionState::signaling);
    arm_negotiation_deadline();
    wire_relay();

    TransferHeader preview = TransferHeader::describe(source_->name(), source_->size(),
                                                      config_.transfer.chunk_size);
    // The receiver would refuse it anyway; fail before a code is handed out.
    try {
        preview.validate();
    } catch (const TransferException& e) {
        fail(TransferError::source_read_failure, std::string("cannot offer this file: ") + e.what());
        return;
    }
    spdlog::info("Sending {} ({})", preview.filename, human_readable_size(preview.length));

    std::weak_ptr<SenderSession> weak = self();
    rendezvous_->register_sender(preview.to_json(),
        [weak](TransferError error, const std::string& code) {
            if (auto session = weak.lock()) {
                session->on_registered(error, code);
            }
        });
}

void SenderSession::on_registered(TransferError error, const std::string& code) {
    if (state() != SessionState::signaling) {
        return;
    }
    if (error != TransferError::none) {
        fail(error, std::string("registration failed: ") + to_string(error));
        return;
    }
    code_ = code;

    // Waiting for a receiver, and for that receiver to accept, is bounded by
    // the relay's registration TTL and the receiver's own choice; the
    // negotiation deadline restarts with its answer.
    disarm_negotiation_deadline();

    if (!guarded(TransferError::connectivity_failure, [this] { offer_channel(); })) {
        return;
    }

    spdlog::info("[{}] registered, waiting for receiver", code_);
    if (on_code_) {
        on_code_(code_);
    }
}

void SenderSession::offer_channel() {
    peer_ = factory_();
    watch_peer_connection();

    std::weak_ptr<SenderSession> weak = self();
    peer_->set_on_local_candidate([weak](const std::string& candidate) {
        if (auto session = weak.lock()) {
            session->relay_candidate("receiver", candidate);
        }
    });

    attach_channel(peer_->create_data_channel(kChannelLabel));
    rendezvous_->relay({{"action", RelayAction::kOffer}, {"sdp", peer_->create_offer()}});
}

void SenderSession::on_relay_message(const json& message) {
    std::string action = message.value("action", "");

    if (action == RelayAction::kPeerJoined) {
        if (state() != SessionState::signaling) {
            drop(action);
            return;
        }
        spdlog::info("[{}] receiver joined, waiting for it to accept", code_);
    } else if (action == RelayAction::kAnswer) {
        if (state() != SessionState::signaling || !peer_) {
            drop(action);
            return;
        }
        arm_negotiation_deadline();
        if (guarded(TransferError::connectivity_failure, [&] {
                peer_->set_remote_description(message.at("sdp").get<std::string>());
            })) {
            advance(SessionState::connecting);
        }
    } else if (action == RelayAction::kCandidate) {
        if (!peer_ || state() > SessionState::connecting) {
            drop(action);
            return;
        }
        guarded(TransferError::connectivity_failure, [&] {
            peer_->add_remote_candidate(message.at("candidate").get<std::string>());
        });
    } else if (action == RelayAction::kCancel) {
        fail(TransferError::transfer_declined, "receiver declined the transfer");
    } else if (action == RelayAction::kPeerLeft) {
        if (state() < SessionState::channel_open) {
            fail(TransferError::transfer_cancelled, "receiver left before the channel opened");
        }
    } else if (action == RelayAction::kExpired) {
        fail(TransferError::code_expired, "no receiver joined before the code expired");
    } else {
        drop("relay action '" + action + "'");
    }
}

void SenderSession::on_channel_open() {
    if (state() != SessionState::connecting) {
        drop("channel open");
        return;
    }
    disarm_negotiation_deadline();
    advance(SessionState::channel_open);
    spdlog::info("[{}] receiver connected, sending file", code_);

    std::weak_ptr<SenderSession> weak = self();
    guarded(TransferError::source_read_failure, [&] {
        pipeline_ = std::make_unique<SenderPipeline>(*source_, channel_,
                                                     config_.transfer.chunk_size,
                                                     config_.transfer.high_water,
                                                     config_.transfer.low_water,
                                                     &progress_);
        pipeline_->send_header();
        advance(SessionState::transferring);

        pipeline_->start([weak](const std::string& checksum) {
            auto session = weak.lock();
            if (!session || session->state() != SessionState::transferring) {
                return;
            }
            session->advance(SessionState::verifying);
            spdlog::info("[{}] all data sent (sha256 {}), awaiting verification",
                         session->code_, checksum);
        });
        touch_inactivity_deadline();
    });
}

void SenderSession::on_channel_message(DecodedMessage decoded) {
    if (decoded.type == MessageType::keepalive && state() == SessionState::verifying) {
        spdlog::debug("[{}] receiver assembled {} of {} bytes", code_, decoded.assembled, decoded.total);
        touch_inactivity_deadline();
        return;
    }
    if (decoded.type != MessageType::verdict) {
        drop("data channel message");
        return;
    }

    if (decoded.verdict != TransferError::none) {
        fail(decoded.verdict, "receiver reported " + std::string(to_string(decoded.verdict)) +
                              (decoded.detail.empty() ? "" : ": " + decoded.detail));
        return;
    }
    if (state() != SessionState::verifying) {
        drop("success verdict");
        return;
    }
    succeed();
}

void SenderSession::on_channel_drained() {
    if (state() != SessionState::transferring || !pipeline_) {
        return;
    }
    if (guarded(TransferError::source_read_failure, [this] { pipeline_->resume(); })) {
        touch_inactivity_deadline();
    }
}
