/**
 * ReceiverSession: join -> answer -> reassemble -> verify -> verdict.
 */

#include "session/receiver_session.h"

#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace {

/// Output bytes assembled per posted step while verifying.
constexpr std::size_t kAssemblyStepBytes = 1024 * 1024;

} // namespace

std::shared_ptr<ReceiverSession> ReceiverSession::create(asio::io_context& io,
                                                         SessionConfig config,
                                                         std::string code,
                                                         PeerConnectionFactory factory,
                                                         ReceiverPipeline::SinkFactory sink_factory) {
    return std::shared_ptr<ReceiverSession>(
        new ReceiverSession(io, std::move(config), std::move(code), std::move(factory),
                            std::move(sink_factory)));
}

ReceiverSession::ReceiverSession(asio::io_context& io,
                                 SessionConfig config,
                                 std::string code,
                                 PeerConnectionFactory factory,
                                 ReceiverPipeline::SinkFactory sink_factory)
    : Session(io, RelayRole::receiver, std::move(config), std::move(factory)),
      pipeline_(ReceiverPipeline::to_directory(config_.transfer.memory_budget,
                                               config_.receiver.output_directory,
                                               config_.transfer.part_write_retries,
                                               &progress_,
                                               std::move(sink_factory))) {
    code_ = std::move(code);
}

std::shared_ptr<ReceiverSession> ReceiverSession::self() {
    return std::static_pointer_cast<ReceiverSession>(shared_from_this());
}

std::filesystem::path ReceiverSession::output_path() const {
    if (!pipeline_.has_header()) {
        return {};
    }
    return std::filesystem::path(config_.receiver.output_directory) / pipeline_.header().filename;
}

void ReceiverSession::start() {
    advance(SessionState::signaling);
    arm_negotiation_deadline();
    wire_relay();

    spdlog::info("[{}] joining through relay {}:{}", code_, config_.relay.host, config_.relay.port);

    std::weak_ptr<ReceiverSession> weak = self();
    rendezvous_->join(code_, [weak](TransferError error, const json& metadata) {
        if (auto session = weak.lock()) {
            session->on_joined(error, metadata);
        }
    });
}

void ReceiverSession::on_joined(TransferError error, const json& metadata) {
    if (state() != SessionState::signaling) {
        return;
    }
    if (error != TransferError::none) {
        fail(error, std::string("cannot join ") + code_ + ": " + to_string(error));
        return;
    }

    TransferHeader preview;
    if (!guarded(TransferError::protocol_violation, [&] {
            preview = TransferHeader::from_json(metadata);
            preview.validate();
        })) {
        return;
    }
    spdlog::info("[{}] incoming file: {} ({})", code_, preview.filename,
                 human_readable_size(preview.length));

    awaiting_decision_ = true;
    if (!accept_) {
        on_decision(true);
        return;
    }

    // A person may take a while to answer; negotiation restarts afterwards.
    disarm_negotiation_deadline();
    std::weak_ptr<ReceiverSession> weak = self();
    asio::io_context& io = io_;
    accept_(preview, [weak, &io](bool accept) {
        asio::post(io, [weak, accept] {
            if (auto session = weak.lock()) {
                session->on_decision(accept);
            }
        });
    });
}

void ReceiverSession::on_decision(bool accept) {
    if (state() != SessionState::signaling || !awaiting_decision_) {
        return;
    }
    awaiting_decision_ = false;

    if (!accept) {
        rendezvous_->relay({{"action", RelayAction::kCancel}});
        fail(TransferError::transfer_declined, "transfer declined");
        return;
    }
    accepted_ = true;
    arm_negotiation_deadline();
    spdlog::info("[{}] connecting to the sender", code_);

    if (pending_offer_) {
        std::string offer = std::move(*pending_offer_);
        pending_offer_.reset();
        take_offer(offer);
    }
}

void ReceiverSession::take_offer(const std::string& offer) {
    if (guarded(TransferError::connectivity_failure, [&] { answer_offer(offer); })) {
        advance(SessionState::connecting);
    }
}

void ReceiverSession::answer_offer(const std::string& offer) {
    peer_ = factory_();
    watch_peer_connection();

    std::weak_ptr<ReceiverSession> weak = self();
    peer_->set_on_local_candidate([weak](const std::string& candidate) {
        if (auto session = weak.lock()) {
            session->relay_candidate("sender", candidate);
        }
    });
    peer_->set_on_data_channel([weak](std::shared_ptr<DataChannel> channel) {
        if (auto session = weak.lock()) {
            session->on_data_channel(std::move(channel));
        }
    });

    peer_->set_remote_description(offer);
    rendezvous_->relay({{"action", RelayAction::kAnswer}, {"sdp", peer_->create_answer()}});

    std::vector<std::string> early;
    early.swap(early_candidates_);
    for (const auto& candidate : early) {
        peer_->add_remote_candidate(candidate);
    }
}

void ReceiverSession::on_data_channel(std::shared_ptr<DataChannel> channel) {
    if (state() != SessionState::connecting) {
        drop("data channel");
        channel->close();
        return;
    }
    attach_channel(std::move(channel));
}

void ReceiverSession::on_relay_message(const json& message) {
    std::string action = message.value("action", "");

    if (action == RelayAction::kOffer) {
        if (state() != SessionState::signaling || peer_ || pending_offer_) {
            drop(action);
            return;
        }
        std::string offer;
        if (!guarded(TransferError::protocol_violation,
                     [&] { offer = message.at("sdp").get<std::string>(); })) {
            return;
        }
        if (!accepted_) {
            pending_offer_ = std::move(offer);
            return;
        }
        take_offer(offer);
    } else if (action == RelayAction::kCandidate) {
        if (state() > SessionState::connecting) {
            drop(action);
            return;
        }
        guarded(TransferError::connectivity_failure, [&] {
            std::string candidate = message.at("candidate").get<std::string>();
            if (peer_) {
                peer_->add_remote_candidate(candidate);
            } else {
                early_candidates_.push_back(candidate);
            }
        });
    } else if (action == RelayAction::kCancel || action == RelayAction::kPeerLeft) {
        if (state() < SessionState::channel_open) {
            fail(TransferError::transfer_cancelled, "sender cancelled the session");
        }
    } else {
        drop("relay action '" + action + "'");
    }
}

void ReceiverSession::on_channel_open() {
    if (state() != SessionState::connecting) {
        drop("channel open");
        return;
    }
    disarm_negotiation_deadline();
    advance(SessionState::channel_open);
    touch_inactivity_deadline();
    spdlog::info("[{}] data channel open, waiting for header", code_);
}

void ReceiverSession::on_channel_message(DecodedMessage decoded) {
    try {
        handle_transfer_message(decoded);
    } catch (const TransferException& e) {
        send_verdict(e.cause(), e.what());
        fail(e.cause(), e.what());
    }
}

void ReceiverSession::handle_transfer_message(DecodedMessage& decoded) {
    switch (decoded.type) {
        case MessageType::header:
            if (state() != SessionState::channel_open) {
                throw TransferException(TransferError::protocol_violation, "unexpected transfer header");
            }
            pipeline_.accept_header(decoded.header);
            advance(SessionState::transferring);
            touch_inactivity_deadline();
            spdlog::info("[{}] receiving {} into {}", code_,
                         human_readable_size(decoded.header.length), output_path().string());
            break;

        case MessageType::chunk:
            if (state() != SessionState::transferring) {
                throw TransferException(TransferError::protocol_violation,
                                        "chunk " + std::to_string(decoded.chunk.sequence) +
                                        " before a valid header");
            }
            pipeline_.accept_chunk(decoded.chunk);
            touch_inactivity_deadline();
            break;

        case MessageType::complete:
            if (state() != SessionState::transferring) {
                throw TransferException(TransferError::protocol_violation,
                                        "completion marker before a valid header");
            }
            advance(SessionState::verifying);
            disarm_inactivity_deadline();
            spdlog::info("[{}] all data received, finalizing", code_);
            pipeline_.finish(decoded.checksum);
            last_keepalive_ = std::chrono::steady_clock::now();
            schedule_assembly();
            break;

        case MessageType::keepalive:
        case MessageType::verdict:
            drop(decoded.type == MessageType::verdict ? "verdict" : "keepalive");
            break;
    }
}

void ReceiverSession::schedule_assembly() {
    std::weak_ptr<ReceiverSession> weak = self();
    asio::post(io_, [weak] {
        auto session = weak.lock();
        if (session && session->state() == SessionState::verifying) {
            session->assemble();
        }
    });
}

void ReceiverSession::assemble() {
    bool done = false;
    try {
        done = pipeline_.assemble_step(kAssemblyStepBytes);
    } catch (const TransferException& e) {
        send_verdict(e.cause(), e.what());
        fail(e.cause(), e.what());
        return;
    } catch (const std::exception& e) {
        send_verdict(TransferError::insufficient_local_storage, e.what());
        fail(TransferError::insufficient_local_storage, e.what());
        return;
    }

    if (done) {
        send_verdict(TransferError::none, "");
        succeed();
        return;
    }

    auto interval = std::chrono::duration_cast<std::chrono::milliseconds>(
        config_.transfer.chunk_inactivity_timeout) / 4;
    auto now = std::chrono::steady_clock::now();
    if (now - last_keepalive_ >= interval && channel_ && channel_->is_open()) {
        last_keepalive_ = now;
        channel_->send(MessageCodec::encode_keepalive(pipeline_.assembled_bytes(),
                                                      pipeline_.header().length));
    }
    schedule_assembly();
}

void ReceiverSession::send_verdict(TransferError result, const std::string& detail) {
    if (channel_ && channel_->is_open()) {
        channel_->send(MessageCodec::encode_verdict(result, detail));
    }
}
