/**
 * RelayRegistry: pairing rules for the signaling relay.
 *
 *   sender registers  -> pending, expires after the TTL unless joined
 *   receiver joins    -> paired; metadata + stored offer/candidates replayed
 *   receiver leaves   -> claimed, further joins get code_expired
 *   sender leaves     -> session removed, further joins get code_not_found
 */

#include "rendezvous/relay_registry.h"

#include <spdlog/spdlog.h>

using json = nlohmann::json;

RelayRegistry::RelayRegistry(std::chrono::seconds registration_ttl)
    : ttl_(registration_ttl) {}

void RelayRegistry::post(Outbox& outbox, const std::weak_ptr<RelayPeer>& to, json message) {
    if (auto peer = to.lock()) {
        outbox.emplace_back(std::move(peer), std::move(message));
    }
}

void RelayRegistry::flush(Outbox& outbox) {
    for (auto& [peer, message] : outbox) {
        peer->deliver(message);
    }
    outbox.clear();
}

RelayStatus RelayRegistry::register_sender(const std::string& code,
                                             const std::shared_ptr<RelayPeer>& peer,
                                             const json& metadata,
                                             Clock::time_point now) {
    Outbox outbox;
    RelayStatus status = RelayStatus::ok;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (code.empty() || members_.count(peer.get()) != 0) {
            status = RelayStatus::bad_request;
            post(outbox, peer, make_error_response(status, "invalid sender registration"));
        } else if (sessions_.count(code) != 0) {
            status = RelayStatus::code_busy;
            post(outbox, peer, make_error_response(status,
                "sender already registered in session " + code));
        } else {
            PendingSession session;
            session.sender = peer;
            session.metadata = metadata;
            session.expires_at = now + ttl_;
            sessions_.emplace(code, std::move(session));
            members_[peer.get()] = Membership{code, RelayRole::sender};
            post(outbox, peer, make_registered_response());
        }
    }
    flush(outbox);

    if (status == RelayStatus::ok) {
        spdlog::info("[{}] sender registered", code);
    } else {
        spdlog::info("[{}] sender registration refused: {}", code, to_string(status));
    }
    return status;
}

RelayStatus RelayRegistry::join(const std::string& code,
                                  const std::shared_ptr<RelayPeer>& peer,
                                  Clock::time_point now) {
    Outbox outbox;
    RelayStatus status = RelayStatus::ok;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = sessions_.find(code);
        if (members_.count(peer.get()) != 0) {
            status = RelayStatus::bad_request;
            post(outbox, peer, make_error_response(status, "already registered"));
        } else if (it == sessions_.end()) {
            status = RelayStatus::code_not_found;
            post(outbox, peer, make_error_response(status, "Session " + code + " does not exist"));
        } else {
            PendingSession& session = it->second;

            if (!session.expired && !session.claimed && session.receiver.expired() &&
                now >= session.expires_at) {
                session.expired = true;
                post(outbox, session.sender, json{{"action", RelayAction::kExpired}});
            }

            if (session.expired || session.claimed) {
                status = RelayStatus::code_expired;
                post(outbox, peer, make_error_response(status, "Session " + code + " has expired"));
            } else if (!session.receiver.expired()) {
                status = RelayStatus::code_busy;
                post(outbox, peer, make_error_response(status,
                    "receiver already registered in session " + code));
            } else {
                session.receiver = peer;
                members_[peer.get()] = Membership{code, RelayRole::receiver};

                post(outbox, peer, make_registered_response());
                post(outbox, peer, json{{"action", RelayAction::kMetadata},
                                        {"metadata", session.metadata}});
                if (session.offer) {
                    post(outbox, peer, json{{"action", RelayAction::kOffer},
                                            {"sdp", *session.offer}});
                }
                for (const auto& candidate : session.sender_candidates) {
                    post(outbox, peer, json{{"action", RelayAction::kCandidate},
                                            {"candidate", candidate}});
                }
                post(outbox, session.sender, json{{"action", RelayAction::kPeerJoined}});
            }
        }
    }
    flush(outbox);

    if (status == RelayStatus::ok) {
        spdlog::info("[{}] receiver joined", code);
    } else {
        spdlog::info("[{}] join refused: {}", code, to_string(status));
    }
    return status;
}

RelayStatus RelayRegistry::forward(const RelayPeer* from, const json& message) {
    Outbox outbox;
    RelayStatus status = RelayStatus::ok;
    std::string action = message.value("action", "");
    std::string code;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto member = members_.find(from);
        if (member == members_.end()) {
            return RelayStatus::bad_request;
        }
        code = member->second.code;
        auto it = sessions_.find(code);
        if (it == sessions_.end()) {
            return RelayStatus::code_not_found;
        }

        PendingSession& session = it->second;
        bool from_sender = member->second.role == RelayRole::sender;
        const std::weak_ptr<RelayPeer>& other = from_sender ? session.receiver : session.sender;

        try {
            if (action == RelayAction::kOffer && from_sender) {
                session.offer = message.at("sdp").get<std::string>();
                post(outbox, other, json{{"action", action}, {"sdp", *session.offer}});
            } else if (action == RelayAction::kAnswer && !from_sender) {
                post(outbox, other, json{{"action", action},
                                         {"sdp", message.at("sdp").get<std::string>()}});
            } else if (action == RelayAction::kCandidate) {
                const json& candidate = message.at("candidate");
                if (from_sender) {
                    session.sender_candidates.push_back(candidate);
                }
                post(outbox, other, json{{"action", action}, {"candidate", candidate}});
            } else if (action == RelayAction::kCancel) {
                post(outbox, other, json{{"action", action}});
            } else {
                status = RelayStatus::bad_request;
            }
        } catch (const json::exception& e) {
            spdlog::warn("[{}] malformed {} message: {}", code, action, e.what());
            status = RelayStatus::bad_request;
        }
    }
    flush(outbox);

    if (status == RelayStatus::ok) {
        spdlog::debug("[{}] forwarded {}", code, action);
    }
    return status;
}

void RelayRegistry::disconnect(const RelayPeer* peer) {
    Outbox outbox;
    std::string code;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto member = members_.find(peer);
        if (member == members_.end()) {
            return;
        }
        code = member->second.code;
        RelayRole role = member->second.role;
        members_.erase(member);

        auto it = sessions_.find(code);
        if (it == sessions_.end()) {
            return;
        }
        PendingSession& session = it->second;

        if (role == RelayRole::receiver) {
            session.receiver.reset();
            session.claimed = true;
            post(outbox, session.sender, json{{"action", RelayAction::kPeerLeft}});
        } else {
            if (auto receiver = session.receiver.lock()) {
                members_.erase(receiver.get());
                post(outbox, session.receiver, json{{"action", RelayAction::kPeerLeft}});
            }
            sessions_.erase(it);
        }
    }
    flush(outbox);

    spdlog::debug("[{}] peer disconnected", code);
}

std::size_t RelayRegistry::expire(Clock::time_point now) {
    Outbox outbox;
    std::size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        for (auto& [code, session] : sessions_) {
            if (session.expired || session.claimed || !session.receiver.expired()) {
                continue;
            }
            if (now >= session.expires_at) {
                session.expired = true;
                ++count;
                post(outbox, session.sender, json{{"action", RelayAction::kExpired}});
                spdlog::info("[{}] registration expired", code);
            }
        }
    }
    flush(outbox);
    return count;
}

std::size_t RelayRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

bool RelayRegistry::contains(const std::string& code) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.count(code) != 0;
}
