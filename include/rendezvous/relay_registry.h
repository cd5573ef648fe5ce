#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "rendezvous/relay_protocol.h"

/**
 * One end of a relay link, as seen by the registry.
 */
class RelayPeer {
public:
    virtual ~RelayPeer() = default;

    /// Queue a JSON message for this peer. Must not call back into the registry.
    virtual void deliver(const nlohmann::json& message) = 0;
};

/**
 * Keyed store of pending sessions (code -> sender, receiver, stored
 * negotiation messages, expiry).
 *
 * Every mutation takes the registry mutex, so concurrent register/join on
 * the same code serialize here. Messages are delivered after the lock is
 * released, in the order they were produced.
 */
class RelayRegistry {
public:
    using Clock = std::chrono::steady_clock;

    explicit RelayRegistry(std::chrono::seconds registration_ttl);

    /// Register `peer` as the sender for `code`. A live code is code_busy.
    RelayStatus register_sender(const std::string& code,
                                  const std::shared_ptr<RelayPeer>& peer,
                                  const nlohmann::json& metadata,
                                  Clock::time_point now = Clock::now());

    /// Pair `peer` as the receiver for `code`; replays metadata, offer and
    /// candidates on success.
    RelayStatus join(const std::string& code,
                       const std::shared_ptr<RelayPeer>& peer,
                       Clock::time_point now = Clock::now());

    /// Forward offer / answer / candidate / cancel from a member. The sender's
    /// offer and candidates are kept for replay to a later receiver.
    RelayStatus forward(const RelayPeer* from, const nlohmann::json& message);

    /// Drop a peer whose link closed and notify the other side.
    void disconnect(const RelayPeer* peer);

    /// Mark unjoined registrations past their TTL as expired. Returns how many.
    std::size_t expire(Clock::time_point now = Clock::now());

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool contains(const std::string& code) const;

private:
    struct PendingSession {
        std::weak_ptr<RelayPeer> sender;
        std::weak_ptr<RelayPeer> receiver;
        nlohmann::json metadata;
        std::optional<std::string> offer;
        /// Sender candidates gathered before the receiver joined.
        std::vector<nlohmann::json> sender_candidates;
        Clock::time_point expires_at;
        bool claimed = false;
        bool expired = false;
    };

    struct Membership {
        std::string code;
        RelayRole role;
    };

    using Outbox = std::vector<std::pair<std::shared_ptr<RelayPeer>, nlohmann::json>>;

    static void post(Outbox& outbox, const std::weak_ptr<RelayPeer>& to, nlohmann::json message);
    static void flush(Outbox& outbox);

    std::chrono::seconds ttl_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, PendingSession> sessions_;
    std::unordered_map<const RelayPeer*, Membership> members_;
};
