#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "common/errors.h"

/**
 * Vocabulary of the relay link: JSON objects carried in length-prefixed
 * frames. Requests and notifications carry "action", responses "status".
 */

constexpr std::size_t kMaxRelayFrameSize = 1024 * 1024;

struct RelayAction {
    static constexpr const char* kRegister   = "register";
    static constexpr const char* kOffer      = "offer";
    static constexpr const char* kAnswer     = "answer";
    static constexpr const char* kCandidate  = "candidate";
    static constexpr const char* kCancel     = "cancel";
    static constexpr const char* kMetadata   = "metadata";
    static constexpr const char* kPeerJoined = "peer_joined";
    static constexpr const char* kPeerLeft   = "peer_left";
    static constexpr const char* kExpired    = "expired";
};

enum class RelayRole { sender, receiver };

const char* to_string(RelayRole role);
bool relay_role_from_string(const std::string& name, RelayRole& out);

enum class RelayStatus {
    ok,
    code_busy,
    code_not_found,
    code_expired,
    bad_request,
};

const char* to_string(RelayStatus status);

/// Rendezvous failure for an error response's "code" field.
TransferError transfer_error_for_status(const std::string& status_code);

nlohmann::json make_registered_response();
nlohmann::json make_error_response(RelayStatus status, const std::string& message);

/// Serialises a relay message. Strings that are not valid UTF-8 are replaced
/// rather than thrown on, so a peer-supplied name cannot abort a handler.
std::string dump_relay_message(const nlohmann::json& message);
