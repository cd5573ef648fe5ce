/**
 * Relay link vocabulary: roles, status codes and response builders.
 */

#include "rendezvous/relay_protocol.h"

const char* to_string(RelayRole role) {
    return role == RelayRole::sender ? "sender" : "receiver";
}

bool relay_role_from_string(const std::string& name, RelayRole& out) {
    if (name == "sender") {
        out = RelayRole::sender;
        return true;
    }
    if (name == "receiver") {
        out = RelayRole::receiver;
        return true;
    }
    return false;
}

const char* to_string(RelayStatus status) {
    switch (status) {
        case RelayStatus::ok:             return "ok";
        case RelayStatus::code_busy:      return "code_busy";
        case RelayStatus::code_not_found: return "code_not_found";
        case RelayStatus::code_expired:   return "code_expired";
        case RelayStatus::bad_request:    return "bad_request";
    }
    return "bad_request";
}

TransferError transfer_error_for_status(const std::string& status_code) {
    if (status_code == "code_busy")      return TransferError::code_busy;
    if (status_code == "code_not_found") return TransferError::code_not_found;
    if (status_code == "code_expired")   return TransferError::code_expired;
    return TransferError::protocol_violation;
}

nlohmann::json make_registered_response() {
    return {{"status", "registered"}};
}

nlohmann::json make_error_response(RelayStatus status, const std::string& message) {
    return {{"status", "error"}, {"code", to_string(status)}, {"message", message}};
}

std::string dump_relay_message(const nlohmann::json& message) {
    return message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}
