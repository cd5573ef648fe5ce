/**
 * Transfer failure taxonomy and its string form.
 */

#include "common/errors.h"

#include <utility>

namespace {

struct ErrorName {
    TransferError error;
    const char* name;
};

constexpr ErrorName kErrorNames[] = {
    {TransferError::none,                       "none"},
    {TransferError::relay_unreachable,          "relay_unreachable"},
    {TransferError::code_exhausted,             "code_exhausted"},
    {TransferError::code_not_found,             "code_not_found"},
    {TransferError::code_busy,                  "code_busy"},
    {TransferError::code_expired,               "code_expired"},
    {TransferError::negotiation_timeout,        "negotiation_timeout"},
    {TransferError::connectivity_failure,       "connectivity_failure"},
    {TransferError::protocol_violation,         "protocol_violation"},
    {TransferError::channel_closed_early,       "channel_closed_early"},
    {TransferError::chunk_inactivity_timeout,   "chunk_inactivity_timeout"},
    {TransferError::checksum_mismatch,          "checksum_mismatch"},
    {TransferError::length_mismatch,            "length_mismatch"},
    {TransferError::insufficient_local_storage, "insufficient_local_storage"},
    {TransferError::source_read_failure,        "source_read_failure"},
    {TransferError::transfer_declined,          "transfer_declined"},
    {TransferError::transfer_cancelled,         "transfer_cancelled"},
};

} // namespace

const char* to_string(TransferError error) {
    for (const auto& entry : kErrorNames) {
        if (entry.error == error) {
            return entry.name;
        }
    }
    return "unknown";
}

TransferError transfer_error_from_string(const std::string& name) {
    for (const auto& entry : kErrorNames) {
        if (name == entry.name) {
            return entry.error;
        }
    }
    return TransferError::protocol_violation;
}

TransferException::TransferException(TransferError cause, const std::string& what)
    : std::runtime_error(std::string(to_string(cause)) + ": " + what),
      cause_(cause) {}
