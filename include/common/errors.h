#pragma once

#include <stdexcept>
#include <string>

/**
 * Every way a transfer session can end in FAILED.
 *
 * All causes are terminal for the session that reports them.
 */
enum class TransferError {
    none,

    // rendezvous
    relay_unreachable,
    code_exhausted,
    code_not_found,
    code_busy,
    code_expired,

    // negotiation
    negotiation_timeout,
    connectivity_failure,

    // transport
    protocol_violation,
    channel_closed_early,
    chunk_inactivity_timeout,

    // integrity
    checksum_mismatch,
    length_mismatch,

    // local storage
    insufficient_local_storage,
    source_read_failure,

    // peer decisions
    transfer_declined,
    transfer_cancelled,
};

/// Stable name used in logs, relay error codes and receiver verdicts.
const char* to_string(TransferError error);

/// Inverse of to_string(); unknown names map to protocol_violation.
TransferError transfer_error_from_string(const std::string& name);

/**
 * Thrown by codecs and pipelines; sessions catch it at the event handler
 * boundary and fail with cause().
 */
class TransferException : public std::runtime_error {
public:
    TransferException(TransferError cause, const std::string& what);

    [[nodiscard]] TransferError cause() const { return cause_; }

private:
    TransferError cause_;
};
