#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "common/errors.h"
#include "common/framing.h"

/**
 * Metadata envelope sent on the data channel before any chunk.
 */
struct TransferHeader {
    std::string filename;
    uint64_t length = 0;
    uint64_t chunk_size = 0;
    uint64_t chunk_count = 0;
    /// Placeholder; may be empty. The completion marker carries the final value.
    std::string checksum;

    static TransferHeader describe(const std::string& filename,
                                   uint64_t length,
                                   uint64_t chunk_size,
                                   const std::string& checksum = "");

    /// ceil(length / chunk_size); zero-length content has no chunks.
    static uint64_t chunk_count_for(uint64_t length, uint64_t chunk_size);

    /// Throws TransferException(protocol_violation) when inconsistent.
    void validate() const;

    /// Expected payload size of chunk `sequence`.
    [[nodiscard]] uint64_t chunk_length(uint64_t sequence) const;

    [[nodiscard]] nlohmann::json to_json() const;

    /// Throws TransferException(protocol_violation) on missing/mistyped fields.
    static TransferHeader from_json(const nlohmann::json& json);
};

/// Sequenced slice of the content.
struct Chunk {
    uint64_t sequence = 0;
    Bytes payload;
};

/**
 * Data-channel message codec: a one-byte tag and a tag-specific body.
 *
 *   'H' header      JSON TransferHeader
 *   'C' chunk       u64 big-endian sequence, raw payload
 *   'E' complete    JSON {"checksum": "..."}
 *   'K' keepalive   JSON {"assembled": n, "total": n}, receiver to sender while verifying
 *   'R' verdict     JSON {"result": "ok" | <error name>, "detail": "..."}
 */
enum class MessageType : uint8_t {
    header    = 'H',
    chunk     = 'C',
    complete  = 'E',
    keepalive = 'K',
    verdict   = 'R',
};

struct DecodedMessage {
    MessageType type = MessageType::header;
    TransferHeader header;
    Chunk chunk;
    std::string checksum;
    uint64_t assembled = 0;
    uint64_t total = 0;
    TransferError verdict = TransferError::none;
    std::string detail;
};

class MessageCodec {
public:
    /// Tag plus sequence number in front of every chunk payload.
    static constexpr std::size_t kChunkOverhead = 1 + 8;

    static Bytes encode_header(const TransferHeader& header);
    static Bytes encode_chunk(uint64_t sequence, const uint8_t* data, std::size_t size);
    static Bytes encode_complete(const std::string& checksum);
    static Bytes encode_keepalive(uint64_t assembled, uint64_t total);
    static Bytes encode_verdict(TransferError result, const std::string& detail = "");

    /// Throws TransferException(protocol_violation) on a malformed message.
    /// A verdict whose result is neither "ok" nor a failure cause is malformed.
    static DecodedMessage decode(Bytes message);
};
