#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <sodium.h>

/**
 * Incremental SHA-256 over a byte stream (libsodium crypto_hash_sha256).
 *
 * Fed one chunk at a time and finalized once; the digest depends only on
 * the bytes, never on how they were sliced.
 */
class ChecksumAccumulator {
public:
    ChecksumAccumulator();

    void update(const uint8_t* data, std::size_t size);

    /// Lowercase hex digest. Further updates are rejected after this.
    std::string finalize();

    [[nodiscard]] bool finalized() const { return finalized_; }
    [[nodiscard]] uint64_t bytes_processed() const { return bytes_; }

private:
    crypto_hash_sha256_state state_;
    uint64_t bytes_ = 0;
    bool finalized_ = false;
};

/// SHA-256 hex digest of a file read in 8 KiB blocks.
std::string file_checksum(const std::string& path);

/// SHA-256 hex digest of an in-memory buffer.
std::string buffer_checksum(const uint8_t* data, std::size_t size);
