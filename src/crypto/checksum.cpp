/**
 * ChecksumAccumulator: whole-content SHA-256 computed chunk by chunk.
 */

#include "crypto/checksum.h"

#include <array>
#include <fstream>
#include <stdexcept>

#include "crypto/random.h"

ChecksumAccumulator::ChecksumAccumulator() {
    if (!CryptoRandom::init()) {
        throw std::runtime_error("libsodium initialisation failed");
    }
    crypto_hash_sha256_init(&state_);
}

void ChecksumAccumulator::update(const uint8_t* data, std::size_t size) {
    if (finalized_) {
        throw std::logic_error("checksum already finalized");
    }
    if (size == 0) {
        return;
    }
    crypto_hash_sha256_update(&state_, data, size);
    bytes_ += size;
}

std::string ChecksumAccumulator::finalize() {
    if (finalized_) {
        throw std::logic_error("checksum already finalized");
    }
    std::array<uint8_t, crypto_hash_sha256_BYTES> digest{};
    crypto_hash_sha256_final(&state_, digest.data());
    finalized_ = true;
    return CryptoRandom::to_hex(digest.data(), digest.size());
}

std::string file_checksum(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open " + path);
    }

    ChecksumAccumulator checksum;
    std::array<char, 8192> block{};
    while (file.read(block.data(), block.size()) || file.gcount() > 0) {
        checksum.update(reinterpret_cast<const uint8_t*>(block.data()),
                        static_cast<std::size_t>(file.gcount()));
    }
    if (file.bad()) {
        throw std::runtime_error("read error on " + path);
    }
    return checksum.finalize();
}

std::string buffer_checksum(const uint8_t* data, std::size_t size) {
    ChecksumAccumulator checksum;
    checksum.update(data, size);
    return checksum.finalize();
}
