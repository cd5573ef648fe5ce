/**
 * CSPRNG and hex helpers on top of libsodium.
 */

#include "crypto/random.h"

#include <stdexcept>
#include <vector>

#include <sodium.h>

bool CryptoRandom::init() {
    // sodium_init() returns 1 when already initialised.
    return sodium_init() >= 0;
}

uint32_t CryptoRandom::uniform(uint32_t upper_bound) {
    if (!init()) {
        throw std::runtime_error("libsodium initialisation failed");
    }
    return randombytes_uniform(upper_bound);
}

std::string CryptoRandom::token(std::size_t bytes) {
    if (!init()) {
        throw std::runtime_error("libsodium initialisation failed");
    }
    std::vector<uint8_t> buffer(bytes);
    randombytes_buf(buffer.data(), buffer.size());
    return to_hex(buffer.data(), buffer.size());
}

std::string CryptoRandom::to_hex(const uint8_t* data, std::size_t size) {
    std::string hex(size * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), data, size);
    hex.resize(size * 2);
    return hex;
}
