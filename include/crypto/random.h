#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

/**
 * libsodium CSPRNG helpers.
 */
class CryptoRandom {
public:
    /// Must succeed once before any other crypto call. Safe to call repeatedly.
    static bool init();

    /// Uniform value in [0, upper_bound).
    static uint32_t uniform(uint32_t upper_bound);

    /// `bytes` random bytes, hex-encoded.
    static std::string token(std::size_t bytes = 16);

    /// Lowercase hex of a buffer.
    static std::string to_hex(const uint8_t* data, std::size_t size);
};
