/**
 * Framing helpers: 4-byte big-endian length prefixes and u64 packing.
 */

#include "common/framing.h"

#include <limits>
#include <stdexcept>

FrameHeader encode_frame_length(uint32_t length) {
    return FrameHeader{
        static_cast<uint8_t>(length >> 24),
        static_cast<uint8_t>(length >> 16),
        static_cast<uint8_t>(length >> 8),
        static_cast<uint8_t>(length),
    };
}

uint32_t decode_frame_length(const FrameHeader& header) {
    return (static_cast<uint32_t>(header[0]) << 24) |
           (static_cast<uint32_t>(header[1]) << 16) |
           (static_cast<uint32_t>(header[2]) << 8) |
           static_cast<uint32_t>(header[3]);
}

Bytes encode_frame(const uint8_t* data, std::size_t size) {
    if (size > std::numeric_limits<uint32_t>::max()) {
        throw std::length_error("frame body too large");
    }
    FrameHeader header = encode_frame_length(static_cast<uint32_t>(size));

    Bytes frame;
    frame.reserve(kFrameHeaderSize + size);
    frame.insert(frame.end(), header.begin(), header.end());
    frame.insert(frame.end(), data, data + size);
    return frame;
}

Bytes encode_frame(const std::string& text) {
    return encode_frame(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

void put_u64(Bytes& out, uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>(value >> shift));
    }
}

uint64_t get_u64(const uint8_t* data) {
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value = (value << 8) | data[i];
    }
    return value;
}

