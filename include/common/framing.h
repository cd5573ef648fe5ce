#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

using Bytes = std::vector<uint8_t>;

/**
 * Length-prefixed framing shared by the relay link and the TCP data channel.
 *
 * Every frame is a 4-byte big-endian body length followed by the body.
 */
constexpr std::size_t kFrameHeaderSize = 4;

using FrameHeader = std::array<uint8_t, kFrameHeaderSize>;

FrameHeader encode_frame_length(uint32_t length);
uint32_t decode_frame_length(const FrameHeader& header);

/// Header + body in one buffer, ready for a single write.
Bytes encode_frame(const uint8_t* data, std::size_t size);
Bytes encode_frame(const std::string& text);

/// Big-endian helpers used by the chunk message codec.
void put_u64(Bytes& out, uint64_t value);
uint64_t get_u64(const uint8_t* data);
