#include "frame_channel.hpp"
#include "errors.hpp"

#include <string>

namespace {

void put_u64_le(uint8_t* out, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        out[i] = static_cast<uint8_t>((value >> (8 * i)) & 0xFF);
    }
}

uint64_t get_u64_le(const uint8_t* in) {
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value |= static_cast<uint64_t>(in[i]) << (8 * i);
    }
    return value;
}

}  // namespace

std::array<uint8_t, kFrameHeaderSize> encode_frame_header(uint64_t sequence, TimestampNS capture_ts_ns) {
    std::array<uint8_t, kFrameHeaderSize> header{};
    put_u64_le(header.data(), sequence);
    put_u64_le(header.data() + 8, capture_ts_ns);
    return header;
}

void decode_frame_header(const uint8_t* data, size_t size, Frame& frame) {
    if (data == nullptr || size != kFrameHeaderSize) {
        throw DecodeError("frame header must be " + std::to_string(kFrameHeaderSize) +
                          " bytes, got " + std::to_string(size));
    }
    frame.sequence = get_u64_le(data);
    frame.capture_ts_ns = get_u64_le(data + 8);
    frame.has_header = true;
}
