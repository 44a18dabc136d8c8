#pragma once
#include "data_types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>

enum class SendStatus {
    Sent,
    WouldBlock,  // consumer not keeping up, frame dropped
    Failed
};

// Send side of the channel. try_send never blocks.
class FrameSender {
public:
    virtual ~FrameSender() = default;
    virtual SendStatus try_send(const Frame& frame) = 0;
};

// Receive side of the channel. receive blocks until a message arrives and
// returns false on a transport error or when interrupted; a malformed
// message throws DecodeError.
class FrameReceiver {
public:
    virtual ~FrameReceiver() = default;
    virtual bool receive(Frame& frame) = 0;
};

// Wire header: sequence and capture timestamp, both u64 little-endian
constexpr size_t kFrameHeaderSize = 16;

std::array<uint8_t, kFrameHeaderSize> encode_frame_header(uint64_t sequence, TimestampNS capture_ts_ns);

// Fills sequence, capture_ts_ns and has_header. Throws DecodeError if size is wrong.
void decode_frame_header(const uint8_t* data, size_t size, Frame& frame);
