#pragma once
#include "frame_channel.hpp"

#include <zmq.hpp>
#include <spdlog/spdlog.h>

#include <string>

/*
 * Offers one frame to a non-blocking socket, as [header, payload] or [payload].
 * A full queue on the first part is WouldBlock. Once the header part is queued
 * the payload must follow, so a refused payload is a send failure.
 */
template <typename Socket>
SendStatus send_frame(Socket& socket, const Frame& frame, bool with_header, const std::string& address) {
    if (with_header) {
        const auto header = encode_frame_header(frame.sequence, frame.capture_ts_ns);
        // the high-water mark is checked on the first part only
        if (!socket.send(zmq::buffer(header), zmq::send_flags::sndmore | zmq::send_flags::dontwait)) {
            return SendStatus::WouldBlock;
        }
        if (!socket.send(zmq::buffer(frame.payload), zmq::send_flags::dontwait)) {
            spdlog::error("Error sending frame {} on {}: payload refused after header", frame.sequence, address);
            return SendStatus::Failed;
        }
        return SendStatus::Sent;
    }
    if (!socket.send(zmq::buffer(frame.payload), zmq::send_flags::dontwait)) {
        return SendStatus::WouldBlock;
    }
    return SendStatus::Sent;
}

// PUSH end, bound once at startup. A full send queue drops the newest frame.
class ZmqFrameSender : public FrameSender {
public:
    // Throws zmq::error_t if the socket cannot be created or bound.
    ZmqFrameSender(zmq::context_t& context, const std::string& address, int queue_depth, bool with_header);

    SendStatus try_send(const Frame& frame) override;

private:
    zmq::socket_t socket_;
    std::string address_;
    bool with_header_;
};

// PULL end, connected once at startup. Accepts [header, payload] and bare [payload] messages.
class ZmqFrameReceiver : public FrameReceiver {
public:
    // receive_timeout_ms < 0 blocks forever. Throws zmq::error_t on create/connect failure.
    ZmqFrameReceiver(zmq::context_t& context, const std::string& address, int queue_depth,
                     int receive_timeout_ms = -1);

    bool receive(Frame& frame) override;

private:
    zmq::socket_t socket_;
    std::string address_;
};
