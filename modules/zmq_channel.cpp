#include "zmq_channel.hpp"
#include "errors.hpp"

#include <zmq_addon.hpp>
#include <spdlog/spdlog.h>

#include <iterator>
#include <vector>

ZmqFrameSender::ZmqFrameSender(zmq::context_t& context, const std::string& address, int queue_depth,
                               bool with_header)
        : socket_(context, zmq::socket_type::push), address_(address), with_header_(with_header) {
    socket_.set(zmq::sockopt::sndhwm, queue_depth);
    socket_.set(zmq::sockopt::linger, 0);  // unsent frames are worthless at shutdown
    socket_.bind(address_);
    spdlog::info("Frame channel bound at {} (queue depth {})", address_, queue_depth);
}

SendStatus ZmqFrameSender::try_send(const Frame& frame) {
    try {
        return send_frame(socket_, frame, with_header_, address_);
    } catch (const zmq::error_t& e) {
        spdlog::error("Error sending frame {} on {}: {}", frame.sequence, address_, e.what());
        return SendStatus::Failed;
    }
}

ZmqFrameReceiver::ZmqFrameReceiver(zmq::context_t& context, const std::string& address, int queue_depth,
                                   int receive_timeout_ms)
        : socket_(context, zmq::socket_type::pull), address_(address) {
    socket_.set(zmq::sockopt::rcvhwm, queue_depth);
    socket_.set(zmq::sockopt::linger, 0);
    if (receive_timeout_ms >= 0) {
        socket_.set(zmq::sockopt::rcvtimeo, receive_timeout_ms);
    }
    socket_.connect(address_);
    spdlog::info("Frame channel connected to {}", address_);
}

bool ZmqFrameReceiver::receive(Frame& frame) {
    std::vector<zmq::message_t> parts;
    try {
        if (!zmq::recv_multipart(socket_, std::back_inserter(parts))) {
            return false;  // receive timeout
        }
    } catch (const zmq::error_t& e) {
        if (e.num() == ETERM) {
            spdlog::debug("Receive on {} interrupted", address_);
        } else {
            spdlog::error("Failed to receive frame from {}: {}", address_, e.what());
        }
        return false;
    }

    frame = Frame{};
    const zmq::message_t* payload = nullptr;
    if (parts.size() == 1) {
        payload = &parts[0];
    } else if (parts.size() == 2) {
        decode_frame_header(parts[0].data<uint8_t>(), parts[0].size(), frame);
        payload = &parts[1];
    } else {
        throw DecodeError("expected 1 or 2 message parts, got " + std::to_string(parts.size()));
    }

    const uint8_t* bytes = payload->data<uint8_t>();
    frame.payload.assign(bytes, bytes + payload->size());
    return true;
}
