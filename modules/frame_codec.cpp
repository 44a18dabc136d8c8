#include "frame_codec.hpp"
#include "errors.hpp"

#include <opencv2/dnn.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <sstream>
#include <string>
#include <utility>

std::string shape_to_string(const std::vector<int64_t>& shape) {
    std::ostringstream ss;
    ss << "[";
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i) ss << ",";
        ss << shape[i];
    }
    ss << "]";
    return ss.str();
}

JpegEncoder::JpegEncoder(int quality)
        : params_{cv::IMWRITE_JPEG_QUALITY, quality} {}

bool JpegEncoder::encode(const cv::Mat& frame, std::vector<uint8_t>& out) const {
    out.clear();
    if (frame.empty()) return false;
    try {
        return cv::imencode(".jpg", frame, out, params_) && !out.empty();
    } catch (const cv::Exception&) {
        out.clear();
        return false;
    }
}

TensorDecoder::TensorDecoder(std::vector<int64_t> shape, InputMode mode)
        : shape_(std::move(shape)), mode_(mode), element_count_(1) {
    if (shape_.size() != 4) {
        throw ConfigError("input shape must be [N, C, H, W], got " + shape_to_string(shape_));
    }
    for (int64_t dim : shape_) {
        if (dim <= 0) throw ConfigError("input shape dimensions must be positive, got " + shape_to_string(shape_));
        element_count_ *= static_cast<size_t>(dim);
    }
}

InputTensor TensorDecoder::decode(const std::vector<uint8_t>& payload) const {
    if (payload.empty()) {
        throw DecodeError("empty payload");
    }
    return mode_ == InputMode::Raw ? decode_raw(payload) : decode_image(payload);
}

InputTensor TensorDecoder::decode_image(const std::vector<uint8_t>& payload) const {
    const int channels = static_cast<int>(shape_[1]);
    const int height = static_cast<int>(shape_[2]);
    const int width = static_cast<int>(shape_[3]);

    // 1. decompress into the channel layout the model wants
    cv::Mat image;
    try {
        image = cv::imdecode(payload, channels == 1 ? cv::IMREAD_GRAYSCALE : cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        throw DecodeError(std::string("image decode failed: ") + e.what());
    }
    if (image.empty()) {
        throw DecodeError("payload of " + std::to_string(payload.size()) + " bytes is not a decodable image");
    }
    if (image.channels() != channels) {
        throw DecodeError("shape mismatch: decoded " + std::to_string(image.channels()) +
                          " channels, model wants " + shape_to_string(shape_));
    }

    // 2. resize + normalize, BGR -> RGB for color input
    cv::Mat resized;
    cv::resize(image, resized, cv::Size(width, height), 0, 0, cv::INTER_LINEAR);
    cv::Mat blob = cv::dnn::blobFromImage(resized, 1 / 255.0, cv::Size(), cv::Scalar(), channels == 3, false);
    if (blob.total() != element_count_) {
        throw DecodeError("shape mismatch: blob has " + std::to_string(blob.total()) +
                          " elements, model wants " + shape_to_string(shape_));
    }

    InputTensor tensor;
    tensor.shape = shape_;
    tensor.data.assign(blob.ptr<float>(), blob.ptr<float>() + blob.total());
    return tensor;
}

InputTensor TensorDecoder::decode_raw(const std::vector<uint8_t>& payload) const {
    if (payload.size() != element_count_) {
        throw DecodeError("shape mismatch: got " + std::to_string(payload.size()) + " bytes, " +
                          shape_to_string(shape_) + " needs " + std::to_string(element_count_));
    }
    InputTensor tensor;
    tensor.shape = shape_;
    tensor.data.assign(payload.begin(), payload.end());
    return tensor;
}
