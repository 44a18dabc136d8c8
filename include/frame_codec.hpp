#pragma once
#include "data_types.hpp"

#include <opencv2/core.hpp>

#include <cstddef>
#include <string>
#include <vector>

// Compresses captured frames for the wire
class JpegEncoder {
public:
    explicit JpegEncoder(int quality);

    // false if OpenCV cannot encode the frame; out is left empty then
    bool encode(const cv::Mat& frame, std::vector<uint8_t>& out) const;

private:
    std::vector<int> params_;
};

/*
 * Turns a received payload into the model input tensor [N, C, H, W].
 *
 * Image mode decodes the compressed bytes, resizes to W x H and normalizes to
 * [0, 1] with RGB channel order. Raw mode takes every payload byte as one tensor
 * element and requires the byte count to match the shape exactly.
 * Both throw DecodeError on any mismatch.
 */
class TensorDecoder {
public:
    TensorDecoder(std::vector<int64_t> shape, InputMode mode);

    InputTensor decode(const std::vector<uint8_t>& payload) const;

    const std::vector<int64_t>& shape() const { return shape_; }
    size_t element_count() const { return element_count_; }

private:
    InputTensor decode_image(const std::vector<uint8_t>& payload) const;
    InputTensor decode_raw(const std::vector<uint8_t>& payload) const;

    std::vector<int64_t> shape_;
    InputMode mode_;
    size_t element_count_;
};

// "[1,3,224,224]"
std::string shape_to_string(const std::vector<int64_t>& shape);
