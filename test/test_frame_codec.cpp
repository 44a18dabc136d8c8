#include "errors.hpp"
#include "frame_channel.hpp"
#include "frame_codec.hpp"

#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <vector>

namespace {

cv::Mat gradient_image(int width, int height) {
    cv::Mat image(height, width, CV_8UC3);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            image.at<cv::Vec3b>(y, x) = cv::Vec3b(static_cast<uint8_t>(x * 4), static_cast<uint8_t>(y * 4), 128);
        }
    }
    return image;
}

}  // namespace

TEST(TensorDecoder, RawModeRejectsWrongByteCount) {
    TensorDecoder decoder({1, 3, 224, 224}, InputMode::Raw);
    const std::vector<uint8_t> payload(1000, 7);
    try {
        decoder.decode(payload);
        FAIL() << "expected DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_NE(std::string(e.what()).find("shape mismatch"), std::string::npos);
    }
}

TEST(TensorDecoder, RawModeCopiesBytes) {
    TensorDecoder decoder({1, 1, 2, 3}, InputMode::Raw);
    const InputTensor tensor = decoder.decode({0, 1, 2, 3, 4, 255});
    EXPECT_EQ(tensor.shape, (std::vector<int64_t>{1, 1, 2, 3}));
    EXPECT_EQ(tensor.data, (std::vector<float>{0, 1, 2, 3, 4, 255}));
}

TEST(TensorDecoder, ElementCountIsShapeProduct) {
    EXPECT_EQ(TensorDecoder({1, 3, 224, 224}, InputMode::Image).element_count(), 150528u);
    EXPECT_EQ(TensorDecoder({1, 1, 2, 3}, InputMode::Raw).element_count(), 6u);
}

TEST(TensorDecoder, EmptyPayloadIsRejected) {
    TensorDecoder decoder({1, 3, 8, 8}, InputMode::Image);
    EXPECT_THROW(decoder.decode({}), DecodeError);
}

TEST(TensorDecoder, ImageModeResizesAndNormalizes) {
    JpegEncoder encoder(95);
    std::vector<uint8_t> jpeg;
    ASSERT_TRUE(encoder.encode(gradient_image(64, 48), jpeg));
    ASSERT_FALSE(jpeg.empty());

    TensorDecoder decoder({1, 3, 32, 32}, InputMode::Image);
    const InputTensor tensor = decoder.decode(jpeg);
    EXPECT_EQ(tensor.shape, (std::vector<int64_t>{1, 3, 32, 32}));
    ASSERT_EQ(tensor.data.size(), 3u * 32 * 32);
    for (float v : tensor.data) {
        EXPECT_GE(v, 0.0f);
        EXPECT_LE(v, 1.0f);
    }
}

TEST(TensorDecoder, ImageModeGrayscale) {
    JpegEncoder encoder(90);
    std::vector<uint8_t> jpeg;
    ASSERT_TRUE(encoder.encode(gradient_image(40, 30), jpeg));

    TensorDecoder decoder({1, 1, 28, 28}, InputMode::Image);
    EXPECT_EQ(decoder.decode(jpeg).data.size(), 28u * 28);
}

TEST(TensorDecoder, GarbageIsNotAnImage) {
    TensorDecoder decoder({1, 3, 32, 32}, InputMode::Image);
    const std::vector<uint8_t> garbage{'n', 'o', 't', ' ', 'a', ' ', 'j', 'p', 'e', 'g'};
    EXPECT_THROW(decoder.decode(garbage), DecodeError);
}

TEST(TensorDecoder, BadShapeIsAConfigError) {
    EXPECT_THROW(TensorDecoder({1, 3, 224}, InputMode::Raw), ConfigError);
    EXPECT_THROW(TensorDecoder({1, 0, 224, 224}, InputMode::Raw), ConfigError);
}

TEST(JpegEncoder, EmptyFrameFails) {
    JpegEncoder encoder(95);
    std::vector<uint8_t> out{1, 2, 3};
    EXPECT_FALSE(encoder.encode(cv::Mat(), out));
    EXPECT_TRUE(out.empty());
}

TEST(FrameHeader, LittleEndianLayout) {
    const auto header = encode_frame_header(0x0102030405060708ULL, 42);
    EXPECT_EQ(header[0], 0x08);
    EXPECT_EQ(header[7], 0x01);
    EXPECT_EQ(header[8], 42);
    EXPECT_EQ(header[15], 0);

    Frame frame;
    decode_frame_header(header.data(), header.size(), frame);
    EXPECT_TRUE(frame.has_header);
    EXPECT_EQ(frame.sequence, 0x0102030405060708ULL);
    EXPECT_EQ(frame.capture_ts_ns, 42u);
}

TEST(FrameHeader, WrongSizeIsRejected) {
    const uint8_t bytes[8] = {};
    Frame frame;
    EXPECT_THROW(decode_frame_header(bytes, sizeof(bytes), frame), DecodeError);
    EXPECT_FALSE(frame.has_header);
}

TEST(ShapeToString, Format) {
    EXPECT_EQ(shape_to_string({1, 3, 224, 224}), "[1,3,224,224]");
    EXPECT_EQ(shape_to_string({}), "[]");
}
