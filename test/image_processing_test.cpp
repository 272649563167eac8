#include <gtest/gtest.h>
#include "shikaku/utils/image_processing.hpp"
#include "shikaku/utils/errors.hpp"
#include "test_utils.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>

using namespace shikaku;

namespace {

std::string encode_png(const cv::Mat& image) {
    std::vector<uint8_t> buffer;
    cv::imencode(".png", image, buffer);
    return std::string(buffer.begin(), buffer.end());
}

float value_at(const ImageTensor& t, size_t y, size_t x, size_t c) {
    return t.data[(y * t.width() + x) * t.channels() + c];
}

} // namespace

TEST(ImageProcessingTest, OutputShapeHasBatchDimension) {
    ImageTensor tensor = preprocess_image(test::red_png());
    EXPECT_EQ(tensor.shape[0], 1u);
    EXPECT_EQ(tensor.shape[1], 224u);
    EXPECT_EQ(tensor.shape[2], 224u);
    EXPECT_EQ(tensor.shape[3], 3u);
    EXPECT_EQ(tensor.data.size(), 224u * 224u * 3u);
}

TEST(ImageProcessingTest, AffineMapEndpoints) {
    ImageTensor black = normalize_image(cv::Mat(10, 10, CV_8UC3, cv::Scalar(0, 0, 0)));
    ImageTensor white = normalize_image(cv::Mat(10, 10, CV_8UC3, cv::Scalar(255, 255, 255)));

    for (float v : black.data) ASSERT_FLOAT_EQ(v, -1.0f);
    for (float v : white.data) ASSERT_FLOAT_EQ(v, 1.0f);
}

TEST(ImageProcessingTest, MidpointMapsNearZero) {
    ImageTensor low = normalize_image(cv::Mat(4, 4, CV_8UC3, cv::Scalar(127, 127, 127)));
    ImageTensor high = normalize_image(cv::Mat(4, 4, CV_8UC3, cv::Scalar(128, 128, 128)));

    EXPECT_NEAR(low.data[0], 127.0f / 127.5f - 1.0f, 1e-6);
    EXPECT_LT(low.data[0], 0.0f);
    EXPECT_GT(high.data[0], 0.0f);
    EXPECT_NEAR(low.data[0] + high.data[0], 0.0f, 1e-6);
}

TEST(ImageProcessingTest, ValuesStayInRange) {
    cv::Mat noise(50, 70, CV_8UC3);
    cv::randu(noise, cv::Scalar::all(0), cv::Scalar::all(256));
    ImageTensor tensor = normalize_image(noise);

    auto bounds = std::minmax_element(tensor.data.begin(), tensor.data.end());
    EXPECT_GE(*bounds.first, -1.0f);
    EXPECT_LE(*bounds.second, 1.0f);
}

TEST(ImageProcessingTest, ChannelOrderIsRgb) {
    ImageTensor tensor = preprocess_image(test::blue_png());
    EXPECT_FLOAT_EQ(value_at(tensor, 0, 0, 0), -1.0f);
    EXPECT_FLOAT_EQ(value_at(tensor, 0, 0, 1), -1.0f);
    EXPECT_FLOAT_EQ(value_at(tensor, 0, 0, 2), 1.0f);

    tensor = preprocess_image(test::red_png());
    EXPECT_FLOAT_EQ(value_at(tensor, 100, 100, 0), 1.0f);
    EXPECT_FLOAT_EQ(value_at(tensor, 100, 100, 2), -1.0f);
}

TEST(ImageProcessingTest, GrayscaleIsExpandedToThreeChannels) {
    cv::Mat gray(30, 40, CV_8UC1, cv::Scalar(255));
    ImageTensor tensor = preprocess_image(encode_png(gray));
    ASSERT_EQ(tensor.channels(), 3u);
    for (size_t c = 0; c < 3; ++c) {
        EXPECT_FLOAT_EQ(value_at(tensor, 5, 5, c), 1.0f);
    }
}

TEST(ImageProcessingTest, AlphaChannelIsDropped) {
    // Fully transparent green: the alpha value must not leak into the colors
    cv::Mat bgra(20, 20, CV_8UC4, cv::Scalar(0, 255, 0, 0));
    ImageTensor tensor = preprocess_image(encode_png(bgra));
    ASSERT_EQ(tensor.channels(), 3u);
    EXPECT_FLOAT_EQ(value_at(tensor, 0, 0, 0), -1.0f);
    EXPECT_FLOAT_EQ(value_at(tensor, 0, 0, 1), 1.0f);
    EXPECT_FLOAT_EQ(value_at(tensor, 0, 0, 2), -1.0f);
}

TEST(ImageProcessingTest, SixteenBitImagesAreScaled) {
    cv::Mat deep(16, 16, CV_16UC3, cv::Scalar(65535, 0, 65535));
    ImageTensor tensor = preprocess_image(encode_png(deep));
    EXPECT_FLOAT_EQ(value_at(tensor, 0, 0, 0), 1.0f);
    EXPECT_FLOAT_EQ(value_at(tensor, 0, 0, 1), -1.0f);
    EXPECT_FLOAT_EQ(value_at(tensor, 0, 0, 2), 1.0f);
}

TEST(ImageProcessingTest, ResizeDoesNotCrop) {
    // Only the leftmost 20 columns are red. A center crop would lose them,
    // a direct resize keeps them in the first output column.
    cv::Mat wide(100, 400, CV_8UC3, cv::Scalar(255, 0, 0));
    wide(cv::Rect(0, 0, 20, 100)).setTo(cv::Scalar(0, 0, 255));
    ImageTensor tensor = normalize_image(wide);

    EXPECT_FLOAT_EQ(value_at(tensor, 112, 0, 0), 1.0f);
    EXPECT_FLOAT_EQ(value_at(tensor, 112, 0, 2), -1.0f);
    EXPECT_FLOAT_EQ(value_at(tensor, 112, 223, 2), 1.0f);
}

TEST(ImageProcessingTest, CustomSizeAndInterpolation) {
    PreprocessOptions options;
    options.image_size = 96;
    options.interpolation = interpolation_from_name("area");
    ImageTensor tensor = preprocess_image(test::green_png(), options);
    EXPECT_EQ(tensor.height(), 96u);
    EXPECT_EQ(tensor.width(), 96u);
    EXPECT_FLOAT_EQ(value_at(tensor, 50, 50, 1), 1.0f);
}

TEST(ImageProcessingTest, InterpolationNames) {
    EXPECT_EQ(interpolation_from_name("bilinear"), cv::INTER_LINEAR);
    EXPECT_EQ(interpolation_from_name("bicubic"), cv::INTER_CUBIC);
    EXPECT_EQ(interpolation_from_name("nearest"), cv::INTER_NEAREST);
    EXPECT_THROW(interpolation_from_name("lanczos7"), std::invalid_argument);
}

TEST(ImageProcessingTest, CorruptBytesThrowDecodeError) {
    EXPECT_THROW(preprocess_image(std::string("this is not an image")), DecodeError);

    std::string truncated = test::red_png().substr(0, 20);
    EXPECT_THROW(preprocess_image(truncated), DecodeError);
}

TEST(ImageProcessingTest, EmptyUploadThrowsDecodeError) {
    EXPECT_THROW(decode_image(std::string()), DecodeError);
    EXPECT_THROW(decode_image(std::vector<uint8_t>()), DecodeError);
    EXPECT_THROW(normalize_image(cv::Mat()), DecodeError);
}

TEST(ImageProcessingTest, DecodeErrorIsInputError) {
    EXPECT_THROW(preprocess_image(std::string("garbage")), InputError);
}
