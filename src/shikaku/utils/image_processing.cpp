// MIT License

// Copyright (c) 2026 ICHIRO ITS

// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:

// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.

// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.

#include "shikaku/utils/image_processing.hpp"
#include "shikaku/utils/errors.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace shikaku {

namespace {

cv::Mat decode_buffer(const cv::Mat& buffer) {
    if (buffer.empty()) {
        throw DecodeError("Empty image upload");
    }

    cv::Mat image;
    try {
        // IMREAD_UNCHANGED keeps alpha and skips EXIF rotation
        image = cv::imdecode(buffer, cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        throw DecodeError(std::string("Cannot decode image: ") + e.what());
    }

    if (image.empty()) {
        throw DecodeError("Cannot identify image file: unsupported or corrupt data");
    }
    return image;
}

cv::Mat to_rgb8(const cv::Mat& image) {
    cv::Mat src = image;
    if (src.depth() == CV_16U) {
        src.convertTo(src, CV_MAKETYPE(CV_8U, src.channels()), 1.0 / 257.0);
    } else if (src.depth() != CV_8U) {
        throw DecodeError("Unsupported pixel depth");
    }

    cv::Mat rgb;
    switch (src.channels()) {
    case 1:
        cv::cvtColor(src, rgb, cv::COLOR_GRAY2RGB);
        break;
    case 3:
        cv::cvtColor(src, rgb, cv::COLOR_BGR2RGB);
        break;
    case 4:
        cv::cvtColor(src, rgb, cv::COLOR_BGRA2RGB);
        break;
    default:
        throw DecodeError("Unsupported channel count: " + std::to_string(src.channels()));
    }
    return rgb;
}

} // namespace

int interpolation_from_name(const std::string& name) {
    if (name == "bilinear") return cv::INTER_LINEAR;
    if (name == "bicubic") return cv::INTER_CUBIC;
    if (name == "area") return cv::INTER_AREA;
    if (name == "nearest") return cv::INTER_NEAREST;
    throw std::invalid_argument("Unknown resize interpolation: " + name);
}

cv::Mat decode_image(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) {
        return decode_buffer(cv::Mat());
    }
    cv::Mat buffer(1, static_cast<int>(bytes.size()), CV_8UC1,
                   const_cast<uint8_t*>(bytes.data()));
    return decode_buffer(buffer);
}

cv::Mat decode_image(const std::string& bytes) {
    if (bytes.empty()) {
        return decode_buffer(cv::Mat());
    }
    cv::Mat buffer(1, static_cast<int>(bytes.size()), CV_8UC1,
                   const_cast<char*>(bytes.data()));
    return decode_buffer(buffer);
}

ImageTensor normalize_image(const cv::Mat& image, const PreprocessOptions& options) {
    if (image.empty()) {
        throw DecodeError("Empty image");
    }

    cv::Mat rgb = to_rgb8(image);

    // Direct resize, aspect ratio is not preserved
    const cv::Size target(options.image_size, options.image_size);
    cv::Mat resized;
    if (rgb.size() != target) {
        cv::resize(rgb, resized, target, 0, 0, options.interpolation);
    } else {
        resized = rgb;
    }
    if (!resized.isContinuous()) {
        resized = resized.clone();
    }

    ImageTensor tensor;
    tensor.shape = {{1, static_cast<size_t>(options.image_size),
                     static_cast<size_t>(options.image_size), 3}};
    tensor.data.resize(resized.total() * 3);

    // Same affine map as the training pipeline: [0, 255] -> [-1, 1]
    const uint8_t* pixels = resized.ptr<uint8_t>();
    for (size_t i = 0; i < tensor.data.size(); ++i) {
        tensor.data[i] = static_cast<float>(pixels[i]) / 127.5f - 1.0f;
    }

    return tensor;
}

ImageTensor preprocess_image(const std::string& bytes, const PreprocessOptions& options) {
    return normalize_image(decode_image(bytes), options);
}

} // namespace shikaku
