#ifndef SHIKAKU_IMAGE_PROCESSING_HPP
#define SHIKAKU_IMAGE_PROCESSING_HPP

#include <opencv2/core.hpp>
#include <array>
#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>

namespace shikaku {

// NHWC float tensor, RGB channel order, values in [-1, 1].
struct ImageTensor {
    std::array<size_t, 4> shape{{1, 0, 0, 3}};
    std::vector<float> data;

    size_t height() const { return shape[1]; }
    size_t width() const { return shape[2]; }
    size_t channels() const { return shape[3]; }
};

struct PreprocessOptions {
    int image_size = 224;
    int interpolation = cv::INTER_LINEAR;
};

// Maps a config name (bilinear, bicubic, area, nearest) to a cv interpolation flag.
int interpolation_from_name(const std::string& name);

cv::Mat decode_image(const std::vector<uint8_t>& bytes);
cv::Mat decode_image(const std::string& bytes);

ImageTensor normalize_image(const cv::Mat& image, const PreprocessOptions& options = {});

ImageTensor preprocess_image(const std::string& bytes, const PreprocessOptions& options = {});

} // namespace shikaku

#endif // SHIKAKU_IMAGE_PROCESSING_HPP
