#include "psr_analyzer/detection/detection.hpp"
#include "psr_analyzer/core/errors.hpp"
#include "psr_analyzer/core/utils.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <string>

namespace psr_analyzer::detection {

Mask2D detect_basic(const Matrix2Df& img, float threshold) {
    if (img.size() == 0) {
        throw DimensionError("detect_basic: image must not be empty");
    }
    return (img.array() < threshold).cast<uint8_t>().matrix();
}

double adaptive_gaussian_sigma(int block_size) {
    return 0.3 * ((static_cast<double>(block_size) - 1.0) * 0.5 - 1.0) + 0.8;
}

Mask2D detect_adaptive(const Matrix2Df& img, int block_size, float constant) {
    const int h = static_cast<int>(img.rows());
    const int w = static_cast<int>(img.cols());
    if (h <= 0 || w <= 0) {
        throw DimensionError("detect_adaptive: image must not be empty");
    }
    if (block_size < 3 || (block_size % 2) == 0) {
        throw ConfigError("detection.adaptive_block_size must be odd and >= 3, got " +
                          std::to_string(block_size));
    }
    if (block_size > std::min(h, w)) {
        throw DimensionError("detect_adaptive: block size " + std::to_string(block_size) +
                             " exceeds image " + std::to_string(w) + "x" + std::to_string(h));
    }

    cv::Mat src;
    core::to_cv_mat(img).convertTo(src, CV_64F);

    const double sigma = adaptive_gaussian_sigma(block_size);
    cv::Mat mean;
    cv::GaussianBlur(src, mean, cv::Size(block_size, block_size), sigma, sigma,
                     cv::BORDER_REFLECT_101);

    Mask2D mask(h, w);
    for (int y = 0; y < h; ++y) {
        const double* mrow = mean.ptr<double>(y);
        for (int x = 0; x < w; ++x) {
            const double local = std::round(mrow[x]);
            mask(y, x) = (static_cast<double>(img(y, x)) < local - static_cast<double>(constant))
                             ? uint8_t(1) : uint8_t(0);
        }
    }
    return mask;
}

} // namespace psr_analyzer::detection
