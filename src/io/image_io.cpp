#include "psr_analyzer/io/image_io.hpp"
#include "psr_analyzer/core/errors.hpp"
#include "psr_analyzer/core/utils.hpp"

#include <opencv2/imgcodecs.hpp>
#include <algorithm>
#include <string>

namespace psr_analyzer::io {

bool is_supported_image_path(const fs::path& path) {
    const std::string ext = core::to_lower(path.extension().string());
    return ext == ".png" || ext == ".jpg" || ext == ".jpeg" || ext == ".webp" ||
           ext == ".tif" || ext == ".tiff" || ext == ".bmp";
}

Matrix2Df load_grayscale(const fs::path& path) {
    if (!fs::exists(path)) {
        throw IOError("Image file not found: " + path.string());
    }
    if (!is_supported_image_path(path)) {
        throw IOError("Unsupported image extension: " + path.string());
    }

    cv::Mat gray;
    try {
        gray = cv::imread(path.string(), cv::IMREAD_GRAYSCALE);
    } catch (const cv::Exception& e) {
        throw IOError("Failed to decode " + path.string() + ": " + e.what());
    }
    if (gray.empty()) {
        throw IOError("Failed to decode image: " + path.string());
    }
    return core::from_cv_mat(gray);
}

cv::Mat to_8bit(const Matrix2Df& img) {
    cv::Mat out;
    core::to_cv_mat(img).convertTo(out, CV_8U);
    return out;
}

cv::Mat stretch_to_8bit(const Matrix2Df& img) {
    cv::Mat out;
    const cv::Mat src = core::to_cv_mat(img);
    double lo = 0.0, hi = 0.0;
    cv::minMaxLoc(src, &lo, &hi);
    if (!(hi > lo)) {
        return cv::Mat::zeros(src.rows, src.cols, CV_8U);
    }
    src.convertTo(out, CV_8U, 255.0 / (hi - lo), -lo * 255.0 / (hi - lo));
    return out;
}

cv::Mat mask_to_image(const Mask2D& mask) {
    cv::Mat out;
    cv::Mat src = core::mask_to_cv_mat(mask);
    cv::compare(src, cv::Scalar(0), out, cv::CMP_GT);
    return out;
}

void save_image(const fs::path& path, const cv::Mat& img) {
    bool ok = false;
    try {
        ok = cv::imwrite(path.string(), img);
    } catch (const cv::Exception& e) {
        throw IOError("Failed to encode " + path.string() + ": " + e.what());
    }
    if (!ok) {
        throw IOError("Failed to write image: " + path.string());
    }
}

} // namespace psr_analyzer::io
