#include "psr_analyzer/terrain/terrain.hpp"
#include "psr_analyzer/core/errors.hpp"
#include "psr_analyzer/core/utils.hpp"
#include "psr_analyzer/image/enhancement.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <string>

namespace psr_analyzer::terrain {

namespace {

void check_image(const Matrix2Df& img, const char* stage) {
    if (img.rows() <= 0 || img.cols() <= 0) {
        throw DimensionError(std::string(stage) + ": image must not be empty");
    }
}

} // namespace

std::vector<PixelCoord> find_peaks(const Matrix2Df& img, int min_distance) {
    check_image(img, "find_peaks");
    if (min_distance < 1) {
        throw ConfigError("terrain.peak_min_distance must be >= 1, got " + std::to_string(min_distance));
    }
    const int h = static_cast<int>(img.rows());
    const int w = static_cast<int>(img.cols());

    // Max filter with out-of-image samples ignored.
    const cv::Mat src = core::to_cv_mat(img);
    cv::Mat local_max;
    const cv::Mat kernel = cv::getStructuringElement(
        cv::MORPH_RECT, cv::Size(2 * min_distance + 1, 2 * min_distance + 1));
    cv::dilate(src, local_max, kernel);

    // Candidates equal their neighborhood maximum and rise above the image
    // minimum, so a constant image has no peaks.
    const float floor_value = img.minCoeff();
    std::vector<PixelCoord> candidates;
    for (int y = 0; y < h; ++y) {
        const float* srow = src.ptr<float>(y);
        const float* mrow = local_max.ptr<float>(y);
        for (int x = 0; x < w; ++x) {
            if (srow[x] >= mrow[x] && srow[x] > floor_value) {
                candidates.push_back({y, x, srow[x]});
            }
        }
    }
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const PixelCoord& a, const PixelCoord& b) { return a.value > b.value; });

    // Greedy suppression: a kept peak blocks its Chebyshev neighborhood, so
    // the higher value wins and ties go to the first in raster order.
    Mask2D blocked = Mask2D::Zero(h, w);
    std::vector<PixelCoord> peaks;
    for (const auto& c : candidates) {
        if (blocked(c.row, c.col)) continue;
        peaks.push_back(c);
        const int y0 = std::max(0, c.row - min_distance);
        const int y1 = std::min(h - 1, c.row + min_distance);
        const int x0 = std::max(0, c.col - min_distance);
        const int x1 = std::min(w - 1, c.col + min_distance);
        blocked.block(y0, x0, y1 - y0 + 1, x1 - x0 + 1).setOnes();
    }
    return peaks;
}

std::vector<PixelCoord> find_valleys(const Matrix2Df& img, int min_distance) {
    check_image(img, "find_valleys");
    std::vector<PixelCoord> valleys = find_peaks(image::invert(img), min_distance);
    for (auto& v : valleys) {
        v.value = img(v.row, v.col);
    }
    return valleys;
}

Matrix2Df roughness_map(const Matrix2Df& img, int window) {
    check_image(img, "roughness_map");
    if (window < 3 || (window % 2) == 0) {
        throw ConfigError("terrain.roughness_window must be odd and >= 3, got " + std::to_string(window));
    }
    const int h = static_cast<int>(img.rows());
    const int w = static_cast<int>(img.cols());
    if (window > std::min(h, w)) {
        throw DimensionError("roughness_map: window " + std::to_string(window) +
                             " exceeds image " + std::to_string(w) + "x" + std::to_string(h));
    }

    const int r = window / 2;
    cv::Mat padded;
    cv::copyMakeBorder(core::to_cv_mat(img), padded, r, r, r, r, cv::BORDER_REFLECT_101);

    const double n = static_cast<double>(window) * static_cast<double>(window);
    Matrix2Df out(h, w);
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            double sum = 0.0;
            for (int dy = 0; dy < window; ++dy) {
                const float* prow = padded.ptr<float>(y + dy);
                for (int dx = 0; dx < window; ++dx) {
                    sum += prow[x + dx];
                }
            }
            const double mean = sum / n;

            double sq = 0.0;
            for (int dy = 0; dy < window; ++dy) {
                const float* prow = padded.ptr<float>(y + dy);
                for (int dx = 0; dx < window; ++dx) {
                    const double d = static_cast<double>(prow[x + dx]) - mean;
                    sq += d * d;
                }
            }
            out(y, x) = static_cast<float>(std::sqrt(sq / n));
        }
    }
    return out;
}

FeatureSet analyze_terrain(const Matrix2Df& img, int peak_min_distance, int roughness_window) {
    FeatureSet fs;
    fs.peaks = find_peaks(img, peak_min_distance);
    fs.valleys = find_valleys(img, peak_min_distance);
    fs.roughness = roughness_map(img, roughness_window);
    return fs;
}

} // namespace psr_analyzer::terrain
