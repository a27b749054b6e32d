#include "psr_analyzer/detection/detection.hpp"
#include "psr_analyzer/core/errors.hpp"
#include "psr_analyzer/core/utils.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

namespace psr_analyzer::detection {

namespace {

// Gradient magnitudes below this are treated as flat.
constexpr double kMinGradientMagnitude = 1e-6;

// Neighbor offsets along the gradient direction, quantized to 4 sectors.
void gradient_neighbors(double gx, double gy, int& dy, int& dx) {
    double angle = std::atan2(gy, gx) * 180.0 / CV_PI;
    if (angle < 0.0) angle += 180.0;

    if (angle < 22.5 || angle >= 157.5) {
        dy = 0; dx = 1;
    } else if (angle < 67.5) {
        dy = 1; dx = 1;
    } else if (angle < 112.5) {
        dy = 1; dx = 0;
    } else {
        dy = 1; dx = -1;
    }
}

} // namespace

Mask2D detect_edges(const Matrix2Df& img, float sigma, const EdgeThresholds& thresholds) {
    const int h = static_cast<int>(img.rows());
    const int w = static_cast<int>(img.cols());
    if (h < 3 || w < 3) {
        throw DimensionError("detect_edges: image must be at least 3x3, got " +
                             std::to_string(w) + "x" + std::to_string(h));
    }
    if (!(sigma > 0.0f)) {
        throw ConfigError("detection.edge_sigma must be > 0");
    }

    Mask2D edges = Mask2D::Zero(h, w);
    if (core::is_constant(img)) {
        return edges;
    }

    cv::Mat src;
    core::to_cv_mat(img).convertTo(src, CV_64F);

    const int ksize = 2 * static_cast<int>(std::ceil(3.0 * sigma)) + 1;
    cv::Mat smooth;
    cv::GaussianBlur(src, smooth, cv::Size(ksize, ksize), sigma, sigma, cv::BORDER_REFLECT_101);

    cv::Mat gx, gy, mag;
    cv::Sobel(smooth, gx, CV_64F, 1, 0, 3, 1.0, 0.0, cv::BORDER_REFLECT_101);
    cv::Sobel(smooth, gy, CV_64F, 0, 1, 3, 1.0, 0.0, cv::BORDER_REFLECT_101);
    cv::magnitude(gx, gy, mag);

    double max_mag = 0.0;
    cv::minMaxLoc(mag, nullptr, &max_mag);
    if (max_mag < kMinGradientMagnitude) {
        return edges;
    }

    double low = static_cast<double>(thresholds.low_ratio) * max_mag;
    double high = static_cast<double>(thresholds.high_ratio) * max_mag;
    if (thresholds.low >= 0.0f && thresholds.high >= 0.0f) {
        low = thresholds.low;
        high = thresholds.high;
    }
    low = std::max(low, kMinGradientMagnitude);
    high = std::max(high, low);

    // Non-maximum suppression; the one-pixel border never holds edges.
    cv::Mat thin = cv::Mat::zeros(h, w, CV_64F);
    for (int y = 1; y < h - 1; ++y) {
        const double* grow_x = gx.ptr<double>(y);
        const double* grow_y = gy.ptr<double>(y);
        const double* mrow = mag.ptr<double>(y);
        double* trow = thin.ptr<double>(y);
        for (int x = 1; x < w - 1; ++x) {
            const double m = mrow[x];
            if (m < low) continue;
            int dy = 0, dx = 0;
            gradient_neighbors(grow_x[x], grow_y[x], dy, dx);
            const double before = mag.at<double>(y - dy, x - dx);
            const double after = mag.at<double>(y + dy, x + dx);
            if (m > before && m >= after) {
                trow[x] = m;
            }
        }
    }

    // Hysteresis: grow strong seeds through 8-connected weak pixels.
    std::vector<std::pair<int, int>> stack;
    for (int y = 1; y < h - 1; ++y) {
        const double* trow = thin.ptr<double>(y);
        for (int x = 1; x < w - 1; ++x) {
            if (trow[x] >= high && edges(y, x) == 0) {
                edges(y, x) = 1;
                stack.emplace_back(y, x);
            }
        }
    }
    while (!stack.empty()) {
        const auto [cy, cx] = stack.back();
        stack.pop_back();
        for (int dy = -1; dy <= 1; ++dy) {
            for (int dx = -1; dx <= 1; ++dx) {
                if (dy == 0 && dx == 0) continue;
                const int ny = cy + dy;
                const int nx = cx + dx;
                if (ny < 1 || ny >= h - 1 || nx < 1 || nx >= w - 1) continue;
                if (edges(ny, nx) != 0) continue;
                if (thin.at<double>(ny, nx) >= low) {
                    edges(ny, nx) = 1;
                    stack.emplace_back(ny, nx);
                }
            }
        }
    }

    return edges;
}

} // namespace psr_analyzer::detection
