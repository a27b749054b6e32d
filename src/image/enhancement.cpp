#include "psr_analyzer/image/enhancement.hpp"
#include "psr_analyzer/core/errors.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <string>
#include <vector>

namespace psr_analyzer::image {

namespace {

using Lut = std::array<float, kHistogramBins>;

struct TileSpan {
    int begin;
    int end;      // exclusive
    double center;
};

// Equal spans of length/n, the last one absorbing the remainder.
std::vector<TileSpan> split_axis(int length, int n) {
    std::vector<TileSpan> spans;
    spans.reserve(static_cast<size_t>(n));
    const int step = length / n;
    for (int i = 0; i < n; ++i) {
        TileSpan s;
        s.begin = i * step;
        s.end = (i == n - 1) ? length : (i + 1) * step;
        s.center = 0.5 * static_cast<double>(s.begin + s.end - 1);
        spans.push_back(s);
    }
    return spans;
}

inline int to_bin(float v) {
    const int b = static_cast<int>(std::lround(v));
    return std::min(std::max(b, 0), kHistogramBins - 1);
}

Lut build_tile_lut(const Matrix2Df& img, const TileSpan& ys, const TileSpan& xs,
                   float clip_limit) {
    std::array<double, kHistogramBins> hist{};
    for (int y = ys.begin; y < ys.end; ++y) {
        for (int x = xs.begin; x < xs.end; ++x) {
            hist[static_cast<size_t>(to_bin(img(y, x)))] += 1.0;
        }
    }

    const double n_pixels = static_cast<double>(ys.end - ys.begin) *
                            static_cast<double>(xs.end - xs.begin);
    const double clip = std::max(1.0, static_cast<double>(clip_limit) * n_pixels /
                                          static_cast<double>(kHistogramBins));

    double excess = 0.0;
    for (double& h : hist) {
        if (h > clip) {
            excess += h - clip;
            h = clip;
        }
    }
    const double per_bin = excess / static_cast<double>(kHistogramBins);

    Lut lut{};
    double cdf = 0.0;
    const double scale = static_cast<double>(kMaxIntensity) / n_pixels;
    for (int b = 0; b < kHistogramBins; ++b) {
        cdf += hist[static_cast<size_t>(b)] + per_bin;
        const double mapped = std::round(cdf * scale);
        lut[static_cast<size_t>(b)] =
            static_cast<float>(std::min(std::max(mapped, 0.0), static_cast<double>(kMaxIntensity)));
    }
    return lut;
}

// Index of the lower of the two tile centers bracketing pos, and the blend
// weight toward the upper one. Outside the outermost centers the weight is
// pinned to the nearest tile.
void locate(const std::vector<TileSpan>& spans, int pos, int& lo, double& w) {
    const int n = static_cast<int>(spans.size());
    if (n == 1 || pos <= spans.front().center) {
        lo = 0;
        w = 0.0;
        return;
    }
    if (pos >= spans.back().center) {
        lo = n - 1;
        w = 0.0;
        return;
    }
    lo = 0;
    while (lo + 1 < n && spans[static_cast<size_t>(lo + 1)].center <= pos) {
        ++lo;
    }
    const double c0 = spans[static_cast<size_t>(lo)].center;
    const double c1 = spans[static_cast<size_t>(lo + 1)].center;
    w = (static_cast<double>(pos) - c0) / (c1 - c0);
}

} // namespace

Matrix2Df enhance(const Matrix2Df& img, float clip_limit, int tile_size) {
    const int h = static_cast<int>(img.rows());
    const int w = static_cast<int>(img.cols());
    if (h <= 0 || w <= 0) {
        throw DimensionError("enhance: image must not be empty");
    }
    if (!(clip_limit > 0.0f)) {
        throw ConfigError("enhance.clip_limit must be > 0");
    }
    if (tile_size <= 0 || tile_size > std::min(h, w)) {
        throw ConfigError("enhance.tile_size " + std::to_string(tile_size) +
                          " must be in [1," + std::to_string(std::min(h, w)) +
                          "] for a " + std::to_string(w) + "x" + std::to_string(h) + " image");
    }

    const auto row_spans = split_axis(h, tile_size);
    const auto col_spans = split_axis(w, tile_size);

    std::vector<Lut> luts;
    luts.reserve(static_cast<size_t>(tile_size) * static_cast<size_t>(tile_size));
    for (const auto& ys : row_spans) {
        for (const auto& xs : col_spans) {
            luts.push_back(build_tile_lut(img, ys, xs, clip_limit));
        }
    }
    auto lut_at = [&](int r, int c) -> const Lut& {
        return luts[static_cast<size_t>(r) * static_cast<size_t>(tile_size) + static_cast<size_t>(c)];
    };

    std::vector<int> col_lo(static_cast<size_t>(w));
    std::vector<double> col_w(static_cast<size_t>(w));
    for (int x = 0; x < w; ++x) {
        locate(col_spans, x, col_lo[static_cast<size_t>(x)], col_w[static_cast<size_t>(x)]);
    }

    Matrix2Df out(h, w);
    for (int y = 0; y < h; ++y) {
        int r0 = 0;
        double wy = 0.0;
        locate(row_spans, y, r0, wy);
        const int r1 = std::min(r0 + 1, tile_size - 1);

        for (int x = 0; x < w; ++x) {
            const int c0 = col_lo[static_cast<size_t>(x)];
            const int c1 = std::min(c0 + 1, tile_size - 1);
            const double wx = col_w[static_cast<size_t>(x)];
            const size_t b = static_cast<size_t>(to_bin(img(y, x)));

            const double top = (1.0 - wx) * lut_at(r0, c0)[b] + wx * lut_at(r0, c1)[b];
            const double bottom = (1.0 - wx) * lut_at(r1, c0)[b] + wx * lut_at(r1, c1)[b];
            const double v = (1.0 - wy) * top + wy * bottom;
            out(y, x) = static_cast<float>(
                std::min(std::max(std::round(v), 0.0), static_cast<double>(kMaxIntensity)));
        }
    }
    return out;
}

Matrix2Df invert(const Matrix2Df& img) {
    return (kMaxIntensity - img.array()).matrix();
}

} // namespace psr_analyzer::image
