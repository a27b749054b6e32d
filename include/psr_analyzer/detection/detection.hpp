#pragma once

#include "psr_analyzer/core/types.hpp"

namespace psr_analyzer::detection {

// Hysteresis thresholds for the edge detector. Ratios apply to the maximum
// gradient magnitude of the smoothed image; non-negative absolute values
// override them.
struct EdgeThresholds {
    float low_ratio = 0.1f;
    float high_ratio = 0.2f;
    float low = -1.0f;
    float high = -1.0f;
};

// mask = img < threshold
Mask2D detect_basic(const Matrix2Df& img, float threshold);

// Gaussian-weighted local mean over block_size x block_size (reflect-101
// border, sigma = 0.3 * ((block_size - 1) / 2 - 1) + 0.8). The mean is
// quantized to the nearest intensity level before the comparison
// mask = img < mean - constant, so flat regions never classify positive.
Mask2D detect_adaptive(const Matrix2Df& img, int block_size, float constant);

// Gaussian smoothing, Sobel gradients, non-maximum suppression and
// 8-connected hysteresis. Returns an all-zero mask for flat input.
Mask2D detect_edges(const Matrix2Df& img, float sigma,
                    const EdgeThresholds& thresholds = EdgeThresholds());

// sigma used by detect_adaptive for a given block size
double adaptive_gaussian_sigma(int block_size);

} // namespace psr_analyzer::detection
