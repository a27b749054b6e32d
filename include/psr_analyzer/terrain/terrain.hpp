#pragma once

#include "psr_analyzer/core/types.hpp"

#include <vector>

namespace psr_analyzer::terrain {

// Local maxima within Chebyshev radius min_distance (neighborhood clipped to
// the image) that lie above the image minimum. Maxima closer than
// min_distance to a higher one are suppressed; equal maxima keep the first
// in raster order. Sorted by value descending, raster order on ties.
// A constant image has no peaks.
std::vector<PixelCoord> find_peaks(const Matrix2Df& img, int min_distance);

// Peaks of the inverted image, reported with their original values and
// sorted by value ascending, raster order on ties.
std::vector<PixelCoord> find_valleys(const Matrix2Df& img, int min_distance);

// Population standard deviation over a window x window neighborhood
// (reflect-101 border). Raw intensity units; exactly zero on flat regions.
Matrix2Df roughness_map(const Matrix2Df& img, int window);

FeatureSet analyze_terrain(const Matrix2Df& img, int peak_min_distance, int roughness_window);

} // namespace psr_analyzer::terrain
