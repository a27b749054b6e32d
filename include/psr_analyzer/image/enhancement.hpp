#pragma once

#include "psr_analyzer/core/types.hpp"

namespace psr_analyzer::image {

// Contrast-limited adaptive histogram equalization.
//
// The image is split into tile_size x tile_size tiles (the last row/column
// absorbs the remainder). Each tile's 256-bin histogram is clipped at
// max(1, clip_limit * tile_pixels / 256), the excess is spread evenly over
// all bins, and the cumulative histogram becomes the tile's lookup table.
// Output pixels blend the LUTs of the four nearest tile centers bilinearly.
//
// Output keeps the input dimensions and holds integer levels in [0, 255].
// Throws ConfigError for tile_size outside [1, min(rows, cols)] or a
// non-positive clip_limit, DimensionError for an empty image.
Matrix2Df enhance(const Matrix2Df& img, float clip_limit, int tile_size);

// 255 - v for every sample.
Matrix2Df invert(const Matrix2Df& img);

} // namespace psr_analyzer::image
