#pragma once

#include "psr_analyzer/core/types.hpp"

#include <opencv2/core.hpp>
#include <filesystem>

namespace psr_analyzer::io {

namespace fs = std::filesystem;

// png, jpg/jpeg, webp, tif/tiff, bmp
bool is_supported_image_path(const fs::path& path);

// Decodes any OpenCV-readable format into a single-channel [0, 255] image.
Matrix2Df load_grayscale(const fs::path& path);

// Rounds and saturates to 8 bit.
cv::Mat to_8bit(const Matrix2Df& img);

// Min-max stretch to 8 bit for layers in raw units (roughness).
cv::Mat stretch_to_8bit(const Matrix2Df& img);

// 0 -> 0, positive -> 255
cv::Mat mask_to_image(const Mask2D& mask);

void save_image(const fs::path& path, const cv::Mat& img);

} // namespace psr_analyzer::io
