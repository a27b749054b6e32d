#pragma once

#include "types.hpp"
#include <opencv2/core.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace psr_analyzer::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);

// Eigen <-> OpenCV (deep copies, CV_32F / CV_8U)
cv::Mat to_cv_mat(const Matrix2Df& img);
Matrix2Df from_cv_mat(const cv::Mat& mat);
cv::Mat mask_to_cv_mat(const Mask2D& mask);

// Math utilities
bool is_constant(const Matrix2Df& img);
double round_to_decimals(double value, int decimals);
size_t count_positive(const Mask2D& mask);

// String utilities
std::string to_lower(const std::string& s);
std::string trim(const std::string& s);
std::vector<std::string> split(const std::string& str, char delimiter);

} // namespace psr_analyzer::core
