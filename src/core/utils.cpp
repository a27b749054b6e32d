#include "psr_analyzer/core/utils.hpp"
#include "psr_analyzer/core/errors.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>

namespace psr_analyzer::core {

std::string get_iso_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string get_run_id() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S") << '_';

    const char* hex = "0123456789abcdef";
    for (int i = 0; i < 8; ++i) {
        oss << hex[dis(gen)];
    }

    return oss.str();
}

std::string read_text(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

void write_text(const fs::path& path, const std::string& text) {
    std::ofstream file(path);
    if (!file) {
        throw IOError("Cannot create file: " + path.string());
    }
    file << text;
    if (!file) {
        throw IOError("Cannot write file: " + path.string());
    }
}

cv::Mat to_cv_mat(const Matrix2Df& img) {
    cv::Mat view(static_cast<int>(img.rows()), static_cast<int>(img.cols()), CV_32F,
                 const_cast<float*>(img.data()));
    return view.clone();
}

Matrix2Df from_cv_mat(const cv::Mat& mat) {
    cv::Mat f32;
    if (mat.type() == CV_32F) {
        f32 = mat;
    } else {
        mat.convertTo(f32, CV_32F);
    }

    Matrix2Df out(f32.rows, f32.cols);
    for (int r = 0; r < f32.rows; ++r) {
        const float* src = f32.ptr<float>(r);
        float* dst = out.data() + static_cast<size_t>(r) * static_cast<size_t>(f32.cols);
        std::memcpy(dst, src, static_cast<size_t>(f32.cols) * sizeof(float));
    }
    return out;
}

cv::Mat mask_to_cv_mat(const Mask2D& mask) {
    cv::Mat view(static_cast<int>(mask.rows()), static_cast<int>(mask.cols()), CV_8U,
                 const_cast<uint8_t*>(mask.data()));
    return view.clone();
}

bool is_constant(const Matrix2Df& img) {
    if (img.size() == 0) return true;
    return img.minCoeff() == img.maxCoeff();
}

double round_to_decimals(double value, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

size_t count_positive(const Mask2D& mask) {
    return static_cast<size_t>((mask.array() != 0).count());
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream iss(str);
    std::string part;
    while (std::getline(iss, part, delimiter)) {
        parts.push_back(part);
    }
    return parts;
}

} // namespace psr_analyzer::core
