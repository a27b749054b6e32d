#include "psr_analyzer/metrics/statistics.hpp"
#include "psr_analyzer/core/errors.hpp"
#include "psr_analyzer/core/utils.hpp"

#include <cmath>
#include <string>

namespace psr_analyzer::metrics {

namespace {

std::string dims_of(Eigen::Index rows, Eigen::Index cols) {
    return std::to_string(cols) + "x" + std::to_string(rows);
}

} // namespace

std::vector<std::pair<std::string, double>> StatRecord::rows() const {
    std::vector<std::pair<std::string, double>> out;
    out.emplace_back("image_stats.mean", image.mean);
    out.emplace_back("image_stats.std", image.std);
    out.emplace_back("image_stats.min", image.min);
    out.emplace_back("image_stats.max", image.max);
    out.emplace_back("image_stats.dynamic_range", image.dynamic_range);
    for (const auto& [method, pct] : coverage) {
        out.emplace_back("psr_coverage." + detection_method_to_string(method), pct);
    }
    if (terrain) {
        out.emplace_back("terrain.peak_count", static_cast<double>(terrain->peak_count));
        out.emplace_back("terrain.valley_count", static_cast<double>(terrain->valley_count));
        out.emplace_back("terrain.mean_roughness", terrain->mean_roughness);
    }
    return out;
}

ImageStats compute_image_stats(const Matrix2Df& img) {
    if (img.size() == 0) {
        throw DimensionError("compute_image_stats: image must not be empty");
    }
    ImageStats s;
    const Eigen::ArrayXXd d = img.cast<double>().array();
    s.mean = d.mean();
    s.std = std::sqrt((d - s.mean).square().mean());
    s.min = d.minCoeff();
    s.max = d.maxCoeff();
    s.dynamic_range = s.max - s.min;
    return s;
}

double coverage_percent(const Mask2D& mask) {
    if (mask.size() == 0) {
        throw DimensionError("coverage_percent: mask must not be empty");
    }
    const double pct = 100.0 * static_cast<double>(core::count_positive(mask)) /
                       static_cast<double>(mask.size());
    return core::round_to_decimals(pct, kCoverageDecimals);
}

StatRecord compute_stats(const Matrix2Df& original, const Matrix2Df& enhanced,
                         const std::map<DetectionMethod, Mask2D>& masks) {
    if (enhanced.rows() != original.rows() || enhanced.cols() != original.cols()) {
        throw DimensionError("compute_stats: enhanced image is " +
                             dims_of(enhanced.rows(), enhanced.cols()) + ", original is " +
                             dims_of(original.rows(), original.cols()));
    }

    StatRecord rec;
    rec.image = compute_image_stats(original);
    for (const auto& [method, mask] : masks) {
        if (mask.rows() != original.rows() || mask.cols() != original.cols()) {
            throw DimensionError("compute_stats: " + detection_method_to_string(method) +
                                 " mask is " + dims_of(mask.rows(), mask.cols()) +
                                 ", original is " + dims_of(original.rows(), original.cols()));
        }
        rec.coverage[method] = coverage_percent(mask);
    }
    return rec;
}

TerrainSummary summarize_terrain(const FeatureSet& features) {
    TerrainSummary t;
    t.peak_count = static_cast<int>(features.peaks.size());
    t.valley_count = static_cast<int>(features.valleys.size());
    t.mean_roughness = features.roughness.size() > 0
                           ? features.roughness.cast<double>().mean()
                           : 0.0;
    return t;
}

} // namespace psr_analyzer::metrics
