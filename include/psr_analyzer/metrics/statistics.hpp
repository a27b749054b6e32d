#pragma once

#include "psr_analyzer/core/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace psr_analyzer::metrics {

// Coverage percentages are rounded to this many decimals.
constexpr int kCoverageDecimals = 4;

struct ImageStats {
    double mean = 0.0;
    double std = 0.0;          // population standard deviation
    double min = 0.0;
    double max = 0.0;
    double dynamic_range = 0.0;
};

struct TerrainSummary {
    int peak_count = 0;
    int valley_count = 0;
    double mean_roughness = 0.0;
};

struct StatRecord {
    ImageStats image;                              // original image only
    std::map<DetectionMethod, double> coverage;    // percent, [0, 100]
    std::optional<TerrainSummary> terrain;

    // Stable (metric, value) rows for tabular export, e.g.
    // "image_stats.mean", "psr_coverage.edges", "terrain.peak_count".
    std::vector<std::pair<std::string, double>> rows() const;
};

ImageStats compute_image_stats(const Matrix2Df& img);

// 100 * positives / pixels, rounded to kCoverageDecimals.
double coverage_percent(const Mask2D& mask);

// Throws DimensionError if enhanced or any mask differs in size from original.
StatRecord compute_stats(const Matrix2Df& original, const Matrix2Df& enhanced,
                         const std::map<DetectionMethod, Mask2D>& masks);

TerrainSummary summarize_terrain(const FeatureSet& features);

} // namespace psr_analyzer::metrics
