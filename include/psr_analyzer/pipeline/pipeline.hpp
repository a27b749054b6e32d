#pragma once

#include "psr_analyzer/config/configuration.hpp"
#include "psr_analyzer/core/types.hpp"
#include "psr_analyzer/detection/detection.hpp"
#include "psr_analyzer/metrics/landing.hpp"
#include "psr_analyzer/metrics/statistics.hpp"

#include <map>
#include <optional>
#include <ostream>
#include <vector>

namespace psr_analyzer::pipeline {

// Which stages a run executes. The default is a full analysis; a preview
// selects a subset of detection methods and optionally the terrain stage.
struct AnalysisOptions {
    std::vector<DetectionMethod> methods = all_detection_methods();
    bool terrain = true;
    bool landing = true;  // requires terrain and the EDGES method
    bool preview = false;
};

AnalysisOptions preview_options(const std::vector<DetectionMethod>& methods, bool terrain);

struct AnalysisReport {
    Matrix2Df original;
    Matrix2Df enhanced;
    std::map<DetectionMethod, Mask2D> masks;
    std::optional<FeatureSet> features;
    metrics::StatRecord stats;
    std::optional<metrics::LandingAssessment> landing;
    std::vector<StageWarning> warnings;
    config::AnalysisConfig config;
    bool preview = false;
};

// Non-empty, finite, every sample within [0, 255].
void validate_input_image(const Matrix2Df& img);

detection::EdgeThresholds edge_thresholds_from_config(const config::DetectionConfig& cfg);

// Validates cfg, the image, and tile_size against the image size before any
// stage runs; nothing is written to log_out when validation fails. Progress
// events are JSON lines.
AnalysisReport run_analysis(const Matrix2Df& image, const config::AnalysisConfig& cfg,
                            const AnalysisOptions& options = AnalysisOptions(),
                            std::ostream* log_out = nullptr);

} // namespace psr_analyzer::pipeline
