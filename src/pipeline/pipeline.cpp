#include "psr_analyzer/pipeline/pipeline.hpp"
#include "psr_analyzer/core/errors.hpp"
#include "psr_analyzer/core/events.hpp"
#include "psr_analyzer/core/utils.hpp"
#include "psr_analyzer/image/enhancement.hpp"
#include "psr_analyzer/terrain/terrain.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace psr_analyzer::pipeline {

using json = nlohmann::json;

static std::vector<DetectionMethod> unique_methods(const std::vector<DetectionMethod>& in) {
    std::vector<DetectionMethod> out;
    for (DetectionMethod m : all_detection_methods()) {
        if (std::find(in.begin(), in.end(), m) != in.end()) {
            out.push_back(m);
        }
    }
    return out;
}

static Mask2D run_method(DetectionMethod method, const Matrix2Df& enhanced,
                         const config::DetectionConfig& cfg) {
    switch (method) {
        case DetectionMethod::THRESHOLD:
            return detection::detect_basic(enhanced, static_cast<float>(cfg.basic_threshold));
        case DetectionMethod::ADAPTIVE:
            return detection::detect_adaptive(enhanced, cfg.adaptive_block_size, cfg.adaptive_constant);
        case DetectionMethod::EDGES:
            return detection::detect_edges(enhanced, cfg.edge_sigma, edge_thresholds_from_config(cfg));
    }
    throw std::logic_error("unhandled detection method");
}

AnalysisOptions preview_options(const std::vector<DetectionMethod>& methods, bool terrain) {
    AnalysisOptions opts;
    opts.methods = methods;
    opts.terrain = terrain;
    opts.landing = false;
    opts.preview = true;
    return opts;
}

void validate_input_image(const Matrix2Df& img) {
    if (img.rows() <= 0 || img.cols() <= 0) {
        throw DimensionError("input image must have non-zero width and height, got " +
                             std::to_string(img.cols()) + "x" + std::to_string(img.rows()));
    }
    for (Eigen::Index i = 0; i < img.size(); ++i) {
        const float v = img.data()[i];
        if (!std::isfinite(v) || v < kMinIntensity || v > kMaxIntensity) {
            const Eigen::Index row = i / img.cols();
            const Eigen::Index col = i % img.cols();
            throw ValidationError("input sample at (" + std::to_string(row) + "," +
                                  std::to_string(col) + ") is outside [0,255]");
        }
    }
}

detection::EdgeThresholds edge_thresholds_from_config(const config::DetectionConfig& cfg) {
    detection::EdgeThresholds t;
    t.low_ratio = cfg.edge_low_ratio;
    t.high_ratio = cfg.edge_high_ratio;
    t.low = cfg.edge_low_threshold;
    t.high = cfg.edge_high_threshold;
    return t;
}

AnalysisReport run_analysis(const Matrix2Df& image, const config::AnalysisConfig& cfg,
                            const AnalysisOptions& options, std::ostream* log_out) {
    cfg.validate();
    validate_input_image(image);
    const Eigen::Index min_dim = std::min(image.rows(), image.cols());
    if (cfg.enhance.tile_size > min_dim) {
        throw ConfigError("enhance.tile_size " + std::to_string(cfg.enhance.tile_size) +
                          " exceeds the smaller image dimension " + std::to_string(min_dim));
    }

    core::EventEmitter emitter(log_out, core::get_run_id());
    emitter.run_start({
        {"width", image.cols()},
        {"height", image.rows()},
        {"preview", options.preview},
        {"parameters", cfg.to_parameters()}
    });

    AnalysisReport report;
    report.original = image;
    report.config = cfg;
    report.preview = options.preview;

    auto warn = [&](const std::string& stage, const std::string& message) {
        report.warnings.push_back({stage, message});
        emitter.warning(stage, message);
    };

    try {
        // --- ENHANCE ---
        emitter.phase_start(Phase::ENHANCE);
        report.enhanced = image::enhance(image, cfg.enhance.clip_limit, cfg.enhance.tile_size);
        emitter.phase_end(Phase::ENHANCE, "ok");

        const bool flat = core::is_constant(report.enhanced);

        // --- DETECTION ---
        emitter.phase_start(Phase::DETECTION);
        json detection_out = json::object();
        for (DetectionMethod method : unique_methods(options.methods)) {
            report.masks.emplace(method, run_method(method, report.enhanced, cfg.detection));
            detection_out[detection_method_to_string(method)] =
                core::count_positive(report.masks.at(method));
            if (flat && method != DetectionMethod::THRESHOLD) {
                warn(detection_method_to_string(method),
                     "zero-variance input, mask is empty");
            }
        }
        emitter.phase_end(Phase::DETECTION, "ok", {{"positives", detection_out}});

        // --- TERRAIN ---
        if (options.terrain) {
            emitter.phase_start(Phase::TERRAIN);
            report.features = terrain::analyze_terrain(report.enhanced,
                                                       cfg.terrain.peak_min_distance,
                                                       cfg.terrain.roughness_window);
            if (flat) {
                warn("roughness", "zero-variance input, roughness is zero everywhere");
            }
            emitter.phase_end(Phase::TERRAIN, "ok", {
                {"peaks", report.features->peaks.size()},
                {"valleys", report.features->valleys.size()}
            });
        }

        // --- STATISTICS ---
        emitter.phase_start(Phase::STATISTICS);
        report.stats = metrics::compute_stats(report.original, report.enhanced, report.masks);
        if (report.features) {
            report.stats.terrain = metrics::summarize_terrain(*report.features);
        }
        emitter.phase_end(Phase::STATISTICS, "ok");

        // --- LANDING ---
        const auto edges = report.masks.find(DetectionMethod::EDGES);
        if (options.landing && report.features && edges != report.masks.end()) {
            emitter.phase_start(Phase::LANDING);
            report.landing = metrics::assess_landing_safety(*report.features, edges->second,
                                                            cfg.landing);
            emitter.phase_end(Phase::LANDING, "ok", {{"safe", report.landing->safe}});
        }
    } catch (const std::exception& e) {
        emitter.error(e.what());
        emitter.run_end(false, "error");
        throw;
    }

    emitter.run_end(true, "ok");
    return report;
}

} // namespace psr_analyzer::pipeline
