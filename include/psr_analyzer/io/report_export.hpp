#pragma once

#include "psr_analyzer/pipeline/pipeline.hpp"

#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>
#include <filesystem>
#include <vector>

namespace psr_analyzer::io {

namespace fs = std::filesystem;

// image_stats, psr_coverage, terrain, landing_assessment, parameters,
// peaks, valleys, warnings. Images are not embedded.
nlohmann::json report_to_json(const pipeline::AnalysisReport& report);

void write_statistics_json(const pipeline::AnalysisReport& report, const fs::path& path);

// "metric,value" header followed by StatRecord::rows()
void write_statistics_csv(const pipeline::AnalysisReport& report, const fs::path& path);

// 2x3 BGR panel figure: original, enhanced, threshold, adaptive, edges,
// roughness. Layers a preview did not compute are drawn as empty panels.
cv::Mat render_composite(const pipeline::AnalysisReport& report, int panel_size = 360);

// Writes statistics.json, statistics.csv, analysis_result.png and one PNG
// per computed layer into dir. Returns the written paths.
std::vector<fs::path> export_report(const pipeline::AnalysisReport& report, const fs::path& dir);

} // namespace psr_analyzer::io
