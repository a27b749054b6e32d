#include "psr_analyzer/io/report_export.hpp"
#include "psr_analyzer/io/image_io.hpp"
#include "psr_analyzer/core/errors.hpp"
#include "psr_analyzer/core/utils.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

namespace psr_analyzer::io {

using json = nlohmann::json;

namespace {

const cv::Scalar kBackground(46, 26, 26); // #1a1a2e in BGR
const cv::Scalar kTitleColor(255, 255, 255);
constexpr int kTitleHeight = 36;
constexpr int kMargin = 12;

json coords_to_json(const std::vector<PixelCoord>& coords) {
    json arr = json::array();
    for (const auto& c : coords) {
        arr.push_back({{"row", c.row}, {"col", c.col}, {"value", c.value}});
    }
    return arr;
}

// Letterboxes a BGR layer into a titled square panel.
cv::Mat make_panel(const std::optional<cv::Mat>& layer, const std::string& title, int panel_size) {
    cv::Mat panel(panel_size + kTitleHeight, panel_size, CV_8UC3, kBackground);
    cv::putText(panel, title, cv::Point(8, kTitleHeight - 12), cv::FONT_HERSHEY_SIMPLEX, 0.6,
                kTitleColor, 1, cv::LINE_AA);

    if (!layer || layer->empty()) {
        cv::putText(panel, "not computed", cv::Point(8, kTitleHeight + panel_size / 2),
                    cv::FONT_HERSHEY_SIMPLEX, 0.5, cv::Scalar(160, 160, 160), 1, cv::LINE_AA);
        return panel;
    }

    const double scale = std::min(static_cast<double>(panel_size) / layer->cols,
                                  static_cast<double>(panel_size) / layer->rows);
    const int w = std::max(1, static_cast<int>(layer->cols * scale));
    const int h = std::max(1, static_cast<int>(layer->rows * scale));
    cv::Mat resized;
    cv::resize(*layer, resized, cv::Size(w, h), 0, 0, cv::INTER_NEAREST);

    const int x0 = (panel_size - w) / 2;
    const int y0 = kTitleHeight + (panel_size - h) / 2;
    resized.copyTo(panel(cv::Rect(x0, y0, w, h)));
    return panel;
}

cv::Mat gray_to_bgr(const cv::Mat& gray) {
    cv::Mat bgr;
    cv::cvtColor(gray, bgr, cv::COLOR_GRAY2BGR);
    return bgr;
}

cv::Mat colorize(const cv::Mat& gray, int colormap) {
    cv::Mat bgr;
    cv::applyColorMap(gray, bgr, colormap);
    return bgr;
}

std::optional<cv::Mat> mask_layer(const pipeline::AnalysisReport& report, DetectionMethod method,
                                  int colormap) {
    const auto it = report.masks.find(method);
    if (it == report.masks.end()) return std::nullopt;
    const cv::Mat img = mask_to_image(it->second);
    return colormap < 0 ? gray_to_bgr(img) : colorize(img, colormap);
}

} // namespace

json report_to_json(const pipeline::AnalysisReport& report) {
    json j;
    j["width"] = report.original.cols();
    j["height"] = report.original.rows();
    j["preview"] = report.preview;

    const auto& s = report.stats.image;
    j["image_stats"] = {
        {"mean", s.mean},
        {"std", s.std},
        {"min", s.min},
        {"max", s.max},
        {"dynamic_range", s.dynamic_range}
    };

    j["psr_coverage"] = json::object();
    for (const auto& [method, pct] : report.stats.coverage) {
        j["psr_coverage"][detection_method_to_string(method)] = pct;
    }

    if (report.stats.terrain) {
        j["terrain"] = {
            {"peak_count", report.stats.terrain->peak_count},
            {"valley_count", report.stats.terrain->valley_count},
            {"mean_roughness", report.stats.terrain->mean_roughness}
        };
    }
    if (report.features) {
        j["peaks"] = coords_to_json(report.features->peaks);
        j["valleys"] = coords_to_json(report.features->valleys);
    }

    if (report.landing) {
        const auto& a = *report.landing;
        j["landing_assessment"] = {
            {"safe", a.safe},
            {"roughness_safe", a.roughness_safe},
            {"edge_density_safe", a.edge_density_safe},
            {"mean_roughness", a.mean_roughness},
            {"edge_density_percent", a.edge_density_percent},
            {"explanation", a.explanation}
        };
    } else {
        j["landing_assessment"] = json::object();
    }

    j["parameters"] = report.config.to_parameters();

    j["warnings"] = json::array();
    for (const auto& w : report.warnings) {
        j["warnings"].push_back({{"stage", w.stage}, {"message", w.message}});
    }
    return j;
}

void write_statistics_json(const pipeline::AnalysisReport& report, const fs::path& path) {
    core::write_text(path, report_to_json(report).dump(2) + "\n");
}

void write_statistics_csv(const pipeline::AnalysisReport& report, const fs::path& path) {
    std::ostringstream oss;
    oss << "metric,value\n";
    oss << std::setprecision(10);
    for (const auto& [name, value] : report.stats.rows()) {
        oss << name << "," << value << "\n";
    }
    core::write_text(path, oss.str());
}

cv::Mat render_composite(const pipeline::AnalysisReport& report, int panel_size) {
    if (panel_size < 32) {
        throw ConfigError("render_composite: panel_size must be >= 32");
    }
    if (report.original.size() == 0) {
        throw DimensionError("render_composite: report has no image");
    }

    std::optional<cv::Mat> roughness;
    if (report.features) {
        roughness = colorize(stretch_to_8bit(report.features->roughness), cv::COLORMAP_VIRIDIS);
    }
    std::optional<cv::Mat> enhanced;
    if (report.enhanced.size() > 0) {
        enhanced = gray_to_bgr(to_8bit(report.enhanced));
    }

    const std::vector<cv::Mat> panels = {
        make_panel(gray_to_bgr(to_8bit(report.original)), "Original Image", panel_size),
        make_panel(enhanced, "Enhanced (CLAHE)", panel_size),
        make_panel(mask_layer(report, DetectionMethod::THRESHOLD, cv::COLORMAP_HOT),
                   "Basic Threshold PSR", panel_size),
        make_panel(mask_layer(report, DetectionMethod::ADAPTIVE, cv::COLORMAP_HOT),
                   "Adaptive Threshold PSR", panel_size),
        make_panel(mask_layer(report, DetectionMethod::EDGES, -1), "Edge Detection", panel_size),
        make_panel(roughness, "Surface Roughness", panel_size)
    };

    const int cell_w = panel_size;
    const int cell_h = panel_size + kTitleHeight;
    cv::Mat figure(2 * cell_h + 3 * kMargin, 3 * cell_w + 4 * kMargin, CV_8UC3, kBackground);
    for (size_t i = 0; i < panels.size(); ++i) {
        const int row = static_cast<int>(i) / 3;
        const int col = static_cast<int>(i) % 3;
        const int x = kMargin + col * (cell_w + kMargin);
        const int y = kMargin + row * (cell_h + kMargin);
        panels[i].copyTo(figure(cv::Rect(x, y, cell_w, cell_h)));
    }
    return figure;
}

std::vector<fs::path> export_report(const pipeline::AnalysisReport& report, const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw IOError("Cannot create output directory " + dir.string() + ": " + ec.message());
    }

    std::vector<fs::path> written;
    auto record = [&](const fs::path& p) { written.push_back(p); };

    write_statistics_json(report, dir / "statistics.json");
    record(dir / "statistics.json");
    write_statistics_csv(report, dir / "statistics.csv");
    record(dir / "statistics.csv");

    save_image(dir / "original.png", to_8bit(report.original));
    record(dir / "original.png");
    if (report.enhanced.size() > 0) {
        save_image(dir / "enhanced.png", to_8bit(report.enhanced));
        record(dir / "enhanced.png");
    }
    for (const auto& [method, mask] : report.masks) {
        const fs::path p = dir / (detection_method_to_string(method) + ".png");
        save_image(p, mask_to_image(mask));
        record(p);
    }
    if (report.features) {
        save_image(dir / "roughness.png",
                   colorize(stretch_to_8bit(report.features->roughness), cv::COLORMAP_VIRIDIS));
        record(dir / "roughness.png");
    }

    save_image(dir / "analysis_result.png", render_composite(report));
    record(dir / "analysis_result.png");
    return written;
}

} // namespace psr_analyzer::io
