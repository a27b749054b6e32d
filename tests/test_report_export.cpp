#include "psr_analyzer/io/report_export.hpp"
#include "psr_analyzer/io/image_io.hpp"
#include "psr_analyzer/core/errors.hpp"
#include "psr_analyzer/core/utils.hpp"
#include "psr_analyzer/pipeline/pipeline.hpp"

#include <filesystem>
#include <string>

#include <catch2/catch_test_macros.hpp>

using namespace psr_analyzer;
namespace fs = std::filesystem;

static pipeline::AnalysisReport square_report(const pipeline::AnalysisOptions& opts) {
    Matrix2Df img = Matrix2Df::Constant(60, 60, 255.0f);
    img.block(20, 20, 12, 12).setZero();
    return pipeline::run_analysis(img, config::AnalysisConfig(), opts);
}

TEST_CASE("report_json_has_expected_sections") {
    const auto report = square_report(pipeline::AnalysisOptions());
    const nlohmann::json j = io::report_to_json(report);

    REQUIRE(j["width"] == 60);
    REQUIRE(j["height"] == 60);
    REQUIRE(j["preview"] == false);
    REQUIRE(j["image_stats"]["max"] == 255.0);
    REQUIRE(j["psr_coverage"].contains("threshold"));
    REQUIRE(j["psr_coverage"].contains("adaptive"));
    REQUIRE(j["psr_coverage"].contains("edges"));
    REQUIRE(j["terrain"].contains("mean_roughness"));
    REQUIRE(j["landing_assessment"]["explanation"].size() == 3);
    REQUIRE(j["parameters"]["clahe_tile_size"] == 8);
    REQUIRE(j["warnings"].is_array());
}

TEST_CASE("report_json_preview_omits_terrain_and_landing") {
    const auto report = square_report(pipeline::preview_options({DetectionMethod::THRESHOLD}, false));
    const nlohmann::json j = io::report_to_json(report);
    REQUIRE(j["preview"] == true);
    REQUIRE_FALSE(j.contains("terrain"));
    REQUIRE(j["landing_assessment"].empty());
    REQUIRE(j["psr_coverage"].size() == 1);
}

TEST_CASE("mask_and_intensity_conversions") {
    Mask2D mask = Mask2D::Zero(2, 2);
    mask(1, 0) = 1;
    const cv::Mat m = io::mask_to_image(mask);
    REQUIRE(m.type() == CV_8U);
    REQUIRE(m.at<uint8_t>(1, 0) == 255);
    REQUIRE(m.at<uint8_t>(0, 0) == 0);

    Matrix2Df img(1, 2);
    img << 12.6f, 300.0f;
    const cv::Mat u8 = io::to_8bit(img);
    REQUIRE(u8.at<uint8_t>(0, 0) == 13);
    REQUIRE(u8.at<uint8_t>(0, 1) == 255);
}

TEST_CASE("composite_figure_has_six_panels") {
    const auto report = square_report(pipeline::AnalysisOptions());
    const cv::Mat fig = io::render_composite(report, 120);
    REQUIRE(fig.type() == CV_8UC3);
    REQUIRE(fig.cols == 3 * 120 + 4 * 12);
    REQUIRE(fig.rows == 2 * (120 + 36) + 3 * 12);
    REQUIRE_THROWS_AS(io::render_composite(report, 8), ConfigError);
}

TEST_CASE("export_report_writes_artifacts") {
    const fs::path dir = fs::temp_directory_path() / ("psr_analyzer_export_" + core::get_run_id());
    const auto report = square_report(pipeline::AnalysisOptions());
    const auto written = io::export_report(report, dir);

    REQUIRE(fs::exists(dir / "statistics.json"));
    REQUIRE(fs::exists(dir / "statistics.csv"));
    REQUIRE(fs::exists(dir / "edges.png"));
    REQUIRE(fs::exists(dir / "roughness.png"));
    REQUIRE(fs::exists(dir / "analysis_result.png"));
    REQUIRE(written.size() == 9);

    const std::string csv = core::read_text(dir / "statistics.csv");
    REQUIRE(csv.rfind("metric,value\n", 0) == 0);
    REQUIRE(csv.find("psr_coverage.threshold,") != std::string::npos);

    const Matrix2Df reloaded = io::load_grayscale(dir / "original.png");
    REQUIRE(reloaded == report.original);

    fs::remove_all(dir);
}

TEST_CASE("load_grayscale_reports_missing_files") {
    REQUIRE_THROWS_AS(io::load_grayscale("/nonexistent/moon.png"), IOError);
    REQUIRE(io::is_supported_image_path("crater.TIF"));
    REQUIRE_FALSE(io::is_supported_image_path("crater.fits"));
}
