#include "psr_analyzer/metrics/statistics.hpp"
#include "psr_analyzer/core/errors.hpp"

#include <cmath>
#include <map>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace psr_analyzer;

TEST_CASE("compute_stats_reports_original_and_coverage") {
    Matrix2Df original(2, 2);
    original << 0.0f, 10.0f,
                20.0f, 30.0f;
    const Matrix2Df enhanced = Matrix2Df::Constant(2, 2, 200.0f);

    Mask2D threshold(2, 2);
    threshold << 1, 1,
                 0, 0;
    Mask2D adaptive(2, 2);
    adaptive << 1, 0,
                0, 1;
    std::map<DetectionMethod, Mask2D> masks = {
        {DetectionMethod::THRESHOLD, threshold},
        {DetectionMethod::ADAPTIVE, adaptive},
        {DetectionMethod::EDGES, Mask2D::Zero(2, 2)}
    };

    const metrics::StatRecord rec = metrics::compute_stats(original, enhanced, masks);
    REQUIRE(rec.image.mean == Catch::Approx(15.0));
    REQUIRE(rec.image.min == 0.0);
    REQUIRE(rec.image.max == 30.0);
    REQUIRE(rec.image.dynamic_range == 30.0);
    REQUIRE(rec.image.std == Catch::Approx(std::sqrt(125.0)));
    REQUIRE(rec.coverage.at(DetectionMethod::THRESHOLD) == 50.0);
    REQUIRE(rec.coverage.at(DetectionMethod::ADAPTIVE) == 50.0);
    REQUIRE(rec.coverage.at(DetectionMethod::EDGES) == 0.0);
    REQUIRE_FALSE(rec.terrain.has_value());
}

TEST_CASE("coverage_is_rounded_to_four_decimals") {
    Mask2D m = Mask2D::Zero(3, 1);
    m(0, 0) = 1;
    REQUIRE(metrics::coverage_percent(m) == Catch::Approx(33.3333).margin(1e-9));
    REQUIRE(metrics::coverage_percent(Mask2D::Ones(4, 4)) == 100.0);
}

TEST_CASE("compute_stats_rejects_mismatched_dimensions") {
    const Matrix2Df original = Matrix2Df::Zero(4, 4);
    REQUIRE_THROWS_AS(metrics::compute_stats(original, Matrix2Df::Zero(4, 5), {}),
                      DimensionError);

    std::map<DetectionMethod, Mask2D> masks = {{DetectionMethod::EDGES, Mask2D::Zero(3, 4)}};
    REQUIRE_THROWS_AS(metrics::compute_stats(original, original, masks), DimensionError);
}

TEST_CASE("stat_record_rows_are_stable") {
    metrics::StatRecord rec;
    rec.image.mean = 1.0;
    rec.coverage[DetectionMethod::EDGES] = 2.5;
    rec.coverage[DetectionMethod::THRESHOLD] = 7.0;
    metrics::TerrainSummary t;
    t.peak_count = 3;
    rec.terrain = t;

    const auto rows = rec.rows();
    REQUIRE(rows.size() == 10);
    REQUIRE(rows[0].first == "image_stats.mean");
    REQUIRE(rows[5].first == "psr_coverage.threshold");
    REQUIRE(rows[6].first == "psr_coverage.edges");
    REQUIRE(rows[7].first == "terrain.peak_count");
    REQUIRE(rows[7].second == 3.0);
}

TEST_CASE("summarize_terrain_counts_features") {
    FeatureSet fs;
    fs.peaks = {{1, 1, 200.0f}, {5, 5, 150.0f}};
    fs.valleys = {{3, 3, 5.0f}};
    fs.roughness = Matrix2Df::Constant(4, 4, 2.0f);
    fs.roughness(0, 0) = 18.0f;

    const metrics::TerrainSummary s = metrics::summarize_terrain(fs);
    REQUIRE(s.peak_count == 2);
    REQUIRE(s.valley_count == 1);
    REQUIRE(s.mean_roughness == Catch::Approx(3.0));
}
