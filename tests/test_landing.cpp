#include "psr_analyzer/metrics/landing.hpp"
#include "psr_analyzer/core/errors.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace psr_analyzer;

TEST_CASE("landing_safe_when_both_criteria_pass") {
    const config::LandingConfig cfg;
    const metrics::LandingAssessment a = metrics::assess_landing_safety(10.0, 5.0, cfg);
    REQUIRE(a.safe);
    REQUIRE(a.roughness_safe);
    REQUIRE(a.edge_density_safe);
    REQUIRE(a.explanation.size() == 3);
    REQUIRE(a.explanation[0] == "Terrain Roughness: SAFE (10.00 <= 25.00)");
    REQUIRE(a.explanation[1] == "Edge Density: SAFE (5.00% <= 15.00%)");
    REQUIRE(a.explanation[2] == "FINAL ASSESSMENT: SAFE for landing");
}

TEST_CASE("landing_unsafe_for_rough_dense_terrain") {
    const config::LandingConfig cfg;
    const metrics::LandingAssessment a = metrics::assess_landing_safety(100.0, 60.0, cfg);
    REQUIRE_FALSE(a.safe);
    REQUIRE_FALSE(a.roughness_safe);
    REQUIRE_FALSE(a.edge_density_safe);
    REQUIRE(a.explanation_text() ==
            "Terrain Roughness: UNSAFE (100.00 > 25.00)\n"
            "Edge Density: UNSAFE (60.00% > 15.00%)\n"
            "FINAL ASSESSMENT: UNSAFE for landing");
}

TEST_CASE("landing_limits_are_inclusive") {
    config::LandingConfig cfg;
    cfg.max_mean_roughness = 10.0f;
    cfg.max_edge_density_percent = 20.0f;
    REQUIRE(metrics::assess_landing_safety(10.0, 20.0, cfg).safe);
    REQUIRE_FALSE(metrics::assess_landing_safety(10.0, 20.5, cfg).safe);
}

TEST_CASE("landing_from_features_uses_mean_roughness_and_edge_coverage") {
    FeatureSet fs;
    fs.roughness = Matrix2Df::Constant(10, 10, 4.0f);
    Mask2D edges = Mask2D::Zero(10, 10);
    edges.row(0).setOnes();

    const metrics::LandingAssessment a =
        metrics::assess_landing_safety(fs, edges, config::LandingConfig());
    REQUIRE(a.mean_roughness == 4.0);
    REQUIRE(a.edge_density_percent == 10.0);
    REQUIRE(a.safe);

    REQUIRE_THROWS_AS(metrics::assess_landing_safety(FeatureSet(), edges, config::LandingConfig()),
                      DimensionError);
}
