#pragma once

#include "psr_analyzer/config/configuration.hpp"
#include "psr_analyzer/core/types.hpp"

#include <string>
#include <vector>

namespace psr_analyzer::metrics {

struct LandingAssessment {
    bool safe = false;
    bool roughness_safe = false;
    bool edge_density_safe = false;
    double mean_roughness = 0.0;
    double edge_density_percent = 0.0;
    std::vector<std::string> explanation;  // one line per criterion + verdict

    std::string explanation_text() const;
};

// Safe when mean roughness <= max_mean_roughness and edge density
// <= max_edge_density_percent.
LandingAssessment assess_landing_safety(double mean_roughness, double edge_density_percent,
                                        const config::LandingConfig& cfg);

LandingAssessment assess_landing_safety(const FeatureSet& terrain, const Mask2D& edges,
                                        const config::LandingConfig& cfg);

} // namespace psr_analyzer::metrics
