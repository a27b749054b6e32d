#include "psr_analyzer/metrics/landing.hpp"
#include "psr_analyzer/metrics/statistics.hpp"
#include "psr_analyzer/core/errors.hpp"

#include <iomanip>
#include <sstream>

namespace psr_analyzer::metrics {

namespace {

std::string criterion_line(const std::string& name, bool ok, double value,
                           double limit, const std::string& unit) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    oss << name << ": " << (ok ? "SAFE" : "UNSAFE") << " (" << value << unit
        << (ok ? " <= " : " > ") << limit << unit << ")";
    return oss.str();
}

} // namespace

std::string LandingAssessment::explanation_text() const {
    std::ostringstream oss;
    for (size_t i = 0; i < explanation.size(); ++i) {
        if (i > 0) oss << "\n";
        oss << explanation[i];
    }
    return oss.str();
}

LandingAssessment assess_landing_safety(double mean_roughness, double edge_density_percent,
                                        const config::LandingConfig& cfg) {
    LandingAssessment a;
    a.mean_roughness = mean_roughness;
    a.edge_density_percent = edge_density_percent;
    a.roughness_safe = mean_roughness <= static_cast<double>(cfg.max_mean_roughness);
    a.edge_density_safe = edge_density_percent <= static_cast<double>(cfg.max_edge_density_percent);
    a.safe = a.roughness_safe && a.edge_density_safe;

    a.explanation.push_back(criterion_line("Terrain Roughness", a.roughness_safe, mean_roughness,
                                           cfg.max_mean_roughness, ""));
    a.explanation.push_back(criterion_line("Edge Density", a.edge_density_safe, edge_density_percent,
                                           cfg.max_edge_density_percent, "%"));
    a.explanation.push_back(a.safe ? "FINAL ASSESSMENT: SAFE for landing"
                                   : "FINAL ASSESSMENT: UNSAFE for landing");
    return a;
}

LandingAssessment assess_landing_safety(const FeatureSet& terrain, const Mask2D& edges,
                                        const config::LandingConfig& cfg) {
    if (terrain.roughness.size() == 0) {
        throw DimensionError("assess_landing_safety: roughness map is empty");
    }
    const TerrainSummary summary = summarize_terrain(terrain);
    return assess_landing_safety(summary.mean_roughness, coverage_percent(edges), cfg);
}

} // namespace psr_analyzer::metrics
