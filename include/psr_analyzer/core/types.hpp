#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <string>
#include <vector>

namespace psr_analyzer {

// Intensity images hold 8-bit levels in [0, 255] stored as float.
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// Binary masks: 1 = classified positive, 0 = background.
using Mask2D = Eigen::Matrix<uint8_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

constexpr float kMinIntensity = 0.0f;
constexpr float kMaxIntensity = 255.0f;
constexpr int kHistogramBins = 256;

// PSR detection methods
enum class DetectionMethod {
    THRESHOLD,
    ADAPTIVE,
    EDGES
};

inline std::string detection_method_to_string(DetectionMethod method) {
    switch (method) {
        case DetectionMethod::THRESHOLD: return "threshold";
        case DetectionMethod::ADAPTIVE: return "adaptive";
        case DetectionMethod::EDGES: return "edges";
        default: return "unknown";
    }
}

// Returns false for unknown names.
inline bool string_to_detection_method(const std::string& s, DetectionMethod& out) {
    if (s == "threshold") { out = DetectionMethod::THRESHOLD; return true; }
    if (s == "adaptive") { out = DetectionMethod::ADAPTIVE; return true; }
    if (s == "edges") { out = DetectionMethod::EDGES; return true; }
    return false;
}

inline std::vector<DetectionMethod> all_detection_methods() {
    return {DetectionMethod::THRESHOLD, DetectionMethod::ADAPTIVE, DetectionMethod::EDGES};
}

// Local extremum location
struct PixelCoord {
    int row;
    int col;
    float value;

    bool operator==(const PixelCoord& other) const {
        return row == other.row && col == other.col && value == other.value;
    }
};

// Terrain analyzer output
struct FeatureSet {
    std::vector<PixelCoord> peaks;    // value descending, raster order on ties
    std::vector<PixelCoord> valleys;  // value ascending, raster order on ties
    Matrix2Df roughness;              // local std-dev, raw intensity units
};

// Non-fatal numeric degeneracy (e.g. zero-variance input)
struct StageWarning {
    std::string stage;
    std::string message;
};

// Pipeline phase enumeration
enum class Phase {
    ENHANCE = 0,
    DETECTION = 1,
    TERRAIN = 2,
    STATISTICS = 3,
    LANDING = 4
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::ENHANCE: return "ENHANCE";
        case Phase::DETECTION: return "DETECTION";
        case Phase::TERRAIN: return "TERRAIN";
        case Phase::STATISTICS: return "STATISTICS";
        case Phase::LANDING: return "LANDING";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

} // namespace psr_analyzer
