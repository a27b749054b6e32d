#include "psr_analyzer/config/configuration.hpp"
#include "psr_analyzer/core/errors.hpp"

#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>

namespace psr_analyzer::config {

static bool is_odd(int v) {
    return (v % 2) != 0;
}

template <typename T>
static void read_value(const YAML::Node& section, const std::string& section_name,
                       const char* key, T& out) {
    const YAML::Node n = section[key];
    if (!n) return;
    try {
        out = n.as<T>();
    } catch (const YAML::BadConversion&) {
        throw ConfigError(section_name + "." + key + " has the wrong type");
    }
}

static void read_int_param(const nlohmann::json& params, const char* key, int& out) {
    if (!params.contains(key)) return;
    const auto& v = params.at(key);
    if (!v.is_number_integer()) {
        throw ConfigError(std::string(key) + " must be an integer");
    }
    const bool in_range = v.is_number_unsigned()
        ? v.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max())
        : v.get<int64_t>() >= std::numeric_limits<int>::min() &&
          v.get<int64_t>() <= std::numeric_limits<int>::max();
    if (!in_range) {
        throw ConfigError(std::string(key) + " is out of range");
    }
    out = static_cast<int>(v.get<int64_t>());
}

static void read_float_param(const nlohmann::json& params, const char* key, float& out) {
    if (!params.contains(key)) return;
    const auto& v = params.at(key);
    if (!v.is_number()) {
        throw ConfigError(std::string(key) + " must be a number");
    }
    out = v.get<float>();
}

AnalysisConfig AnalysisConfig::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

AnalysisConfig AnalysisConfig::from_yaml(const YAML::Node& node) {
    AnalysisConfig cfg;

    if (node["enhance"]) {
        auto e = node["enhance"];
        read_value(e, "enhance", "clip_limit", cfg.enhance.clip_limit);
        read_value(e, "enhance", "tile_size", cfg.enhance.tile_size);
    }

    if (node["detection"]) {
        auto d = node["detection"];
        read_value(d, "detection", "basic_threshold", cfg.detection.basic_threshold);
        read_value(d, "detection", "adaptive_block_size", cfg.detection.adaptive_block_size);
        read_value(d, "detection", "adaptive_constant", cfg.detection.adaptive_constant);
        read_value(d, "detection", "edge_sigma", cfg.detection.edge_sigma);
        read_value(d, "detection", "edge_low_ratio", cfg.detection.edge_low_ratio);
        read_value(d, "detection", "edge_high_ratio", cfg.detection.edge_high_ratio);
        read_value(d, "detection", "edge_low_threshold", cfg.detection.edge_low_threshold);
        read_value(d, "detection", "edge_high_threshold", cfg.detection.edge_high_threshold);
    }

    if (node["terrain"]) {
        auto t = node["terrain"];
        read_value(t, "terrain", "peak_min_distance", cfg.terrain.peak_min_distance);
        read_value(t, "terrain", "roughness_window", cfg.terrain.roughness_window);
    }

    if (node["landing"]) {
        auto l = node["landing"];
        read_value(l, "landing", "max_mean_roughness", cfg.landing.max_mean_roughness);
        read_value(l, "landing", "max_edge_density_percent", cfg.landing.max_edge_density_percent);
    }

    return cfg;
}

AnalysisConfig AnalysisConfig::from_parameters(const nlohmann::json& params,
                                               const AnalysisConfig& base) {
    AnalysisConfig cfg = base;
    if (params.is_null()) return cfg;
    if (!params.is_object()) {
        throw ConfigError("parameters must be a JSON object");
    }

    static const char* kKnown[] = {
        "clahe_clip_limit", "clahe_tile_size", "basic_threshold",
        "adaptive_block_size", "adaptive_c", "edge_sigma",
        "peak_min_distance", "roughness_size"};
    for (auto it = params.begin(); it != params.end(); ++it) {
        bool known = false;
        for (const char* k : kKnown) {
            if (it.key() == k) {
                known = true;
                break;
            }
        }
        if (!known) {
            throw ConfigError("unknown parameter '" + it.key() + "'");
        }
    }

    read_float_param(params, "clahe_clip_limit", cfg.enhance.clip_limit);
    read_int_param(params, "clahe_tile_size", cfg.enhance.tile_size);
    read_int_param(params, "basic_threshold", cfg.detection.basic_threshold);
    read_int_param(params, "adaptive_block_size", cfg.detection.adaptive_block_size);
    read_float_param(params, "adaptive_c", cfg.detection.adaptive_constant);
    read_float_param(params, "edge_sigma", cfg.detection.edge_sigma);
    read_int_param(params, "peak_min_distance", cfg.terrain.peak_min_distance);
    read_int_param(params, "roughness_size", cfg.terrain.roughness_window);
    return cfg;
}

nlohmann::json AnalysisConfig::to_parameters() const {
    return {
        {"clahe_clip_limit", enhance.clip_limit},
        {"clahe_tile_size", enhance.tile_size},
        {"basic_threshold", detection.basic_threshold},
        {"adaptive_block_size", detection.adaptive_block_size},
        {"adaptive_c", detection.adaptive_constant},
        {"edge_sigma", detection.edge_sigma},
        {"peak_min_distance", terrain.peak_min_distance},
        {"roughness_size", terrain.roughness_window}
    };
}

void AnalysisConfig::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node AnalysisConfig::to_yaml() const {
    YAML::Node node;

    node["enhance"]["clip_limit"] = enhance.clip_limit;
    node["enhance"]["tile_size"] = enhance.tile_size;

    node["detection"]["basic_threshold"] = detection.basic_threshold;
    node["detection"]["adaptive_block_size"] = detection.adaptive_block_size;
    node["detection"]["adaptive_constant"] = detection.adaptive_constant;
    node["detection"]["edge_sigma"] = detection.edge_sigma;
    node["detection"]["edge_low_ratio"] = detection.edge_low_ratio;
    node["detection"]["edge_high_ratio"] = detection.edge_high_ratio;
    node["detection"]["edge_low_threshold"] = detection.edge_low_threshold;
    node["detection"]["edge_high_threshold"] = detection.edge_high_threshold;

    node["terrain"]["peak_min_distance"] = terrain.peak_min_distance;
    node["terrain"]["roughness_window"] = terrain.roughness_window;

    node["landing"]["max_mean_roughness"] = landing.max_mean_roughness;
    node["landing"]["max_edge_density_percent"] = landing.max_edge_density_percent;

    return node;
}

void AnalysisConfig::validate() const {
    if (!std::isfinite(enhance.clip_limit) || enhance.clip_limit < 0.1f || enhance.clip_limit > 40.0f) {
        throw ConfigError("enhance.clip_limit must be in [0.1,40]");
    }
    if (enhance.tile_size < 1 || enhance.tile_size > 64) {
        throw ConfigError("enhance.tile_size must be in [1,64]");
    }

    if (detection.basic_threshold < 0 || detection.basic_threshold > 255) {
        throw ConfigError("detection.basic_threshold must be in [0,255]");
    }
    if (detection.adaptive_block_size < 3 || detection.adaptive_block_size > 101 ||
        !is_odd(detection.adaptive_block_size)) {
        throw ConfigError("detection.adaptive_block_size must be odd and in [3,101]");
    }
    if (!std::isfinite(detection.adaptive_constant) ||
        detection.adaptive_constant < 0.0f || detection.adaptive_constant > 20.0f) {
        throw ConfigError("detection.adaptive_constant must be in [0,20]");
    }
    if (!std::isfinite(detection.edge_sigma) || detection.edge_sigma < 0.1f || detection.edge_sigma > 10.0f) {
        throw ConfigError("detection.edge_sigma must be in [0.1,10]");
    }
    if (!(detection.edge_low_ratio > 0.0f && detection.edge_low_ratio < 1.0f)) {
        throw ConfigError("detection.edge_low_ratio must be in (0,1)");
    }
    if (!(detection.edge_high_ratio > detection.edge_low_ratio && detection.edge_high_ratio <= 1.0f)) {
        throw ConfigError("detection.edge_high_ratio must be in (edge_low_ratio,1]");
    }
    const bool low_abs = detection.edge_low_threshold >= 0.0f;
    const bool high_abs = detection.edge_high_threshold >= 0.0f;
    if (low_abs != high_abs) {
        throw ConfigError("detection.edge_low_threshold and detection.edge_high_threshold must be set together");
    }
    if (low_abs && detection.edge_high_threshold < detection.edge_low_threshold) {
        throw ConfigError("detection.edge_high_threshold must be >= detection.edge_low_threshold");
    }

    if (terrain.peak_min_distance < 5 || terrain.peak_min_distance > 50) {
        throw ConfigError("terrain.peak_min_distance must be in [5,50]");
    }
    if (terrain.roughness_window < 3 || terrain.roughness_window > 51 ||
        !is_odd(terrain.roughness_window)) {
        throw ConfigError("terrain.roughness_window must be odd and in [3,51]");
    }

    if (!std::isfinite(landing.max_mean_roughness) || landing.max_mean_roughness < 0.0f) {
        throw ConfigError("landing.max_mean_roughness must be >= 0");
    }
    if (!(landing.max_edge_density_percent >= 0.0f && landing.max_edge_density_percent <= 100.0f)) {
        throw ConfigError("landing.max_edge_density_percent must be in [0,100]");
    }
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "enhance": {
      "type": "object",
      "properties": {
        "clip_limit": {"type": "number", "minimum": 0.1, "maximum": 40, "default": 2.0},
        "tile_size": {"type": "integer", "minimum": 1, "maximum": 64, "default": 8}
      }
    },
    "detection": {
      "type": "object",
      "properties": {
        "basic_threshold": {"type": "integer", "minimum": 0, "maximum": 255, "default": 50},
        "adaptive_block_size": {"type": "integer", "minimum": 3, "maximum": 101, "default": 11},
        "adaptive_constant": {"type": "number", "minimum": 0, "maximum": 20, "default": 0},
        "edge_sigma": {"type": "number", "minimum": 0.1, "maximum": 10, "default": 1.0},
        "edge_low_ratio": {"type": "number", "exclusiveMinimum": 0, "exclusiveMaximum": 1, "default": 0.1},
        "edge_high_ratio": {"type": "number", "exclusiveMinimum": 0, "maximum": 1, "default": 0.2},
        "edge_low_threshold": {"type": "number", "default": -1},
        "edge_high_threshold": {"type": "number", "default": -1}
      }
    },
    "terrain": {
      "type": "object",
      "properties": {
        "peak_min_distance": {"type": "integer", "minimum": 5, "maximum": 50, "default": 20},
        "roughness_window": {"type": "integer", "minimum": 3, "maximum": 51, "default": 5}
      }
    },
    "landing": {
      "type": "object",
      "properties": {
        "max_mean_roughness": {"type": "number", "minimum": 0, "default": 25.0},
        "max_edge_density_percent": {"type": "number", "minimum": 0, "maximum": 100, "default": 15.0}
      }
    }
  }
})";
}

} // namespace psr_analyzer::config
