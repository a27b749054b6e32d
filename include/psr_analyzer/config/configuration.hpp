#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <yaml-cpp/yaml.h>

namespace psr_analyzer::config {

namespace fs = std::filesystem;

struct EnhanceConfig {
  float clip_limit = 2.0f; // histogram clip, multiple of the uniform bin height
  int tile_size = 8;       // tiles per axis
};

struct DetectionConfig {
  int basic_threshold = 50;
  int adaptive_block_size = 11;   // odd
  float adaptive_constant = 0.0f; // subtracted from the local mean
  float edge_sigma = 1.0f;
  float edge_low_ratio = 0.1f;    // fraction of the max gradient magnitude
  float edge_high_ratio = 0.2f;
  // Absolute hysteresis thresholds; < 0 derives them from the ratios.
  float edge_low_threshold = -1.0f;
  float edge_high_threshold = -1.0f;
};

struct TerrainConfig {
  int peak_min_distance = 20; // Chebyshev radius
  int roughness_window = 5;   // odd
};

struct LandingConfig {
  float max_mean_roughness = 25.0f;
  float max_edge_density_percent = 15.0f;
};

struct AnalysisConfig {
  EnhanceConfig enhance;
  DetectionConfig detection;
  TerrainConfig terrain;
  LandingConfig landing;

  static AnalysisConfig load(const fs::path &path);
  static AnalysisConfig from_yaml(const YAML::Node &node);

  // Flat request parameters (clahe_clip_limit, adaptive_c, ...) applied on
  // top of base. Omitted keys keep the base values.
  static AnalysisConfig from_parameters(const nlohmann::json &params,
                                        const AnalysisConfig &base = AnalysisConfig());
  nlohmann::json to_parameters() const;

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  // Throws ConfigError on the first invalid parameter.
  void validate() const;
};

std::string get_schema_json();

} // namespace psr_analyzer::config
