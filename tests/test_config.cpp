#include "psr_analyzer/config/configuration.hpp"
#include "psr_analyzer/core/errors.hpp"

#include <filesystem>
#include <string>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using psr_analyzer::ConfigError;
using psr_analyzer::config::AnalysisConfig;

TEST_CASE("config_defaults_are_valid") {
    AnalysisConfig cfg;
    REQUIRE_NOTHROW(cfg.validate());
    REQUIRE(cfg.enhance.clip_limit == Catch::Approx(2.0f));
    REQUIRE(cfg.enhance.tile_size == 8);
    REQUIRE(cfg.detection.basic_threshold == 50);
    REQUIRE(cfg.detection.adaptive_block_size == 11);
    REQUIRE(cfg.detection.adaptive_constant == 0.0f);
    REQUIRE(cfg.terrain.roughness_window == 5);
}

TEST_CASE("config_from_yaml_overrides_and_keeps_defaults") {
    const YAML::Node node = YAML::Load(
        "enhance:\n"
        "  clip_limit: 3.5\n"
        "detection:\n"
        "  adaptive_block_size: 21\n"
        "landing:\n"
        "  max_mean_roughness: 10\n");
    const AnalysisConfig cfg = AnalysisConfig::from_yaml(node);
    REQUIRE(cfg.enhance.clip_limit == Catch::Approx(3.5f));
    REQUIRE(cfg.enhance.tile_size == 8);
    REQUIRE(cfg.detection.adaptive_block_size == 21);
    REQUIRE(cfg.landing.max_mean_roughness == Catch::Approx(10.0f));
}

TEST_CASE("config_from_yaml_rejects_wrong_types") {
    const YAML::Node node = YAML::Load("enhance:\n  tile_size: eight\n");
    REQUIRE_THROWS_AS(AnalysisConfig::from_yaml(node), ConfigError);
}

TEST_CASE("config_yaml_save_load_keeps_values") {
    AnalysisConfig cfg;
    cfg.detection.basic_threshold = 80;
    cfg.terrain.peak_min_distance = 7;
    cfg.detection.edge_low_threshold = 5.0f;
    cfg.detection.edge_high_threshold = 12.0f;

    const auto path = std::filesystem::temp_directory_path() / "psr_analyzer_test_config.yaml";
    cfg.save(path);
    const AnalysisConfig loaded = AnalysisConfig::load(path);
    std::filesystem::remove(path);

    REQUIRE(loaded.detection.basic_threshold == 80);
    REQUIRE(loaded.terrain.peak_min_distance == 7);
    REQUIRE(loaded.detection.edge_high_threshold == Catch::Approx(12.0f));
    REQUIRE_NOTHROW(loaded.validate());
}

TEST_CASE("config_load_missing_file_is_config_error") {
    REQUIRE_THROWS_AS(AnalysisConfig::load("/nonexistent/psr.yaml"), ConfigError);
}

TEST_CASE("config_from_parameters_uses_flat_names") {
    const nlohmann::json params = {
        {"clahe_clip_limit", 4.0},
        {"adaptive_block_size", 15},
        {"adaptive_c", 3},
        {"roughness_size", 7}
    };
    const AnalysisConfig cfg = AnalysisConfig::from_parameters(params);
    REQUIRE(cfg.enhance.clip_limit == Catch::Approx(4.0f));
    REQUIRE(cfg.detection.adaptive_block_size == 15);
    REQUIRE(cfg.detection.adaptive_constant == Catch::Approx(3.0f));
    REQUIRE(cfg.terrain.roughness_window == 7);
    REQUIRE(cfg.detection.basic_threshold == 50);

    const nlohmann::json back = cfg.to_parameters();
    REQUIRE(back["adaptive_block_size"] == 15);
    REQUIRE(back["roughness_size"] == 7);
}

TEST_CASE("config_from_parameters_applies_on_base") {
    AnalysisConfig base;
    base.detection.basic_threshold = 90;
    const nlohmann::json params = {{"clahe_tile_size", 4}};
    const AnalysisConfig cfg = AnalysisConfig::from_parameters(params, base);
    REQUIRE(cfg.detection.basic_threshold == 90);
    REQUIRE(cfg.enhance.tile_size == 4);
}

TEST_CASE("config_from_parameters_rejects_unknown_and_mistyped") {
    const nlohmann::json unknown = {{"clip", 2.0}};
    const nlohmann::json fractional_tile = {{"clahe_tile_size", 8.5}};
    const nlohmann::json text_sigma = {{"edge_sigma", "wide"}};
    REQUIRE_THROWS_AS(AnalysisConfig::from_parameters(unknown), ConfigError);
    REQUIRE_THROWS_AS(AnalysisConfig::from_parameters(fractional_tile), ConfigError);
    REQUIRE_THROWS_AS(AnalysisConfig::from_parameters(text_sigma), ConfigError);
    REQUIRE_THROWS_AS(AnalysisConfig::from_parameters(nlohmann::json::array()), ConfigError);
}

TEST_CASE("config_from_parameters_rejects_integers_beyond_int") {
    const nlohmann::json huge_block = {{"adaptive_block_size", 4294967307LL}};
    const nlohmann::json negative_threshold = {{"basic_threshold", -4294967246LL}};
    const nlohmann::json unsigned_tile = {{"clahe_tile_size", 18446744073709551615ULL}};
    REQUIRE_THROWS_AS(AnalysisConfig::from_parameters(huge_block), ConfigError);
    REQUIRE_THROWS_AS(AnalysisConfig::from_parameters(negative_threshold), ConfigError);
    REQUIRE_THROWS_AS(AnalysisConfig::from_parameters(unsigned_tile), ConfigError);

    const nlohmann::json parsed = nlohmann::json::parse(R"({"peak_min_distance": 2147483648})");
    REQUIRE_THROWS_AS(AnalysisConfig::from_parameters(parsed), ConfigError);
}

TEST_CASE("config_validate_rejects_out_of_range") {
    SECTION("even adaptive block") {
        AnalysisConfig cfg;
        cfg.detection.adaptive_block_size = 10;
        REQUIRE_THROWS_AS(cfg.validate(), ConfigError);
    }
    SECTION("clip limit too small") {
        AnalysisConfig cfg;
        cfg.enhance.clip_limit = 0.0f;
        REQUIRE_THROWS_AS(cfg.validate(), ConfigError);
    }
    SECTION("basic threshold above 255") {
        AnalysisConfig cfg;
        cfg.detection.basic_threshold = 300;
        REQUIRE_THROWS_AS(cfg.validate(), ConfigError);
    }
    SECTION("even roughness window") {
        AnalysisConfig cfg;
        cfg.terrain.roughness_window = 4;
        REQUIRE_THROWS_AS(cfg.validate(), ConfigError);
    }
    SECTION("peak distance below range") {
        AnalysisConfig cfg;
        cfg.terrain.peak_min_distance = 2;
        REQUIRE_THROWS_AS(cfg.validate(), ConfigError);
    }
    SECTION("hysteresis ratios inverted") {
        AnalysisConfig cfg;
        cfg.detection.edge_low_ratio = 0.3f;
        cfg.detection.edge_high_ratio = 0.2f;
        REQUIRE_THROWS_AS(cfg.validate(), ConfigError);
    }
    SECTION("only one absolute threshold") {
        AnalysisConfig cfg;
        cfg.detection.edge_low_threshold = 5.0f;
        REQUIRE_THROWS_AS(cfg.validate(), ConfigError);
    }
}

TEST_CASE("config_schema_is_json") {
    const auto schema = nlohmann::json::parse(psr_analyzer::config::get_schema_json());
    REQUIRE(schema["properties"].contains("enhance"));
    REQUIRE(schema["properties"]["detection"]["properties"]["adaptive_block_size"]["default"] == 11);
}
