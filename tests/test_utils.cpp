#include "psr_analyzer/core/errors.hpp"
#include "psr_analyzer/core/events.hpp"
#include "psr_analyzer/core/types.hpp"
#include "psr_analyzer/core/utils.hpp"

#include <new>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace psr_analyzer;

TEST_CASE("round_to_decimals_keeps_four_places") {
    REQUIRE(core::round_to_decimals(12.345678, 4) == Catch::Approx(12.3457));
    REQUIRE(core::round_to_decimals(1.0 / 3.0, 4) == Catch::Approx(0.3333));
    REQUIRE(core::round_to_decimals(50.0, 4) == 50.0);
}

TEST_CASE("split_and_trim_layer_lists") {
    const auto parts = core::split(" edges, threshold ,roughness", ',');
    REQUIRE(parts.size() == 3);
    REQUIRE(core::trim(parts[0]) == "edges");
    REQUIRE(core::trim(parts[1]) == "threshold");
    REQUIRE(core::to_lower("ADAPTIVE") == "adaptive");
}

TEST_CASE("is_constant_and_count_positive") {
    Matrix2Df flat = Matrix2Df::Constant(4, 5, 128.0f);
    REQUIRE(core::is_constant(flat));
    flat(2, 3) = 129.0f;
    REQUIRE_FALSE(core::is_constant(flat));

    Mask2D mask = Mask2D::Zero(3, 3);
    mask(0, 0) = 1;
    mask(2, 1) = 1;
    REQUIRE(core::count_positive(mask) == 2);
}

TEST_CASE("cv_mat_bridge_preserves_layout") {
    Matrix2Df img(2, 3);
    img << 1.0f, 2.0f, 3.0f,
           4.0f, 5.0f, 6.0f;

    const cv::Mat m = core::to_cv_mat(img);
    REQUIRE(m.rows == 2);
    REQUIRE(m.cols == 3);
    REQUIRE(m.at<float>(1, 0) == 4.0f);

    const Matrix2Df back = core::from_cv_mat(m);
    REQUIRE(back == img);
}

TEST_CASE("detection_method_names") {
    DetectionMethod m = DetectionMethod::THRESHOLD;
    REQUIRE(string_to_detection_method("edges", m));
    REQUIRE(m == DetectionMethod::EDGES);
    REQUIRE_FALSE(string_to_detection_method("sobel", m));
    REQUIRE(detection_method_to_string(DetectionMethod::ADAPTIVE) == "adaptive");
    REQUIRE(all_detection_methods().size() == 3);
}

TEST_CASE("event_emitter_writes_json_lines") {
    std::ostringstream out;
    core::EventEmitter emitter(&out, "run42");
    emitter.phase_start(Phase::ENHANCE);
    emitter.warning("edges", "flat");

    std::istringstream lines(out.str());
    std::string line;
    std::vector<nlohmann::json> events;
    while (std::getline(lines, line)) {
        events.push_back(nlohmann::json::parse(line));
    }
    REQUIRE(events.size() == 2);
    REQUIRE(events[0]["type"] == "phase_start");
    REQUIRE(events[0]["phase_name"] == "ENHANCE");
    REQUIRE(events[0]["run_id"] == "run42");
    REQUIRE(events[1]["stage"] == "edges");
}

TEST_CASE("event_emitter_null_stream_is_silent") {
    core::EventEmitter emitter(nullptr, "run");
    emitter.run_start({{"width", 1}});
    emitter.run_end(true, "ok");
    REQUIRE(emitter.run_id() == "run");
}

TEST_CASE("error_exit_codes_cover_every_failure") {
    REQUIRE(error_exit_code(ConfigError("tile")) == 2);
    REQUIRE(error_exit_code(DimensionError("block")) == 3);
    REQUIRE(error_exit_code(ValidationError("nan")) == 3);
    REQUIRE(error_exit_code(IOError("decode")) == 4);
    REQUIRE(error_exit_code(std::runtime_error("opencv")) == 1);
    REQUIRE(error_exit_code(std::bad_alloc()) == 1);
}
