#include "psr_analyzer/config/configuration.hpp"
#include "psr_analyzer/core/errors.hpp"
#include "psr_analyzer/core/types.hpp"
#include "psr_analyzer/core/utils.hpp"
#include "psr_analyzer/io/image_io.hpp"
#include "psr_analyzer/io/report_export.hpp"
#include "psr_analyzer/pipeline/pipeline.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <cstring>
#include <initializer_list>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using json = nlohmann::json;

using namespace psr_analyzer;

static void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

static std::string read_stdin() {
    std::ostringstream ss;
    ss << std::cin.rdbuf();
    return ss.str();
}

static int print_error(const std::exception& e) {
    json result;
    result["ok"] = false;
    result["error"] = e.what();
    print_json(result);
    return error_exit_code(e);
}

// Config file first, then flat request parameters on top of it.
static config::AnalysisConfig resolve_config(const std::string& config_path,
                                             const std::string& params_text) {
    config::AnalysisConfig cfg;
    if (!config_path.empty()) {
        cfg = config::AnalysisConfig::load(config_path);
    }
    if (!params_text.empty()) {
        json params;
        try {
            params = json::parse(params_text);
        } catch (const json::parse_error& e) {
            throw ConfigError(std::string("--params is not valid JSON: ") + e.what());
        }
        cfg = config::AnalysisConfig::from_parameters(params, cfg);
    }
    return cfg;
}

// ============================================================================
// analyze <image> [--config <yaml>] [--params <json>] [--output-dir <dir>]
// preview <image> --layers <list> [...]
// ============================================================================
static int cmd_analyze(const std::string& image_path, const std::string& config_path,
                       const std::string& params_text, const std::string& output_dir,
                       const std::string& layers, bool quiet) {
    try {
        const config::AnalysisConfig cfg = resolve_config(config_path, params_text);
        const Matrix2Df image = io::load_grayscale(image_path);

        pipeline::AnalysisOptions options;
        if (!layers.empty()) {
            std::vector<DetectionMethod> methods;
            bool terrain = false;
            for (const auto& raw : core::split(layers, ',')) {
                const std::string name = core::to_lower(core::trim(raw));
                if (name.empty() || name == "original" || name == "enhanced") continue;
                if (name == "roughness") {
                    terrain = true;
                    continue;
                }
                DetectionMethod m;
                if (!string_to_detection_method(name, m)) {
                    throw ConfigError("unknown preview layer '" + name + "'");
                }
                methods.push_back(m);
            }
            options = pipeline::preview_options(methods, terrain);
        }

        const pipeline::AnalysisReport report =
            pipeline::run_analysis(image, cfg, options, quiet ? nullptr : &std::cerr);

        json result = io::report_to_json(report);
        result["ok"] = true;
        result["input_path"] = image_path;
        if (!output_dir.empty()) {
            json artifacts = json::array();
            for (const auto& p : io::export_report(report, output_dir)) {
                artifacts.push_back(p.string());
            }
            result["artifacts"] = artifacts;
        }
        print_json(result);
        return 0;
    } catch (const std::exception& e) {
        return print_error(e);
    }
}

int cmd_get_defaults() {
    print_json(config::AnalysisConfig().to_parameters());
    return 0;
}

int cmd_get_schema() {
    std::cout << config::get_schema_json() << std::endl;
    return 0;
}

int cmd_validate_config(const std::string& path, bool use_stdin, bool strict_exit) {
    json result;
    result["valid"] = false;
    result["errors"] = json::array();
    if (!path.empty()) result["path"] = path;

    try {
        config::AnalysisConfig cfg;
        if (use_stdin) {
            YAML::Node node;
            try {
                node = YAML::Load(read_stdin());
            } catch (const YAML::Exception& e) {
                throw ConfigError(std::string("cannot parse YAML: ") + e.what());
            }
            cfg = config::AnalysisConfig::from_yaml(node);
        } else {
            cfg = config::AnalysisConfig::load(path);
        }
        cfg.validate();
        result["valid"] = true;
    } catch (const PsrAnalyzerError& e) {
        result["errors"].push_back(e.what());
    }

    print_json(result);
    if (strict_exit) {
        return result["valid"].get<bool>() ? 0 : 2;
    }
    return 0;
}

void print_usage() {
    std::cout << "Usage: psr_analyzer_cli <command> [options]\n\n"
              << "Commands:\n"
              << "  analyze <image>        Run the full analysis\n"
              << "  preview <image>        Run only the layers named by --layers\n"
              << "  get-defaults           Print default parameters as JSON\n"
              << "  get-schema             Print the configuration JSON schema\n"
              << "  validate-config        Validate a YAML configuration\n"
              << "\nOptions:\n"
              << "  --config <path>        YAML configuration (analyze, preview)\n"
              << "  --params <json>        Flat parameter overrides (analyze, preview)\n"
              << "  --output-dir <dir>     Write statistics and images (analyze, preview)\n"
              << "  --layers <list>        original,enhanced,threshold,adaptive,edges,roughness\n"
              << "  --quiet                Suppress progress events on stderr\n"
              << "  --path <path>          Configuration file (validate-config)\n"
              << "  --stdin                Read configuration from stdin (validate-config)\n"
              << "  --strict-exit-codes    Non-zero exit for invalid configuration\n"
              << std::endl;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];

    auto get_arg = [&](const char* name) -> std::string {
        for (int i = 2; i < argc - 1; ++i) {
            if (std::strcmp(argv[i], name) == 0) {
                return argv[i + 1];
            }
        }
        return "";
    };

    auto has_flag = [&](const char* name) -> bool {
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], name) == 0) return true;
        }
        return false;
    };

    auto takes_value = [](const char* opt) -> bool {
        for (const char* name : {"--config", "--params", "--output-dir", "--layers", "--path"}) {
            if (std::strcmp(opt, name) == 0) return true;
        }
        return false;
    };

    auto get_positional = [&](int pos) -> std::string {
        int count = 0;
        for (int i = 2; i < argc; ++i) {
            if (argv[i][0] != '-') {
                if (count == pos) return argv[i];
                ++count;
            } else if (takes_value(argv[i])) {
                ++i; // Skip argument value
            }
        }
        return "";
    };

    if (command == "get-defaults") {
        return cmd_get_defaults();
    }

    if (command == "get-schema") {
        return cmd_get_schema();
    }

    if (command == "validate-config") {
        std::string path = get_arg("--path");
        bool use_stdin = has_flag("--stdin");
        if (path.empty() && !use_stdin) {
            std::cerr << "validate-config requires --path or --stdin\n";
            return 1;
        }
        return cmd_validate_config(path, use_stdin, has_flag("--strict-exit-codes"));
    }

    if (command == "analyze" || command == "preview") {
        std::string image_path = get_positional(0);
        if (image_path.empty()) {
            std::cerr << command << " requires an image path\n";
            return 1;
        }
        std::string layers = get_arg("--layers");
        if (command == "preview" && layers.empty()) {
            std::cerr << "preview requires --layers\n";
            return 1;
        }
        if (command == "analyze") layers.clear();
        return cmd_analyze(image_path, get_arg("--config"), get_arg("--params"),
                           get_arg("--output-dir"), layers, has_flag("--quiet"));
    }

    print_usage();
    return 1;
}
