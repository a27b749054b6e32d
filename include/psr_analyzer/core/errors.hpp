#pragma once

#include <stdexcept>
#include <string>

namespace psr_analyzer {

class PsrAnalyzerError : public std::runtime_error {
public:
    explicit PsrAnalyzerError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public PsrAnalyzerError {
public:
    explicit ConfigError(const std::string& message)
        : PsrAnalyzerError("Config error: " + message) {}
};

class DimensionError : public PsrAnalyzerError {
public:
    explicit DimensionError(const std::string& message)
        : PsrAnalyzerError("Dimension error: " + message) {}
};

class ValidationError : public PsrAnalyzerError {
public:
    explicit ValidationError(const std::string& message)
        : PsrAnalyzerError("Validation error: " + message) {}
};

class IOError : public PsrAnalyzerError {
public:
    explicit IOError(const std::string& message)
        : PsrAnalyzerError("I/O error: " + message) {}
};

// Process exit status for a failure: 2 configuration, 3 dimension or
// validation, 4 I/O, 1 anything else.
inline int error_exit_code(const std::exception& e) {
    if (dynamic_cast<const ConfigError*>(&e)) return 2;
    if (dynamic_cast<const DimensionError*>(&e)) return 3;
    if (dynamic_cast<const ValidationError*>(&e)) return 3;
    if (dynamic_cast<const IOError*>(&e)) return 4;
    return 1;
}

} // namespace psr_analyzer
