#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace safeproc {

// ============================================================================
// Configuration
// ============================================================================
//
// A plain value built once by the caller and handed to each component by
// reference. The library itself never reads configuration files or the
// environment.

struct ExecutorConfig {
    std::chrono::milliseconds default_timeout{60000};
};

struct GitConfig {
    std::string program = "git";
    std::chrono::milliseconds clone_timeout{300000};
    std::chrono::milliseconds checkout_timeout{60000};
    int clone_depth = 1;                                  // 0 disables --depth
    std::vector<std::string> allowed_schemes = {"https", "git"};
};

struct LatexConfig {
    std::string program = "pdflatex";
    std::string bibliography_program = "bibtex";
    std::string source_extension = ".tex";
    std::string output_extension = "pdf";
    std::string bibliography_extension = ".bib";
    int passes = 3;
    std::chrono::milliseconds pass_timeout{120000};
    std::chrono::milliseconds bibliography_timeout{30000};
};

struct ScriptConfig {
    std::string interpreter = "python3";
    std::string extension = ".py";
    std::string script_root;                              // empty: no confinement
    std::chrono::milliseconds timeout{300000};
};

struct Config {
    ExecutorConfig executor;
    GitConfig git;
    LatexConfig latex;
    ScriptConfig script;
    std::string log_level = "info";
    std::string source_path;                              // for diagnostics
};

constexpr const char* kConfigSchema = "safeproc.config.v1";

// Largest accepted latex.passes
constexpr int kMaxPasses = 20;

// Built-in defaults
Config default_config();

// ============================================================================
// Config Parsing
// ============================================================================

struct ConfigParseResult {
    bool ok = false;
    std::string error;
    std::vector<std::string> warnings;
    Config config;
};

// Parse a JSON config document. "$schema" must equal kConfigSchema.
// Unknown keys are ignored; wrong-typed or invalid known keys keep their
// default and add a warning.
ConfigParseResult parse_config(const std::string& json_str, const std::string& source_path = "");

// Install the spdlog level named by @p level (trace, debug, info, warn,
// error, off); anything else selects info.
void configure_logging(const std::string& level);

} // namespace safeproc
