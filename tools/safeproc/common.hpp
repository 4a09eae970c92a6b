/**
 * safeproc CLI - Common utilities and types
 */

#pragma once

#include <safeproc/safeproc.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace safeproc::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string config;            // --config
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Resolve the configuration document path.
 * Priority: --config flag > SAFEPROC_CONFIG env > none (built-in defaults)
 */
inline std::optional<std::string> resolve_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return override_path;
    }

    auto env_path = get_env("SAFEPROC_CONFIG");
    if (env_path && !env_path->empty()) {
        return env_path;
    }

    return std::nullopt;
}

/**
 * Warning collector for accumulating warnings during command execution.
 * In JSON mode, warnings are collected and output at the end.
 * In text mode, warnings are printed immediately to stderr.
 */
struct WarningCollector {
    std::vector<std::string> warnings;
    bool json_mode = false;
    bool quiet = false;

    void add(const std::string& msg) {
        if (json_mode) {
            warnings.push_back(msg);
        } else if (!quiet) {
            std::cerr << "Warning: " << msg << std::endl;
        }
    }

    void clear() { warnings.clear(); }
    bool empty() const { return warnings.empty(); }

    nlohmann::json to_json() const {
        return nlohmann::json(warnings);
    }
};

inline WarningCollector& get_warning_collector() {
    static WarningCollector collector;
    return collector;
}

inline void init_warning_collector(bool json_mode, bool quiet) {
    auto& collector = get_warning_collector();
    collector.clear();
    collector.json_mode = json_mode;
    collector.quiet = quiet;
}

/**
 * Output utilities.
 */
inline void output_json(const nlohmann::json& j) {
    auto& collector = get_warning_collector();
    if (!collector.empty() && !j.contains("warnings")) {
        nlohmann::json output = j;
        output["warnings"] = collector.to_json();
        std::cout << output.dump(2) << std::endl;
    } else {
        std::cout << j.dump(2) << std::endl;
    }
}

inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        output_json(j);
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_error(const Error& error, bool json_mode) {
    if (!json_mode) {
        std::cerr << "Error: " << error.toString() << std::endl;
        return;
    }

    const auto& detail = error.detail();
    nlohmann::json j;
    j["ok"] = false;
    j["code"] = error_code_to_string(error.code());
    j["error"] = error.message();
    if (!detail.value.empty()) j["value"] = detail.value;
    if (detail.exit_code) j["exit_code"] = *detail.exit_code;
    if (!detail.command.empty()) j["command"] = detail.command;
    if (!detail.cwd.empty()) j["cwd"] = detail.cwd;
    if (!detail.path.empty()) j["path"] = detail.path;
    if (!detail.stdout_text.empty()) j["stdout"] = detail.stdout_text;
    if (!detail.stderr_text.empty()) j["stderr"] = detail.stderr_text;
    output_json(j);
}

inline void print_warning(const std::string& msg) {
    get_warning_collector().add(msg);
}

inline void print_success(const std::string& msg, const GlobalOptions& opts) {
    if (!opts.json && !opts.quiet) {
        std::cout << msg << std::endl;
    }
}

// Seconds as accepted by --timeout options
constexpr double kMaxTimeoutSeconds = kMaxCommandTimeout.count() / 1000.0;

// Callers bound @p seconds by kMaxTimeoutSeconds first
inline std::chrono::milliseconds seconds_to_ms(double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

/**
 * Install log level and load the configuration for a command.
 * Returns nullopt (after reporting) when an explicit document is unusable.
 */
inline std::optional<Config> load_config(const GlobalOptions& opts) {
    init_warning_collector(opts.json, opts.quiet);

    Config config = default_config();
    auto path = resolve_config_path(opts.config);
    if (path) {
        auto content = read_file(*path);
        if (!content) {
            print_error(Error(ErrorCode::IO_ERROR, "Failed to read config: " + *path), opts.json);
            return std::nullopt;
        }
        auto parsed = parse_config(*content, *path);
        if (!parsed.ok) {
            print_error(Error(ErrorCode::CONFIG_PARSE_ERROR, parsed.error).withContext(*path),
                        opts.json);
            return std::nullopt;
        }
        for (const auto& warning : parsed.warnings) {
            print_warning(warning);
        }
        config = parsed.config;
    }

    if (opts.verbose) {
        configure_logging("debug");
    } else if (opts.quiet || opts.json) {
        configure_logging("error");
    } else {
        configure_logging(config.log_level);
    }

    return config;
}

} // namespace safeproc::cli
