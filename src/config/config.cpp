#include "safeproc/config.hpp"
#include "safeproc/command.hpp"
#include "safeproc/validator.hpp"

#include <limits>
#include <optional>

#include <nlohmann/json.hpp>

namespace safeproc {

namespace {

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key,
                                      const std::string& section,
                                      std::vector<std::string>& warnings) {
    if (!j.contains(key)) return std::nullopt;
    if (j[key].is_string()) {
        return j[key].get<std::string>();
    }
    warnings.push_back("invalid_configuration:" + section + "." + key + ":expected_string");
    return std::nullopt;
}

// Timeouts are written in seconds in the document
void read_timeout(const nlohmann::json& j, const std::string& key, const std::string& section,
                  std::chrono::milliseconds& out, std::vector<std::string>& warnings) {
    if (!j.contains(key)) return;
    const auto& v = j[key];
    if (!v.is_number() || v.get<double>() <= 0) {
        warnings.push_back("invalid_configuration:" + section + "." + key + ":expected_positive_seconds");
        return;
    }
    const double max_seconds = static_cast<double>(kMaxCommandTimeout.count()) / 1000.0;
    if (v.get<double>() > max_seconds) {
        warnings.push_back("invalid_configuration:" + section + "." + key + ":out_of_range");
        return;
    }
    out = std::chrono::milliseconds(static_cast<long long>(v.get<double>() * 1000.0));
}

void read_int(const nlohmann::json& j, const std::string& key, const std::string& section,
              int min_value, int max_value, int& out, std::vector<std::string>& warnings) {
    if (!j.contains(key)) return;
    const auto& v = j[key];
    // Unsigned values above LLONG_MAX would wrap in get<long long>()
    if (!v.is_number_integer() ||
        (v.is_number_unsigned() && v.get<unsigned long long>() > static_cast<unsigned long long>(max_value)) ||
        v.get<long long>() < min_value || v.get<long long>() > max_value) {
        warnings.push_back("invalid_configuration:" + section + "." + key + ":out_of_range");
        return;
    }
    out = v.get<int>();
}

// Program names end up as argv[0]; hold them to identifier rules plus '.'
// for names like "python3.11". Absolute paths are allowed.
void read_program(const nlohmann::json& j, const std::string& key, const std::string& section,
                  std::string& out, std::vector<std::string>& warnings) {
    auto value = get_string(j, key, section, warnings);
    if (!value) return;

    std::string candidate = *value;
    std::string check = candidate;
    for (auto& c : check) {
        if (c == '.') c = '_';
    }
    IdentifierRules rules;
    rules.name = section + "." + key;
    rules.max_length = 255;
    rules.allow_slash = true;
    auto validated = Validator::validate_identifier(check, rules);
    if (validated.isErr() || candidate.front() == '-' ||
        candidate.find("..") != std::string::npos) {
        warnings.push_back("invalid_configuration:" + section + "." + key + ":invalid_program");
        return;
    }
    out = candidate;
}

void read_extension(const nlohmann::json& j, const std::string& key, const std::string& section,
                    std::string& out, std::vector<std::string>& warnings) {
    auto value = get_string(j, key, section, warnings);
    if (!value) return;
    if (value->empty() || value->find('/') != std::string::npos) {
        warnings.push_back("invalid_configuration:" + section + "." + key + ":invalid_extension");
        return;
    }
    out = *value;
}

} // namespace

Config default_config() {
    return Config{};
}

ConfigParseResult parse_config(const std::string& json_str, const std::string& source_path) {
    ConfigParseResult result;
    result.config = default_config();
    result.config.source_path = source_path;
    auto& warnings = result.warnings;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // $schema (REQUIRED)
        if (j.contains("$schema") && j["$schema"].is_string()) {
            if (j["$schema"].get<std::string>() != kConfigSchema) {
                result.error = std::string("$schema mismatch: expected ") + kConfigSchema;
                return result;
            }
        } else {
            result.error = "$schema missing";
            return result;
        }

        if (auto level = get_string(j, "log_level", "root", warnings)) {
            result.config.log_level = *level;
        }

        if (j.contains("executor") && j["executor"].is_object()) {
            const auto& ex = j["executor"];
            read_timeout(ex, "default_timeout", "executor", result.config.executor.default_timeout, warnings);
        }

        if (j.contains("git") && j["git"].is_object()) {
            const auto& git = j["git"];
            auto& cfg = result.config.git;
            read_program(git, "program", "git", cfg.program, warnings);
            read_timeout(git, "clone_timeout", "git", cfg.clone_timeout, warnings);
            read_timeout(git, "checkout_timeout", "git", cfg.checkout_timeout, warnings);
            read_int(git, "clone_depth", "git", 0, std::numeric_limits<int>::max(), cfg.clone_depth, warnings);

            if (git.contains("allowed_schemes")) {
                if (git["allowed_schemes"].is_array()) {
                    std::vector<std::string> schemes;
                    for (const auto& elem : git["allowed_schemes"]) {
                        if (elem.is_string()) {
                            schemes.push_back(elem.get<std::string>());
                        }
                    }
                    if (!schemes.empty()) {
                        cfg.allowed_schemes = std::move(schemes);
                    }
                } else {
                    warnings.push_back("invalid_configuration:git.allowed_schemes:expected_array");
                }
            }
        }

        if (j.contains("latex") && j["latex"].is_object()) {
            const auto& latex = j["latex"];
            auto& cfg = result.config.latex;
            read_program(latex, "program", "latex", cfg.program, warnings);
            read_program(latex, "bibliography_program", "latex", cfg.bibliography_program, warnings);
            read_extension(latex, "source_extension", "latex", cfg.source_extension, warnings);
            read_extension(latex, "output_extension", "latex", cfg.output_extension, warnings);
            read_extension(latex, "bibliography_extension", "latex", cfg.bibliography_extension, warnings);
            read_int(latex, "passes", "latex", 1, kMaxPasses, cfg.passes, warnings);
            read_timeout(latex, "pass_timeout", "latex", cfg.pass_timeout, warnings);
            read_timeout(latex, "bibliography_timeout", "latex", cfg.bibliography_timeout, warnings);
        }

        if (j.contains("script") && j["script"].is_object()) {
            const auto& script = j["script"];
            auto& cfg = result.config.script;
            read_program(script, "interpreter", "script", cfg.interpreter, warnings);
            read_extension(script, "extension", "script", cfg.extension, warnings);
            if (auto root = get_string(script, "script_root", "script", warnings)) {
                cfg.script_root = *root;
            }
            read_timeout(script, "timeout", "script", cfg.timeout, warnings);
        }

        result.ok = true;
    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("JSON parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }

    return result;
}

} // namespace safeproc
