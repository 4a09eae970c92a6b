/**
 * safeproc CLI - validate command
 *
 * Check one untrusted value against a validation rule.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>
#include <cerrno>
#include <climits>

namespace safeproc::cli::commands {

namespace {

struct ValidateOptions {
    std::string kind;
    std::string value;
    std::string base;
    bool must_exist = false;
    std::vector<std::string> schemes;
    std::size_t max_length = kDefaultIdentifierMaxLength;
    bool allow_slash = false;
};

std::optional<int> parse_int(const std::string& text) {
    if (text.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    long parsed = std::strtol(text.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || parsed < INT_MIN || parsed > INT_MAX) {
        return std::nullopt;
    }
    return static_cast<int>(parsed);
}

// Runs the rule; on success fills @p out with the fields worth reporting.
Result<void> run_rule(const Config& config, const ValidateOptions& v, nlohmann::json& out) {
    using R = Result<void>;
    const std::string& kind = v.kind;

    if (kind == "identifier") {
        IdentifierRules rules;
        rules.max_length = v.max_length;
        rules.allow_slash = v.allow_slash;
        auto r = Validator::validate_identifier(v.value, rules);
        if (r.isErr()) return R::err(r.error());
        out["value"] = r.value().value();
    } else if (kind == "path") {
        if (v.base.empty()) {
            return R::err(Error(ErrorCode::VALIDATION_ERROR, "--base is required for path"));
        }
        auto r = Validator::validate_path(v.value, v.base, v.must_exist);
        if (r.isErr()) return R::err(r.error());
        out["value"] = r.value().value();
        out["base"] = r.value().base_dir();
        out["exists"] = r.value().verified_exists();
    } else if (kind == "branch") {
        auto r = Validator::validate_branch_name(v.value);
        if (r.isErr()) return R::err(r.error());
        out["value"] = r.value().value();
    } else if (kind == "url") {
        auto schemes = v.schemes.empty() ? config.git.allowed_schemes : v.schemes;
        auto r = Validator::validate_url(v.value, schemes);
        if (r.isErr()) return R::err(r.error());
        out["value"] = r.value().value();
        out["scheme"] = r.value().scheme();
    } else if (kind == "model") {
        auto r = Validator::validate_model_name(v.value);
        if (r.isErr()) return R::err(r.error());
        out["value"] = r.value().value();
    } else if (kind == "latex") {
        auto content = read_file(v.value);
        if (!content) {
            ErrorDetail detail;
            detail.path = v.value;
            return R::err(Error(ErrorCode::IO_ERROR, "Failed to read " + v.value, std::move(detail)));
        }
        auto r = Validator::sanitize_latex_content(*content);
        if (r.isErr()) return R::err(r.error().withContext(v.value));
        out["value"] = v.value;
    } else if (kind == "port") {
        auto port = parse_int(v.value);
        if (!port) {
            ErrorDetail detail;
            detail.value = truncate_for_message(v.value);
            return R::err(Error(ErrorCode::VALIDATION_ERROR, "port must be an integer",
                                std::move(detail)));
        }
        auto r = Validator::validate_port(*port);
        if (r.isErr()) return R::err(r.error());
        out["value"] = r.value();
    } else {
        return R::err(Error(ErrorCode::VALIDATION_ERROR, "Unknown kind: " + kind));
    }

    return R::ok();
}

int cmd_validate(const GlobalOptions& opts, const ValidateOptions& validate_opts) {
    auto config = load_config(opts);
    if (!config) return 1;

    nlohmann::json j;
    auto result = run_rule(*config, validate_opts, j);
    if (result.isErr()) {
        print_error(result.error(), opts.json);
        return 1;
    }

    if (opts.json) {
        j["ok"] = true;
        j["kind"] = validate_opts.kind;
        output_json(j);
    } else if (!opts.quiet) {
        std::cout << "valid " << validate_opts.kind << ": "
                  << (j["value"].is_string() ? j["value"].get<std::string>() : j["value"].dump())
                  << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_validate(CLI::App* app, GlobalOptions& opts) {
    static ValidateOptions validate_opts;

    app->add_option("kind", validate_opts.kind, "Rule to apply")
        ->required()
        ->check(CLI::IsMember({"identifier", "path", "branch", "url", "model", "latex", "port"}));
    app->add_option("value", validate_opts.value, "Value to check (a file for latex)")->required();
    app->add_option("--base", validate_opts.base, "Base directory for path");
    app->add_flag("--must-exist", validate_opts.must_exist, "Path must exist");
    app->add_option("--scheme", validate_opts.schemes, "Allowed URL scheme (repeatable)");
    app->add_option("--max-length", validate_opts.max_length, "Identifier length limit");
    app->add_flag("--allow-slash", validate_opts.allow_slash, "Identifier may contain '/'");

    app->callback([&opts]() {
        std::exit(cmd_validate(opts, validate_opts));
    });
}

} // namespace safeproc::cli::commands
