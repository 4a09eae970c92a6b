#include "safeproc/script.hpp"
#include "safeproc/platform.hpp"
#include "safeproc/validator.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>

namespace safeproc {

namespace {

Error script_error(const std::string& message, const std::string& value) {
    ErrorDetail detail;
    detail.value = truncate_for_message(value);
    detail.path = value;
    return Error(ErrorCode::VALIDATION_ERROR, message, std::move(detail));
}

} // namespace

Result<std::string> ScriptRunner::resolve_script(const std::string& script_path) const {
    using R = Result<std::string>;

    std::string resolved;
    if (!config_.script_root.empty()) {
        auto validated = Validator::validate_path(script_path, config_.script_root, true, "script");
        if (validated.isErr()) {
            return R::err(validated.error());
        }
        resolved = validated.value().value();
    } else {
        if (script_path.empty() || script_path.find('\0') != std::string::npos) {
            return R::err(script_error("Invalid script path", script_path));
        }
        if (!path_exists(script_path)) {
            return R::err(script_error("Script not found: " + script_path, script_path));
        }
        // Absolute, so the interpreter never sees a leading '-'
        resolved = make_absolute(script_path);
    }

    if (!is_regular_file(resolved)) {
        return R::err(script_error("Script is not a regular file: " + resolved, script_path));
    }

    if (std::filesystem::path(resolved).extension().string() != config_.extension) {
        return R::err(script_error("File must be " + config_.extension + ": " + resolved, script_path));
    }

    return R::ok(resolved);
}

Result<ExecutionResult> ScriptRunner::run(const std::string& script_path,
                                          const std::vector<std::string>& args,
                                          const ScriptRunOptions& options) const {
    auto script = resolve_script(script_path);
    if (script.isErr()) {
        return Result<ExecutionResult>::err(script.error());
    }

    std::vector<std::string> argv = {config_.interpreter, script.value()};
    argv.insert(argv.end(), args.begin(), args.end());

    spdlog::info("Running script: {}", script.value());

    CommandSpec spec(std::move(argv));
    spec.cwd = options.cwd;
    spec.timeout = options.timeout.value_or(config_.timeout);
    spec.environment = options.environment;

    return executor_.execute(spec);
}

} // namespace safeproc
