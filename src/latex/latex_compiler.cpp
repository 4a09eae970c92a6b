#include "safeproc/latex.hpp"
#include "safeproc/platform.hpp"
#include "safeproc/validator.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>

namespace safeproc {

namespace fs = std::filesystem;

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

Error precondition_error(const std::string& message, const std::string& value) {
    ErrorDetail detail;
    detail.value = truncate_for_message(value);
    return Error(ErrorCode::VALIDATION_ERROR, message, std::move(detail));
}

} // namespace

std::vector<std::string> LatexCompiler::pass_argv(const std::string& tex_file) const {
    return {
        config_.program,
        "-interaction=nonstopmode",
        "-no-shell-escape",
        "-halt-on-error",
        tex_file,
    };
}

Result<void> LatexCompiler::check_preconditions(const std::string& tex_file,
                                                const std::string& project_dir,
                                                const CompileOptions& options) const {
    using R = Result<void>;

    if (tex_file.size() <= config_.source_extension.size() ||
        !ends_with(tex_file, config_.source_extension)) {
        return R::err(precondition_error(
            "File must end with " + config_.source_extension + ": " + tex_file, tex_file));
    }

    // The filename must not itself be a traversal vector
    if (tex_file.find('/') != std::string::npos || tex_file.find('\\') != std::string::npos) {
        return R::err(precondition_error(
            "Source must be a filename only, not a path: " + tex_file, tex_file));
    }

    if (tex_file.find('\0') != std::string::npos) {
        return R::err(precondition_error("Null byte detected in source filename", tex_file));
    }

    // '-' reads as an option, '&' as a format name
    if (tex_file.front() == '-' || tex_file.front() == '&') {
        return R::err(precondition_error(
            "Source filename cannot start with '-' or '&': " + tex_file, tex_file));
    }

    if (!is_directory(project_dir)) {
        return R::err(precondition_error("Project directory not found: " + project_dir, project_dir));
    }

    std::string source_path = (fs::path(project_dir) / tex_file).string();
    if (!is_regular_file(source_path)) {
        return R::err(precondition_error("Source file not found: " + source_path, tex_file));
    }

    if (options.sanitize_source) {
        auto content = read_file(source_path);
        if (!content) {
            ErrorDetail detail;
            detail.path = source_path;
            return R::err(Error(ErrorCode::IO_ERROR, "Failed to read " + source_path, std::move(detail)));
        }
        auto sanitized = Validator::sanitize_latex_content(*content);
        if (sanitized.isErr()) {
            return R::err(sanitized.error().withContext(tex_file));
        }
    }

    return R::ok();
}

bool LatexCompiler::has_bibliography(const std::string& project_dir) const {
    for (const auto& name : list_directory(project_dir)) {
        if (name.size() > config_.bibliography_extension.size() &&
            ends_with(name, config_.bibliography_extension) &&
            is_regular_file((fs::path(project_dir) / name).string())) {
            return true;
        }
    }
    return false;
}

bool LatexCompiler::run_bibliography(const std::string& base_name,
                                     const std::string& project_dir) const {
    CommandSpec spec({config_.bibliography_program, base_name});
    spec.cwd = project_dir;
    spec.timeout = config_.bibliography_timeout;
    spec.check_exit_code = false;

    // Best effort: later passes can still finish with a stale bibliography.
    auto result = executor_.execute(spec);
    if (result.isErr()) {
        spdlog::warn("  {} failed (continuing anyway): {}", config_.bibliography_program,
                     result.error().message());
        return false;
    }
    if (result.value().exit_code != 0) {
        spdlog::warn("  {} exited with code {} (continuing anyway)", config_.bibliography_program,
                     result.value().exit_code);
        return false;
    }
    return true;
}

Result<std::string> LatexCompiler::compile(const std::string& tex_file,
                                           const std::string& project_dir,
                                           const CompileOptions& options) const {
    CompilationState state;
    return compile(tex_file, project_dir, options, state);
}

Result<std::string> LatexCompiler::compile(const std::string& tex_file,
                                           const std::string& project_dir,
                                           const CompileOptions& options,
                                           CompilationState& state) const {
    using R = Result<std::string>;

    state = CompilationState{};
    state.max_passes = options.passes.value_or(config_.passes);

    if (state.max_passes < 1) {
        state.phase = CompilePhase::Failed;
        return R::err(precondition_error("Pass count must be at least 1",
                                         std::to_string(state.max_passes)));
    }

    auto ready = check_preconditions(tex_file, project_dir, options);
    if (ready.isErr()) {
        state.phase = CompilePhase::Failed;
        return R::err(ready.error());
    }

    DirectoryLocks::Lock project_lock;
    if (locks_) {
        project_lock = locks_->acquire(project_dir);
    }

    const std::string base_name =
        tex_file.substr(0, tex_file.size() - config_.source_extension.size());
    const auto timeout = options.pass_timeout.value_or(config_.pass_timeout);

    spdlog::info("Compiling LaTeX: {} ({} runs)", tex_file, state.max_passes);

    for (int pass = 1; pass <= state.max_passes; ++pass) {
        state.phase = CompilePhase::Pass;
        state.pass = pass;
        spdlog::info("  Run {}/{}...", pass, state.max_passes);

        CommandSpec spec(pass_argv(tex_file));
        spec.cwd = project_dir;
        spec.timeout = timeout;
        spec.check_exit_code = false;  // inspected below so stdout can be surfaced

        auto result = executor_.execute(spec);
        if (result.isErr()) {
            state.phase = CompilePhase::Failed;
            return R::err(result.error().withContext(
                config_.program + " run " + std::to_string(pass)));
        }

        const auto& run = result.value();
        if (run.exit_code != 0) {
            state.phase = CompilePhase::Failed;
            spdlog::error("{} failed on run {}", config_.program, pass);
            spdlog::error("Output:\n{}", run.stdout_text);

            ErrorDetail detail;
            detail.exit_code = run.exit_code;
            detail.stdout_text = run.stdout_text;
            detail.stderr_text = run.stderr_text;
            detail.command = quote_argv(spec.argv);
            detail.cwd = project_dir;
            return R::err(Error(ErrorCode::COMMAND_FAILED,
                                config_.program + " failed on run " + std::to_string(pass) +
                                    " (exit code " + std::to_string(run.exit_code) + ")",
                                std::move(detail)));
        }

        if (pass == 1 && has_bibliography(project_dir)) {
            state.phase = CompilePhase::BibliographyPass;
            spdlog::info("  Running {}...", config_.bibliography_program);
            state.bibliography_ok = run_bibliography(base_name, project_dir);
            state.bibliography_ran = true;
        }
    }

    std::string output_path =
        (fs::path(project_dir) / (base_name + "." + config_.output_extension)).string();
    if (!is_regular_file(output_path)) {
        state.phase = CompilePhase::Failed;
        ErrorDetail detail;
        detail.path = output_path;
        return R::err(Error(ErrorCode::PDF_NOT_PRODUCED,
                            "Output file not created: " + output_path +
                                " (check the " + config_.program + " log for errors)",
                            std::move(detail)));
    }

    state.phase = CompilePhase::Done;
    state.output_path = output_path;
    spdlog::info("LaTeX compilation successful: {}", output_path);
    return R::ok(output_path);
}

} // namespace safeproc
