#pragma once

#include "safeproc/command.hpp"
#include "safeproc/config.hpp"
#include "safeproc/directory_locks.hpp"
#include "safeproc/result.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace safeproc {

// ============================================================================
// Compilation State
// ============================================================================
//
// Init -> Pass(1) -> [BibliographyPass] -> Pass(2) -> ... -> Done | Failed

enum class CompilePhase {
    Init,
    Pass,
    BibliographyPass,
    Done,
    Failed,
};

inline const char* compile_phase_to_string(CompilePhase phase) {
    switch (phase) {
        case CompilePhase::Init: return "init";
        case CompilePhase::Pass: return "pass";
        case CompilePhase::BibliographyPass: return "bibliography_pass";
        case CompilePhase::Done: return "done";
        case CompilePhase::Failed: return "failed";
        default: return "unknown";
    }
}

// Lives for one compile() call only.
struct CompilationState {
    CompilePhase phase = CompilePhase::Init;
    int pass = 0;                    // 1-based index of the last pass started
    int max_passes = 0;
    bool bibliography_ran = false;
    bool bibliography_ok = false;    // tool started and exited 0
    std::string output_path;         // set once Done
};

struct CompileOptions {
    std::optional<int> passes;                          // unset: LatexConfig::passes
    std::optional<std::chrono::milliseconds> pass_timeout;
    bool sanitize_source = false;                       // scan the main file before pass 1
};

// ============================================================================
// LaTeX Compiler
// ============================================================================

/**
 * @brief Multi-pass document compilation with conditional bibliography run
 *
 * Each pass runs the typesetting tool non-interactively with shell escape
 * disabled and halt-on-error. A failing pass ends the compile at once.
 * After pass 1, if any bibliography database sits in the project
 * directory, the bibliography tool runs once; its failure is logged and
 * ignored.
 *
 * Two compiles of the same project directory must not overlap. Construct
 * with a shared DirectoryLocks to have compile() serialize them, or hold
 * the lock yourself.
 */
class LatexCompiler {
public:
    LatexCompiler(const CommandExecutor& executor, const LatexConfig& config,
                  DirectoryLocks* locks = nullptr)
        : executor_(executor), config_(config), locks_(locks) {}

    /// @return path of the produced artifact, project_dir/<base>.<output_extension>
    Result<std::string> compile(const std::string& tex_file,
                                const std::string& project_dir,
                                const CompileOptions& options = {}) const;

    /// Same, exposing the final state machine position to the caller.
    Result<std::string> compile(const std::string& tex_file,
                                const std::string& project_dir,
                                const CompileOptions& options,
                                CompilationState& state) const;

    /// Argument vector of one typesetting pass.
    std::vector<std::string> pass_argv(const std::string& tex_file) const;

private:
    Result<void> check_preconditions(const std::string& tex_file,
                                     const std::string& project_dir,
                                     const CompileOptions& options) const;
    bool has_bibliography(const std::string& project_dir) const;
    bool run_bibliography(const std::string& base_name, const std::string& project_dir) const;

    const CommandExecutor& executor_;
    const LatexConfig& config_;
    DirectoryLocks* locks_;
};

} // namespace safeproc
