/**
 * safeproc CLI - compile command
 *
 * Multi-pass LaTeX compilation of a document inside a project directory.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace safeproc::cli::commands {

namespace {

struct CompileCommandOptions {
    std::string tex_file;
    std::string dir = ".";
    int runs = 0;        // 0: config default
    double timeout = 0;  // seconds per pass
    bool sanitize = false;
};

int cmd_compile(const GlobalOptions& opts, const CompileCommandOptions& compile_opts) {
    auto config = load_config(opts);
    if (!config) return 1;

    CompileOptions options;
    if (compile_opts.runs > 0) options.passes = compile_opts.runs;
    if (compile_opts.timeout > 0) options.pass_timeout = seconds_to_ms(compile_opts.timeout);
    options.sanitize_source = compile_opts.sanitize;

    CommandExecutor executor;
    DirectoryLocks locks;
    LatexCompiler compiler(executor, config->latex, &locks);

    CompilationState state;
    auto result = compiler.compile(compile_opts.tex_file, compile_opts.dir, options, state);
    if (result.isErr()) {
        print_error(result.error(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["output"] = result.value();
        j["phase"] = compile_phase_to_string(state.phase);
        j["passes"] = state.pass;
        j["bibliography_ran"] = state.bibliography_ran;
        if (state.bibliography_ran) {
            j["bibliography_ok"] = state.bibliography_ok;
        }
        output_json(j);
    } else {
        print_success(result.value(), opts);
    }
    return 0;
}

} // anonymous namespace

void setup_compile(CLI::App* app, GlobalOptions& opts) {
    static CompileCommandOptions compile_opts;

    app->add_option("file", compile_opts.tex_file, "Main source file name (not a path)")->required();
    app->add_option("--dir", compile_opts.dir, "Project directory");
    app->add_option("--runs", compile_opts.runs, "Number of passes")
        ->check(CLI::Range(0, kMaxPasses));
    app->add_option("--timeout", compile_opts.timeout, "Per-pass timeout in seconds")
        ->check(CLI::Range(0.0, kMaxTimeoutSeconds));
    app->add_flag("--sanitize", compile_opts.sanitize, "Reject dangerous commands in the source first");

    app->callback([&opts]() {
        std::exit(cmd_compile(opts, compile_opts));
    });
}

} // namespace safeproc::cli::commands
