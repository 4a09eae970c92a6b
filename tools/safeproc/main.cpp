/**
 * safeproc CLI - Entry Point
 *
 * Validate untrusted values and run mediated tools from the command line.
 */

#include <CLI/CLI.hpp>
#include <spdlog/sinks/stderr_color_sinks.h>
#include "common.hpp"

// Forward declarations for commands
namespace safeproc::cli::commands {
    void setup_validate(CLI::App* app, GlobalOptions& opts);
    void setup_exec(CLI::App* app, GlobalOptions& opts);
    void setup_clone(CLI::App* app, GlobalOptions& opts);
    void setup_checkout(CLI::App* app, GlobalOptions& opts);
    void setup_compile(CLI::App* app, GlobalOptions& opts);
    void setup_run_script(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace safeproc::cli;

    // stdout belongs to command output and --json documents
    spdlog::set_default_logger(spdlog::stderr_color_mt("safeproc"));

    CLI::App app{"safeproc - validated, shell-free process execution"};
    app.set_version_flag("-V,--version", SAFEPROC_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--config", opts.config, "Configuration document (JSON)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    // Commands
    auto* validate_cmd = app.add_subcommand("validate", "Check a value against a validation rule");
    commands::setup_validate(validate_cmd, opts);

    auto* exec_cmd = app.add_subcommand("exec", "Run an argument vector without a shell");
    commands::setup_exec(exec_cmd, opts);

    auto* clone_cmd = app.add_subcommand("clone", "Clone a repository");
    commands::setup_clone(clone_cmd, opts);

    auto* checkout_cmd = app.add_subcommand("checkout", "Check out a branch");
    commands::setup_checkout(checkout_cmd, opts);

    auto* compile_cmd = app.add_subcommand("compile", "Compile a LaTeX document to PDF");
    commands::setup_compile(compile_cmd, opts);

    auto* script_cmd = app.add_subcommand("run-script", "Run a helper script");
    commands::setup_run_script(script_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
