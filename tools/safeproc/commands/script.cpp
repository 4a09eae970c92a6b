/**
 * safeproc CLI - run-script command
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace safeproc::cli::commands {

namespace {

struct RunScriptOptions {
    std::string script;
    std::vector<std::string> args;
    std::string cwd;
    double timeout = 0;  // seconds
};

int cmd_run_script(const GlobalOptions& opts, const RunScriptOptions& script_opts) {
    auto config = load_config(opts);
    if (!config) return 1;

    ScriptRunOptions options;
    options.cwd = script_opts.cwd;
    if (script_opts.timeout > 0) options.timeout = seconds_to_ms(script_opts.timeout);

    CommandExecutor executor;
    ScriptRunner runner(executor, config->script);

    auto result = runner.run(script_opts.script, script_opts.args, options);
    if (result.isErr()) {
        print_error(result.error(), opts.json);
        return 1;
    }

    const auto& run = result.value();
    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["exit_code"] = run.exit_code;
        j["stdout"] = run.stdout_text;
        j["stderr"] = run.stderr_text;
        output_json(j);
    } else {
        std::cout << run.stdout_text << std::flush;
        std::cerr << run.stderr_text << std::flush;
    }
    return 0;
}

} // anonymous namespace

void setup_run_script(CLI::App* app, GlobalOptions& opts) {
    static RunScriptOptions script_opts;

    app->add_option("script", script_opts.script, "Script file")->required();
    app->add_option("args", script_opts.args, "Arguments passed to the script");
    app->add_option("--cwd", script_opts.cwd, "Working directory");
    app->add_option("--timeout", script_opts.timeout, "Timeout in seconds")
        ->check(CLI::Range(0.0, kMaxTimeoutSeconds));

    app->callback([&opts]() {
        std::exit(cmd_run_script(opts, script_opts));
    });
}

} // namespace safeproc::cli::commands
