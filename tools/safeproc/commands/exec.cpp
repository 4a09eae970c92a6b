/**
 * safeproc CLI - exec command
 *
 * Run an argument vector directly, with a timeout and no shell.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace safeproc::cli::commands {

namespace {

struct ExecOptions {
    std::vector<std::string> argv;
    std::string cwd;
    double timeout = 0;  // seconds; 0 uses executor.default_timeout
    bool no_check = false;
};

void emit_result(const GlobalOptions& opts, const ExecutionResult& result) {
    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["exit_code"] = result.exit_code;
        j["stdout"] = result.stdout_text;
        j["stderr"] = result.stderr_text;
        j["elapsed"] = result.elapsed.count();
        output_json(j);
        return;
    }
    std::cout << result.stdout_text << std::flush;
    std::cerr << result.stderr_text << std::flush;
}

int cmd_exec(const GlobalOptions& opts, const ExecOptions& exec_opts) {
    auto config = load_config(opts);
    if (!config) return 1;

    CommandSpec spec(exec_opts.argv);
    spec.cwd = exec_opts.cwd;
    spec.timeout = exec_opts.timeout > 0 ? seconds_to_ms(exec_opts.timeout)
                                         : config->executor.default_timeout;
    spec.check_exit_code = !exec_opts.no_check;

    CommandExecutor executor;
    auto result = executor.execute(spec);
    if (result.isErr()) {
        print_error(result.error(), opts.json);
        return 1;
    }

    emit_result(opts, result.value());
    return 0;
}

} // anonymous namespace

void setup_exec(CLI::App* app, GlobalOptions& opts) {
    static ExecOptions exec_opts;

    app->add_option("command", exec_opts.argv, "Program and arguments (after --)")->required();
    app->add_option("--cwd", exec_opts.cwd, "Working directory");
    app->add_option("--timeout", exec_opts.timeout, "Timeout in seconds")
        ->check(CLI::Range(0.0, kMaxTimeoutSeconds));
    app->add_flag("--no-check", exec_opts.no_check, "Do not treat a non-zero exit as an error");

    app->callback([&opts]() {
        std::exit(cmd_exec(opts, exec_opts));
    });
}

} // namespace safeproc::cli::commands
