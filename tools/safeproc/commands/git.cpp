/**
 * safeproc CLI - clone and checkout commands
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace safeproc::cli::commands {

namespace {

struct CloneCommandOptions {
    std::string url;
    std::string target;
    std::string branch;
    int depth = -1;      // negative: config default
    double timeout = 0;  // seconds
};

struct CheckoutOptions {
    std::string branch;
    std::string repo = ".";
    bool create = false;
};

int cmd_clone(const GlobalOptions& opts, const CloneCommandOptions& clone_opts) {
    auto config = load_config(opts);
    if (!config) return 1;

    CloneOptions options;
    if (!clone_opts.branch.empty()) options.branch = clone_opts.branch;
    if (clone_opts.depth >= 0) options.depth = clone_opts.depth;
    if (clone_opts.timeout > 0) options.timeout = seconds_to_ms(clone_opts.timeout);

    CommandExecutor executor;
    GitOperations git(executor, config->git);

    auto result = git.clone(clone_opts.url, clone_opts.target, options);
    if (result.isErr()) {
        print_error(result.error(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["url"] = clone_opts.url;
        j["target"] = make_absolute(clone_opts.target);
        output_json(j);
    } else {
        print_success("Cloned " + clone_opts.url + " into " + make_absolute(clone_opts.target), opts);
    }
    return 0;
}

int cmd_checkout(const GlobalOptions& opts, const CheckoutOptions& checkout_opts) {
    auto config = load_config(opts);
    if (!config) return 1;

    CommandExecutor executor;
    GitOperations git(executor, config->git);

    auto result = git.checkout(checkout_opts.branch, checkout_opts.repo, checkout_opts.create);
    if (result.isErr()) {
        print_error(result.error(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["branch"] = checkout_opts.branch;
        j["repo"] = make_absolute(checkout_opts.repo);
        j["created"] = checkout_opts.create;
        output_json(j);
    } else {
        print_success((checkout_opts.create ? "Created and checked out " : "Checked out ") +
                          checkout_opts.branch, opts);
    }
    return 0;
}

} // anonymous namespace

void setup_clone(CLI::App* app, GlobalOptions& opts) {
    static CloneCommandOptions clone_opts;

    app->add_option("url", clone_opts.url, "Repository URL")->required();
    app->add_option("target", clone_opts.target, "Directory to clone into (must not exist)")->required();
    app->add_option("--branch", clone_opts.branch, "Branch to clone");
    app->add_option("--depth", clone_opts.depth, "History depth (0 for full history)");
    app->add_option("--timeout", clone_opts.timeout, "Timeout in seconds")
        ->check(CLI::Range(0.0, kMaxTimeoutSeconds));

    app->callback([&opts]() {
        std::exit(cmd_clone(opts, clone_opts));
    });
}

void setup_checkout(CLI::App* app, GlobalOptions& opts) {
    static CheckoutOptions checkout_opts;

    app->add_option("branch", checkout_opts.branch, "Branch name")->required();
    app->add_option("--repo", checkout_opts.repo, "Repository directory");
    app->add_flag("-b,--create", checkout_opts.create, "Create the branch");

    app->callback([&opts]() {
        std::exit(cmd_checkout(opts, checkout_opts));
    });
}

} // namespace safeproc::cli::commands
