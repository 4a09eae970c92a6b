#include "safeproc/git.hpp"
#include "safeproc/platform.hpp"
#include "safeproc/validator.hpp"

#include <spdlog/spdlog.h>

namespace safeproc {

namespace {

Error precondition_error(const std::string& message, const std::string& value) {
    ErrorDetail detail;
    detail.value = truncate_for_message(value);
    detail.path = value;
    return Error(ErrorCode::VALIDATION_ERROR, message, std::move(detail));
}

} // namespace

Result<std::vector<std::string>> GitOperations::build_clone_argv(const std::string& url,
                                                                 const std::string& target_dir,
                                                                 const CloneOptions& options) const {
    using R = Result<std::vector<std::string>>;

    auto validated_url = Validator::validate_url(url, config_.allowed_schemes);
    if (validated_url.isErr()) {
        return R::err(validated_url.error());
    }

    std::optional<std::string> branch;
    if (options.branch) {
        auto validated_branch = Validator::validate_branch_name(*options.branch);
        if (validated_branch.isErr()) {
            return R::err(validated_branch.error());
        }
        branch = validated_branch.value().value();
    }

    if (target_dir.empty() || target_dir.find('\0') != std::string::npos) {
        return R::err(precondition_error("Invalid target directory", target_dir));
    }

    int depth = options.depth.value_or(config_.clone_depth);

    std::vector<std::string> argv = {config_.program, "clone"};
    if (branch) {
        argv.push_back("--branch");
        argv.push_back(*branch);
    }
    if (depth > 0) {
        argv.push_back("--depth");
        argv.push_back(std::to_string(depth));
    }
    argv.push_back(validated_url.value().value());
    // Absolute, so a target such as "-x" can never be read as an option
    argv.push_back(make_absolute(target_dir));

    return R::ok(std::move(argv));
}

Result<void> GitOperations::clone(const std::string& url,
                                  const std::string& target_dir,
                                  const CloneOptions& options) const {
    auto argv = build_clone_argv(url, target_dir, options);
    if (argv.isErr()) {
        return Result<void>::err(argv.error());
    }

    const std::string absolute_target = argv.value().back();

    // No silent overwrite
    if (path_exists(absolute_target)) {
        return Result<void>::err(
            precondition_error("Target directory already exists: " + absolute_target, absolute_target));
    }

    std::string parent = get_parent_directory(absolute_target);
    if (!parent.empty() && !create_directories(parent)) {
        ErrorDetail detail;
        detail.path = parent;
        return Result<void>::err(
            Error(ErrorCode::IO_ERROR, "Failed to create parent directory: " + parent, std::move(detail)));
    }

    spdlog::info("Cloning repository: {}", argv.value()[argv.value().size() - 2]);

    CommandSpec spec(std::move(argv.value()));
    spec.timeout = options.timeout.value_or(config_.clone_timeout);

    auto result = executor_.execute(spec);
    if (result.isErr()) {
        return Result<void>::err(result.error());
    }

    spdlog::info("Successfully cloned to {}", absolute_target);
    return Result<void>::ok();
}

Result<void> GitOperations::checkout(const std::string& branch,
                                     const std::string& repo_dir,
                                     bool create) const {
    auto validated = Validator::validate_branch_name(branch);
    if (validated.isErr()) {
        return Result<void>::err(validated.error());
    }

    if (!is_directory(repo_dir)) {
        return Result<void>::err(precondition_error("Not a directory: " + repo_dir, repo_dir));
    }

    std::vector<std::string> argv = {config_.program, "checkout"};
    if (create) {
        argv.push_back("-b");
    }
    argv.push_back(validated.value().value());

    spdlog::info("Checking out branch: {}", validated.value().value());

    CommandSpec spec(std::move(argv));
    spec.cwd = repo_dir;
    spec.timeout = config_.checkout_timeout;

    auto result = executor_.execute(spec);
    if (result.isErr()) {
        return Result<void>::err(result.error());
    }

    spdlog::info("Checked out branch: {}", validated.value().value());
    return Result<void>::ok();
}

} // namespace safeproc
