#pragma once

#include "safeproc/command.hpp"
#include "safeproc/config.hpp"
#include "safeproc/result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace safeproc {

struct CloneOptions {
    std::optional<std::string> branch;
    std::optional<int> depth;                        // unset: GitConfig::clone_depth; 0 disables
    std::optional<std::chrono::milliseconds> timeout; // unset: GitConfig::clone_timeout
};

/**
 * @brief Clone and checkout workflows over the git CLI
 *
 * Every string is validated before an argument vector is built. Errors
 * from validation or execution propagate unchanged; nothing is retried.
 */
class GitOperations {
public:
    GitOperations(const CommandExecutor& executor, const GitConfig& config)
        : executor_(executor), config_(config) {}

    /// git clone [--branch B] [--depth N] <url> <target_dir>
    /// Fails before spawning anything if target_dir already exists.
    Result<void> clone(const std::string& url,
                       const std::string& target_dir,
                       const CloneOptions& options = {}) const;

    /// git checkout [-b] <branch>, run inside repo_dir
    Result<void> checkout(const std::string& branch,
                          const std::string& repo_dir,
                          bool create = false) const;

    /// Argument vector clone() would execute; validation included.
    Result<std::vector<std::string>> build_clone_argv(const std::string& url,
                                                      const std::string& target_dir,
                                                      const CloneOptions& options = {}) const;

private:
    const CommandExecutor& executor_;
    const GitConfig& config_;
};

} // namespace safeproc
