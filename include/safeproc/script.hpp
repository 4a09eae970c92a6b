#pragma once

#include "safeproc/command.hpp"
#include "safeproc/config.hpp"
#include "safeproc/result.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace safeproc {

struct ScriptRunOptions {
    std::string cwd;
    std::optional<std::chrono::milliseconds> timeout;  // unset: ScriptConfig::timeout
    std::optional<Environment> environment;
};

/**
 * @brief Runs helper scripts as <interpreter> <script> [args...]
 *
 * The script must exist and carry the configured extension. When
 * ScriptConfig::script_root is set the script must also resolve inside it.
 * A non-zero exit is COMMAND_FAILED.
 */
class ScriptRunner {
public:
    ScriptRunner(const CommandExecutor& executor, const ScriptConfig& config)
        : executor_(executor), config_(config) {}

    Result<ExecutionResult> run(const std::string& script_path,
                                const std::vector<std::string>& args = {},
                                const ScriptRunOptions& options = {}) const;

private:
    Result<std::string> resolve_script(const std::string& script_path) const;

    const CommandExecutor& executor_;
    const ScriptConfig& config_;
};

} // namespace safeproc
