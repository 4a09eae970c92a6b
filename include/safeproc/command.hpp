#pragma once

/**
 * @file command.hpp
 * @brief Argument-vector process execution
 *
 * A CommandSpec is an ordered list of arguments, program first. There is
 * no constructor or setter taking a single command string, and the
 * executor never hands anything to a shell: the vector goes straight to
 * execve(). Characters such as ';' or '$(...)' inside an argument are
 * delivered to the program verbatim.
 */

#include "safeproc/result.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace safeproc {

using Environment = std::unordered_map<std::string, std::string>;

constexpr std::chrono::milliseconds kDefaultCommandTimeout{60000};
// One week; longer timeouts are rejected before spawning.
constexpr std::chrono::milliseconds kMaxCommandTimeout{7LL * 24 * 60 * 60 * 1000};

// ============================================================================
// Command Specification
// ============================================================================

struct CommandSpec {
    explicit CommandSpec(std::vector<std::string> args) : argv(std::move(args)) {}

    std::vector<std::string> argv;                 // program first; never empty
    std::string cwd;                               // empty: inherit
    std::chrono::milliseconds timeout = kDefaultCommandTimeout;
    std::optional<Environment> environment;        // replaces the child environment when set
    bool check_exit_code = true;                   // non-zero exit -> COMMAND_FAILED
    bool capture_output = true;                    // false: child inherits stdout/stderr
};

// ============================================================================
// Execution Result
// ============================================================================

struct ExecutionResult {
    int exit_code = -1;                            // 128 + signal when killed by a signal
    std::string stdout_text;
    std::string stderr_text;
    std::chrono::duration<double> elapsed{};
};

// ============================================================================
// Audit Quoting
// ============================================================================

// Quote one argument POSIX-shell style for log output only.
std::string quote_argument(const std::string& arg);

// Render an argv readably: words joined by spaces, each quoted when needed.
// The output is for audit logs and error messages; nothing executes it.
std::string quote_argv(const std::vector<std::string>& argv);

// ============================================================================
// Command Executor
// ============================================================================

/**
 * @brief Runs one process per call from an explicit argument vector
 *
 * Holds no mutable state; concurrent execute() calls are independent as
 * long as they do not share a working directory's files.
 */
class CommandExecutor {
public:
    CommandExecutor() = default;

    /**
     * @brief Spawn, wait and collect one process
     *
     * The child runs in its own process group with stdin on /dev/null.
     * When the timeout elapses the whole group is sent SIGKILL and reaped
     * before COMMAND_TIMEOUT is returned.
     *
     * @return ExecutionResult, or an Error with code VALIDATION_ERROR
     *         (malformed spec), SPAWN_FAILED, COMMAND_TIMEOUT or
     *         COMMAND_FAILED (only when check_exit_code is set)
     */
    Result<ExecutionResult> execute(const CommandSpec& spec) const;
};

} // namespace safeproc
