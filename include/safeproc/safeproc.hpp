#pragma once

/**
 * @file safeproc.hpp
 * @brief Umbrella header for the safeproc library
 *
 * safeproc mediates every external process a service starts on behalf of
 * untrusted input:
 * - Validator turns raw strings into typed, checked values
 * - CommandExecutor spawns argument vectors without a shell, with timeouts
 * - GitOperations, LatexCompiler and ScriptRunner build fixed argument
 *   vectors for their tools from validated values
 *
 * ## Example
 *
 * ```cpp
 * #include <safeproc/safeproc.hpp>
 *
 * safeproc::Config config = safeproc::default_config();
 * safeproc::CommandExecutor executor;
 * safeproc::GitOperations git(executor, config.git);
 *
 * auto cloned = git.clone("https://github.com/user/repo.git", "/srv/work/repo");
 * if (cloned.isErr()) {
 *     std::cerr << cloned.error().toString() << "\n";
 * }
 * ```
 */

#include "safeproc/command.hpp"
#include "safeproc/config.hpp"
#include "safeproc/directory_locks.hpp"
#include "safeproc/git.hpp"
#include "safeproc/latex.hpp"
#include "safeproc/platform.hpp"
#include "safeproc/result.hpp"
#include "safeproc/script.hpp"
#include "safeproc/validator.hpp"
