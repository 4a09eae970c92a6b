#include "safeproc/command.hpp"
#include "safeproc/platform.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern "C" char** environ;

namespace safeproc {

namespace {

constexpr int kExecFailedExitCode = 127;
constexpr size_t kPipeBufferSize = 8192;
constexpr int kPollIntervalMs = 50;
constexpr const char* kDefaultSearchPath = "/usr/local/bin:/usr/bin:/bin";

// Stages reported by the child over the error pipe
enum class SpawnStage : int {
    Chdir = 1,
    Exec = 2,
    Redirect = 3,
};

struct SpawnFailure {
    int stage;
    int error_number;
};

class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    void reset(int fd = -1) {
        if (fd_ >= 0) close(fd_);
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

// Both ends close-on-exec so concurrently spawned children never inherit them.
bool make_pipe(FileDescriptor& read_end, FileDescriptor& write_end) {
    int fds[2];
#ifdef __linux__
    if (pipe2(fds, O_CLOEXEC) != 0) return false;
#else
    if (pipe(fds) != 0) return false;
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
#endif
    read_end.reset(fds[0]);
    write_end.reset(fds[1]);
    return true;
}

std::string errno_message(int error_number) {
    return std::strerror(error_number);
}

Error spawn_error(const std::string& message, const CommandSpec& spec, const std::string& command) {
    ErrorDetail detail;
    detail.command = command;
    detail.cwd = spec.cwd;
    return Error(ErrorCode::SPAWN_FAILED, message + "\nCommand: " + command, std::move(detail));
}

Result<void> check_spec(const CommandSpec& spec) {
    auto reject = [](const std::string& message) {
        return Result<void>::err(Error(ErrorCode::VALIDATION_ERROR, message));
    };

    if (spec.argv.empty() || spec.argv.front().empty()) {
        return reject("Command must be a non-empty argument vector");
    }
    for (const auto& arg : spec.argv) {
        if (arg.find('\0') != std::string::npos) {
            return reject("Command arguments cannot contain NUL bytes");
        }
    }
    if (spec.cwd.find('\0') != std::string::npos) {
        return reject("Working directory cannot contain NUL bytes");
    }
    if (spec.timeout.count() <= 0) {
        return reject("Command timeout must be positive");
    }
    if (spec.timeout > kMaxCommandTimeout) {
        return reject("Command timeout exceeds " +
                      std::to_string(kMaxCommandTimeout.count() / 1000) + " seconds");
    }
    if (spec.environment) {
        for (const auto& [key, value] : *spec.environment) {
            if (key.empty() || key.find('=') != std::string::npos ||
                key.find('\0') != std::string::npos || value.find('\0') != std::string::npos) {
                return reject("Invalid environment variable name or value: " + key);
            }
        }
    }
    return Result<void>::ok();
}

// Drain whatever is readable; returns false once the pipe reached EOF.
bool read_available(int fd, std::string& sink) {
    std::array<char, kPipeBufferSize> buffer{};
    for (;;) {
        ssize_t n = read(fd, buffer.data(), buffer.size());
        if (n > 0) {
            sink.append(buffer.data(), static_cast<size_t>(n));
            if (static_cast<size_t>(n) < buffer.size()) return true;
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        return false;
    }
}

int decode_exit_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// Negative pid addresses the group created by setpgid in the child. The
// plain pid is only a fallback while it is still unreaped and cannot be reused.
void kill_process_group(pid_t pid, bool reaped) {
    if (kill(-pid, SIGKILL) != 0 && !reaped) {
        kill(pid, SIGKILL);
    }
}

std::string format_seconds(std::chrono::milliseconds ms) {
    auto count = ms.count();
    if (count % 1000 == 0) return std::to_string(count / 1000) + "s";
    return std::to_string(count) + "ms";
}

} // namespace

// ============================================================================
// Audit Quoting
// ============================================================================

std::string quote_argument(const std::string& arg) {
    if (arg.empty()) return "''";

    static const char* const safe_punct = "@%+=:,./-_";
    bool safe = std::all_of(arg.begin(), arg.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
               std::strchr(safe_punct, c) != nullptr;
    });
    if (safe) return arg;

    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\"'\"'";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

std::string quote_argv(const std::vector<std::string>& argv) {
    std::string out;
    for (size_t i = 0; i < argv.size(); i++) {
        if (i > 0) out += ' ';
        out += quote_argument(argv[i]);
    }
    return out;
}

// ============================================================================
// Execution
// ============================================================================

Result<ExecutionResult> CommandExecutor::execute(const CommandSpec& spec) const {
    using R = Result<ExecutionResult>;

    auto checked = check_spec(spec);
    if (checked.isErr()) {
        return R::err(checked.error());
    }

    const std::string command = quote_argv(spec.argv);
    spdlog::info("Executing: {}{}", command, spec.cwd.empty() ? "" : " (cwd: " + spec.cwd + ")");

    if (!spec.cwd.empty() && !is_directory(spec.cwd)) {
        spdlog::error("Working directory not found: {}", spec.cwd);
        return R::err(spawn_error("Working directory not found: " + spec.cwd, spec, command));
    }

    // Resolve the program before fork; the child only calls async-signal-safe functions.
    std::string search_path = kDefaultSearchPath;
    if (spec.environment) {
        auto it = spec.environment->find("PATH");
        if (it != spec.environment->end()) search_path = it->second;
    } else if (auto inherited = get_env("PATH")) {
        search_path = *inherited;
    }

    auto program = find_program(spec.argv.front(), search_path, spec.cwd);
    if (!program) {
        spdlog::error("Program not found: {}", spec.argv.front());
        return R::err(spawn_error("Program not found: " + spec.argv.front(), spec, command));
    }

    std::vector<char*> argv;
    argv.reserve(spec.argv.size() + 1);
    for (const auto& s : spec.argv) {
        argv.push_back(const_cast<char*>(s.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_strings;
    std::vector<char*> envp;
    if (spec.environment) {
        for (const auto& [key, value] : *spec.environment) {
            env_strings.push_back(key + "=" + value);
        }
        for (auto& s : env_strings) {
            envp.push_back(const_cast<char*>(s.c_str()));
        }
        envp.push_back(nullptr);
    }
    char** child_env = spec.environment ? envp.data() : environ;

    FileDescriptor out_read, out_write, err_read, err_write, status_read, status_write;
    if (!make_pipe(status_read, status_write) ||
        (spec.capture_output && (!make_pipe(out_read, out_write) || !make_pipe(err_read, err_write)))) {
        return R::err(spawn_error("pipe failed: " + errno_message(errno), spec, command));
    }

    FileDescriptor dev_null(open("/dev/null", O_RDONLY | O_CLOEXEC));
    if (!dev_null.valid()) {
        return R::err(spawn_error("open /dev/null failed: " + errno_message(errno), spec, command));
    }

    const char* cwd = spec.cwd.empty() ? nullptr : spec.cwd.c_str();
    const auto start_time = std::chrono::steady_clock::now();

    pid_t pid = fork();
    if (pid == -1) {
        return R::err(spawn_error("fork failed: " + errno_message(errno), spec, command));
    }

    if (pid == 0) {
        // Child process
        auto report = [&](SpawnStage stage) {
            SpawnFailure failure{static_cast<int>(stage), errno};
            ssize_t ignored = write(status_write.get(), &failure, sizeof(failure));
            (void)ignored;
            _exit(kExecFailedExitCode);
        };

        setpgid(0, 0);

        if (dup2(dev_null.get(), STDIN_FILENO) == -1) report(SpawnStage::Redirect);
        if (spec.capture_output) {
            if (dup2(out_write.get(), STDOUT_FILENO) == -1 ||
                dup2(err_write.get(), STDERR_FILENO) == -1) {
                report(SpawnStage::Redirect);
            }
        }

        if (cwd && chdir(cwd) != 0) report(SpawnStage::Chdir);

        execve(program->c_str(), argv.data(), child_env);
        report(SpawnStage::Exec);
        _exit(kExecFailedExitCode);
    }

    // Parent process. Also set the group here so a timeout racing the
    // child's own setpgid still finds it; EACCES after exec is expected.
    setpgid(pid, pid);
    status_write.reset();
    out_write.reset();
    err_write.reset();
    dev_null.reset();

    // EOF here means execve succeeded (close-on-exec); data means it did not.
    SpawnFailure failure{0, 0};
    ssize_t got = 0;
    do {
        got = read(status_read.get(), &failure, sizeof(failure));
    } while (got == -1 && errno == EINTR);

    if (got == static_cast<ssize_t>(sizeof(failure))) {
        int status = 0;
        while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {}

        std::string stage = failure.stage == static_cast<int>(SpawnStage::Chdir) ? "chdir"
                          : failure.stage == static_cast<int>(SpawnStage::Exec) ? "execve"
                          : "redirect";
        spdlog::error("Failed to start {}: {} failed: {}", spec.argv.front(), stage,
                      errno_message(failure.error_number));
        return R::err(spawn_error(stage + " failed: " + errno_message(failure.error_number), spec, command));
    }
    status_read.reset();

    if (out_read.valid()) fcntl(out_read.get(), F_SETFL, O_NONBLOCK);
    if (err_read.valid()) fcntl(err_read.get(), F_SETFL, O_NONBLOCK);

    ExecutionResult result;
    const auto deadline = start_time + spec.timeout;
    bool reaped = false;
    bool timed_out = false;
    int status = 0;

    for (;;) {
        if (!reaped) {
            pid_t w = waitpid(pid, &status, WNOHANG);
            if (w == pid) {
                reaped = true;
            } else if (w == -1 && errno != EINTR) {
                int saved = errno;
                kill_process_group(pid, false);
                return R::err(spawn_error("waitpid failed: " + errno_message(saved), spec, command));
            }
        }

        if (reaped && !out_read.valid() && !err_read.valid()) break;

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            timed_out = true;
            break;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        int wait_ms = static_cast<int>(std::min<long long>(remaining, kPollIntervalMs));
        if (wait_ms <= 0) wait_ms = 1;

        std::array<pollfd, 2> fds{};
        nfds_t count = 0;
        if (out_read.valid()) fds[count++] = {out_read.get(), POLLIN, 0};
        if (err_read.valid()) fds[count++] = {err_read.get(), POLLIN, 0};

        int ready = poll(count ? fds.data() : nullptr, count, wait_ms);
        if (ready <= 0) continue;

        for (nfds_t i = 0; i < count; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            bool is_stdout = fds[i].fd == out_read.get();
            std::string& sink = is_stdout ? result.stdout_text : result.stderr_text;
            if (!read_available(fds[i].fd, sink)) {
                if (is_stdout) {
                    out_read.reset();
                } else {
                    err_read.reset();
                }
            }
        }
    }

    if (timed_out) {
        kill_process_group(pid, reaped);
        if (!reaped) {
            while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {}
        }
        spdlog::error("Command timed out after {}: {}", format_seconds(spec.timeout), command);

        ErrorDetail detail;
        detail.command = command;
        detail.cwd = spec.cwd;
        detail.stdout_text = std::move(result.stdout_text);
        detail.stderr_text = std::move(result.stderr_text);
        return R::err(Error(ErrorCode::COMMAND_TIMEOUT,
                            "Command timed out after " + format_seconds(spec.timeout) +
                                "\nCommand: " + command,
                            std::move(detail)));
    }

    result.exit_code = decode_exit_status(status);
    result.elapsed = std::chrono::steady_clock::now() - start_time;

    if (spec.check_exit_code && result.exit_code != 0) {
        spdlog::error("Command failed (exit code {}): {}", result.exit_code, result.stderr_text);

        ErrorDetail detail;
        detail.exit_code = result.exit_code;
        detail.stdout_text = result.stdout_text;
        detail.stderr_text = result.stderr_text;
        detail.command = command;
        detail.cwd = spec.cwd;
        return R::err(Error(ErrorCode::COMMAND_FAILED,
                            "Command failed with exit code " + std::to_string(result.exit_code) +
                                "\nCommand: " + command + "\nError: " + result.stderr_text,
                            std::move(detail)));
    }

    spdlog::debug("Command completed (exit code: {})", result.exit_code);
    return R::ok(std::move(result));
}

} // namespace safeproc
