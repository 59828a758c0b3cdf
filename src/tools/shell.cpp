/**
 * @file shell.cpp
 * @brief shell tool (fork/exec with pipes, no shell involved)
 */

#include "toolrpc/tools/shell_tool.h"
#include "toolrpc/tools/params.h"
#include "toolrpc/utils/utf8.h"
#include "toolrpc/logger.h"
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace toolrpc {

namespace {

constexpr const char* SHELL_METACHARACTERS = ";&|()<>$`\\\"'";

/**
 * @brief Pipe whose ends close on destruction
 */
struct Pipe {
    int fds[2] = {-1, -1};

    Pipe() {
        if (pipe2(fds, O_CLOEXEC) == -1) {
            throw IoError(std::string("Failed to create pipe: ") + std::strerror(errno));
        }
    }
    ~Pipe() {
        close_read();
        close_write();
    }
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    int read_end() const { return fds[0]; }
    int write_end() const { return fds[1]; }
    void close_read() { if (fds[0] != -1) { ::close(fds[0]); fds[0] = -1; } }
    void close_write() { if (fds[1] != -1) { ::close(fds[1]); fds[1] = -1; } }
};

std::vector<std::string> build_environment(const std::map<std::string, std::string>& extra) {
    std::map<std::string, std::string> merged;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string kv(*entry);
        size_t eq = kv.find('=');
        if (eq != std::string::npos) {
            merged[kv.substr(0, eq)] = kv.substr(eq + 1);
        }
    }
    for (const auto& [key, value] : extra) {
        merged[key] = value;
    }

    std::vector<std::string> env;
    env.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        env.push_back(key + "=" + value);
    }
    return env;
}

std::vector<char*> pointers(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) {
        out.push_back(s.data());
    }
    out.push_back(nullptr);
    return out;
}

// Child side: only async-signal-safe calls until exec
[[noreturn]] void exec_child(const ShellParams& params, char* const argv[], char* const envp[],
                             int stdout_fd, int stderr_fd, int error_fd) {
    int devnull = ::open("/dev/null", O_RDWR);
    if (devnull != -1) {
        dup2(devnull, STDIN_FILENO);
    }
    dup2(stdout_fd, STDOUT_FILENO);
    if (stderr_fd != -1) {
        dup2(stderr_fd, STDERR_FILENO);
    } else if (devnull != -1) {
        dup2(devnull, STDERR_FILENO);
    }

    if (params.cwd && chdir(params.cwd->c_str()) == -1) {
        int err = errno;
        ssize_t ignored = write(error_fd, &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    execvpe(argv[0], argv, envp);

    int err = errno;
    ssize_t ignored = write(error_fd, &err, sizeof(err));
    (void)ignored;
    _exit(127);
}

// Reads both pipes until EOF or the deadline; returns false on timeout
bool drain(int stdout_fd, int stderr_fd, std::string& out, std::string& err,
           std::optional<std::chrono::steady_clock::time_point> deadline) {
    char buffer[4096];
    struct pollfd fds[2] = {{stdout_fd, POLLIN, 0}, {stderr_fd, POLLIN, 0}};
    int open_count = (stdout_fd != -1) + (stderr_fd != -1);

    while (open_count > 0) {
        int timeout = -1;
        if (deadline) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                *deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0) {
                return false;
            }
            timeout = static_cast<int>(remaining);
        }

        int ready = poll(fds, 2, timeout);
        if (ready == -1) {
            if (errno == EINTR) continue;
            throw IoError(std::string("poll failed: ") + std::strerror(errno));
        }
        if (ready == 0) {
            return false;
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd == -1 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
                continue;
            }
            ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                (i == 0 ? out : err).append(buffer, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                fds[i].fd = -1;
                --open_count;
            }
        }
    }
    return true;
}

int exit_code(int status) {
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

int wait_for(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            return -1;
        }
    }
    return exit_code(status);
}

// The child may close its output before exiting
std::optional<int> wait_until(pid_t pid, std::chrono::steady_clock::time_point deadline) {
    for (;;) {
        int status = 0;
        pid_t done = waitpid(pid, &status, WNOHANG);
        if (done == pid) {
            return exit_code(status);
        }
        if (done == -1 && errno != EINTR) {
            return -1;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return std::nullopt;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

} // namespace

void validate_command(const std::string& command) {
    if (command.empty()) {
        throw InvalidParams("Command must not be empty");
    }
    for (char c : command) {
        if (std::isspace(static_cast<unsigned char>(c)) || std::strchr(SHELL_METACHARACTERS, c)) {
            throw InvalidParams("Command '" + command + "' contains whitespace or shell metacharacters. "
                                "Use the 'args' parameter for arguments instead.");
        }
    }
}

void from_json(const json& j, ShellParams& p) {
    require_object(j);
    p.command = required_field<std::string>(j, "command");
    p.args = field_or(j, "args", std::vector<std::string>{});
    p.env = field_or(j, "env", std::map<std::string, std::string>{});
    p.cwd = optional_field<std::string>(j, "cwd");
    p.capture_stderr = field_or(j, "capture_stderr", false);
    p.timeout_ms = count_field(j, "timeout_ms");
    if (p.timeout_ms > MAX_SHELL_TIMEOUT_MS) {
        throw InvalidParams("`timeout_ms` must be at most " + std::to_string(MAX_SHELL_TIMEOUT_MS));
    }
}

void to_json(json& j, const ShellOutput& o) {
    j = json{
        {"command", o.command},
        {"args", o.args},
        {"status", o.status},
        {"success", o.success},
        {"stdout", o.stdout_text},
        {"timed_out", o.timed_out}
    };
    if (o.stderr_text) {
        j["stderr"] = *o.stderr_text;
    }
}

ShellOutput ShellTool::run(const ShellParams& params) const {
    validate_command(params.command);

    if (params.cwd) {
        std::error_code ec;
        if (!std::filesystem::is_directory(*params.cwd, ec)) {
            throw InvalidParams("Working directory does not exist: " + *params.cwd);
        }
    }

    std::vector<std::string> argv_strings;
    argv_strings.push_back(params.command);
    argv_strings.insert(argv_strings.end(), params.args.begin(), params.args.end());
    std::vector<std::string> env_strings = build_environment(params.env);
    std::vector<char*> argv = pointers(argv_strings);
    std::vector<char*> envp = pointers(env_strings);

    Pipe out_pipe;
    Pipe err_pipe;
    Pipe error_pipe;  // carries the child's errno if exec fails

    LOG_DEBUG("shell", "Spawning " + params.command + " with " + std::to_string(params.args.size()) + " args");

    pid_t pid = fork();
    if (pid == -1) {
        throw IoError(std::string("Failed to spawn ") + params.command + ": " + std::strerror(errno));
    }
    if (pid == 0) {
        exec_child(params, argv.data(), envp.data(), out_pipe.write_end(),
                   params.capture_stderr ? err_pipe.write_end() : -1, error_pipe.write_end());
    }

    out_pipe.close_write();
    err_pipe.close_write();
    error_pipe.close_write();

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(error_pipe.read_end(), &child_errno, sizeof(child_errno));
    } while (n == -1 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        wait_for(pid);
        throw IoError("Failed to spawn " + params.command + ": " + std::strerror(child_errno));
    }

    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (params.timeout_ms > 0) {
        deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(params.timeout_ms);
    }

    ShellOutput output;
    output.command = params.command;
    output.args = params.args;

    std::string stderr_text;
    bool finished = drain(out_pipe.read_end(), params.capture_stderr ? err_pipe.read_end() : -1,
                          output.stdout_text, stderr_text, deadline);

    std::optional<int> status;
    if (finished) {
        status = deadline ? wait_until(pid, *deadline) : wait_for(pid);
    }

    if (status) {
        output.status = *status;
    } else {
        LOG_WARN("shell", params.command + " timed out after " + std::to_string(params.timeout_ms) + "ms");
        kill(pid, SIGKILL);
        wait_for(pid);
        output.status = -1;
        output.timed_out = true;
    }

    output.success = output.status == 0;
    output.stdout_text = to_valid_utf8(output.stdout_text);
    if (params.capture_stderr) {
        output.stderr_text = to_valid_utf8(stderr_text);
    }
    return output;
}

} // namespace toolrpc
