#include "shkit/runner.hpp"
#include "shkit/logging.hpp"
#include "shkit/output.hpp"
#include "shkit/platform.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern "C" char** environ;

namespace shkit {

namespace {

std::vector<std::string> build_environment(const RunOptions& options) {
    std::unordered_map<std::string, std::string> merged;
    for (char** ep = environ; ep && *ep; ++ep) {
        std::string entry(*ep);
        auto eq = entry.find('=');
        if (eq != std::string::npos) {
            merged[entry.substr(0, eq)] = entry.substr(eq + 1);
        }
    }
    for (const auto& [key, value] : options.env) {
        merged[key] = value;
    }

    std::vector<std::string> env;
    env.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        env.push_back(key + "=" + value);
    }
    return env;
}

std::vector<char*> to_c_array(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) {
        out.push_back(s.data());
    }
    out.push_back(nullptr);
    return out;
}

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Drain both pipes until EOF. fds set to -1 are ignored.
void read_pipes(int out_fd, int err_fd, std::string& out, std::string& err) {
    char buf[4096];
    while (out_fd >= 0 || err_fd >= 0) {
        pollfd fds[2];
        nfds_t count = 0;
        if (out_fd >= 0) fds[count++] = {out_fd, POLLIN, 0};
        if (err_fd >= 0) fds[count++] = {err_fd, POLLIN, 0};

        if (poll(fds, count, -1) < 0) {
            if (errno == EINTR) continue;
            break;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;

            ssize_t n = read(fds[i].fd, buf, sizeof(buf));
            if (n < 0 && errno == EINTR) continue;

            bool is_out = fds[i].fd == out_fd;
            if (n <= 0) {
                if (is_out) close_fd(out_fd);
                else close_fd(err_fd);
                continue;
            }
            (is_out ? out : err).append(buf, static_cast<std::size_t>(n));
        }
    }
    close_fd(out_fd);
    close_fd(err_fd);
}

} // namespace

std::optional<std::string> find_program(const std::string& name, const std::string& path_value) {
    if (name.empty()) {
        return std::nullopt;
    }
    if (name.find('/') != std::string::npos) {
        if (is_executable(name)) return name;
        return std::nullopt;
    }

    std::size_t start = 0;
    while (start <= path_value.size()) {
        std::size_t end = path_value.find(get_path_separator(), start);
        if (end == std::string::npos) end = path_value.size();

        std::string dir = path_value.substr(start, end - start);
        if (dir.empty()) dir = ".";

        std::string candidate = dir + "/" + name;
        if (is_executable(candidate)) {
            return candidate;
        }
        start = end + 1;
    }
    return std::nullopt;
}

RunResult run_command(const std::vector<std::string>& argv, const RunOptions& options) {
    RunResult result;

    if (argv.empty()) {
        result.error = "empty command";
        return result;
    }

    std::string path_value;
    if (auto it = options.env.find("PATH"); it != options.env.end()) {
        path_value = it->second;
    } else {
        path_value = get_env("PATH").value_or("");
    }

    auto binary = find_program(argv[0], path_value);
    if (!binary) {
        result.error = "command not found: " + argv[0];
        return result;
    }

    std::vector<std::string> argv_strings = argv;
    std::vector<std::string> env_strings = build_environment(options);
    auto c_argv = to_c_array(argv_strings);
    auto c_envp = to_c_array(env_strings);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (pipe(out_pipe) != 0) {
        result.error = "pipe failed: " + std::string(strerror(errno));
        return result;
    }
    if (!options.merge_stderr && pipe(err_pipe) != 0) {
        result.error = "pipe failed: " + std::string(strerror(errno));
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        return result;
    }

    logger()->debug("running {}", *binary);

    pid_t pid = fork();
    if (pid == -1) {
        result.error = "fork failed: " + std::string(strerror(errno));
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        close_fd(err_pipe[0]);
        close_fd(err_pipe[1]);
        return result;
    }

    if (pid == 0) {
        // Child process
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(options.merge_stderr ? out_pipe[1] : err_pipe[1], STDERR_FILENO);
        close(out_pipe[0]);
        close(out_pipe[1]);
        if (!options.merge_stderr) {
            close(err_pipe[0]);
            close(err_pipe[1]);
        }

        if (!options.cwd.empty() && chdir(options.cwd.c_str()) != 0) {
            _exit(127);
        }

        execve(binary->c_str(), c_argv.data(), c_envp.data());
        _exit(127);
    }

    // Parent process
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    read_pipes(out_pipe[0], err_pipe[0], result.output, result.error_output);

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            result.error = "waitpid failed: " + std::string(strerror(errno));
            return result;
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        result.ok = true;
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
        result.ok = true;
    } else {
        result.error = "process terminated abnormally";
    }

    result.lines = split_output_into_lines(result.output);
    return result;
}

} // namespace shkit
