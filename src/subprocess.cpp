#include "lakesync/subprocess.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace lakesync {

namespace {

// Exit status the child uses when execvp fails
constexpr int EXEC_FAILED_STATUS = 127;

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Append whatever is readable; returns false on EOF or error.
bool drain(int fd, std::string& out) {
    char buf[8192];
    ssize_t n = read(fd, buf, sizeof(buf));
    if (n > 0) {
        out.append(buf, static_cast<size_t>(n));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }
    return false;
}

}  // namespace

ProcessResult run_process(const std::vector<std::string>& args,
                          std::chrono::milliseconds timeout,
                          const std::map<std::string, std::string>& env) {
    ProcessResult result;
    if (args.empty()) {
        result.spawn_failed = true;
        result.error_message = "empty command";
        return result;
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    // Reports execvp failure to the parent; closed on successful exec via O_CLOEXEC
    int exec_pipe[2] = {-1, -1};
    if (pipe2(out_pipe, O_CLOEXEC) < 0 || pipe2(err_pipe, O_CLOEXEC) < 0 ||
        pipe2(exec_pipe, O_CLOEXEC) < 0) {
        result.spawn_failed = true;
        result.error_message = "pipe2 failed: " + std::string(strerror(errno));
        for (int* p : {out_pipe, err_pipe, exec_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return result;
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) {
        argv.push_back(const_cast<char*>(a.c_str()));
    }
    argv.push_back(nullptr);

    // Environment is built before fork; the child only calls async-signal-safe functions
    std::vector<std::string> env_strings;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq != std::string::npos && env.count(entry.substr(0, eq))) continue;
        env_strings.push_back(std::move(entry));
    }
    for (const auto& [k, v] : env) {
        env_strings.push_back(k + "=" + v);
    }
    std::vector<char*> envp;
    envp.reserve(env_strings.size() + 1);
    for (auto& e : env_strings) {
        envp.push_back(e.data());
    }
    envp.push_back(nullptr);

    const pid_t pid = fork();
    if (pid < 0) {
        result.spawn_failed = true;
        result.error_message = "fork failed: " + std::string(strerror(errno));
        for (int* p : {out_pipe, err_pipe, exec_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return result;
    }

    if (pid == 0) {
        // Child: stdout/stderr into the pipes, stdin from /dev/null
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);

        execvpe(argv[0], argv.data(), envp.data());

        int err = errno;
        ssize_t w = write(exec_pipe[1], &err, sizeof(err));
        (void)w;
        _exit(EXEC_FAILED_STATUS);
    }

    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    auto deadline = std::chrono::steady_clock::now() + timeout;
    bool out_open = true;
    bool err_open = true;

    while (out_open || err_open) {
        int wait_ms = -1;
        if (timeout.count() > 0) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                result.timed_out = true;
                break;
            }
            wait_ms = static_cast<int>(std::min<int64_t>(remaining.count(), 1000));
        }

        struct pollfd fds[2];
        nfds_t nfds = 0;
        int out_idx = -1;
        int err_idx = -1;
        if (out_open) {
            out_idx = static_cast<int>(nfds);
            fds[nfds++] = {out_pipe[0], POLLIN, 0};
        }
        if (err_open) {
            err_idx = static_cast<int>(nfds);
            fds[nfds++] = {err_pipe[0], POLLIN, 0};
        }

        int ret = poll(fds, nfds, wait_ms);
        if (ret < 0) {
            if (errno == EINTR) continue;
            result.error_message = "poll failed: " + std::string(strerror(errno));
            break;
        }
        if (ret == 0) continue;

        if (out_idx >= 0 && (fds[out_idx].revents & (POLLIN | POLLHUP | POLLERR))) {
            out_open = drain(out_pipe[0], result.stdout_data);
        }
        if (err_idx >= 0 && (fds[err_idx].revents & (POLLIN | POLLHUP | POLLERR))) {
            err_open = drain(err_pipe[0], result.stderr_data);
        }
    }

    if (result.timed_out || !result.error_message.empty()) {
        kill(pid, SIGKILL);
    }

    // The child may close its output before exiting; keep honouring the deadline
    int status = 0;
    while (true) {
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) break;
        if (w < 0) {
            if (errno == EINTR) continue;
            status = 0;
            break;
        }
        if (timeout.count() > 0 && !result.timed_out &&
            std::chrono::steady_clock::now() >= deadline) {
            result.timed_out = true;
            kill(pid, SIGKILL);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    int exec_errno = 0;
    ssize_t n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);
    close_fd(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        result.spawn_failed = true;
        result.error_message = "cannot execute " + args[0] + ": " + strerror(exec_errno);
        return result;
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }

    if (result.timed_out) {
        result.error_message = args[0] + " timed out after " +
            std::to_string(timeout.count()) + " ms";
    }
    return result;
}

}  // namespace lakesync
