#include "platform/subprocess.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace platform {

namespace {

std::string errno_message(const char* what) {
    return std::string(what) + " failed: " + std::strerror(errno);
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

int wait_child(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return -1;
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

std::expected<ProcessResult, std::string>
run_process(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
    if (argv.empty()) {
        return std::unexpected("empty command");
    }

    // Build argv before fork; the child may only make async-signal-safe calls.
    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& a : argv) c_argv.push_back(const_cast<char*>(a.c_str()));
    c_argv.push_back(nullptr);

    int out_pipe[2];
    int err_pipe[2];
    if (::pipe2(out_pipe, O_CLOEXEC) < 0) {
        return std::unexpected(errno_message("pipe()"));
    }
    if (::pipe2(err_pipe, O_CLOEXEC) < 0) {
        auto msg = errno_message("pipe()");
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        return std::unexpected(msg);
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        auto msg = errno_message("fork()");
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) ::close(fd);
        return std::unexpected(msg);
    }

    if (pid == 0) {
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::execvp(c_argv[0], c_argv.data());
        ::_exit(kExecFailedCode);
    }

    ::close(out_pipe[1]);
    ::close(err_pipe[1]);

    ProcessResult result;
    std::array<int, 2> fds = {out_pipe[0], err_pipe[0]};
    std::array<std::string*, 2> sinks = {&result.out, &result.err};

    auto deadline = std::chrono::steady_clock::now() + timeout;
    bool timed_out = false;
    std::array<char, 4096> buf;

    while (fds[0] >= 0 || fds[1] >= 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            timed_out = true;
            break;
        }

        std::array<pollfd, 2> pfds{};
        for (size_t i = 0; i < fds.size(); ++i) {
            pfds[i].fd = fds[i];   // negative fds are ignored by poll
            pfds[i].events = POLLIN;
        }

        int rc = ::poll(pfds.data(), pfds.size(), static_cast<int>(remaining.count()));
        if (rc < 0) {
            if (errno == EINTR) continue;
            auto msg = errno_message("poll()");
            ::kill(pid, SIGKILL);
            wait_child(pid);
            close_fd(fds[0]);
            close_fd(fds[1]);
            return std::unexpected(msg);
        }
        if (rc == 0) continue;

        for (size_t i = 0; i < fds.size(); ++i) {
            if (fds[i] < 0 || pfds[i].revents == 0) continue;
            ssize_t n = ::read(fds[i], buf.data(), buf.size());
            if (n > 0) {
                sinks[i]->append(buf.data(), static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close_fd(fds[i]);
            }
        }
    }

    close_fd(fds[0]);
    close_fd(fds[1]);

    if (timed_out) {
        ::kill(pid, SIGKILL);
        wait_child(pid);
        return std::unexpected(std::format("{} timed out after {}ms", argv[0], timeout.count()));
    }

    result.exit_code = wait_child(pid);
    if (result.exit_code < 0) {
        return std::unexpected(errno_message("waitpid()"));
    }
    return result;
}

} // namespace platform
