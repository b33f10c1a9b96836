#pragma once

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <string>
#include <vector>

namespace lsbridge::internal {

    struct subprocess_result {
        int exit_code{};
        bool timed_out{false};
        std::string stdout_output{};
        std::string stderr_output{};
    };

    // Runs args to completion with stdin closed, capturing both output streams.
    // exit_code is 127 when the program could not be executed, 128+N when killed by signal N.
    inline subprocess_result run_subprocess(const std::vector<std::string>& args, std::chrono::milliseconds timeout) {
        if (args.empty()) {
            return {.exit_code = 127, .stderr_output = "empty command"};
        }

        int stdout_pipe[2]{-1, -1};
        int stderr_pipe[2]{-1, -1};
        if (::pipe2(stdout_pipe, O_CLOEXEC) != 0) {
            return {.exit_code = 1, .stderr_output = "pipe() failed"};
        }
        if (::pipe2(stderr_pipe, O_CLOEXEC) != 0) {
            ::close(stdout_pipe[0]);
            ::close(stdout_pipe[1]);
            return {.exit_code = 1, .stderr_output = "pipe() failed"};
        }

        std::vector<char*> argv{};
        argv.reserve(args.size() + 1);
        for (const auto& arg : args) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        auto pid = ::fork();
        if (pid < 0) {
            ::close(stdout_pipe[0]);
            ::close(stdout_pipe[1]);
            ::close(stderr_pipe[0]);
            ::close(stderr_pipe[1]);
            return {.exit_code = 1, .stderr_output = "fork() failed"};
        }

        if (pid == 0) {
            int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
            if (devnull >= 0) {
                ::dup2(devnull, STDIN_FILENO);
            }
            ::dup2(stdout_pipe[1], STDOUT_FILENO);
            ::dup2(stderr_pipe[1], STDERR_FILENO);
            ::execvp(argv[0], argv.data());
            _exit(127);
        }

        ::close(stdout_pipe[1]);
        ::close(stderr_pipe[1]);

        std::string out_buf{};
        std::string err_buf{};
        bool timed_out = false;
        int fds_open = 2;

        pollfd fds[2]{};
        fds[0] = {.fd = stdout_pipe[0], .events = POLLIN, .revents = 0};
        fds[1] = {.fd = stderr_pipe[0], .events = POLLIN, .revents = 0};

        auto deadline = std::chrono::steady_clock::now() + timeout;

        while (fds_open > 0) {
            auto remaining =
                    std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now())
                            .count();
            if (remaining <= 0) {
                timed_out = true;
                break;
            }

            int ret = ::poll(fds, 2, static_cast<int>(remaining));
            if (ret < 0) {
                if (errno == EINTR) {
                    continue;
                }
                break;
            }
            if (ret == 0) {
                timed_out = true;
                break;
            }

            char chunk[4096]{};
            for (int i = 0; i < 2; ++i) {
                if (fds[i].fd < 0) {
                    continue;
                }
                if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
                    auto n = ::read(fds[i].fd, chunk, sizeof(chunk));
                    if (n > 0) {
                        (i == 0 ? out_buf : err_buf).append(chunk, static_cast<size_t>(n));
                    }
                    else if (n == 0 || errno != EINTR) {
                        ::close(fds[i].fd);
                        fds[i].fd = -1;
                        --fds_open;
                    }
                }
            }
        }

        if (timed_out) {
            ::kill(pid, SIGKILL);
        }

        for (auto& p : fds) {
            if (p.fd >= 0) {
                ::close(p.fd);
            }
        }

        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}

        if (timed_out) {
            return {.exit_code = 1,
                    .timed_out = true,
                    .stdout_output = std::move(out_buf),
                    .stderr_output = "subprocess timed out"};
        }

        int exit_code = 1;
        if (WIFEXITED(status)) {
            exit_code = WEXITSTATUS(status);
        }
        else if (WIFSIGNALED(status)) {
            exit_code = 128 + WTERMSIG(status);
        }

        return {.exit_code = exit_code, .stdout_output = std::move(out_buf), .stderr_output = std::move(err_buf)};
    }

}  // namespace lsbridge::internal
