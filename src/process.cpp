#include "lsbridge/process.hpp"

#include "lsbridge/errors.hpp"
#include "lsbridge/format.hpp"

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>

using namespace lsbridge::literals;
using namespace std::chrono_literals;

namespace lsbridge {

    namespace detail {

        static void ignore_sigpipe() {
            static std::once_flag once{};
            std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
        }

        static void close_fd(int& fd) {
            if (fd >= 0) {
                ::close(fd);
                fd = -1;
            }
        }

        static void close_pair(int (&fds)[2]) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }

        static exit_status decode_wait_status(int status) {
            exit_status result{};
            if (WIFEXITED(status)) {
                result.code = WEXITSTATUS(status);
            }
            else if (WIFSIGNALED(status)) {
                result.signal = WTERMSIG(status);
            }
            return result;
        }

        // Written by the child when chdir/exec fails; the pipe is CLOEXEC, so EOF means exec succeeded.
        struct exec_failure {
            int stage{};
            int err{};
        };

        [[noreturn]] static void report_and_exit(int fd, int stage) {
            exec_failure failure{.stage = stage, .err = errno};
            auto ignored = ::write(fd, &failure, sizeof(failure));
            (void)ignored;
            _exit(127);
        }

    }  // namespace detail

    std::string exit_status::describe() const {
        if (code) {
            return "exited with code {}"_format(*code);
        }
        if (signal) {
            return "killed by signal {} ({})"_format(*signal, ::strsignal(*signal));
        }
        return "still running";
    }

    child_process child_process::spawn(const spawn_options& opts, pipes& out) {
        detail::ignore_sigpipe();

        std::vector<std::string> args{};
        args.reserve(opts.args.size() + 1);
        args.push_back(opts.executable.string());
        args.insert(args.end(), opts.args.begin(), opts.args.end());

        std::vector<char*> argv{};
        argv.reserve(args.size() + 1);
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);

        auto workdir = opts.working_directory.string();
        auto stderr_path = opts.stderr_path.string();

        int in_pipe[2]{-1, -1};
        int out_pipe[2]{-1, -1};
        int err_pipe[2]{-1, -1};
        if (::pipe2(in_pipe, O_CLOEXEC) != 0 || ::pipe2(out_pipe, O_CLOEXEC) != 0 ||
            ::pipe2(err_pipe, O_CLOEXEC) != 0) {
            int err = errno;
            detail::close_pair(in_pipe);
            detail::close_pair(out_pipe);
            detail::close_pair(err_pipe);
            throw session_error{error_kind::spawn_error, "pipe2() failed: {}"_format(std::strerror(err))};
        }

        int stderr_fd = ::open(stderr_path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
        if (stderr_fd < 0) {
            log_warn("cannot open server log ", stderr_path, ": ", std::strerror(errno), "; using /dev/null");
            stderr_fd = ::open("/dev/null", O_WRONLY | O_CLOEXEC);
        }

        auto pid = ::fork();
        if (pid < 0) {
            int err = errno;
            detail::close_pair(in_pipe);
            detail::close_pair(out_pipe);
            detail::close_pair(err_pipe);
            detail::close_fd(stderr_fd);
            throw session_error{error_kind::spawn_error, "fork() failed: {}"_format(std::strerror(err))};
        }

        if (pid == 0) {
            ::dup2(in_pipe[0], STDIN_FILENO);
            ::dup2(out_pipe[1], STDOUT_FILENO);
            if (stderr_fd >= 0) {
                ::dup2(stderr_fd, STDERR_FILENO);
            }
            ::signal(SIGPIPE, SIG_DFL);

            if (!workdir.empty() && ::chdir(workdir.c_str()) != 0) {
                detail::report_and_exit(err_pipe[1], 1);
            }
            ::execvp(argv[0], argv.data());
            detail::report_and_exit(err_pipe[1], 2);
        }

        ::close(in_pipe[0]);
        ::close(out_pipe[1]);
        ::close(err_pipe[1]);
        detail::close_fd(stderr_fd);

        detail::exec_failure failure{};
        ssize_t n = 0;
        do {
            n = ::read(err_pipe[0], &failure, sizeof(failure));
        } while (n < 0 && errno == EINTR);
        ::close(err_pipe[0]);

        child_process child{pid};
        if (n == static_cast<ssize_t>(sizeof(failure))) {
            ::close(in_pipe[1]);
            ::close(out_pipe[0]);
            child.terminate(0ms);
            auto what = failure.stage == 1 ? "chdir to {}"_format(workdir) : "exec {}"_format(args.front());
            throw session_error{error_kind::spawn_error, "{} failed: {}"_format(what, std::strerror(failure.err))};
        }

        auto deadline = std::chrono::steady_clock::now() + opts.startup_check;
        while (std::chrono::steady_clock::now() < deadline) {
            if (!child.is_alive()) {
                ::close(in_pipe[1]);
                ::close(out_pipe[0]);
                auto st = child.status();
                throw session_error{
                        error_kind::spawn_error,
                        "{} {} immediately after start"_format(args.front(), st ? st->describe() : "exited")};
            }
            std::this_thread::sleep_for(5ms);
        }

        debug_log("spawned ", args.front(), " pid=", pid, " cwd=", workdir);
        out.stdin_fd = in_pipe[1];
        out.stdout_fd = out_pipe[0];
        return child;
    }

    child_process::~child_process() {
        terminate(0ms);
    }

    child_process::child_process(child_process&& other) noexcept {
        std::lock_guard lock{other.mutex_};
        pid_ = other.pid_;
        status_ = std::move(other.status_);
        other.pid_ = -1;
        other.status_.reset();
    }

    child_process& child_process::operator=(child_process&& other) noexcept {
        if (this != &other) {
            terminate(0ms);
            std::scoped_lock lock{mutex_, other.mutex_};
            pid_ = other.pid_;
            status_ = std::move(other.status_);
            other.pid_ = -1;
            other.status_.reset();
        }
        return *this;
    }

    bool child_process::reap_locked(int flags) {
        if (pid_ <= 0 || status_) {
            return true;
        }
        int status = 0;
        pid_t ret = 0;
        do {
            ret = ::waitpid(pid_, &status, flags);
        } while (ret < 0 && errno == EINTR);

        if (ret == pid_) {
            status_ = detail::decode_wait_status(status);
            return true;
        }
        if (ret < 0) {
            // ECHILD: someone else reaped it; treat as gone
            status_ = exit_status{};
            return true;
        }
        return false;
    }

    bool child_process::is_alive() {
        std::lock_guard lock{mutex_};
        return !reap_locked(WNOHANG);
    }

    bool child_process::wait_for_exit(std::chrono::milliseconds timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        for (;;) {
            {
                std::lock_guard lock{mutex_};
                if (reap_locked(WNOHANG)) {
                    return true;
                }
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                return false;
            }
            std::this_thread::sleep_for(10ms);
        }
    }

    void child_process::terminate(std::chrono::milliseconds grace) {
        {
            std::lock_guard lock{mutex_};
            if (reap_locked(WNOHANG)) {
                return;
            }
            ::kill(pid_, SIGTERM);
        }

        if (grace.count() > 0 && wait_for_exit(grace)) {
            return;
        }

        std::lock_guard lock{mutex_};
        if (reap_locked(WNOHANG)) {
            return;
        }
        debug_log("pid ", pid_, " ignored SIGTERM; sending SIGKILL");
        ::kill(pid_, SIGKILL);
        reap_locked(0);
    }

    std::optional<exit_status> child_process::status() const {
        std::lock_guard lock{mutex_};
        return status_;
    }

}  // namespace lsbridge
