#pragma once

#include <sys/types.h>

#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lsbridge {

    struct spawn_options {
        std::filesystem::path executable{};
        std::vector<std::string> args{};
        std::filesystem::path working_directory{};
        std::filesystem::path stderr_path{"/dev/null"};
        // The child is observed this long after exec; dying inside the window is a spawn failure.
        std::chrono::milliseconds startup_check{50};
    };

    struct exit_status {
        std::optional<int> code{};
        std::optional<int> signal{};

        std::string describe() const;
    };

    /*
     * One supervised language server process.
     *
     * spawn() hands back the parent ends of the stdin/stdout pipes; ownership of those
     * descriptors passes to the caller (normally a transport_channel). The process
     * itself is owned here: destruction terminates and reaps it.
     */
    class child_process {
      public:
        struct pipes {
            int stdin_fd{-1};
            int stdout_fd{-1};
        };

        // Throws session_error{spawn_error} if the executable cannot be started or exits immediately.
        static child_process spawn(const spawn_options& opts, pipes& out);

        child_process() = default;
        ~child_process();

        child_process(child_process&& other) noexcept;
        child_process& operator=(child_process&& other) noexcept;
        child_process(const child_process&) = delete;
        child_process& operator=(const child_process&) = delete;

        pid_t pid() const { return pid_; }

        // Non-blocking; reaps the child when it has exited.
        bool is_alive();

        // Sends SIGTERM, waits up to grace, then SIGKILL. Idempotent.
        void terminate(std::chrono::milliseconds grace);

        // Waits up to timeout for the process to exit on its own (after shutdown/exit).
        bool wait_for_exit(std::chrono::milliseconds timeout);

        std::optional<exit_status> status() const;

      private:
        explicit child_process(pid_t pid) : pid_{pid} {}

        bool reap_locked(int flags);

        mutable std::mutex mutex_{};
        pid_t pid_{-1};
        std::optional<exit_status> status_{};
    };

}  // namespace lsbridge
