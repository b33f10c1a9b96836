#pragma once

#include "utils.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace lsbridge {

    using namespace std::string_view_literals;

    /*
     * lsbridge Startup Config Options
     *
     * Backend
     * - server_path: Language server executable, resolved through PATH when not absolute.
     * - server_args: Extra arguments passed to every spawned language server.
     * - server_log: Destination for the language server's stderr (appended).
     * - root_markers: Entries that mark a project root. "*.ext" matches by suffix.
     *
     * Timeouts
     * - handshake_timeout_ms: Deadline for the initialize reply. First load can index the
     *   whole project, so this is deliberately longer than request_timeout_ms.
     * - request_timeout_ms: Deadline for every steady-state request.
     * - shutdown_grace_ms: Time given to the server to exit after shutdown/exit before SIGKILL.
     * - idle_timeout_ms: Sessions unused for longer than this are evicted. 0 disables.
     * - reaper_interval_ms: How often the registry sweeps for idle or dead sessions.
     *
     * Limits
     * - max_body_bytes: Largest accepted Content-Length from the server.
     *
     * Observability and UX
     * - events_file: Optional JSON-lines sink for per-operation execution events.
     * - verbosity: quiet|normal|verbose stderr logging.
     * - mode: mcp (stdio tool server) or repl (interactive command loop).
     * - history_file: Line history for the repl. Unset keeps history in memory only.
     *
     * Introspection flags (one-shot startup actions)
     * - print_config: Print resolved startup config and exit.
     */

    enum class run_mode { mcp, repl };

    inline constexpr std::string_view to_string(run_mode mode) {
        switch (mode) {
            case run_mode::mcp:
                return "mcp"sv;
            case run_mode::repl:
                return "repl"sv;
        }
        return "mcp"sv;
    }

    inline constexpr bool try_parse_run_mode(std::string_view text, run_mode& out) {
        if (utils::str_case_eq(text, "mcp"sv)) {
            out = run_mode::mcp;
            return true;
        }
        if (utils::str_case_eq(text, "repl"sv)) {
            out = run_mode::repl;
            return true;
        }
        return false;
    }

    inline constexpr std::string_view to_string(log_level level) {
        switch (level) {
            case log_level::quiet:
                return "quiet"sv;
            case log_level::normal:
                return "normal"sv;
            case log_level::verbose:
                return "verbose"sv;
        }
        return "normal"sv;
    }

    inline constexpr bool try_parse_log_level(std::string_view text, log_level& out) {
        if (utils::str_case_eq(text, "quiet"sv)) {
            out = log_level::quiet;
            return true;
        }
        if (utils::str_case_eq(text, "normal"sv)) {
            out = log_level::normal;
            return true;
        }
        if (utils::str_case_eq(text, "verbose"sv) || utils::str_case_eq(text, "debug"sv)) {
            out = log_level::verbose;
            return true;
        }
        return false;
    }

    struct startup_config {
        std::filesystem::path server_path{"sourcekit-lsp"};
        std::vector<std::string> server_args{};
        std::filesystem::path server_log{"/dev/null"};
        std::vector<std::string> root_markers{
                "Package.swift", "*.xcodeproj", "*.xcworkspace", "compile_commands.json", "buildServer.json"};

        int handshake_timeout_ms{30'000};
        int request_timeout_ms{10'000};
        int shutdown_grace_ms{2'000};
        int idle_timeout_ms{300'000};
        int reaper_interval_ms{1'000};

        std::size_t max_body_bytes{64U << 20U};

        std::optional<std::filesystem::path> events_file{};
        log_level verbosity{log_level::normal};
        run_mode mode{run_mode::mcp};
        std::optional<std::filesystem::path> history_file{};

        std::optional<std::filesystem::path> config_file{};
        bool print_config{false};
    };

    // JSON config file shape; every field is optional so a file may override any subset.
    struct persisted_config {
        int schema_version{1};
        std::optional<std::string> server_path{};
        std::optional<std::vector<std::string>> server_args{};
        std::optional<std::string> server_log{};
        std::optional<std::vector<std::string>> root_markers{};
        std::optional<int> handshake_timeout_ms{};
        std::optional<int> request_timeout_ms{};
        std::optional<int> shutdown_grace_ms{};
        std::optional<int> idle_timeout_ms{};
        std::optional<int> reaper_interval_ms{};
        std::optional<std::size_t> max_body_bytes{};
        std::optional<std::string> events_file{};
        std::optional<std::string> verbosity{};
    };

    // Applies a JSON config file on top of cfg. Throws std::runtime_error on unreadable or malformed files.
    void load_config_file(startup_config& cfg, const std::filesystem::path& path);

    // Applies LSBRIDGE_SERVER, LSBRIDGE_REQUEST_TIMEOUT_MS and LSBRIDGE_IDLE_TIMEOUT_MS when set and valid.
    void apply_environment_overrides(startup_config& cfg);

    void print_config(const startup_config& cfg, std::ostream& os);

}  // namespace lsbridge
