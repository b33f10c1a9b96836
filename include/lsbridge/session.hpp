#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "events.hpp"
#include "multiplexer.hpp"
#include "process.hpp"
#include "protocol.hpp"
#include "transport.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

namespace lsbridge {

    enum class session_state : uint8_t { uninitialized, initializing, ready, degraded, closed };

    inline constexpr std::string_view to_string(session_state state) {
        switch (state) {
            case session_state::uninitialized:
                return "uninitialized"sv;
            case session_state::initializing:
                return "initializing"sv;
            case session_state::ready:
                return "ready"sv;
            case session_state::degraded:
                return "degraded"sv;
            case session_state::closed:
                return "closed"sv;
        }
        return "closed"sv;
    }

    struct session_options {
        std::filesystem::path root{};
        std::filesystem::path server_path{};
        std::vector<std::string> server_args{};
        std::filesystem::path server_log{"/dev/null"};
        std::chrono::milliseconds handshake_timeout{30'000};
        std::chrono::milliseconds request_timeout{10'000};
        std::chrono::milliseconds shutdown_grace{2'000};
        size_t max_body_bytes{default_max_body_bytes};

        static session_options from_config(const std::filesystem::path& root, const startup_config& cfg);
    };

    /*
     * One language server process bound to one project root.
     *
     * A dedicated reader thread drains the server's output and hands every frame to the
     * multiplexer; callers block only on their own request slot. When the stream ends or
     * breaks, every outstanding request fails with backend_disconnected, the session
     * becomes degraded and the disconnect handler runs (on the reader thread, so it must
     * not close the session itself).
     *
     * Typed operations throw session_error:
     *   - handshake_not_complete before initialize() has finished
     *   - backend_disconnected once degraded or closed
     *   - timeout when no reply arrived within request_timeout (the session stays usable)
     *   - invalid_response for backend errors and empty results where a result is required
     */
    class session {
        struct private_tag {
            explicit private_tag() = default;
        };

      public:
        using disconnect_handler = std::function<void()>;

        // Use spawn() or open().
        session(private_tag, session_options opts, std::shared_ptr<event_sink> events);

        // Starts the server process and the reader thread; no handshake yet.
        static std::shared_ptr<session> spawn(session_options opts, std::shared_ptr<event_sink> events = nullptr);

        // spawn() + initialize(). Whatever was acquired is released if the handshake fails.
        static std::shared_ptr<session> open(session_options opts, std::shared_ptr<event_sink> events = nullptr);

        ~session();

        session(const session&) = delete;
        session& operator=(const session&) = delete;

        // initialize request, then the initialized notification. Throws handshake_timeout.
        void initialize();

        hover_info hover(const std::filesystem::path& file, position pos);
        std::vector<location> definition(const std::filesystem::path& file, position pos);
        std::vector<location> references(
                const std::filesystem::path& file, position pos, bool include_declaration = true);
        std::vector<document_symbol> document_symbols(const std::filesystem::path& file);

        // Last published diagnostics for file; empty when the server has published none.
        std::vector<diagnostic> diagnostics(const std::filesystem::path& file);

        // Rewrites [span.start, span.end) of file with new_text on disk, then syncs the server.
        // Lines in the result are 1-based.
        edit_result apply_edit(const std::filesystem::path& file, range span, std::string_view new_text);

        // Raw request; params and the returned result are JSON text.
        std::string request(std::string_view method, std::string params_json);

        // shutdown/exit when the handshake completed, then terminate and join. Idempotent.
        void close();

        void set_disconnect_handler(disconnect_handler handler);

        session_state state() const;
        bool healthy();
        pid_t pid() const { return process_.pid(); }
        const std::filesystem::path& root() const { return opts_.root; }
        const session_options& options() const { return opts_; }
        size_t pending_requests() const { return mux_.pending(); }

      private:
        void start();
        void read_loop();

        void on_notification(std::string_view method, std::string_view params);
        void on_server_request(std::string_view id_json, std::string_view method, std::string_view params);

        void require_ready() const;
        void mark_degraded();

        std::string send_request(std::string_view method, std::string params_json, std::chrono::milliseconds timeout);
        void send_notification(
                std::string_view method, std::string params_json, std::chrono::steady_clock::time_point deadline);

        std::string ensure_document_open(const std::filesystem::path& file);

        template <typename F>
        auto traced(std::string_view operation, F&& fn);

        session_options opts_;
        std::shared_ptr<event_sink> events_;

        child_process process_{};
        std::unique_ptr<transport_channel> channel_{};
        request_multiplexer mux_;
        std::jthread reader_{};

        mutable std::mutex state_mutex_{};
        session_state state_{session_state::uninitialized};
        bool handshake_done_{false};
        disconnect_handler on_disconnect_{};

        std::mutex close_mutex_{};

        std::mutex documents_mutex_{};
        std::unordered_map<std::string, int> open_documents_{};

        std::mutex diagnostics_mutex_{};
        std::unordered_map<std::string, std::vector<diagnostic>> diagnostics_{};
    };

}  // namespace lsbridge
