#pragma once

#include "config.hpp"
#include "events.hpp"
#include "session.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace lsbridge {

    struct session_summary {
        std::filesystem::path root{};
        pid_t pid{-1};
        session_state state{session_state::uninitialized};
        std::chrono::milliseconds idle{};
        size_t pending_requests{};
        bool starting{false};
    };

    /*
     * Process-wide map from project root to session.
     *
     * acquire() returns the live session for a root or creates one. While a creation is in
     * flight the entry holds a shared future, so concurrent callers for the same root wait
     * on that single attempt and all observe its outcome. Sessions are always closed outside
     * the map lock. A background reaper removes disconnected sessions as soon as they report
     * it, and sessions idle for longer than idle_timeout_ms on every sweep.
     */
    class session_registry {
      public:
        using clock = std::chrono::steady_clock;
        using session_factory = std::function<std::shared_ptr<session>(const std::filesystem::path& root)>;

        // An empty factory means session::open with options derived from cfg.
        explicit session_registry(
                startup_config cfg, std::shared_ptr<event_sink> events = nullptr, session_factory factory = {});
        ~session_registry();

        session_registry(const session_registry&) = delete;
        session_registry& operator=(const session_registry&) = delete;

        std::shared_ptr<session> acquire(const std::filesystem::path& root);

        // Removes and closes the session for root. Returns false when there was none.
        bool evict(const std::filesystem::path& root);

        // Like evict(root), but only while root still maps to expected. A caller reporting a
        // failure of one session never removes its replacement or a start in flight.
        bool evict(const std::filesystem::path& root, const std::shared_ptr<session>& expected);

        // Closes every session; later acquire() calls start fresh ones.
        size_t shutdown_all();

        // One reaper pass; returns the number of sessions removed.
        size_t sweep();

        size_t size() const;
        bool contains(const std::filesystem::path& root) const;
        std::vector<session_summary> list() const;

        // Number of session creations attempted so far.
        uint64_t starts() const;

        const startup_config& config() const { return cfg_; }

      private:
        struct entry {
            std::shared_future<std::shared_ptr<session>> pending{};
            std::shared_ptr<session> live{};
            clock::time_point last_used{};
            uint64_t generation{};
        };

        static std::filesystem::path key_for(const std::filesystem::path& root);

        void reaper_loop(std::stop_token stop);
        void request_sweep();

        startup_config cfg_;
        std::shared_ptr<event_sink> events_;
        session_factory factory_;

        mutable std::mutex mutex_{};
        std::map<std::filesystem::path, entry> entries_{};
        uint64_t generation_{0};

        std::mutex wake_mutex_{};
        std::condition_variable_any wake_cv_{};
        bool wake_requested_{false};

        std::jthread reaper_{};
    };

}  // namespace lsbridge
