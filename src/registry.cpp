#include "lsbridge/registry.hpp"

#include "lsbridge/format.hpp"

#include <algorithm>

using namespace lsbridge::literals;
namespace fs = std::filesystem;

namespace lsbridge {

    session_registry::session_registry(startup_config cfg, std::shared_ptr<event_sink> events, session_factory factory)
            : cfg_{std::move(cfg)}, events_{std::move(events)}, factory_{std::move(factory)} {
        if (!factory_) {
            factory_ = [this](const fs::path& root) {
                return session::open(session_options::from_config(root, cfg_), events_);
            };
        }
        reaper_ = std::jthread{[this](std::stop_token stop) { reaper_loop(stop); }};
    }

    session_registry::~session_registry() {
        reaper_.request_stop();
        wake_cv_.notify_all();
        if (reaper_.joinable()) {
            reaper_.join();
        }
        shutdown_all();
    }

    fs::path session_registry::key_for(const fs::path& root) {
        auto key = root.lexically_normal();
        // "/work/app/" and "/work/app" are the same root
        if (!key.has_filename() && key.has_relative_path()) {
            key = key.parent_path();
        }
        return key;
    }

    std::shared_ptr<session> session_registry::acquire(const fs::path& root) {
        auto key = key_for(root);

        std::promise<std::shared_ptr<session>> promise{};
        std::shared_future<std::shared_ptr<session>> in_flight{};
        std::shared_ptr<session> stale{};
        uint64_t generation = 0;
        {
            std::lock_guard lock{mutex_};
            if (auto it = entries_.find(key); it != entries_.end()) {
                auto& e = it->second;
                if (e.live && e.live->healthy()) {
                    e.last_used = clock::now();
                    return e.live;
                }
                if (e.live) {
                    stale = std::move(e.live);
                    entries_.erase(it);
                }
                else {
                    in_flight = e.pending;
                }
            }
            if (!in_flight.valid()) {
                generation = ++generation_;
                entries_[key] = entry{
                        .pending = promise.get_future().share(), .last_used = clock::now(), .generation = generation};
            }
        }

        if (stale) {
            log_info("replacing unhealthy session for ", key.string());
            stale->close();
        }
        if (in_flight.valid()) {
            debug_log("waiting for in-flight session start for ", key.string());
            return in_flight.get();
        }

        std::shared_ptr<session> created{};
        try {
            created = factory_(key);
        } catch (...) {
            {
                std::lock_guard lock{mutex_};
                if (auto it = entries_.find(key); it != entries_.end() && it->second.generation == generation) {
                    entries_.erase(it);
                }
            }
            // waiters receive the same failure
            promise.set_exception(std::current_exception());
            throw;
        }

        created->set_disconnect_handler([this] { request_sweep(); });

        bool orphaned = false;
        {
            std::lock_guard lock{mutex_};
            auto it = entries_.find(key);
            if (it != entries_.end() && it->second.generation == generation) {
                it->second.live = created;
                it->second.pending = {};
                it->second.last_used = clock::now();
            }
            else {
                orphaned = true;
            }
        }

        if (orphaned) {
            created->close();
            session_error err{
                    error_kind::backend_disconnected,
                    "session for {} was evicted while starting"_format(key.string())};
            promise.set_exception(std::make_exception_ptr(err));
            throw err;
        }

        promise.set_value(created);
        return created;
    }

    bool session_registry::evict(const fs::path& root) {
        auto key = key_for(root);
        std::shared_ptr<session> victim{};
        {
            std::lock_guard lock{mutex_};
            auto it = entries_.find(key);
            if (it == entries_.end()) {
                return false;
            }
            victim = std::move(it->second.live);
            entries_.erase(it);
        }
        log_info("evicting session for ", key.string());
        if (victim) {
            victim->close();
        }
        return true;
    }

    bool session_registry::evict(const fs::path& root, const std::shared_ptr<session>& expected) {
        if (!expected) {
            return false;
        }
        auto key = key_for(root);
        bool removed = false;
        {
            std::lock_guard lock{mutex_};
            auto it = entries_.find(key);
            if (it != entries_.end() && it->second.live == expected) {
                entries_.erase(it);
                removed = true;
            }
        }
        if (removed) {
            log_info("evicting session for ", key.string());
        }
        else {
            debug_log("session for ", key.string(), " was already replaced; closing the stale one only");
        }
        // the failed session is closed either way; its replacement is untouched
        expected->close();
        return removed;
    }

    size_t session_registry::shutdown_all() {
        std::vector<std::shared_ptr<session>> victims{};
        {
            std::lock_guard lock{mutex_};
            for (auto& [root, e] : entries_) {
                if (e.live) {
                    victims.push_back(std::move(e.live));
                }
            }
            entries_.clear();
        }
        for (auto& s : victims) {
            s->close();
        }
        if (!victims.empty()) {
            log_info("shut down ", victims.size(), " session(s)");
        }
        return victims.size();
    }

    size_t session_registry::sweep() {
        std::vector<std::shared_ptr<session>> victims{};
        auto now = clock::now();
        auto idle_limit = std::chrono::milliseconds{cfg_.idle_timeout_ms};
        {
            std::lock_guard lock{mutex_};
            for (auto it = entries_.begin(); it != entries_.end();) {
                auto& e = it->second;
                if (!e.live) {
                    ++it;
                    continue;
                }
                if (!e.live->healthy()) {
                    log_warn("removing disconnected session for ", it->first.string());
                }
                else if (idle_limit.count() > 0 && now - e.last_used > idle_limit && e.live->pending_requests() == 0) {
                    log_info("evicting idle session for ", it->first.string(), " after ", to_millis(now - e.last_used), "ms");
                }
                else {
                    ++it;
                    continue;
                }
                victims.push_back(std::move(e.live));
                it = entries_.erase(it);
            }
        }
        for (auto& s : victims) {
            s->close();
        }
        return victims.size();
    }

    void session_registry::request_sweep() {
        {
            std::lock_guard lock{wake_mutex_};
            wake_requested_ = true;
        }
        wake_cv_.notify_all();
    }

    void session_registry::reaper_loop(std::stop_token stop) {
        auto interval = std::chrono::milliseconds{std::max(cfg_.reaper_interval_ms, 1)};
        while (!stop.stop_requested()) {
            {
                std::unique_lock lock{wake_mutex_};
                wake_cv_.wait_for(lock, stop, interval, [this] { return wake_requested_; });
                wake_requested_ = false;
            }
            if (stop.stop_requested()) {
                break;
            }
            sweep();
        }
    }

    size_t session_registry::size() const {
        std::lock_guard lock{mutex_};
        return entries_.size();
    }

    bool session_registry::contains(const fs::path& root) const {
        std::lock_guard lock{mutex_};
        return entries_.contains(key_for(root));
    }

    std::vector<session_summary> session_registry::list() const {
        std::vector<session_summary> out{};
        auto now = clock::now();
        std::lock_guard lock{mutex_};
        for (const auto& [root, e] : entries_) {
            session_summary summary{
                    .root = root,
                    .idle = std::chrono::duration_cast<std::chrono::milliseconds>(now - e.last_used),
                    .starting = !e.live};
            if (e.live) {
                summary.pid = e.live->pid();
                summary.state = e.live->state();
                summary.pending_requests = e.live->pending_requests();
            }
            out.push_back(std::move(summary));
        }
        return out;
    }

    uint64_t session_registry::starts() const {
        std::lock_guard lock{mutex_};
        return generation_;
    }

}  // namespace lsbridge
