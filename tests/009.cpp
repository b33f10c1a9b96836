#include "utils.hpp"

namespace lsbridge::test {

    namespace {
        constexpr std::string_view small_source = "struct Counter {\n    func tick() {\n    }\n}\n";
    }  // namespace

    TEST_CASE("009: concurrent acquires share one start", "[009][registry]") {
        temp_dir dir{"lsbridge_registry_concurrent"};
        make_swift_package(dir, small_source);
        session_registry registry{fake_config({"--init-delay-ms", "300"})};

        std::vector<std::future<std::shared_ptr<session>>> callers{};
        for (int i = 0; i < 8; ++i) {
            callers.push_back(std::async(std::launch::async, [&] { return registry.acquire(dir.path); }));
        }

        std::vector<std::shared_ptr<session>> sessions{};
        for (auto& f : callers) {
            sessions.push_back(f.get());
        }
        for (const auto& s : sessions) {
            CHECK(s == sessions.front());
        }
        CHECK(registry.starts() == 1U);
        CHECK(registry.size() == 1U);
        CHECK(sessions.front()->state() == session_state::ready);

        // trailing slash and dot segments name the same root
        CHECK(registry.acquire(dir.path / "." / "") == sessions.front());
        CHECK(registry.starts() == 1U);
    }

    TEST_CASE("009: distinct roots get distinct servers", "[009][registry]") {
        temp_dir a{"lsbridge_registry_a"};
        temp_dir b{"lsbridge_registry_b"};
        session_registry registry{fake_config()};

        auto sa = registry.acquire(a.path);
        auto sb = registry.acquire(b.path);
        CHECK(sa != sb);
        CHECK(sa->pid() != sb->pid());
        CHECK(registry.starts() == 2U);

        auto listed = registry.list();
        REQUIRE(listed.size() == 2U);
        for (const auto& summary : listed) {
            CHECK_FALSE(summary.starting);
            CHECK(summary.state == session_state::ready);
            CHECK(summary.pid > 0);
        }
    }

    TEST_CASE("009: idle sessions are evicted and restarted on demand", "[009][registry]") {
        temp_dir dir{"lsbridge_registry_idle"};
        auto cfg = fake_config();
        cfg.idle_timeout_ms = 200;
        session_registry registry{cfg};

        auto first = registry.acquire(dir.path);
        auto first_pid = first->pid();
        first.reset();

        REQUIRE(eventually([&] { return !registry.contains(dir.path); }));
        CHECK(eventually([&] { return !process_exists(first_pid); }));

        auto second = registry.acquire(dir.path);
        CHECK(second->pid() != first_pid);
        CHECK(second->healthy());
        CHECK(registry.starts() == 2U);
    }

    TEST_CASE("009: idle sweep waits for in-flight requests", "[009][registry]") {
        temp_dir dir{"lsbridge_registry_busy"};
        auto file = make_swift_package(dir, small_source);
        auto cfg = fake_config();
        cfg.idle_timeout_ms = 200;
        session_registry registry{cfg};

        auto s = registry.acquire(dir.path);
        auto slow = std::async(std::launch::async, [&] { return s->hover(file, position{98, 0}); });
        REQUIRE(eventually([&] { return s->pending_requests() == 1U; }));

        std::this_thread::sleep_for(700ms);
        CHECK(registry.contains(dir.path));
        CHECK(slow.get().contents == "late");

        CHECK(eventually([&] { return !registry.contains(dir.path); }));
    }

    TEST_CASE("009: a disconnected session is removed without waiting for idle", "[009][registry]") {
        temp_dir dir{"lsbridge_registry_crash"};
        session_registry registry{fake_config({"--crash-after-init-ms", "150"})};

        auto s = registry.acquire(dir.path);
        auto pid = s->pid();
        REQUIRE(eventually([&] { return s->state() == session_state::degraded; }));
        CHECK(eventually([&] { return !registry.contains(dir.path); }));

        auto replacement = registry.acquire(dir.path);
        CHECK(replacement != s);
        CHECK(replacement->pid() != pid);
        CHECK(registry.starts() == 2U);
    }

    TEST_CASE("009: evicting a failed session never removes its replacement", "[009][registry]") {
        temp_dir dir{"lsbridge_registry_stale_evict"};
        auto cfg = fake_config();
        cfg.reaper_interval_ms = 60'000;
        session_registry registry{cfg};

        auto first = registry.acquire(dir.path);
        REQUIRE(::kill(first->pid(), SIGKILL) == 0);
        REQUIRE(eventually([&] { return !first->healthy(); }));
        registry.sweep();
        REQUIRE_FALSE(registry.contains(dir.path));

        auto second = registry.acquire(dir.path);
        REQUIRE(second != first);
        REQUIRE(registry.starts() == 2U);

        // a caller that saw the first session fail reports it late
        CHECK_FALSE(registry.evict(dir.path, first));
        CHECK(second->healthy());
        CHECK(registry.acquire(dir.path) == second);
        CHECK(registry.starts() == 2U);

        CHECK(registry.evict(dir.path, second));
        CHECK_FALSE(registry.contains(dir.path));
        CHECK(second->state() == session_state::closed);
    }

    TEST_CASE("009: evicting a failed session leaves a start in flight alone", "[009][registry]") {
        temp_dir dir{"lsbridge_registry_evict_starting"};
        auto cfg = fake_config();
        session_registry registry{cfg, nullptr, [&](const fs::path& root) {
                                      std::this_thread::sleep_for(300ms);
                                      return session::open(session_options::from_config(root, cfg));
                                  }};
        auto unrelated = session::open(fake_options(dir.path));

        auto starting = std::async(std::launch::async, [&] { return registry.acquire(dir.path); });
        REQUIRE(eventually([&] { return registry.contains(dir.path); }));

        CHECK_FALSE(registry.evict(dir.path, unrelated));
        CHECK(registry.contains(dir.path));

        REQUIRE(starting.wait_for(10s) == std::future_status::ready);
        auto s = starting.get();
        CHECK(s->healthy());
        CHECK(registry.acquire(dir.path) == s);
        CHECK(registry.starts() == 1U);
    }

    TEST_CASE("009: acquire replaces an unhealthy session itself", "[009][registry]") {
        temp_dir dir{"lsbridge_registry_replace"};
        auto cfg = fake_config();
        // keep the reaper out of the way
        cfg.reaper_interval_ms = 60'000;
        session_registry registry{cfg};

        auto a = registry.acquire(dir.path);
        a->close();
        auto b = registry.acquire(dir.path);
        CHECK(b != a);
        CHECK(b->healthy());
        CHECK(registry.starts() == 2U);
    }

    TEST_CASE("009: a failed start is reported to every waiter and retried later", "[009][registry]") {
        temp_dir dir{"lsbridge_registry_fail"};
        std::atomic<int> calls{0};
        std::atomic<bool> fail{true};
        auto cfg = fake_config();
        session_registry registry{cfg, nullptr, [&](const fs::path& root) {
                                      ++calls;
                                      if (fail.load()) {
                                          std::this_thread::sleep_for(200ms);
                                          throw session_error{error_kind::spawn_error, "cannot start"};
                                      }
                                      return session::open(session_options::from_config(root, cfg));
                                  }};

        // no Catch assertions off the main thread
        std::vector<std::future<std::optional<error_kind>>> callers{};
        for (int i = 0; i < 4; ++i) {
            callers.push_back(std::async(std::launch::async, [&]() -> std::optional<error_kind> {
                try {
                    (void)registry.acquire(dir.path);
                } catch (const session_error& e) {
                    return e.kind();
                }
                return std::nullopt;
            }));
        }
        for (auto& f : callers) {
            CHECK(f.get() == std::optional<error_kind>{error_kind::spawn_error});
        }
        CHECK(calls.load() == 1);
        CHECK_FALSE(registry.contains(dir.path));

        fail = false;
        auto s = registry.acquire(dir.path);
        CHECK(s->healthy());
        CHECK(calls.load() == 2);
    }

    TEST_CASE("009: evict and shutdown_all close servers", "[009][registry]") {
        temp_dir a{"lsbridge_registry_evict_a"};
        temp_dir b{"lsbridge_registry_evict_b"};
        session_registry registry{fake_config()};

        auto pa = registry.acquire(a.path)->pid();
        auto pb = registry.acquire(b.path)->pid();

        CHECK(registry.evict(a.path));
        CHECK_FALSE(registry.evict(a.path));
        CHECK_FALSE(process_exists(pa));
        CHECK(process_exists(pb));

        CHECK(registry.shutdown_all() == 1U);
        CHECK(registry.size() == 0U);
        CHECK_FALSE(process_exists(pb));
    }

}  // namespace lsbridge::test
