#pragma once

#include "lsbridge.hpp"

#include <catch2/catch_test_macros.hpp>
#include <glaze/glaze.hpp>

#include "../src/internal/text.hpp"
#include "../src/internal/types.hpp"

extern "C" {
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <future>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

namespace lsbridge::test {

    namespace fs = std::filesystem;
    using namespace std::chrono_literals;
    using namespace std::string_view_literals;
    using namespace lsbridge::literals;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            static std::atomic<int> counter{0};
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now << "_" << counter++;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
            path = fs::canonical(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }

        temp_dir(const temp_dir&) = delete;
        temp_dir& operator=(const temp_dir&) = delete;
    };

    inline void write_file(const fs::path& p, std::string_view content) {
        if (p.has_parent_path()) {
            fs::create_directories(p.parent_path());
        }
        std::ofstream out{p, std::ios::binary};
        REQUIRE(out.good());
        out << content;
    }

    inline std::string read_file(const fs::path& p) {
        std::ifstream in{p, std::ios::binary};
        REQUIRE(in.good());
        std::ostringstream ss{};
        ss << in.rdbuf();
        return ss.str();
    }

    inline fs::path fake_server_path() {
        return fs::path{LSBRIDGE_FAKE_SERVER_PATH};
    }

    // A project directory recognised by the default markers.
    inline fs::path make_swift_package(const temp_dir& dir, std::string_view source) {
        write_file(dir.path / "Package.swift", "// swift-tools-version:5.9\n");
        auto file = dir.path / "Sources" / "App" / "main.swift";
        write_file(file, source);
        return file;
    }

    inline startup_config fake_config(std::vector<std::string> server_args = {}) {
        startup_config cfg{};
        cfg.server_path = fake_server_path();
        cfg.server_args = std::move(server_args);
        cfg.handshake_timeout_ms = 5'000;
        cfg.request_timeout_ms = 3'000;
        cfg.shutdown_grace_ms = 500;
        cfg.idle_timeout_ms = 0;
        cfg.reaper_interval_ms = 50;
        return cfg;
    }

    inline session_options fake_options(const fs::path& root, std::vector<std::string> server_args = {}) {
        return session_options::from_config(root, fake_config(std::move(server_args)));
    }

    // Polls pred until it holds or timeout passes; returns its final value.
    inline bool eventually(const std::function<bool()>& pred, std::chrono::milliseconds timeout = 5s) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (pred()) {
                return true;
            }
            std::this_thread::sleep_for(10ms);
        }
        return pred();
    }

    inline bool process_exists(pid_t pid) {
        return pid > 0 && (::kill(pid, 0) == 0 || errno == EPERM);
    }

    inline bool contains(std::string_view haystack, std::string_view needle) {
        return haystack.find(needle) != std::string_view::npos;
    }

    template <typename F>
    error_kind error_kind_of(F&& fn) {
        try {
            std::forward<F>(fn)();
        } catch (const session_error& e) {
            return e.kind();
        }
        FAIL("expected a session_error");
        return error_kind::invalid_response;
    }

}  // namespace lsbridge::test
