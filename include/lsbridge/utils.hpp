#pragma once

#include <algorithm>
#include <atomic>
#include <charconv>
#include <iostream>
#include <optional>
#include <ranges>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace lsbridge {

    enum class log_level : int { quiet = 0, normal = 1, verbose = 2 };

    namespace detail {
        inline std::atomic<int>& current_log_level() {
            static std::atomic<int> level{static_cast<int>(log_level::normal)};
            return level;
        }

        constexpr std::string_view sloc_fname(const std::source_location& loc) {
            std::string_view sv{loc.file_name()};
            if (auto p = sv.rfind('/'); p != sv.npos)
                sv.remove_prefix(p + 1);
            return sv;
        }

        inline void prepend_location(std::ostream& os, const std::source_location& loc) {
            os << '[' << sloc_fname(loc) << ':' << loc.line() << "] ";
        }
    }  // namespace detail

    inline void set_log_level(log_level level) {
        detail::current_log_level().store(static_cast<int>(level), std::memory_order_relaxed);
    }

    inline log_level get_log_level() {
        return static_cast<log_level>(detail::current_log_level().load(std::memory_order_relaxed));
    }

    inline bool log_enabled(log_level level) {
        return static_cast<int>(level) <= detail::current_log_level().load(std::memory_order_relaxed);
    }

    // Debug logger; no-op on release builds
#ifndef NDEBUG
    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(
                Args&&... args, const std::source_location& loc = std::source_location::current()) {
            if (!log_enabled(log_level::verbose)) {
                return;
            }
            detail::prepend_location(std::cerr, loc);
            (std::cerr << ... << std::forward<Args>(args)) << std::endl;
        }
    };
#else
    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(Args&&...) {}
    };
#endif

    // deduction guide
    template <typename... Args>
    debug_log(Args&&...) -> debug_log<Args...>;

    // stderr only; stdout carries the mcp wire protocol
    template <typename... Args>
    struct log_info {
        explicit log_info(Args&&... args) {
            if (log_enabled(log_level::verbose)) {
                std::cerr << "lsbridge: ";
                (std::cerr << ... << std::forward<Args>(args)) << '\n';
            }
        }
    };

    template <typename... Args>
    log_info(Args&&...) -> log_info<Args...>;

    template <typename... Args>
    struct log_warn {
        explicit log_warn(Args&&... args) {
            if (log_enabled(log_level::normal)) {
                std::cerr << "lsbridge: warning: ";
                (std::cerr << ... << std::forward<Args>(args)) << '\n';
            }
        }
    };

    template <typename... Args>
    log_warn(Args&&...) -> log_warn<Args...>;

    template <typename... Args>
    struct log_error {
        explicit log_error(Args&&... args) {
            std::cerr << "lsbridge: error: ";
            (std::cerr << ... << std::forward<Args>(args)) << '\n';
        }
    };

    template <typename... Args>
    log_error(Args&&...) -> log_error<Args...>;

    namespace utils {
        constexpr char char_tolower(char c) {
            if (c >= 'A' && c <= 'Z') {
                return c + ('a' - 'A');
            }
            return c;
        }

        constexpr bool str_case_eq(std::string_view lhs, std::string_view rhs) {
            return std::ranges::equal(
                    lhs | std::views::transform(char_tolower), rhs | std::views::transform(char_tolower));
        }

        constexpr std::string_view trim_view(std::string_view value) {
            auto first = value.find_first_not_of(" \t\r\n");
            if (first == std::string_view::npos) {
                return {};
            }
            auto last = value.find_last_not_of(" \t\r\n");
            return value.substr(first, (last - first) + 1U);
        }

        namespace detail {
            template <typename T>
            concept arithmetic_type = std::integral<T> || std::floating_point<T>;
        }

        template <detail::arithmetic_type T>
        constexpr std::optional<T> parse_arithmetic(std::string_view input, [[maybe_unused]] int base = 10) {
            T value{};
            std::from_chars_result result;

            if constexpr (std::integral<T>) {
                result = std::from_chars(input.data(), input.data() + input.size(), value, base);
            }
            else {
                result = std::from_chars(input.data(), input.data() + input.size(), value);
            }

            if (result.ec != std::errc{} || result.ptr != input.data() + input.size()) {
                return std::nullopt;
            }

            return {value};
        }

        inline std::string join_with_separator(const std::vector<std::string>& values, std::string_view separator) {
            if (values.empty()) {
                return {};
            }
            return values | std::views::join_with(separator) | std::ranges::to<std::string>();
        }

        inline std::vector<std::string_view> split_words(std::string_view text) {
            std::vector<std::string_view> words{};
            size_t pos = 0;
            while (pos < text.size()) {
                auto start = text.find_first_not_of(" \t", pos);
                if (start == std::string_view::npos) {
                    break;
                }
                auto end = text.find_first_of(" \t", start);
                if (end == std::string_view::npos) {
                    end = text.size();
                }
                words.push_back(text.substr(start, end - start));
                pos = end;
            }
            return words;
        }

    }  // namespace utils

}  // namespace lsbridge
