#pragma once

#include "errors.hpp"
#include "registry.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace lsbridge {

    // JSON document handed back to the agent; is_error mirrors its "success": false.
    struct tool_result {
        std::string json{};
        bool is_error{false};
    };

    inline constexpr size_t max_symbol_name_length = 200;
    inline constexpr size_t max_pattern_length = 1000;
    inline constexpr int max_context_lines = 50;
    inline constexpr size_t max_search_file_bytes = 10U << 20U;
    inline constexpr size_t max_pattern_matches = 10'000;

    /*
     * Agent-facing tools. Each call validates its arguments, resolves the project root,
     * borrows a session from the registry and turns every failure into a structured
     * {"success": false, "error": ..., "error_type": ...} result. Session-fatal failures
     * also evict the session so the next call starts a fresh server.
     */
    class tool_service {
      public:
        explicit tool_service(session_registry& registry) : registry_{registry} {}

        tool_result check_environment(const std::filesystem::path& directory);

        // line and character are 1-based
        tool_result get_hover_info(const std::string& file_path, int line, int character);

        tool_result get_symbol_definition(const std::string& file_path, const std::string& symbol_name);

        tool_result find_symbol_references(const std::string& file_path, const std::string& symbol_name);

        // symbol_name may be a dotted path ("Type.member"); a trailing "()" is ignored.
        tool_result replace_symbol_body(
                const std::string& file_path, const std::string& symbol_name, const std::string& new_body);

        tool_result get_diagnostics(const std::string& file_path);

        // Full symbol tree of a file; positions are the 1-based start of each symbol's name.
        tool_result analyze_file(const std::string& file_path);

        // Top-level type declarations only (class, struct, enum, protocol, extension).
        tool_result get_symbols_overview(const std::string& file_path);

        // Read from the file text; no language server involved.
        tool_result get_file_imports(const std::string& file_path);

        /*
         * Every match of pattern in the file, with 1-based line and character. A literal
         * pattern (is_regex false) is matched verbatim. flags may hold 'i' (ignore case) and
         * 'm' (^ and $ match at line breaks). context_lines > 0 returns that many lines on
         * each side of the match instead of just the matching line.
         */
        tool_result search_pattern(
                const std::string& file_path,
                const std::string& pattern,
                bool is_regex = true,
                const std::string& flags = "",
                int context_lines = 0);

        // Root used for file_path: the resolved project root, else the file's directory.
        std::filesystem::path root_for(const std::filesystem::path& file) const;

      private:
        template <typename F>
        tool_result with_session(const std::filesystem::path& file, F&& fn);

        session_registry& registry_;
    };

}  // namespace lsbridge
