#pragma once

#include "lsbridge/protocol.hpp"
#include "lsbridge/utils.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lsbridge::internal::text {

    using namespace std::string_view_literals;

    inline constexpr bool is_ident_char(char c) noexcept {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' ||
               static_cast<unsigned char>(c) >= 0x80U;
    }

    // Byte length of the UTF-8 sequence introduced by lead; stray continuation bytes count as one.
    inline constexpr size_t utf8_sequence_length(unsigned char lead) noexcept {
        if (lead < 0x80U) {
            return 1U;
        }
        if ((lead & 0xE0U) == 0xC0U) {
            return 2U;
        }
        if ((lead & 0xF0U) == 0xE0U) {
            return 3U;
        }
        if ((lead & 0xF8U) == 0xF0U) {
            return 4U;
        }
        return 1U;
    }

    // Code points outside the BMP occupy two UTF-16 units.
    inline constexpr uint32_t utf16_units(size_t utf8_length) noexcept {
        return utf8_length == 4U ? 2U : 1U;
    }

    inline constexpr size_t line_start_offset(std::string_view text, uint32_t line) noexcept {
        size_t offset = 0U;
        for (uint32_t i = 0U; i < line; ++i) {
            auto nl = text.find('\n', offset);
            if (nl == std::string_view::npos) {
                return std::string_view::npos;
            }
            offset = nl + 1U;
        }
        return offset;
    }

    /*
     * Byte offset of an LSP position (zero-based line, UTF-16 character) in UTF-8 text.
     * A character past the end of its line clamps to the line end, as LSP prescribes.
     * Returns nullopt when the line does not exist.
     */
    inline constexpr std::optional<size_t> offset_of(std::string_view text, position pos) noexcept {
        auto start = line_start_offset(text, pos.line);
        if (start == std::string_view::npos) {
            return std::nullopt;
        }
        auto end = text.find('\n', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        if (end > start && text[end - 1U] == '\r') {
            --end;
        }

        size_t offset = start;
        uint32_t units = 0U;
        while (offset < end && units < pos.character) {
            auto len = std::min(utf8_sequence_length(static_cast<unsigned char>(text[offset])), end - offset);
            units += utf16_units(len);
            offset += len;
        }
        return offset;
    }

    inline constexpr uint32_t utf16_column(std::string_view line, size_t byte_column) noexcept {
        uint32_t units = 0U;
        size_t offset = 0U;
        byte_column = std::min(byte_column, line.size());
        while (offset < byte_column) {
            auto len = std::min(utf8_sequence_length(static_cast<unsigned char>(line[offset])), line.size() - offset);
            units += utf16_units(len);
            offset += len;
        }
        return units;
    }

    inline constexpr position position_at(std::string_view text, size_t offset) noexcept {
        offset = std::min(offset, text.size());
        auto before = text.substr(0U, offset);
        auto line = static_cast<uint32_t>(std::ranges::count(before, '\n'));
        auto line_begin = before.rfind('\n');
        line_begin = line_begin == std::string_view::npos ? 0U : line_begin + 1U;
        return {.line = line, .character = utf16_column(text.substr(line_begin), offset - line_begin)};
    }

    // Number of lines a piece of text spans; empty text spans none.
    inline constexpr size_t line_count(std::string_view text) noexcept {
        if (text.empty()) {
            return 0U;
        }
        auto newlines = static_cast<size_t>(std::ranges::count(text, '\n'));
        return text.back() == '\n' ? newlines : newlines + 1U;
    }

    inline std::vector<std::string_view> split_lines(std::string_view text) {
        std::vector<std::string_view> lines{};
        size_t pos = 0U;
        while (pos <= text.size()) {
            auto nl = text.find('\n', pos);
            if (nl == std::string_view::npos) {
                lines.push_back(text.substr(pos));
                break;
            }
            lines.push_back(text.substr(pos, nl - pos));
            pos = nl + 1U;
        }
        return lines;
    }

    inline constexpr std::string_view leading_whitespace(std::string_view line) noexcept {
        auto first = line.find_first_not_of(" \t");
        return first == std::string_view::npos ? line : line.substr(0U, first);
    }

    /*
     * Copy of source with comment bodies and string literal contents replaced by spaces.
     * Newlines and byte offsets are preserved, so offsets found in the mask apply to the
     * original. Handles line comments, nested block comments, "..." with escapes and
     * triple-quoted multi-line literals.
     */
    inline std::string mask_code(std::string_view source) {
        std::string out{source};
        enum class state { code, line_comment, block_comment, string, multiline_string };
        state st = state::code;
        int block_depth = 0;

        auto blank = [&](size_t i) {
            if (out[i] != '\n') {
                out[i] = ' ';
            }
        };

        for (size_t i = 0U; i < source.size(); ++i) {
            char c = source[i];
            char next = i + 1U < source.size() ? source[i + 1U] : '\0';
            switch (st) {
                case state::code:
                    if (c == '/' && next == '/') {
                        st = state::line_comment;
                        blank(i);
                    }
                    else if (c == '/' && next == '*') {
                        st = state::block_comment;
                        block_depth = 1;
                        blank(i);
                        blank(++i);
                    }
                    else if (source.substr(i).starts_with(R"(""")")) {
                        st = state::multiline_string;
                        i += 2U;
                    }
                    else if (c == '"') {
                        st = state::string;
                    }
                    break;
                case state::line_comment:
                    if (c == '\n') {
                        st = state::code;
                    }
                    else {
                        blank(i);
                    }
                    break;
                case state::block_comment:
                    if (c == '/' && next == '*') {
                        ++block_depth;
                        blank(i);
                        blank(++i);
                    }
                    else if (c == '*' && next == '/') {
                        blank(i);
                        blank(++i);
                        if (--block_depth == 0) {
                            st = state::code;
                        }
                    }
                    else {
                        blank(i);
                    }
                    break;
                case state::string:
                    if (c == '\\' && next != '\n' && next != '\0') {
                        blank(i);
                        blank(++i);
                    }
                    else if (c == '"' || c == '\n') {
                        st = state::code;
                    }
                    else {
                        blank(i);
                    }
                    break;
                case state::multiline_string:
                    if (source.substr(i).starts_with(R"(""")")) {
                        st = state::code;
                        i += 2U;
                    }
                    else {
                        blank(i);
                    }
                    break;
            }
        }
        return out;
    }

    // Offsets of whole-word occurrences of word in text.
    inline std::vector<size_t> find_word(std::string_view text, std::string_view word) {
        std::vector<size_t> hits{};
        if (word.empty()) {
            return hits;
        }
        for (auto pos = text.find(word); pos != std::string_view::npos; pos = text.find(word, pos + 1U)) {
            bool left_ok = pos == 0U || !is_ident_char(text[pos - 1U]);
            auto after = pos + word.size();
            bool right_ok = after >= text.size() || !is_ident_char(text[after]);
            if (left_ok && right_ok) {
                hits.push_back(pos);
            }
        }
        return hits;
    }

    inline constexpr std::array declaration_keywords{
            "class"sv,
            "struct"sv,
            "enum"sv,
            "protocol"sv,
            "actor"sv,
            "extension"sv,
            "func"sv,
            "var"sv,
            "let"sv,
            "typealias"sv,
            "case"sv,
            "associatedtype"sv};

    // The identifier immediately before offset, skipping horizontal whitespace.
    inline constexpr std::string_view previous_word(std::string_view text, size_t offset) noexcept {
        size_t end = offset;
        while (end > 0U && (text[end - 1U] == ' ' || text[end - 1U] == '\t')) {
            --end;
        }
        size_t begin = end;
        while (begin > 0U && is_ident_char(text[begin - 1U])) {
            --begin;
        }
        return text.substr(begin, end - begin);
    }

    inline constexpr char previous_non_space(std::string_view text, size_t offset) noexcept {
        while (offset > 0U) {
            char c = text[--offset];
            if (c != ' ' && c != '\t') {
                return c;
            }
        }
        return '\0';
    }

    /*
     * Best position of symbol_name in source for position-based queries.
     * Preference order: a declaration ("func name", "class name", ...), then a type
     * annotation (": name"), then any whole-word occurrence outside comments and strings.
     */
    inline std::optional<position> locate_symbol(std::string_view source, std::string_view symbol_name) {
        auto masked = mask_code(source);
        auto hits = find_word(masked, symbol_name);
        if (hits.empty()) {
            return std::nullopt;
        }

        auto pick = [&]() -> size_t {
            for (auto hit : hits) {
                auto word = previous_word(masked, hit);
                if (std::ranges::find(declaration_keywords, word) != declaration_keywords.end()) {
                    return hit;
                }
            }
            for (auto hit : hits) {
                if (previous_non_space(masked, hit) == ':') {
                    return hit;
                }
            }
            return hits.front();
        };

        return position_at(source, pick());
    }

    /*
     * Offsets of the first '{' at or after begin and its matching '}', ignoring braces
     * inside comments and strings. Both must lie before limit. nullopt if the symbol has
     * no brace-delimited body.
     */
    inline std::optional<std::pair<size_t, size_t>> find_brace_body(
            std::string_view source, size_t begin, size_t limit) {
        auto masked = mask_code(source);
        limit = std::min(limit, masked.size());
        auto open = masked.find('{', begin);
        if (open == std::string::npos || open >= limit) {
            return std::nullopt;
        }
        int depth = 0;
        for (size_t i = open; i < limit; ++i) {
            if (masked[i] == '{') {
                ++depth;
            }
            else if (masked[i] == '}' && --depth == 0) {
                return std::pair{open, i};
            }
        }
        return std::nullopt;
    }

    /*
     * Text placed between a body's braces: each non-blank line of body re-indented one
     * level deeper than the declaration, with the closing brace returned to the
     * declaration's indentation.
     */
    inline std::string reindent_body(std::string_view body, std::string_view decl_indent) {
        std::string unit = decl_indent.find('\t') != std::string_view::npos ? "\t" : "    ";
        auto lines = split_lines(body);
        while (!lines.empty() && utils::trim_view(lines.back()).empty()) {
            lines.pop_back();
        }
        size_t first = 0U;
        while (first < lines.size() && utils::trim_view(lines[first]).empty()) {
            ++first;
        }

        // common indentation of the supplied body is replaced, relative nesting is kept
        size_t common = std::string_view::npos;
        for (size_t i = first; i < lines.size(); ++i) {
            if (utils::trim_view(lines[i]).empty()) {
                continue;
            }
            common = std::min(common, leading_whitespace(lines[i]).size());
        }
        if (common == std::string_view::npos) {
            common = 0U;
        }

        std::string out{"\n"};
        for (size_t i = first; i < lines.size(); ++i) {
            auto line = lines[i];
            if (line.ends_with('\r')) {
                line.remove_suffix(1U);
            }
            if (!utils::trim_view(line).empty()) {
                out.append(decl_indent);
                out.append(unit);
                out.append(line.substr(std::min(common, line.size())));
            }
            out.push_back('\n');
        }
        out.append(decl_indent);
        return out;
    }

}  // namespace lsbridge::internal::text
