#include "lsbridge/tools.hpp"

#include "lsbridge/environment.hpp"
#include "lsbridge/format.hpp"
#include "lsbridge/project.hpp"

#include "internal/text.hpp"

#include <glaze/glaze.hpp>

#include <algorithm>
#include <fstream>
#include <regex>
#include <sstream>

using namespace lsbridge::literals;
namespace fs = std::filesystem;

namespace lsbridge {

    namespace detail {

        // Failure detected by the tool layer itself; error_type is reported verbatim.
        class tool_error : public std::runtime_error {
          public:
            tool_error(std::string type, const std::string& message)
                    : std::runtime_error{message}, type_{std::move(type)} {}

            const std::string& type() const noexcept { return type_; }

          private:
            std::string type_;
        };

        struct error_payload {
            bool success{false};
            std::string error{};
            std::string error_type{};
            struct glaze {
                using T = error_payload;
                static constexpr auto value = glz::object(&T::success, &T::error, &T::error_type);
            };
        };

        struct location_entry {
            std::string file_path{};
            uint32_t line{};
            uint32_t character{};
            uint32_t end_line{};
            uint32_t end_character{};
            struct glaze {
                using T = location_entry;
                static constexpr auto value =
                        glz::object(&T::file_path, &T::line, &T::character, &T::end_line, &T::end_character);
            };
        };

        struct hover_payload {
            bool success{true};
            std::string file_path{};
            int line{};
            int character{};
            std::string hover_info{};
            struct glaze {
                using T = hover_payload;
                static constexpr auto value =
                        glz::object(&T::success, &T::file_path, &T::line, &T::character, &T::hover_info);
            };
        };

        struct definition_payload {
            bool success{true};
            std::string file_path{};
            std::string symbol_name{};
            std::vector<location_entry> definitions{};
            struct glaze {
                using T = definition_payload;
                static constexpr auto value =
                        glz::object(&T::success, &T::file_path, &T::symbol_name, &T::definitions);
            };
        };

        struct references_payload {
            bool success{true};
            std::string file_path{};
            std::string symbol_name{};
            std::vector<location_entry> references{};
            size_t reference_count{};
            std::optional<bool> index_store_available{};
            std::optional<std::string> hint{};
            struct glaze {
                using T = references_payload;
                static constexpr auto value = glz::object(
                        &T::success,
                        &T::file_path,
                        &T::symbol_name,
                        &T::references,
                        &T::reference_count,
                        &T::index_store_available,
                        &T::hint);
            };
        };

        struct replace_payload {
            bool success{true};
            std::string file_path{};
            std::string symbol_name{};
            std::string operation{"replace_body"};
            uint32_t start_line{};
            uint32_t end_line{};
            size_t lines_removed{};
            size_t lines_added{};
            struct glaze {
                using T = replace_payload;
                static constexpr auto value = glz::object(
                        &T::success,
                        &T::file_path,
                        &T::symbol_name,
                        &T::operation,
                        &T::start_line,
                        &T::end_line,
                        &T::lines_removed,
                        &T::lines_added);
            };
        };

        struct diagnostic_entry {
            uint32_t line{};
            uint32_t character{};
            std::string severity{};
            std::string message{};
            std::optional<std::string> source{};
            struct glaze {
                using T = diagnostic_entry;
                static constexpr auto value =
                        glz::object(&T::line, &T::character, &T::severity, &T::message, &T::source);
            };
        };

        struct diagnostics_payload {
            bool success{true};
            std::string file_path{};
            std::vector<diagnostic_entry> diagnostics{};
            size_t count{};
            struct glaze {
                using T = diagnostics_payload;
                static constexpr auto value = glz::object(&T::success, &T::file_path, &T::diagnostics, &T::count);
            };
        };

        struct environment_payload {
            bool success{true};
            bool ready{false};
            bool server_available{false};
            std::optional<std::string> server_version{};
            std::string server_path{};
            std::string working_directory{};
            std::optional<std::string> project_type{};
            std::optional<std::string> project_root{};
            bool index_store_available{false};
            std::optional<std::string> index_store_path{};
            bool build_required{false};
            std::vector<std::string> recommendations{};
            struct glaze {
                using T = environment_payload;
                static constexpr auto value = glz::object(
                        &T::success,
                        &T::ready,
                        &T::server_available,
                        &T::server_version,
                        &T::server_path,
                        &T::working_directory,
                        &T::project_type,
                        &T::project_root,
                        &T::index_store_available,
                        &T::index_store_path,
                        &T::build_required,
                        &T::recommendations);
            };
        };

        struct symbol_entry {
            std::string name{};
            std::string kind{};
            uint32_t line{};
            uint32_t character{};
            std::vector<symbol_entry> children{};
            struct glaze {
                using T = symbol_entry;
                static constexpr auto value = glz::object(&T::name, &T::kind, &T::line, &T::character, &T::children);
            };
        };

        struct analysis_payload {
            bool success{true};
            std::string file_path{};
            std::vector<symbol_entry> symbols{};
            size_t symbol_count{};
            struct glaze {
                using T = analysis_payload;
                static constexpr auto value = glz::object(&T::success, &T::file_path, &T::symbols, &T::symbol_count);
            };
        };

        struct overview_entry {
            std::string name{};
            std::string kind{};
            uint32_t line{};
            uint32_t character{};
            size_t member_count{};
            struct glaze {
                using T = overview_entry;
                static constexpr auto value =
                        glz::object(&T::name, &T::kind, &T::line, &T::character, &T::member_count);
            };
        };

        struct overview_payload {
            bool success{true};
            std::string file_path{};
            std::vector<overview_entry> top_level_symbols{};
            size_t symbol_count{};
            struct glaze {
                using T = overview_payload;
                static constexpr auto value =
                        glz::object(&T::success, &T::file_path, &T::top_level_symbols, &T::symbol_count);
            };
        };

        struct imports_payload {
            bool success{true};
            std::string file_path{};
            std::vector<std::string> imports{};
            size_t import_count{};
            struct glaze {
                using T = imports_payload;
                static constexpr auto value = glz::object(&T::success, &T::file_path, &T::imports, &T::import_count);
            };
        };

        struct pattern_match {
            uint32_t line{};
            uint32_t character{};
            std::string match_text{};
            std::string context{};
            struct glaze {
                using T = pattern_match;
                static constexpr auto value = glz::object(&T::line, &T::character, &T::match_text, &T::context);
            };
        };

        struct search_payload {
            bool success{true};
            std::string file_path{};
            std::string pattern{};
            bool is_regex{true};
            std::vector<pattern_match> matches{};
            size_t match_count{};
            std::optional<bool> truncated{};
            struct glaze {
                using T = search_payload;
                static constexpr auto value = glz::object(
                        &T::success,
                        &T::file_path,
                        &T::pattern,
                        &T::is_regex,
                        &T::matches,
                        &T::match_count,
                        &T::truncated);
            };
        };

        template <typename T>
        static tool_result success(const T& payload) {
            tool_result result{};
            if (auto ec = glz::write_json(payload, result.json); ec) {
                throw std::runtime_error("failed to serialize tool result");
            }
            return result;
        }

        static tool_result failure(std::string_view type, std::string_view message) {
            error_payload payload{.error = std::string{message}, .error_type = std::string{type}};
            tool_result result{.is_error = true};
            if (auto ec = glz::write_json(payload, result.json); ec) {
                throw std::runtime_error("failed to serialize tool error");
            }
            return result;
        }

        static location_entry to_entry(const location& loc) {
            return location_entry{
                    .file_path = loc.path().string(),
                    .line = loc.span.start.line + 1U,
                    .character = loc.span.start.character + 1U,
                    .end_line = loc.span.end.line + 1U,
                    .end_character = loc.span.end.character + 1U};
        }

        static std::string_view severity_name(int severity) {
            switch (severity) {
                case 1:
                    return "error"sv;
                case 2:
                    return "warning"sv;
                case 3:
                    return "information"sv;
                case 4:
                    return "hint"sv;
                default:
                    return "unknown"sv;
            }
        }

        static fs::path require_file(const std::string& file_path) {
            if (file_path.empty()) {
                throw tool_error{"invalid_parameters", "file_path must not be empty"};
            }
            std::error_code ec{};
            fs::path path = fs::absolute(fs::path{file_path}, ec);
            if (ec || !fs::is_regular_file(path, ec)) {
                throw tool_error{"file_not_found", "file not found: {}"_format(file_path)};
            }
            return fs::weakly_canonical(path, ec);
        }

        static void require_symbol_name(std::string_view symbol_name) {
            if (utils::trim_view(symbol_name).empty()) {
                throw tool_error{"invalid_parameters", "symbol_name must be a non-empty string"};
            }
            if (symbol_name.size() > max_symbol_name_length) {
                throw tool_error{"invalid_parameters", "symbol_name too long"};
            }
        }

        static std::string read_source(const fs::path& path) {
            std::ifstream in{path, std::ios::binary};
            if (!in) {
                throw session_error{error_kind::io_error, "cannot read {}"_format(path.string())};
            }
            std::ostringstream ss{};
            ss << in.rdbuf();
            return ss.str();
        }

        static position locate_or_throw(const fs::path& file, std::string_view symbol_name) {
            auto pos = internal::text::locate_symbol(read_source(file), symbol_name);
            if (!pos) {
                throw tool_error{
                        "symbol_not_found", "symbol '{}' not found in {}"_format(symbol_name, file.string())};
            }
            return *pos;
        }

        // "foo(_:bar:)" -> "foo"
        static std::string_view base_name(std::string_view name) {
            return name.substr(0, name.find('('));
        }

        struct symbol_match {
            const document_symbol* symbol{};
            std::string qualified_name{};
        };

        static void collect_matches(
                const std::vector<document_symbol>& symbols,
                const std::vector<std::string_view>& parts,
                std::vector<std::string_view>& ancestors,
                std::vector<symbol_match>& out) {
            for (const auto& sym : symbols) {
                auto name = base_name(sym.name);
                if (name == parts.back() && ancestors.size() + 1U >= parts.size()) {
                    bool chain_ok = true;
                    for (size_t i = 0; i + 1U < parts.size(); ++i) {
                        auto anc = ancestors[ancestors.size() - (parts.size() - 1U) + i];
                        if (anc != parts[i]) {
                            chain_ok = false;
                            break;
                        }
                    }
                    if (chain_ok) {
                        std::vector<std::string> trail{ancestors.begin(), ancestors.end()};
                        trail.emplace_back(sym.name);
                        out.push_back({.symbol = &sym, .qualified_name = utils::join_with_separator(trail, ".")});
                    }
                }
                ancestors.push_back(name);
                collect_matches(sym.children, parts, ancestors, out);
                ancestors.pop_back();
            }
        }

        static std::string normalize_symbol_name(std::string_view symbol_name) {
            std::string normalized{utils::trim_view(symbol_name)};
            for (auto pos = normalized.find("()"); pos != std::string::npos; pos = normalized.find("()")) {
                normalized.erase(pos, 2);
            }
            return normalized;
        }

        static std::vector<std::string_view> split_path(std::string_view dotted) {
            std::vector<std::string_view> parts{};
            size_t start = 0;
            while (start <= dotted.size()) {
                auto dot = dotted.find('.', start);
                auto part = dotted.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start);
                if (!part.empty()) {
                    parts.push_back(part);
                }
                if (dot == std::string_view::npos) {
                    break;
                }
                start = dot + 1;
            }
            return parts;
        }

        static symbol_entry to_symbol_entry(const document_symbol& sym) {
            symbol_entry entry{
                    .name = sym.name,
                    .kind = std::string{symbol_kind_name(sym.kind)},
                    .line = sym.selection.start.line + 1U,
                    .character = sym.selection.start.character + 1U};
            entry.children.reserve(sym.children.size());
            for (const auto& child : sym.children) {
                entry.children.push_back(to_symbol_entry(child));
            }
            return entry;
        }

        // Servers report Swift extensions as module or namespace symbols.
        static bool is_type_declaration(int kind) {
            switch (kind) {
                case 2:   // module
                case 3:   // namespace
                case 5:   // class
                case 10:  // enum
                case 11:  // interface
                case 23:  // struct
                    return true;
                default:
                    return false;
            }
        }

        // "@testable import struct Foundation.Date" -> "import struct Foundation.Date"
        static std::vector<std::string> scan_imports(std::string_view source) {
            static const std::regex import_re{
                    R"(^\s*((?:@\w+\s+)*import(?:\s+(?:struct|class|func|enum|protocol|typealias|var|let))?\s+[A-Za-z_][A-Za-z0-9_.]*))"};
            static const std::regex attributes_re{R"(^(?:@\w+\s+)+)"};

            auto masked = internal::text::mask_code(source);
            std::vector<std::string> imports{};
            for (auto line : internal::text::split_lines(masked)) {
                std::match_results<std::string_view::const_iterator> m{};
                if (std::regex_search(line.begin(), line.end(), m, import_re)) {
                    imports.push_back(std::regex_replace(m[1].str(), attributes_re, ""));
                }
            }
            return imports;
        }

        static std::regex::flag_type parse_search_flags(std::string_view flags) {
            auto options = std::regex::ECMAScript;
            for (char f : flags) {
                switch (f) {
                    case 'i':
                    case 'I':
                        options |= std::regex::icase;
                        break;
                    case 'm':
                    case 'M':
                        options |= std::regex::multiline;
                        break;
                    default:
                        throw tool_error{"invalid_parameters", "invalid flag '{}' (supported: i, m)"_format(f)};
                }
            }
            return options;
        }

        static std::string escape_regex(std::string_view literal) {
            static constexpr std::string_view special = R"(\^$.|?*+()[]{})";
            std::string escaped{};
            escaped.reserve(literal.size() * 2U);
            for (char c : literal) {
                if (special.find(c) != std::string_view::npos) {
                    escaped.push_back('\\');
                }
                escaped.push_back(c);
            }
            return escaped;
        }

        // context_lines == 0 is the trimmed matching line; otherwise the surrounding lines verbatim.
        static std::string match_context(
                const std::vector<std::string_view>& lines, uint32_t match_line, int context_lines) {
            if (context_lines == 0) {
                return std::string{utils::trim_view(lines[match_line])};
            }
            auto span = static_cast<uint32_t>(context_lines);
            auto first = match_line > span ? match_line - span : 0U;
            auto last = std::min<size_t>(lines.size() - 1U, size_t{match_line} + span);
            std::vector<std::string> window{};
            for (auto i = size_t{first}; i <= last; ++i) {
                window.emplace_back(lines[i]);
            }
            return utils::join_with_separator(window, "\n");
        }

    }  // namespace detail

    fs::path tool_service::root_for(const fs::path& file) const {
        if (auto root = resolve_project_root(file, registry_.config().root_markers)) {
            return *root;
        }
        return file.parent_path();
    }

    template <typename F>
    tool_result tool_service::with_session(const fs::path& file, F&& fn) {
        auto root = root_for(file);
        auto report = [](const session_error& e) {
            auto kind = e.kind() == error_kind::transport_write_error ? error_kind::backend_disconnected : e.kind();
            return detail::failure(to_string(kind), e.what());
        };

        std::shared_ptr<session> s{};
        try {
            s = registry_.acquire(root);
        } catch (const session_error& e) {
            // acquire() already dropped the failed start
            return report(e);
        }

        try {
            return std::forward<F>(fn)(*s, root);
        } catch (const session_error& e) {
            if (is_session_fatal(e.kind())) {
                log_warn("evicting session for ", root.string(), " after ", to_string(e.kind()));
                registry_.evict(root, s);
            }
            return report(e);
        } catch (const detail::tool_error& e) {
            return detail::failure(e.type(), e.what());
        }
    }

    tool_result tool_service::check_environment(const fs::path& directory) {
        auto report = lsbridge::check_environment(registry_.config(), directory);
        return detail::success(
                detail::environment_payload{
                        .ready = report.ready(),
                        .server_available = report.available,
                        .server_version = report.version,
                        .server_path = report.server_path,
                        .working_directory = report.working_directory,
                        .project_type = report.project_type,
                        .project_root = report.project_root,
                        .index_store_available = report.index_store_available,
                        .index_store_path = report.index_store_path,
                        .build_required = report.build_required,
                        .recommendations = report.recommendations});
    }

    tool_result tool_service::get_hover_info(const std::string& file_path, int line, int character) {
        fs::path file{};
        try {
            file = detail::require_file(file_path);
            if (line < 1 || character < 1) {
                throw detail::tool_error{"invalid_parameters", "line and character are 1-based and must be positive"};
            }
        } catch (const detail::tool_error& e) {
            return detail::failure(e.type(), e.what());
        }

        return with_session(file, [&](session& s, const fs::path&) {
            position pos{.line = static_cast<uint32_t>(line - 1), .character = static_cast<uint32_t>(character - 1)};
            auto info = s.hover(file, pos);
            return detail::success(
                    detail::hover_payload{
                            .file_path = file.string(),
                            .line = line,
                            .character = character,
                            .hover_info = std::move(info.contents)});
        });
    }

    tool_result tool_service::get_symbol_definition(const std::string& file_path, const std::string& symbol_name) {
        fs::path file{};
        try {
            file = detail::require_file(file_path);
            detail::require_symbol_name(symbol_name);
        } catch (const detail::tool_error& e) {
            return detail::failure(e.type(), e.what());
        }

        return with_session(file, [&](session& s, const fs::path&) {
            auto pos = detail::locate_or_throw(file, symbol_name);
            auto found = s.definition(file, pos);
            if (found.empty()) {
                throw detail::tool_error{"symbol_not_found", "no definition found for '{}'"_format(symbol_name)};
            }
            detail::definition_payload payload{.file_path = file.string(), .symbol_name = symbol_name};
            for (const auto& loc : found) {
                payload.definitions.push_back(detail::to_entry(loc));
            }
            return detail::success(payload);
        });
    }

    tool_result tool_service::find_symbol_references(const std::string& file_path, const std::string& symbol_name) {
        fs::path file{};
        try {
            file = detail::require_file(file_path);
            detail::require_symbol_name(symbol_name);
        } catch (const detail::tool_error& e) {
            return detail::failure(e.type(), e.what());
        }

        return with_session(file, [&](session& s, const fs::path& root) {
            auto pos = detail::locate_or_throw(file, symbol_name);
            auto found = s.references(file, pos);

            detail::references_payload payload{
                    .file_path = file.string(), .symbol_name = symbol_name, .reference_count = found.size()};
            for (const auto& loc : found) {
                payload.references.push_back(detail::to_entry(loc));
            }
            if (found.empty()) {
                // an empty answer usually means the index store is missing or stale
                auto store = find_index_store(root);
                payload.index_store_available = store.has_value();
                payload.hint = store ? "No references found. The index store at {} may be stale; rebuild the project to refresh it."_format(store->string())
                                     : "No references found and no index store exists under {}. Build the project (e.g. 'swift build') so cross-file references can be resolved."_format(root.string());
            }
            return detail::success(payload);
        });
    }

    tool_result tool_service::replace_symbol_body(
            const std::string& file_path, const std::string& symbol_name, const std::string& new_body) {
        fs::path file{};
        std::string normalized{};
        try {
            file = detail::require_file(file_path);
            detail::require_symbol_name(symbol_name);
            normalized = detail::normalize_symbol_name(symbol_name);
            if (detail::split_path(normalized).empty()) {
                throw detail::tool_error{"invalid_parameters", "symbol_name must name a symbol"};
            }
            if (utils::trim_view(new_body).empty()) {
                throw detail::tool_error{"invalid_parameters", "new_body must be a non-empty string"};
            }
        } catch (const detail::tool_error& e) {
            return detail::failure(e.type(), e.what());
        }

        return with_session(file, [&](session& s, const fs::path&) {
            auto symbols = s.document_symbols(file);
            auto parts = detail::split_path(normalized);

            std::vector<detail::symbol_match> matches{};
            std::vector<std::string_view> ancestors{};
            detail::collect_matches(symbols, parts, ancestors, matches);

            if (matches.empty()) {
                throw detail::tool_error{
                        "symbol_not_found", "symbol not found or has no replaceable body: {}"_format(symbol_name)};
            }
            if (matches.size() > 1U) {
                std::vector<std::string> names{};
                for (const auto& m : matches) {
                    names.push_back("{} ({})"_format(m.qualified_name, symbol_kind_name(m.symbol->kind)));
                }
                throw detail::tool_error{
                        "symbol_ambiguous",
                        "multiple symbols found: {}"_format(utils::join_with_separator(names, ", "))};
            }

            const auto& target = *matches.front().symbol;
            auto source = detail::read_source(file);
            auto begin = internal::text::offset_of(source, target.span.start);
            auto end = internal::text::offset_of(source, target.span.end);
            if (!begin || !end) {
                throw session_error{error_kind::invalid_response, "symbol range for '{}' is outside the file"_format(symbol_name)};
            }
            auto body = internal::text::find_brace_body(source, *begin, std::min(*end + 1U, source.size()));
            if (!body) {
                throw detail::tool_error{
                        "symbol_not_found", "symbol not found or has no replaceable body: {}"_format(symbol_name)};
            }

            auto decl_line_start = source.rfind('\n', *begin);
            decl_line_start = decl_line_start == std::string::npos ? 0U : decl_line_start + 1U;
            auto indent = internal::text::leading_whitespace(std::string_view{source}.substr(decl_line_start));

            range span{
                    .start = internal::text::position_at(source, body->first + 1U),
                    .end = internal::text::position_at(source, body->second)};
            auto edit = s.apply_edit(file, span, internal::text::reindent_body(new_body, indent));

            return detail::success(
                    detail::replace_payload{
                            .file_path = file.string(),
                            .symbol_name = symbol_name,
                            .start_line = edit.start_line,
                            .end_line = edit.end_line,
                            .lines_removed = edit.lines_removed,
                            .lines_added = internal::text::line_count(new_body)});
        });
    }

    tool_result tool_service::get_diagnostics(const std::string& file_path) {
        fs::path file{};
        try {
            file = detail::require_file(file_path);
        } catch (const detail::tool_error& e) {
            return detail::failure(e.type(), e.what());
        }

        return with_session(file, [&](session& s, const fs::path&) {
            auto found = s.diagnostics(file);
            detail::diagnostics_payload payload{.file_path = file.string(), .count = found.size()};
            for (auto& d : found) {
                payload.diagnostics.push_back(
                        detail::diagnostic_entry{
                                .line = d.span.start.line + 1U,
                                .character = d.span.start.character + 1U,
                                .severity = std::string{detail::severity_name(d.severity)},
                                .message = std::move(d.message),
                                .source = std::move(d.source)});
            }
            return detail::success(payload);
        });
    }

    tool_result tool_service::analyze_file(const std::string& file_path) {
        fs::path file{};
        try {
            file = detail::require_file(file_path);
        } catch (const detail::tool_error& e) {
            return detail::failure(e.type(), e.what());
        }

        return with_session(file, [&](session& s, const fs::path&) {
            auto symbols = s.document_symbols(file);
            detail::analysis_payload payload{.file_path = file.string(), .symbol_count = symbols.size()};
            payload.symbols.reserve(symbols.size());
            for (const auto& sym : symbols) {
                payload.symbols.push_back(detail::to_symbol_entry(sym));
            }
            return detail::success(payload);
        });
    }

    tool_result tool_service::get_symbols_overview(const std::string& file_path) {
        fs::path file{};
        try {
            file = detail::require_file(file_path);
        } catch (const detail::tool_error& e) {
            return detail::failure(e.type(), e.what());
        }

        return with_session(file, [&](session& s, const fs::path&) {
            detail::overview_payload payload{.file_path = file.string()};
            for (const auto& sym : s.document_symbols(file)) {
                if (!detail::is_type_declaration(sym.kind)) {
                    continue;
                }
                payload.top_level_symbols.push_back(
                        detail::overview_entry{
                                .name = sym.name,
                                .kind = std::string{symbol_kind_name(sym.kind)},
                                .line = sym.selection.start.line + 1U,
                                .character = sym.selection.start.character + 1U,
                                .member_count = sym.children.size()});
            }
            payload.symbol_count = payload.top_level_symbols.size();
            return detail::success(payload);
        });
    }

    tool_result tool_service::get_file_imports(const std::string& file_path) {
        try {
            auto file = detail::require_file(file_path);
            auto imports = detail::scan_imports(detail::read_source(file));
            auto count = imports.size();
            return detail::success(
                    detail::imports_payload{
                            .file_path = file.string(), .imports = std::move(imports), .import_count = count});
        } catch (const detail::tool_error& e) {
            return detail::failure(e.type(), e.what());
        } catch (const session_error& e) {
            return detail::failure(to_string(e.kind()), e.what());
        }
    }

    tool_result tool_service::search_pattern(
            const std::string& file_path,
            const std::string& pattern,
            bool is_regex,
            const std::string& flags,
            int context_lines) {
        try {
            auto file = detail::require_file(file_path);
            if (pattern.empty()) {
                throw detail::tool_error{"invalid_parameters", "pattern must be a non-empty string"};
            }
            if (pattern.size() > max_pattern_length) {
                throw detail::tool_error{"invalid_parameters", "pattern too long"};
            }
            if (context_lines < 0 || context_lines > max_context_lines) {
                throw detail::tool_error{
                        "invalid_parameters", "context_lines must be between 0 and {}"_format(max_context_lines)};
            }
            auto options = detail::parse_search_flags(flags);

            std::regex re{};
            try {
                re = std::regex{is_regex ? pattern : detail::escape_regex(pattern), options};
            } catch (const std::regex_error& e) {
                throw detail::tool_error{"invalid_parameters", "invalid regex pattern: {}"_format(e.what())};
            }

            std::error_code ec{};
            auto size = fs::file_size(file, ec);
            if (!ec && size > max_search_file_bytes) {
                throw detail::tool_error{
                        "invalid_parameters",
                        "{} is {} bytes; pattern search is limited to {}"_format(
                                file.string(), size, max_search_file_bytes)};
            }

            auto source = detail::read_source(file);
            auto lines = internal::text::split_lines(source);
            detail::search_payload payload{.file_path = file.string(), .pattern = pattern, .is_regex = is_regex};

            // matches arrive in offset order, so the current line only moves forward
            uint32_t line = 0U;
            size_t line_begin = 0U;
            try {
                for (std::sregex_iterator it{source.begin(), source.end(), re}, end{}; it != end; ++it) {
                    if (payload.matches.size() == max_pattern_matches) {
                        payload.truncated = true;
                        break;
                    }
                    auto offset = static_cast<size_t>(it->position());
                    while (line + 1U < lines.size() && line_begin + lines[line].size() < offset) {
                        line_begin += lines[line].size() + 1U;
                        ++line;
                    }
                    auto column = internal::text::utf16_column(lines[line], offset - line_begin);
                    payload.matches.push_back(
                            detail::pattern_match{
                                    .line = line + 1U,
                                    .character = column + 1U,
                                    .match_text = it->str(),
                                    .context = detail::match_context(lines, line, context_lines)});
                }
            } catch (const std::regex_error& e) {
                throw detail::tool_error{"invalid_parameters", "pattern search failed: {}"_format(e.what())};
            }

            payload.match_count = payload.matches.size();
            return detail::success(payload);
        } catch (const detail::tool_error& e) {
            return detail::failure(e.type(), e.what());
        } catch (const session_error& e) {
            return detail::failure(to_string(e.kind()), e.what());
        }
    }

}  // namespace lsbridge
