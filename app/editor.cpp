#include "editor.hpp"

extern "C" {
#include <isocline.h>
}

#include <filesystem>
#include <string_view>

namespace lsbridge::cli { namespace detail {

    using namespace std::string_view_literals;

    static const char* command_completions[] = {
            ":help",
            ":hover",
            ":def",
            ":refs",
            ":diag",
            ":analyze",
            ":overview",
            ":imports",
            ":search",
            ":env",
            ":sessions",
            ":evict",
            ":show",
            ":quit",
            ":q",
            nullptr};

    static const char* show_completions[] = {"config", nullptr};

    static constexpr std::string_view first_token(std::string_view value) {
        auto end = value.find_first_of(" \t\r\n");
        if (end == std::string_view::npos) {
            return value;
        }
        return value.substr(0, end);
    }

    static bool is_command_char(const char* s, long len) {
        if (len == 1 && s[0] == ':') {
            return true;
        }
        return ic_char_is_idletter(s, len);
    }

    static void complete_commands(ic_completion_env_t* cenv, const char* prefix) {
        (void)ic_add_completions(cenv, prefix, command_completions);
    }

    static void complete_show_args(ic_completion_env_t* cenv, const char* prefix) {
        (void)ic_add_completions(cenv, prefix, show_completions);
    }

    static void complete_repl(ic_completion_env_t* cenv, const char* prefix) {
        if (prefix == nullptr) {
            return;
        }

        auto trimmed = utils::trim_view(std::string_view{prefix});
        if (trimmed.empty()) {
            ic_complete_word(cenv, prefix, complete_commands, is_command_char);
            return;
        }
        if (!trimmed.starts_with(':')) {
            return;
        }

        auto command = first_token(trimmed);
        if (command.size() == trimmed.size()) {
            ic_complete_word(cenv, prefix, complete_commands, is_command_char);
            return;
        }

        if (command == ":show"sv) {
            ic_complete_word(cenv, prefix, complete_show_args, nullptr);
            return;
        }
        // file arguments
        if (command == ":hover"sv || command == ":def"sv || command == ":refs"sv || command == ":diag"sv ||
            command == ":analyze"sv || command == ":overview"sv || command == ":imports"sv || command == ":search"sv ||
            command == ":env"sv || command == ":evict"sv) {
            ic_complete_filename(cenv, prefix, '/', nullptr, nullptr);
        }
    }

}}  // namespace lsbridge::cli::detail

namespace lsbridge::cli {

    namespace fs = std::filesystem;

    line_editor::line_editor(const startup_config& cfg) {
        ic_enable_history_duplicates(false);
        ic_set_prompt_marker("", "");
        ic_set_default_completer(detail::complete_repl, nullptr);

        if (!cfg.history_file) {
            ic_set_history(nullptr, 1000);
            return;
        }

        std::error_code ec{};
        auto history_parent = cfg.history_file->parent_path();
        if (!history_parent.empty()) {
            fs::create_directories(history_parent, ec);
        }

        auto history_file = cfg.history_file->string();
        ic_set_history(history_file.c_str(), 1000);
    }

    std::optional<std::string> line_editor::read_line(std::string_view prompt) {
        auto prompt_text = std::string(prompt);
        auto* raw = ic_readline(prompt_text.c_str());
        if (raw == nullptr) {
            return std::nullopt;
        }

        std::string line{raw};
        ic_free(raw);
        return line;
    }

}  // namespace lsbridge::cli
