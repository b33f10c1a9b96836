#include "cli.hpp"
#include "editor.hpp"

#include <CLI/CLI.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lsbridge::cli {

    namespace detail {

        using namespace std::string_view_literals;

        static void print_help(std::ostream& os) {
            os << "commands:\n";
            os << "  :hover <file> <line> <character>   (1-based)\n";
            os << "  :def <file> <symbol>\n";
            os << "  :refs <file> <symbol>\n";
            os << "  :diag <file>\n";
            os << "  :analyze <file>\n";
            os << "  :overview <file>\n";
            os << "  :imports <file>\n";
            os << "  :search <file> <regex>\n";
            os << "  :env [directory]\n";
            os << "  :sessions\n";
            os << "  :evict <root>\n";
            os << "  :show config\n";
            os << "  :help\n";
            os << "  :quit\n";
        }

        static void print_result(const tool_result& result) {
            (result.is_error ? std::cerr : std::cout) << result.json << '\n';
        }

        static void print_sessions(const session_registry& registry, std::ostream& os) {
            auto sessions = registry.list();
            if (sessions.empty()) {
                os << "no sessions\n";
                return;
            }
            for (const auto& s : sessions) {
                os << s.root.string();
                if (s.starting) {
                    os << "  starting\n";
                    continue;
                }
                os << "  pid=" << s.pid << " state=" << to_string(s.state) << " idle=" << s.idle.count()
                   << "ms pending=" << s.pending_requests << '\n';
            }
        }

        static std::optional<int> parse_int(std::string_view text) {
            return utils::parse_arithmetic<int>(text);
        }

        static bool process_command(
                const std::string& line,
                const startup_config& cfg,
                session_registry& registry,
                tool_service& tools,
                bool& should_quit) {
            auto cmd = utils::trim_view(line);
            auto words = utils::split_words(cmd);
            if (words.empty()) {
                return true;
            }
            auto head = words.front();

            if (head == ":quit"sv || head == ":q"sv) {
                should_quit = true;
                return true;
            }
            if (head == ":help"sv) {
                print_help(std::cout);
                return true;
            }
            if (cmd == ":show config"sv) {
                print_config(cfg, std::cout);
                return true;
            }
            if (head == ":sessions"sv) {
                print_sessions(registry, std::cout);
                return true;
            }
            if (head == ":env"sv) {
                auto dir = words.size() > 1U ? std::filesystem::path{words[1]} : std::filesystem::current_path();
                print_result(tools.check_environment(dir));
                return true;
            }
            if (head == ":evict"sv) {
                if (words.size() != 2U) {
                    std::cerr << "usage: :evict <root>\n";
                    return true;
                }
                std::cout << (registry.evict(std::filesystem::path{words[1]}) ? "evicted\n" : "no such session\n");
                return true;
            }
            if (head == ":hover"sv) {
                std::optional<int> ln{};
                std::optional<int> ch{};
                if (words.size() == 4U) {
                    ln = parse_int(words[2]);
                    ch = parse_int(words[3]);
                }
                if (!ln || !ch) {
                    std::cerr << "usage: :hover <file> <line> <character>\n";
                    return true;
                }
                print_result(tools.get_hover_info(std::string{words[1]}, *ln, *ch));
                return true;
            }
            if (head == ":def"sv || head == ":refs"sv) {
                if (words.size() != 3U) {
                    std::cerr << "usage: " << head << " <file> <symbol>\n";
                    return true;
                }
                std::string file{words[1]};
                std::string symbol{words[2]};
                print_result(
                        head == ":def"sv ? tools.get_symbol_definition(file, symbol)
                                         : tools.find_symbol_references(file, symbol));
                return true;
            }
            if (head == ":diag"sv) {
                if (words.size() != 2U) {
                    std::cerr << "usage: :diag <file>\n";
                    return true;
                }
                print_result(tools.get_diagnostics(std::string{words[1]}));
                return true;
            }
            if (head == ":analyze"sv || head == ":overview"sv || head == ":imports"sv) {
                if (words.size() != 2U) {
                    std::cerr << "usage: " << head << " <file>\n";
                    return true;
                }
                std::string file{words[1]};
                if (head == ":analyze"sv) {
                    print_result(tools.analyze_file(file));
                }
                else if (head == ":overview"sv) {
                    print_result(tools.get_symbols_overview(file));
                }
                else {
                    print_result(tools.get_file_imports(file));
                }
                return true;
            }
            if (head == ":search"sv) {
                if (words.size() < 3U) {
                    std::cerr << "usage: :search <file> <regex>\n";
                    return true;
                }
                // the pattern is the rest of the line, spaces included
                auto pattern = cmd.substr(static_cast<size_t>(words[2].data() - cmd.data()));
                print_result(tools.search_pattern(std::string{words[1]}, std::string{pattern}));
                return true;
            }
            if (head.starts_with(":"sv)) {
                std::cerr << "unknown command: " << cmd << '\n';
                return true;
            }
            return false;
        }

    }  // namespace detail

    void run_repl(const startup_config& cfg) {
        session_registry registry{cfg, make_event_sink(cfg.events_file)};
        tool_service tools{registry};

        line_editor editor{cfg};
        bool should_quit = false;

        std::cout << "lsbridge repl (" << cfg.server_path.string() << ")\n";
        std::cout << "type :help for commands\n";

        while (!should_quit) {
            auto next = editor.read_line("lsbridge> ");
            if (!next) {
                std::cout << '\n';
                break;
            }
            auto& line = *next;

            if (utils::trim_view(line).empty()) {
                continue;
            }

            if (!detail::process_command(line, cfg, registry, tools, should_quit)) {
                std::cerr << "commands start with ':'; type :help\n";
            }
        }

        registry.shutdown_all();
    }

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg) {
        CLI::App app{"lsbridge: language server session manager for agent tools"};

        bool show_version = false;
        bool quiet = false;
        bool verbose = false;
        bool repl = false;
        bool mcp = false;
        std::string config_arg{};
        std::string server_arg{};
        std::vector<std::string> server_args{};
        std::string server_log_arg{};
        std::string events_arg{};
        std::string history_arg{};
        std::vector<std::string> markers{};
        int handshake_timeout = 0;
        int request_timeout = 0;
        int shutdown_grace = 0;
        int idle_timeout = 0;
        int reaper_interval = 0;
        std::size_t max_body_bytes = 0;

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("--config", config_arg, "JSON config file applied before environment and flags");
        auto* server_opt = app.add_option("--server", server_arg, "Language server executable");
        auto* server_args_opt =
                app.add_option("--server-arg", server_args, "Argument passed to the language server (repeatable)");
        auto* server_log_opt = app.add_option("--server-log", server_log_arg, "File receiving the server's stderr");
        auto* markers_opt = app.add_option("--root-marker", markers, "Project root marker, e.g. Package.swift or *.xcodeproj");
        auto* handshake_opt =
                app.add_option("--handshake-timeout-ms", handshake_timeout, "Deadline for the initialize reply")
                        ->check(CLI::PositiveNumber);
        auto* request_opt = app.add_option("--request-timeout-ms", request_timeout, "Deadline for each request")
                                    ->check(CLI::PositiveNumber);
        auto* grace_opt = app.add_option("--shutdown-grace-ms", shutdown_grace, "Wait before killing a server")
                                  ->check(CLI::PositiveNumber);
        auto* idle_opt = app.add_option("--idle-timeout-ms", idle_timeout, "Evict sessions idle this long (0 disables)")
                                 ->check(CLI::NonNegativeNumber);
        auto* reaper_opt =
                app.add_option("--reaper-interval-ms", reaper_interval, "How often idle and dead sessions are swept")
                        ->check(CLI::PositiveNumber);
        auto* body_opt =
                app.add_option("--max-body-bytes", max_body_bytes, "Largest Content-Length accepted from the server")
                        ->check(CLI::PositiveNumber);
        auto* events_opt = app.add_option("--events-file", events_arg, "Append execution events as JSON lines");
        auto* history_opt = app.add_option("--history-file", history_arg, "Persist repl line history to this file");
        app.add_flag("--mcp", mcp, "Serve MCP tools on stdio (default)");
        app.add_flag("--repl", repl, "Interactive command loop");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("--quiet", quiet, "Only log errors");
        app.add_flag("--verbose", verbose, "Enable verbose output");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (quiet && verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{2};
        }
        if (mcp && repl) {
            std::cerr << "--mcp and --repl are mutually exclusive\n";
            return std::optional<int>{2};
        }

        if (show_version) {
            std::cout << "lsbridge 0.1.0\n";
            return std::optional<int>{0};
        }

        if (!config_arg.empty()) {
            cfg.config_file = config_arg;
            load_config_file(cfg, *cfg.config_file);
        }
        apply_environment_overrides(cfg);

        if (server_opt->count() > 0U) {
            cfg.server_path = server_arg;
        }
        if (server_args_opt->count() > 0U) {
            cfg.server_args = server_args;
        }
        if (server_log_opt->count() > 0U) {
            cfg.server_log = server_log_arg;
        }
        if (markers_opt->count() > 0U) {
            cfg.root_markers = markers;
        }
        if (handshake_opt->count() > 0U) {
            cfg.handshake_timeout_ms = handshake_timeout;
        }
        if (request_opt->count() > 0U) {
            cfg.request_timeout_ms = request_timeout;
        }
        if (grace_opt->count() > 0U) {
            cfg.shutdown_grace_ms = shutdown_grace;
        }
        if (idle_opt->count() > 0U) {
            cfg.idle_timeout_ms = idle_timeout;
        }
        if (reaper_opt->count() > 0U) {
            cfg.reaper_interval_ms = reaper_interval;
        }
        if (body_opt->count() > 0U) {
            cfg.max_body_bytes = max_body_bytes;
        }
        if (events_opt->count() > 0U) {
            cfg.events_file = std::filesystem::path{events_arg};
        }
        if (history_opt->count() > 0U) {
            cfg.history_file = std::filesystem::path{history_arg};
        }
        if (quiet) {
            cfg.verbosity = log_level::quiet;
        }
        else if (verbose) {
            cfg.verbosity = log_level::verbose;
        }
        if (repl) {
            cfg.mode = run_mode::repl;
        }
        else if (mcp) {
            cfg.mode = run_mode::mcp;
        }

        set_log_level(cfg.verbosity);

        if (cfg.print_config) {
            print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        return std::nullopt;
    }

}  // namespace lsbridge::cli
