#include "lsbridge/mcp.hpp"

#include "lsbridge/events.hpp"
#include "lsbridge/format.hpp"
#include "lsbridge/registry.hpp"

#include <glaze/ext/jsonrpc.hpp>
#include <glaze/glaze.hpp>

#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace lsbridge::literals;
using namespace std::string_view_literals;
namespace fs = std::filesystem;

namespace lsbridge::mcp {

    namespace detail {

        // ── MCP protocol types ──────────────────────────────────────────

        struct client_info {
            std::string name{};
            std::string version{};
            struct glaze {
                using T = client_info;
                static constexpr auto value = glz::object(&T::name, &T::version);
            };
        };

        struct initialize_params {
            std::string protocolVersion{};
            client_info clientInfo{};
            struct glaze {
                using T = initialize_params;
                static constexpr auto value =
                        glz::object("protocolVersion", &T::protocolVersion, "clientInfo", &T::clientInfo);
            };
        };

        struct server_info {
            std::string name{};
            std::string version{};
            struct glaze {
                using T = server_info;
                static constexpr auto value = glz::object(&T::name, &T::version);
            };
        };

        struct tools_capability {
            struct glaze {
                using T = tools_capability;
                static constexpr auto value = glz::object();
            };
        };

        struct server_capabilities {
            tools_capability tools{};
            struct glaze {
                using T = server_capabilities;
                static constexpr auto value = glz::object(&T::tools);
            };
        };

        struct initialize_result {
            std::string protocolVersion{};
            server_capabilities capabilities{};
            server_info serverInfo{};
            struct glaze {
                using T = initialize_result;
                static constexpr auto value = glz::object(
                        "protocolVersion",
                        &T::protocolVersion,
                        "capabilities",
                        &T::capabilities,
                        "serverInfo",
                        &T::serverInfo);
            };
        };

        struct tool_definition {
            std::string name{};
            std::string description{};
            glz::raw_json inputSchema{};
            struct glaze {
                using T = tool_definition;
                static constexpr auto value = glz::object(&T::name, &T::description, "inputSchema", &T::inputSchema);
            };
        };

        struct tools_list_result {
            std::vector<tool_definition> tools{};
            struct glaze {
                using T = tools_list_result;
                static constexpr auto value = glz::object(&T::tools);
            };
        };

        struct tool_call_params {
            std::string name{};
            glz::raw_json arguments{"{}"};
            struct glaze {
                using T = tool_call_params;
                static constexpr auto value = glz::object(&T::name, &T::arguments);
            };
        };

        struct text_content {
            std::string type{"text"};
            std::string text{};
            struct glaze {
                using T = text_content;
                static constexpr auto value = glz::object(&T::type, &T::text);
            };
        };

        struct tool_call_result {
            std::vector<text_content> content{};
            bool isError{false};
            struct glaze {
                using T = tool_call_result;
                static constexpr auto value = glz::object(&T::content, "isError", &T::isError);
            };
        };

        // ── Tool argument types ─────────────────────────────────────────

        struct environment_args {
            std::optional<std::string> directory{};
            struct glaze {
                using T = environment_args;
                static constexpr auto value = glz::object(&T::directory);
            };
        };

        struct hover_args {
            std::string file_path{};
            int line{};
            int character{};
            struct glaze {
                using T = hover_args;
                static constexpr auto value = glz::object(&T::file_path, &T::line, &T::character);
            };
        };

        struct symbol_args {
            std::string file_path{};
            std::string symbol_name{};
            struct glaze {
                using T = symbol_args;
                static constexpr auto value = glz::object(&T::file_path, &T::symbol_name);
            };
        };

        struct replace_body_args {
            std::string file_path{};
            std::string symbol_name{};
            std::string new_body{};
            struct glaze {
                using T = replace_body_args;
                static constexpr auto value = glz::object(&T::file_path, &T::symbol_name, &T::new_body);
            };
        };

        struct file_args {
            std::string file_path{};
            struct glaze {
                using T = file_args;
                static constexpr auto value = glz::object(&T::file_path);
            };
        };

        struct search_args {
            std::string file_path{};
            std::string pattern{};
            std::optional<bool> is_regex{};
            std::optional<std::string> flags{};
            std::optional<int> context_lines{};
            struct glaze {
                using T = search_args;
                static constexpr auto value =
                        glz::object(&T::file_path, &T::pattern, &T::is_regex, &T::flags, &T::context_lines);
            };
        };

        // ── Tool schemas ────────────────────────────────────────────────

        struct tool_spec {
            std::string_view name;
            std::string_view description;
            std::string_view schema;
        };

        static constexpr tool_spec tool_specs[]{
                {"check_environment",
                 "Check that the language server is installed and whether the project has an index store. Does not start a session.",
                 R"json({"type":"object","properties":{"directory":{"type":"string","description":"Directory to inspect; defaults to the server's working directory"}}})json"},
                {"get_hover_info",
                 "Type and documentation for the symbol at a 1-based line and character.",
                 R"json({"type":"object","properties":{"file_path":{"type":"string"},"line":{"type":"integer","minimum":1},"character":{"type":"integer","minimum":1}},"required":["file_path","line","character"]})json"},
                {"get_symbol_definition",
                 "Locations where a symbol named in the file is defined.",
                 R"json({"type":"object","properties":{"file_path":{"type":"string"},"symbol_name":{"type":"string"}},"required":["file_path","symbol_name"]})json"},
                {"find_symbol_references",
                 "All references to a symbol named in the file. Cross-file results need a built index store.",
                 R"json({"type":"object","properties":{"file_path":{"type":"string"},"symbol_name":{"type":"string"}},"required":["file_path","symbol_name"]})json"},
                {"replace_symbol_body",
                 "Replace the body between a symbol's braces, keeping its declaration. Supports dotted paths like Type.method.",
                 R"json({"type":"object","properties":{"file_path":{"type":"string"},"symbol_name":{"type":"string"},"new_body":{"type":"string"}},"required":["file_path","symbol_name","new_body"]})json"},
                {"get_diagnostics",
                 "Diagnostics the language server has published for the file.",
                 R"json({"type":"object","properties":{"file_path":{"type":"string"}},"required":["file_path"]})json"},
                {"analyze_file",
                 "Symbol tree of the file with kinds and 1-based positions.",
                 R"json({"type":"object","properties":{"file_path":{"type":"string"}},"required":["file_path"]})json"},
                {"get_symbols_overview",
                 "Top-level type declarations in the file (classes, structs, enums, protocols, extensions) with member counts.",
                 R"json({"type":"object","properties":{"file_path":{"type":"string"}},"required":["file_path"]})json"},
                {"get_file_imports",
                 "Import statements of the file, attributes removed. Reads the file directly without starting a session.",
                 R"json({"type":"object","properties":{"file_path":{"type":"string"}},"required":["file_path"]})json"},
                {"search_pattern",
                 "Regex or literal matches in the file with 1-based positions and surrounding lines. Does not start a session.",
                 R"json({"type":"object","properties":{"file_path":{"type":"string"},"pattern":{"type":"string"},"is_regex":{"type":"boolean","default":true},"flags":{"type":"string","description":"i (ignore case), m (multiline)"},"context_lines":{"type":"integer","minimum":0,"maximum":50,"default":0}},"required":["file_path","pattern"]})json"},
        };

        // ── Response helpers ────────────────────────────────────────────

        template <typename T>
        static std::string make_response(const glz::rpc::id_t& id, T&& result) {
            glz::rpc::response_t<std::decay_t<T>> resp{};
            resp.id = id;
            resp.result = std::forward<T>(result);
            std::string json{};
            (void)glz::write_json(resp, json);
            return json;
        }

        static std::string make_error_response(
                const glz::rpc::id_t& id, glz::rpc::error_e code, const std::string& message) {
            glz::rpc::response_t<glz::raw_json> resp{};
            resp.id = id;
            resp.error = glz::rpc::error{code, std::nullopt, message};
            std::string json{};
            (void)glz::write_json(resp, json);
            return json;
        }

        template <typename Args>
        static std::optional<Args> parse_args(const glz::raw_json& raw) {
            Args args{};
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(args, raw.str);
            if (ec) {
                debug_log("bad tool arguments: ", glz::format_error(ec, raw.str));
                return std::nullopt;
            }
            return args;
        }

        // ── Handlers ────────────────────────────────────────────────────

        static std::string handle_initialize(const glz::rpc::id_t& id, glz::raw_json_view raw_params) {
            initialize_params params{};
            (void)glz::read<glz::opts{.error_on_unknown_keys = false}>(params, raw_params.str);
            if (!params.clientInfo.name.empty()) {
                log_info("mcp client ", params.clientInfo.name, " ", params.clientInfo.version);
            }

            initialize_result result{};
            result.protocolVersion = std::string{protocol_version};
            result.capabilities = server_capabilities{};
            result.serverInfo = server_info{.name = "lsbridge", .version = "0.1.0"};

            return make_response(id, std::move(result));
        }

        static std::string handle_tools_list(const glz::rpc::id_t& id) {
            tools_list_result result{};
            for (const auto& spec : tool_specs) {
                result.tools.push_back(
                        tool_definition{
                                .name = std::string{spec.name},
                                .description = std::string{spec.description},
                                .inputSchema = glz::raw_json{std::string{spec.schema}},
                        });
            }
            return make_response(id, std::move(result));
        }

        static std::optional<tool_result> dispatch_tool(
                std::string_view name, const glz::raw_json& arguments, tool_service& tools) {
            if (name == "check_environment"sv) {
                auto args = parse_args<environment_args>(arguments);
                if (!args) {
                    return std::nullopt;
                }
                return tools.check_environment(args->directory ? fs::path{*args->directory} : fs::current_path());
            }
            if (name == "get_hover_info"sv) {
                auto args = parse_args<hover_args>(arguments);
                if (!args) {
                    return std::nullopt;
                }
                return tools.get_hover_info(args->file_path, args->line, args->character);
            }
            if (name == "get_symbol_definition"sv) {
                auto args = parse_args<symbol_args>(arguments);
                if (!args) {
                    return std::nullopt;
                }
                return tools.get_symbol_definition(args->file_path, args->symbol_name);
            }
            if (name == "find_symbol_references"sv) {
                auto args = parse_args<symbol_args>(arguments);
                if (!args) {
                    return std::nullopt;
                }
                return tools.find_symbol_references(args->file_path, args->symbol_name);
            }
            if (name == "replace_symbol_body"sv) {
                auto args = parse_args<replace_body_args>(arguments);
                if (!args) {
                    return std::nullopt;
                }
                return tools.replace_symbol_body(args->file_path, args->symbol_name, args->new_body);
            }
            if (name == "get_diagnostics"sv) {
                auto args = parse_args<file_args>(arguments);
                if (!args) {
                    return std::nullopt;
                }
                return tools.get_diagnostics(args->file_path);
            }
            if (name == "analyze_file"sv) {
                auto args = parse_args<file_args>(arguments);
                if (!args) {
                    return std::nullopt;
                }
                return tools.analyze_file(args->file_path);
            }
            if (name == "get_symbols_overview"sv) {
                auto args = parse_args<file_args>(arguments);
                if (!args) {
                    return std::nullopt;
                }
                return tools.get_symbols_overview(args->file_path);
            }
            if (name == "get_file_imports"sv) {
                auto args = parse_args<file_args>(arguments);
                if (!args) {
                    return std::nullopt;
                }
                return tools.get_file_imports(args->file_path);
            }
            if (name == "search_pattern"sv) {
                auto args = parse_args<search_args>(arguments);
                if (!args) {
                    return std::nullopt;
                }
                return tools.search_pattern(
                        args->file_path,
                        args->pattern,
                        args->is_regex.value_or(true),
                        args->flags.value_or(""),
                        args->context_lines.value_or(0));
            }
            return std::nullopt;
        }

        static bool is_known_tool(std::string_view name) {
            for (const auto& spec : tool_specs) {
                if (spec.name == name) {
                    return true;
                }
            }
            return false;
        }

        static std::string handle_tools_call(
                const glz::rpc::id_t& id, glz::raw_json_view raw_params, tool_service& tools) {
            tool_call_params params{};
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(params, raw_params.str);
            if (ec) {
                return make_error_response(id, glz::rpc::error_e::invalid_params, "Failed to parse tool call params");
            }
            if (!is_known_tool(params.name)) {
                return make_error_response(
                        id, glz::rpc::error_e::invalid_params, "Unknown tool: {}"_format(params.name));
            }

            auto outcome = dispatch_tool(params.name, params.arguments, tools);
            if (!outcome) {
                return make_error_response(
                        id, glz::rpc::error_e::invalid_params, "Failed to parse {} arguments"_format(params.name));
            }

            tool_call_result result{};
            result.content.push_back(text_content{.text = std::move(outcome->json)});
            result.isError = outcome->is_error;
            return make_response(id, std::move(result));
        }

    }  // namespace detail

    std::string handle_message(std::string_view line, tool_service& tools) {
        glz::rpc::generic_request_t request{};
        auto ec = glz::read_json(request, line);
        if (ec) {
            return detail::make_error_response({}, glz::rpc::error_e::parse_error, "JSON parse error");
        }

        bool is_notification = std::holds_alternative<glz::generic::null_t>(request.id);

        if (request.method == "initialize"sv) {
            return detail::handle_initialize(request.id, request.params);
        }
        if (request.method == "tools/list"sv) {
            return detail::handle_tools_list(request.id);
        }
        if (request.method == "tools/call"sv) {
            return detail::handle_tools_call(request.id, request.params, tools);
        }
        if (request.method == "ping"sv) {
            return detail::make_response(request.id, glz::raw_json{"{}"});
        }
        if (is_notification) {
            // notifications/initialized and friends need no reply
            return {};
        }
        return detail::make_error_response(
                request.id,
                glz::rpc::error_e::method_not_found,
                "Unknown method: {}"_format(std::string{request.method}));
    }

    void serve(std::istream& in, std::ostream& out, tool_service& tools) {
        std::string line{};
        while (std::getline(in, line)) {
            if (utils::trim_view(line).empty()) {
                continue;
            }
            auto reply = handle_message(line, tools);
            if (!reply.empty()) {
                out << reply << '\n';
                out.flush();
            }
        }
    }

    int run_mcp_server(const startup_config& cfg) {
        ::signal(SIGPIPE, SIG_IGN);

        session_registry registry{cfg, make_event_sink(cfg.events_file)};
        tool_service tools{registry};

        log_info("serving mcp on stdio with backend ", cfg.server_path.string());
        serve(std::cin, std::cout, tools);

        auto closed = registry.shutdown_all();
        debug_log("stdin closed; shut down ", closed, " session(s)");
        return 0;
    }

}  // namespace lsbridge::mcp
