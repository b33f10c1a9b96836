#include "utils.hpp"

namespace lsbridge::test {

    namespace {
        struct mcp_fixture {
            temp_dir dir;
            fs::path file;
            session_registry registry;
            tool_service tools;

            explicit mcp_fixture(std::string_view prefix)
                    : dir{prefix},
                      file{make_swift_package(dir, "struct Widget {\n    func draw() {\n    }\n}\n")},
                      registry{fake_config()},
                      tools{registry} {}

            std::string call(std::string_view tool, std::string_view arguments, int id = 2) {
                return mcp::handle_message(
                        R"({{"jsonrpc":"2.0","id":{},"method":"tools/call","params":{{"name":"{}","arguments":{}}}}})"_format(
                                id, tool, arguments),
                        tools);
            }
        };
    }  // namespace

    TEST_CASE("011: initialize advertises tools capability", "[011][mcp]") {
        mcp_fixture f{"lsbridge_mcp_init"};
        auto resp = mcp::handle_message(
                R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2024-11-05","capabilities":{},"clientInfo":{"name":"test","version":"0.1"}}})",
                f.tools);

        CHECK(contains(resp, R"("id":1)"));
        CHECK(contains(resp, R"("protocolVersion":"2024-11-05")"));
        CHECK(contains(resp, R"("name":"lsbridge")"));
        CHECK(contains(resp, R"("capabilities":{"tools":{}})"));
    }

    TEST_CASE("011: tools/list names every tool with a schema", "[011][mcp]") {
        mcp_fixture f{"lsbridge_mcp_list"};
        auto resp = mcp::handle_message(R"({"jsonrpc":"2.0","id":"list","method":"tools/list"})", f.tools);

        CHECK(contains(resp, R"("id":"list")"));
        for (auto name :
             {"check_environment",
              "get_hover_info",
              "get_symbol_definition",
              "find_symbol_references",
              "replace_symbol_body",
              "get_diagnostics",
              "analyze_file",
              "get_symbols_overview",
              "get_file_imports",
              "search_pattern"}) {
            CHECK(contains(resp, R"("name":")" + std::string{name} + "\""));
        }
        CHECK(contains(resp, R"("inputSchema":{"type":"object")"));
    }

    TEST_CASE("011: notifications get no reply, unknown methods get an error", "[011][mcp]") {
        mcp_fixture f{"lsbridge_mcp_misc"};

        CHECK(mcp::handle_message(R"({"jsonrpc":"2.0","method":"notifications/initialized"})", f.tools).empty());
        CHECK(contains(mcp::handle_message(R"({"jsonrpc":"2.0","id":3,"method":"ping"})", f.tools), R"("result":{})"));

        auto unknown = mcp::handle_message(R"({"jsonrpc":"2.0","id":4,"method":"resources/list"})", f.tools);
        CHECK(contains(unknown, R"("error":)"));
        CHECK(contains(unknown, "Unknown method: resources/list"));

        auto garbage = mcp::handle_message("{oops", f.tools);
        CHECK(contains(garbage, "JSON parse error"));
    }

    TEST_CASE("011: tools/call returns tool json as text content", "[011][mcp]") {
        mcp_fixture f{"lsbridge_mcp_call"};

        auto hover = f.call(
                "get_hover_info", R"({{"file_path":"{}","line":1,"character":9}})"_format(f.file.string()));
        CHECK(contains(hover, R"("isError":false)"));
        CHECK(contains(hover, R"("type":"text")"));
        CHECK(contains(hover, "symbol Widget"));

        auto missing = f.call("get_symbol_definition", R"({{"file_path":"{}","symbol_name":"Gadget"}})"_format(f.file.string()));
        CHECK(contains(missing, R"("isError":true)"));
        CHECK(contains(missing, R"(\"error_type\":\"symbol_not_found\")"));
    }

    TEST_CASE("011: symbol and text tools dispatch their arguments", "[011][mcp]") {
        mcp_fixture f{"lsbridge_mcp_text_tools"};

        auto search = f.call(
                "search_pattern",
                R"({{"file_path":"{}","pattern":"DRAW","flags":"i","context_lines":1}})"_format(f.file.string()));
        CHECK(contains(search, R"("isError":false)"));
        CHECK(contains(search, R"("line":2,"character":10,"match_text":"draw")"));
        CHECK(contains(search, R"("match_count":1)"));

        auto imports = f.call("get_file_imports", R"({{"file_path":"{}"}})"_format(f.file.string()));
        CHECK(contains(imports, R"("import_count":0)"));
        CHECK(f.registry.starts() == 0U);

        auto overview = f.call("get_symbols_overview", R"({{"file_path":"{}"}})"_format(f.file.string()));
        CHECK(contains(overview, R"("name":"Widget","kind":"struct")"));
        CHECK(contains(overview, R"("member_count":1)"));

        auto analysis = f.call("analyze_file", R"({{"file_path":"{}"}})"_format(f.file.string()), 3);
        CHECK(contains(analysis, R"("id":3)"));
        CHECK(contains(analysis, R"("name":"draw","kind":"method")"));
        CHECK(f.registry.starts() == 1U);

        auto missing_pattern = f.call("search_pattern", R"({{"file_path":"{}"}})"_format(f.file.string()));
        CHECK(contains(missing_pattern, R"("error_type":"invalid_parameters")"));
    }

    TEST_CASE("011: bad tool calls are protocol errors", "[011][mcp]") {
        mcp_fixture f{"lsbridge_mcp_bad"};

        auto unknown = f.call("compile_everything", "{}");
        CHECK(contains(unknown, "Unknown tool: compile_everything"));

        auto wrong_type = f.call("get_hover_info", R"({"file_path":"x","line":"one","character":1})");
        CHECK(contains(wrong_type, "Failed to parse get_hover_info arguments"));
        CHECK(f.registry.starts() == 0U);
    }

    TEST_CASE("011: serve answers line by line and skips blank lines", "[011][mcp]") {
        mcp_fixture f{"lsbridge_mcp_serve"};
        std::istringstream in{
                "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}\n"
                "\n"
                "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}\n"
                "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/list\"}\n"};
        std::ostringstream out{};

        mcp::serve(in, out, f.tools);

        auto text = out.str();
        CHECK(std::ranges::count(text, '\n') == 2);
        CHECK(text.find(R"("id":1)") < text.find(R"("id":2)"));
    }

}  // namespace lsbridge::test
