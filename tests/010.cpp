#include "utils.hpp"

namespace lsbridge::test {

    namespace {
        constexpr std::string_view greeter_source =
                "struct Greeter {\n"
                "    let name: String\n"
                "\n"
                "    func greet() -> String {\n"
                "        return \"hi \" + name\n"
                "    }\n"
                "}\n"
                "\n"
                "func main() {\n"
                "    let g = Greeter(name: \"x\")\n"
                "    print(g.greet())\n"
                "}\n";

        struct fixture {
            temp_dir dir;
            fs::path file;
            session_registry registry;
            tool_service tools;

            explicit fixture(
                    std::string_view prefix,
                    std::string_view source = greeter_source,
                    startup_config cfg = fake_config())
                    : dir{prefix}, file{make_swift_package(dir, source)}, registry{std::move(cfg)}, tools{registry} {}
        };

        std::string error_type_of(const tool_result& result) {
            REQUIRE(result.is_error);
            REQUIRE(contains(result.json, R"("success":false)"));
            auto key = std::string{R"("error_type":")"};
            auto at = result.json.find(key);
            REQUIRE(at != std::string::npos);
            auto begin = at + key.size();
            return result.json.substr(begin, result.json.find('"', begin) - begin);
        }
    }  // namespace

    TEST_CASE("010: hover tool uses 1-based positions", "[010][tools]") {
        fixture f{"lsbridge_tools_hover"};

        auto result = f.tools.get_hover_info(f.file.string(), 1, 9);
        CHECK_FALSE(result.is_error);
        CHECK(contains(result.json, R"("success":true)"));
        CHECK(contains(result.json, R"("line":1,"character":9)"));
        CHECK(contains(result.json, "symbol Greeter"));
        CHECK(f.registry.contains(f.dir.path));
    }

    TEST_CASE("010: argument validation never starts a server", "[010][tools]") {
        fixture f{"lsbridge_tools_args"};

        CHECK(error_type_of(f.tools.get_hover_info(f.file.string(), 0, 1)) == "invalid_parameters");
        CHECK(error_type_of(f.tools.get_hover_info(f.file.string(), 1, -3)) == "invalid_parameters");
        CHECK(error_type_of(f.tools.get_hover_info((f.dir.path / "nope.swift").string(), 1, 1)) == "file_not_found");
        CHECK(error_type_of(f.tools.get_hover_info("", 1, 1)) == "invalid_parameters");
        CHECK(error_type_of(f.tools.get_symbol_definition(f.file.string(), "  ")) == "invalid_parameters");
        CHECK(error_type_of(f.tools.get_symbol_definition(f.file.string(), std::string(201, 'a'))) ==
              "invalid_parameters");
        CHECK(error_type_of(f.tools.replace_symbol_body(f.file.string(), "greet", " \n ")) == "invalid_parameters");
        CHECK(error_type_of(f.tools.get_diagnostics(f.dir.path.string())) == "file_not_found");

        CHECK(f.registry.starts() == 0U);
    }

    TEST_CASE("010: definition and references by symbol name", "[010][tools]") {
        fixture f{"lsbridge_tools_nav"};

        auto def = f.tools.get_symbol_definition(f.file.string(), "Greeter");
        CHECK_FALSE(def.is_error);
        CHECK(contains(def.json, R"("line":1,"character":8,"end_line":1,"end_character":15)"));

        auto refs = f.tools.find_symbol_references(f.file.string(), "Greeter");
        CHECK_FALSE(refs.is_error);
        CHECK(contains(refs.json, R"("reference_count":2)"));
        CHECK_FALSE(contains(refs.json, "hint"));

        CHECK(error_type_of(f.tools.get_symbol_definition(f.file.string(), "Missing")) == "symbol_not_found");
    }

    TEST_CASE("010: replace_symbol_body rewrites only the body", "[010][tools]") {
        fixture f{"lsbridge_tools_replace"};

        auto result = f.tools.replace_symbol_body(
                f.file.string(), "Greeter.greet()", "let prefix = \"hello \"\nreturn prefix + name");
        INFO(result.json);
        REQUIRE_FALSE(result.is_error);
        CHECK(contains(result.json, R"("operation":"replace_body")"));
        CHECK(contains(result.json, R"("start_line":4,"end_line":6,"lines_removed":3,"lines_added":2)"));

        CHECK(read_file(f.file) ==
              "struct Greeter {\n"
              "    let name: String\n"
              "\n"
              "    func greet() -> String {\n"
              "        let prefix = \"hello \"\n"
              "        return prefix + name\n"
              "    }\n"
              "}\n"
              "\n"
              "func main() {\n"
              "    let g = Greeter(name: \"x\")\n"
              "    print(g.greet())\n"
              "}\n");

        // the server saw the edit
        auto hover = f.tools.get_hover_info(f.file.string(), 5, 14);
        CHECK(contains(hover.json, "symbol prefix"));
    }

    TEST_CASE("010: replace_symbol_body resolves dotted names and reports ambiguity", "[010][tools]") {
        fixture f{
                "lsbridge_tools_ambiguous",
                "struct A {\n"
                "    func run() {\n"
                "    }\n"
                "}\n"
                "struct B {\n"
                "    func run() {\n"
                "    }\n"
                "}\n"};

        auto ambiguous = f.tools.replace_symbol_body(f.file.string(), "run", "return");
        CHECK(error_type_of(ambiguous) == "symbol_ambiguous");
        CHECK(contains(ambiguous.json, "A.run (method)"));
        CHECK(contains(ambiguous.json, "B.run (method)"));

        CHECK(error_type_of(f.tools.replace_symbol_body(f.file.string(), "C.run", "return")) == "symbol_not_found");

        auto ok = f.tools.replace_symbol_body(f.file.string(), "B.run", "print(1)");
        REQUIRE_FALSE(ok.is_error);
        CHECK(read_file(f.file) ==
              "struct A {\n"
              "    func run() {\n"
              "    }\n"
              "}\n"
              "struct B {\n"
              "    func run() {\n"
              "        print(1)\n"
              "    }\n"
              "}\n");
    }

    TEST_CASE("010: diagnostics tool reports severities by name", "[010][tools]") {
        fixture f{"lsbridge_tools_diag", "func f() {\n    ERROR_HERE\n}\n"};

        CHECK(eventually([&] {
            auto result = f.tools.get_diagnostics(f.file.string());
            return contains(result.json, R"("count":1)");
        }));
        auto result = f.tools.get_diagnostics(f.file.string());
        CHECK(contains(result.json, R"("line":2,"character":5,"severity":"error","message":"unexpected token")"));
    }

    TEST_CASE("010: timeouts keep the session, disconnects evict it", "[010][tools]") {
        auto cfg = fake_config();
        cfg.request_timeout_ms = 300;
        cfg.reaper_interval_ms = 60'000;
        fixture f{"lsbridge_tools_failures", greeter_source, cfg};

        CHECK(error_type_of(f.tools.get_hover_info(f.file.string(), 99, 1)) == "timeout");
        CHECK(f.registry.contains(f.dir.path));
        CHECK(f.registry.starts() == 1U);

        CHECK(error_type_of(f.tools.get_hover_info(f.file.string(), 98, 1)) == "backend_disconnected");
        CHECK_FALSE(f.registry.contains(f.dir.path));

        auto again = f.tools.get_hover_info(f.file.string(), 1, 9);
        CHECK_FALSE(again.is_error);
        CHECK(f.registry.starts() == 2U);
    }

    TEST_CASE("010: files outside any project use their directory as root", "[010][tools]") {
        temp_dir dir{"lsbridge_tools_loose"};
        auto cfg = fake_config();
        cfg.root_markers = {"lsbridge-unlikely-marker.json"};
        session_registry registry{cfg};
        tool_service tools{registry};

        auto file = dir.path / "script.swift";
        write_file(file, "func hello() {\n}\n");
        CHECK(tools.root_for(file) == dir.path);

        auto result = tools.get_hover_info(file.string(), 1, 7);
        CHECK_FALSE(result.is_error);
        CHECK(registry.contains(dir.path));
    }

    TEST_CASE("010: analyze_file returns the symbol tree", "[010][tools]") {
        fixture f{"lsbridge_tools_analyze"};

        auto result = f.tools.analyze_file(f.file.string());
        INFO(result.json);
        REQUIRE_FALSE(result.is_error);
        CHECK(contains(
                result.json,
                R"({"name":"Greeter","kind":"struct","line":1,"character":8,"children":[{"name":"greet","kind":"method","line":4,"character":10,"children":[]}]})"));
        CHECK(contains(result.json, R"({"name":"main","kind":"function","line":9,"character":6,"children":[]})"));
        CHECK(contains(result.json, R"("symbol_count":2)"));

        CHECK(error_type_of(f.tools.analyze_file((f.dir.path / "gone.swift").string())) == "file_not_found");
    }

    TEST_CASE("010: symbols overview keeps only top-level types", "[010][tools]") {
        fixture f{
                "lsbridge_tools_overview",
                "protocol Shape {\n"
                "}\n"
                "class Box {\n"
                "    func open() {\n"
                "    }\n"
                "    func close() {\n"
                "    }\n"
                "}\n"
                "enum Mode {\n"
                "}\n"
                "extension Box {\n"
                "    func wave() {\n"
                "    }\n"
                "}\n"
                "func helper() {\n"
                "}\n"};

        auto result = f.tools.get_symbols_overview(f.file.string());
        INFO(result.json);
        REQUIRE_FALSE(result.is_error);
        CHECK(contains(result.json, R"({"name":"Shape","kind":"interface","line":1,"character":10,"member_count":0})"));
        CHECK(contains(result.json, R"({"name":"Box","kind":"class","line":3,"character":7,"member_count":2})"));
        CHECK(contains(result.json, R"({"name":"Mode","kind":"enum","line":9,"character":6,"member_count":0})"));
        CHECK(contains(result.json, R"({"name":"Box","kind":"module","line":11,"character":11,"member_count":1})"));
        CHECK(contains(result.json, R"("symbol_count":4)"));
        CHECK_FALSE(contains(result.json, "helper"));
        CHECK_FALSE(contains(result.json, "wave"));
    }

    TEST_CASE("010: file imports are read from text without a server", "[010][tools]") {
        fixture f{
                "lsbridge_tools_imports",
                "import Foundation\n"
                "@testable import MyApp\n"
                "@_exported @testable import struct Core.Date // trailing\n"
                "// import Hidden\n"
                "/* import AlsoHidden */\n"
                "let s = \"import Fake\"\n"
                "  import UIKit.UIView\n"
                "func f() {\n"
                "}\n"};

        auto result = f.tools.get_file_imports(f.file.string());
        INFO(result.json);
        REQUIRE_FALSE(result.is_error);
        CHECK(contains(
                result.json,
                R"("imports":["import Foundation","import MyApp","import struct Core.Date","import UIKit.UIView"],"import_count":4)"));

        CHECK(error_type_of(f.tools.get_file_imports("")) == "invalid_parameters");
        CHECK(f.registry.starts() == 0U);
    }

    TEST_CASE("010: search_pattern reports 1-based matches with context", "[010][tools]") {
        fixture f{"lsbridge_tools_search"};

        auto funcs = f.tools.search_pattern(f.file.string(), R"(func \w+)");
        INFO(funcs.json);
        REQUIRE_FALSE(funcs.is_error);
        CHECK(contains(
                funcs.json,
                R"({"line":4,"character":5,"match_text":"func greet","context":"func greet() -> String {"})"));
        CHECK(contains(funcs.json, R"({"line":9,"character":1,"match_text":"func main","context":"func main() {"})"));
        CHECK(contains(funcs.json, R"("match_count":2)"));
        CHECK_FALSE(contains(funcs.json, "truncated"));

        // literal text: '.' and '()' are not regex syntax
        auto literal = f.tools.search_pattern(f.file.string(), "g.greet()", false, "", 1);
        INFO(literal.json);
        REQUIRE_FALSE(literal.is_error);
        CHECK(contains(literal.json, R"("line":11,"character":11,"match_text":"g.greet()")"));
        CHECK(contains(
                literal.json, R"("context":"    let g = Greeter(name: \"x\")\n    print(g.greet())\n}")"));
        CHECK(contains(literal.json, R"("is_regex":false)"));

        auto exact = f.tools.search_pattern(f.file.string(), "GREETER");
        CHECK_FALSE(exact.is_error);
        CHECK(contains(exact.json, R"("matches":[],"match_count":0)"));

        auto folded = f.tools.search_pattern(f.file.string(), "GREETER", true, "i");
        CHECK(contains(folded.json, R"({"line":1,"character":8,"match_text":"Greeter")"));
        CHECK(contains(folded.json, R"({"line":10,"character":13,"match_text":"Greeter")"));
        CHECK(contains(folded.json, R"("match_count":2)"));

        // pattern search never needs a language server
        CHECK(f.registry.starts() == 0U);
    }

    TEST_CASE("010: search_pattern columns count UTF-16 units", "[010][tools]") {
        fixture f{"lsbridge_tools_search_utf16", "let s = \"\xC3\xA9\xF0\x9F\x98\x80x\"\n"};

        auto result = f.tools.search_pattern(f.file.string(), "x", false);
        INFO(result.json);
        REQUIRE_FALSE(result.is_error);
        CHECK(contains(result.json, R"("line":1,"character":13,"match_text":"x")"));
    }

    TEST_CASE("010: search_pattern validates its arguments", "[010][tools]") {
        fixture f{"lsbridge_tools_search_args"};
        auto path = f.file.string();

        CHECK(error_type_of(f.tools.search_pattern(path, "")) == "invalid_parameters");
        CHECK(error_type_of(f.tools.search_pattern(path, std::string(1001, 'a'))) == "invalid_parameters");
        CHECK(error_type_of(f.tools.search_pattern(path, "(unclosed")) == "invalid_parameters");
        CHECK(error_type_of(f.tools.search_pattern(path, "name", true, "x")) == "invalid_parameters");
        CHECK(error_type_of(f.tools.search_pattern(path, "name", true, "", -1)) == "invalid_parameters");
        CHECK(error_type_of(f.tools.search_pattern(path, "name", true, "", 51)) == "invalid_parameters");
        CHECK(error_type_of(f.tools.search_pattern((f.dir.path / "gone.swift").string(), "name")) ==
              "file_not_found");

        // the same text is fine as a literal
        CHECK_FALSE(f.tools.search_pattern(path, "(unclosed", false).is_error);
        CHECK(f.registry.starts() == 0U);
    }

    TEST_CASE("010: environment tool", "[010][tools]") {
        fixture f{"lsbridge_tools_env"};
        auto result = f.tools.check_environment(f.dir.path);
        CHECK_FALSE(result.is_error);
        CHECK(contains(result.json, R"("server_available":true)"));
        CHECK(contains(result.json, R"("project_type":"Swift Package Manager")"));
        CHECK(contains(result.json, R"("build_required":true)"));
        CHECK(f.registry.starts() == 0U);
    }

}  // namespace lsbridge::test
