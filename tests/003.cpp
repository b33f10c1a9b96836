#include "utils.hpp"

namespace lsbridge::test {

    namespace text = internal::text;

    TEST_CASE("003: file uris percent-encode reserved characters", "[003][protocol]") {
        CHECK(path_to_uri("/tmp/My Project/main.swift") == "file:///tmp/My%20Project/main.swift");
        CHECK(path_to_uri("/a/b#c.swift") == "file:///a/b%23c.swift");

        CHECK(uri_to_path("file:///tmp/My%20Project/main.swift") == fs::path{"/tmp/My Project/main.swift"});
        CHECK(uri_to_path("file://localhost/etc/hosts") == fs::path{"/etc/hosts"});
        CHECK(uri_to_path("file:///bad%zzescape") == fs::path{"/bad%zzescape"});

        fs::path odd{"/tmp/ünïcode dir/a+b.swift"};
        CHECK(uri_to_path(path_to_uri(odd)) == odd);
    }

    TEST_CASE("003: language ids and symbol kind names", "[003][protocol]") {
        CHECK(language_id_for("x/main.swift") == "swift");
        CHECK(language_id_for("x/a.hpp") == "cpp");
        CHECK(language_id_for("x/a.m") == "objective-c");
        CHECK(language_id_for("x/README") == "plaintext");

        CHECK(symbol_kind_name(12) == "function");
        CHECK(symbol_kind_name(23) == "struct");
        CHECK(symbol_kind_name(0) == "unknown");
        CHECK(symbol_kind_name(99) == "unknown");
    }

    TEST_CASE("003: positions count utf-16 code units", "[003][text]") {
        // "é" is 2 UTF-8 bytes / 1 UTF-16 unit; "😀" is 4 bytes / 2 units
        std::string_view source = "let é = 1\nlet 😀x = 2\r\nend";

        CHECK(text::offset_of(source, {0, 4}) == std::optional<size_t>{4U});
        CHECK(text::offset_of(source, {0, 5}) == std::optional<size_t>{6U});
        CHECK(text::offset_of(source, {1, 6}) == std::optional<size_t>{19U});
        // past end of line clamps before the CR
        CHECK(text::offset_of(source, {1, 200}) == std::optional<size_t>{source.find('\r')});
        CHECK(text::offset_of(source, {2, 1}) == std::optional<size_t>{source.find("end") + 1U});
        CHECK_FALSE(text::offset_of(source, {3, 0}).has_value());

        auto pos = text::position_at(source, source.find('x'));
        CHECK(pos == position{1, 6});
    }

    TEST_CASE("003: line counting", "[003][text]") {
        CHECK(text::line_count("") == 0U);
        CHECK(text::line_count("a") == 1U);
        CHECK(text::line_count("a\n") == 1U);
        CHECK(text::line_count("a\nb") == 2U);
        CHECK(text::line_count("\n\n") == 2U);
    }

    TEST_CASE("003: masking blanks comments and strings but keeps offsets", "[003][text]") {
        std::string_view source =
                "let a = \"b { c\" // d {\n"
                "/* outer /* inner } */ still */ let e = 1\n"
                "let f = \"\"\"\n"
                "g }\n"
                "\"\"\"\n";
        auto masked = text::mask_code(source);

        REQUIRE(masked.size() == source.size());
        CHECK(std::ranges::count(masked, '\n') == std::ranges::count(source, '\n'));
        CHECK(masked.find('{') == std::string::npos);
        CHECK(masked.find('}') == std::string::npos);
        CHECK(masked.find("still") == std::string::npos);
        CHECK(masked.find("let e") == source.find("let e"));
        CHECK(masked.find("let f") == source.find("let f"));
    }

    TEST_CASE("003: locate_symbol prefers declarations over uses", "[003][text]") {
        std::string_view source =
                "// compute is documented here\n"
                "let x = compute()\n"
                "var cache: Cache = Cache()\n"
                "func compute() -> Int {\n"
                "    return 1\n"
                "}\n";

        auto decl = text::locate_symbol(source, "compute");
        REQUIRE(decl.has_value());
        CHECK(*decl == position{3, 5});

        auto annotated = text::locate_symbol(source, "Cache");
        REQUIRE(annotated.has_value());
        CHECK(*annotated == position{2, 11});

        auto used = text::locate_symbol(source, "x");
        REQUIRE(used.has_value());
        CHECK(*used == position{1, 4});

        CHECK_FALSE(text::locate_symbol(source, "documented").has_value());
        CHECK_FALSE(text::locate_symbol(source, "comp").has_value());
    }

    TEST_CASE("003: brace bodies skip braces in strings and comments", "[003][text]") {
        std::string source =
                "func f() {\n"
                "    let s = \"}\" // }\n"
                "    if x { y() }\n"
                "}\n"
                "func g() {}\n";

        auto body = text::find_brace_body(source, 0U, source.size());
        REQUIRE(body.has_value());
        CHECK(body->first == source.find('{'));
        CHECK(body->second == source.find("}\nfunc g"));

        auto g = text::find_brace_body(source, source.find("func g"), source.size());
        REQUIRE(g.has_value());
        CHECK(g->second == g->first + 1U);

        CHECK_FALSE(text::find_brace_body("let x = 1\n", 0U, 10U).has_value());
        CHECK_FALSE(text::find_brace_body(source, 0U, source.find("if x")).has_value());
    }

    TEST_CASE("003: reindent_body nests one level below the declaration", "[003][text]") {
        auto out = text::reindent_body("\n  let a = 1\n  if a {\n      run()\n  }\n\n", "    ");
        CHECK(out ==
              "\n"
              "        let a = 1\n"
              "        if a {\n"
              "            run()\n"
              "        }\n"
              "    ");

        auto tabs = text::reindent_body("return 1", "\t");
        CHECK(tabs == "\n\t\treturn 1\n\t");

        CHECK(text::reindent_body("x\n\ny", "") == "\n    x\n\n    y\n");
    }

}  // namespace lsbridge::test
