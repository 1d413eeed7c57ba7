//
// Unit tests for the token scanner
//

#include <doctest/doctest.h>
#include <litfix/lexical.hh>
#include <litfix/scanner.hh>
#include <string>
#include <vector>

using namespace litfix;

namespace {
    // Bracket balance of a span, ignoring strings and comments
    bool balanced(std::string_view text) {
        int depth = 0;
        std::size_t pos = 0;
        while (pos < text.size()) {
            auto r = lexical::region_at(text, pos);
            if (r != lexical::region::none) {
                pos = lexical::region_end(text, pos, r);
                continue;
            }
            if (lexical::is_opener(text[pos])) ++depth;
            if (lexical::is_closer(text[pos])) --depth;
            if (depth < 0) return false;
            ++pos;
        }
        return depth == 0;
    }
}

TEST_SUITE("Scanner - Spans") {
    TEST_CASE("Single-line literal") {
        std::string buffer = R"(w := &Widget{Name: "a"})";
        scanner s("&Widget");

        auto result = s.scan(buffer, 0);
        REQUIRE(result.found());
        CHECK(result.where.start == 5);
        CHECK(result.where.end == buffer.size());
        CHECK(result.body_start == 12);
        CHECK_FALSE(result.mismatched);
    }

    TEST_CASE("Nested literals and braces in strings") {
        std::string literal = R"(&Widget{Name: "}", Meta: map[string]int{"x": 1}, Tags: []string{"{"}})";
        std::string buffer = "use(" + literal + ")\n";
        scanner s("&Widget");

        auto result = s.scan(buffer, 0);
        REQUIRE(result.found());
        CHECK(result.where.text(buffer) == literal);
    }

    TEST_CASE("Raw strings, runes and comments do not affect nesting") {
        std::string literal =
            "&Widget{\n"
            "\tBody: `}\n{`,\n"
            "\tSep: '}',\n"
            "\tSize: 3, // closing } here\n"
            "\t/* and { here */\n"
            "}";
        std::string buffer = literal + "\nnext()";
        scanner s("&Widget");

        auto result = s.scan(buffer, 0);
        REQUIRE(result.found());
        CHECK(result.where.text(buffer) == literal);
    }

    TEST_CASE("Successive scans return disjoint balanced spans") {
        std::string buffer =
            "a := &Widget{Name: \"a\"}\n"
            "b := &Widget{Name: \"b\", Meta: M{K: {1}}}\n"
            "c := &Widget{}\n";
        scanner s("&Widget");

        std::vector<span> spans;
        std::size_t pos = 0;
        while (true) {
            auto result = s.scan(buffer, pos);
            if (!result.found()) break;
            spans.push_back(result.where);
            pos = result.where.end;
        }

        REQUIRE(spans.size() == 3);
        for (std::size_t i = 0; i < spans.size(); ++i) {
            CHECK(balanced(spans[i].text(buffer)));
            if (i > 0) {
                CHECK_FALSE(spans[i].overlaps(spans[i - 1]));
            }
        }
        CHECK(spans[2].text(buffer) == "&Widget{}");
    }
}

TEST_SUITE("Scanner - Markers") {
    TEST_CASE("Prefix must be followed directly by a brace") {
        scanner s("&Widget");
        CHECK(s.scan("x := &Widget {A: 1}", 0).status == scan_status::not_found);
        CHECK(s.scan("x := &WidgetInfo{A: 1}", 0).status == scan_status::not_found);
        CHECK(s.scan("x := &Widget", 0).status == scan_status::not_found);
    }

    TEST_CASE("Prefix matches only at an identifier boundary") {
        scanner s("Widget");
        CHECK(s.scan("x := MyWidget{A: 1}", 0).status == scan_status::not_found);
        CHECK(s.scan("x := pkg.Widget{A: 1}", 0).status == scan_status::not_found);
        CHECK(s.scan("x := Widget{A: 1}", 0).found());
        CHECK(s.scan("Widget{A: 1}", 0).found());
    }

    TEST_CASE("Qualified prefixes") {
        scanner s("&storage.MetricsSnapshot");
        auto result = s.scan("snap := &storage.MetricsSnapshot{Serial: s}", 0);
        REQUIRE(result.found());
        CHECK(result.where.start == 8);
    }

    TEST_CASE("Markers inside strings and comments are ignored") {
        scanner s("&Widget");
        CHECK(s.scan(R"(s := "&Widget{A: 1}")", 0).status == scan_status::not_found);
        CHECK(s.scan("// &Widget{A: 1}\n", 0).status == scan_status::not_found);
        CHECK(s.scan("/* &Widget{A: 1} */", 0).status == scan_status::not_found);
        CHECK(s.scan("s := `\n&Widget{A: 1}\n`", 0).status == scan_status::not_found);
    }

    TEST_CASE("find_marker reports the marker offset") {
        scanner s("&Widget");
        std::string buffer = "// &Widget{\nx := &Widget{}";
        CHECK(s.find_marker(buffer, 0) == 17);
        CHECK(s.find_marker(buffer, 18) == lexical::npos);
    }
}

TEST_SUITE("Scanner - Recovery") {
    TEST_CASE("End of buffer inside a literal is unterminated") {
        std::string buffer = "x := &Widget{A: {1}\n";
        scanner s("&Widget");

        auto result = s.scan(buffer, 0);
        CHECK(result.status == scan_status::unterminated);
        CHECK(result.where.start == 5);
        CHECK(result.where.end == buffer.size());
    }

    TEST_CASE("Unterminated block comment inside a literal") {
        scanner s("&Widget");
        CHECK(s.scan("&Widget{A: 1 /* }", 0).status == scan_status::unterminated);
    }

    TEST_CASE("Mismatched closer is flagged") {
        std::string buffer = "&Widget{A: (1]}";
        scanner s("&Widget");

        auto result = s.scan(buffer, 0);
        REQUIRE(result.found());
        CHECK(result.mismatched);
        CHECK(result.where.end == buffer.size());
    }
}
