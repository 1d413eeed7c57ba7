//
// Unit tests for the field extractor
//

#include <doctest/doctest.h>
#include <litfix/field_extractor.hh>
#include <litfix/scanner.hh>
#include <string>
#include <variant>
#include <vector>

using namespace litfix;

namespace {
    // Scan the first &Widget literal of `buffer` and extract it
    extract_result extract_first(const std::string& buffer) {
        scanner s("&Widget");
        auto result = s.scan(buffer, 0);
        REQUIRE(result.found());
        return extract_fields(buffer, result.where);
    }

    std::vector<field> fields_of(const std::string& buffer) {
        auto result = extract_first(buffer);
        REQUIRE(std::holds_alternative<std::vector<field>>(result));
        return std::get<std::vector<field>>(result);
    }
}

TEST_SUITE("Field Extractor - Well-formed") {
    TEST_CASE("Inline fields with trailing comma") {
        auto fields = fields_of(R"(&Widget{ Name: "a", Size: 3, })");

        REQUIRE(fields.size() == 2);
        CHECK(fields[0].name == "Name");
        CHECK(fields[0].raw_value == "\"a\"");
        CHECK(fields[1].name == "Size");
        CHECK(fields[1].raw_value == "3");
    }

    TEST_CASE("Nested value stays intact") {
        auto fields = fields_of(R"(&Widget{ Name: "a", Meta: map[string]int{"x": 1} })");

        REQUIRE(fields.size() == 2);
        CHECK(fields[1].name == "Meta");
        CHECK(fields[1].raw_value == R"(map[string]int{"x": 1})");
    }

    TEST_CASE("Multi-line literal with comments") {
        std::string buffer =
            "w := &Widget{\n"
            "\t\tName:  \"a\", // primary\n"
            "\t\t// Size is optional\n"
            "\t\tSize:  3,\n"
            "\t\tTags: []string{\n"
            "\t\t\t\"x\",\n"
            "\t\t\t\"y\",\n"
            "\t\t},\n"
            "\t}\n";
        auto fields = fields_of(buffer);

        REQUIRE(fields.size() == 3);
        CHECK(fields[0].raw_value == "\"a\"");
        CHECK(fields[1].name == "Size");
        CHECK(fields[1].raw_value == "3");
        CHECK(fields[2].name == "Tags");
        CHECK(fields[2].raw_value == "[]string{\n\t\t\t\"x\",\n\t\t\t\"y\",\n\t\t}");
    }

    TEST_CASE("Separators inside strings and calls are not split points") {
        auto fields = fields_of(R"(&Widget{URL: "http://a,b", At: time.Date(2024, 1, 2), Fn: func(a, b int) {}})");

        REQUIRE(fields.size() == 3);
        CHECK(fields[0].raw_value == "\"http://a,b\"");
        CHECK(fields[1].raw_value == "time.Date(2024, 1, 2)");
        CHECK(fields[2].raw_value == "func(a, b int) {}");
    }

    TEST_CASE("Value span points at the raw value") {
        std::string buffer = R"(x := &Widget{Name: "a",  Size: 3})";
        auto fields = fields_of(buffer);

        REQUIRE(fields.size() == 2);
        for (const auto& f : fields) {
            CHECK(f.value_span.text(buffer) == f.raw_value);
        }
    }

    TEST_CASE("Empty literal has no fields") {
        CHECK(fields_of("&Widget{}").empty());
        CHECK(fields_of("&Widget{\n\t// nothing yet\n}").empty());
    }
}

TEST_SUITE("Field Extractor - Malformed") {
    TEST_CASE("Segment without separator") {
        auto result = extract_first(R"(&Widget{Name: "a", oops})");
        REQUIRE(std::holds_alternative<malformed_literal>(result));
        CHECK(std::get<malformed_literal>(result).reason.find("oops") != std::string::npos);
        CHECK(std::get<malformed_literal>(result).position == 19);
    }

    TEST_CASE("Positional literal") {
        auto result = extract_first(R"(&Widget{"a", 3})");
        CHECK(std::holds_alternative<malformed_literal>(result));
    }

    TEST_CASE("Duplicate field") {
        auto result = extract_first(R"(&Widget{Name: "a", Size: 1, Name: "b"})");
        REQUIRE(std::holds_alternative<malformed_literal>(result));
        CHECK(std::get<malformed_literal>(result).reason == "duplicate field 'Name'");
    }

    TEST_CASE("Non-identifier key") {
        auto result = extract_first(R"(&Widget{"Name": "a"})");
        CHECK(std::holds_alternative<malformed_literal>(result));
    }

    TEST_CASE("Missing value") {
        auto result = extract_first("&Widget{Name: }");
        REQUIRE(std::holds_alternative<malformed_literal>(result));
        CHECK(std::get<malformed_literal>(result).reason == "field 'Name' has no value");
    }
}
