//
// Unit tests for replacement rendering
//

#include <doctest/doctest.h>
#include <litfix/emit/emitter.hh>
#include <litfix/errors.hh>
#include <string>
#include <vector>

using namespace litfix;
using namespace litfix::emit;

namespace {
    field make_field(const char* name, const char* value) {
        field f;
        f.name = name;
        f.raw_value = value;
        return f;
    }

    rewrite_rule widget_rule() {
        rewrite_rule rule;
        rule.helper = "newWidget";
        rule.params = {rule_param::required("Name"), rule_param::required("Size")};
        return rule;
    }

    rewrite_plan widget_plan(std::vector<field> extras) {
        rewrite_plan plan;
        plan.arguments = {"\"a\"", "3"};
        plan.core_fields = {make_field("Name", "\"a\""), make_field("Size", "3")};
        plan.extra_fields = std::move(extras);
        return plan;
    }

    construction_site declaration_site(const char* receiver, const char* indent) {
        construction_site site;
        site.kind = site_kind::declaration;
        site.receiver = receiver;
        site.indent = indent;
        return site;
    }
}

TEST_SUITE("Emitter - Value normalization") {
    TEST_CASE("Line breaks collapse to one space") {
        CHECK(normalize_value("map[string]int{\n\t\t\"x\": 1,\n\t}") == "map[string]int{ \"x\": 1, }");
    }

    TEST_CASE("Spacing on one line is kept") {
        CHECK(normalize_value("a  +  b") == "a  +  b");
    }

    TEST_CASE("Comments are dropped") {
        CHECK(normalize_value("f(1, // one\n\t2)") == "f(1, 2)");
        CHECK(normalize_value("x /* note */") == "x");
    }

    TEST_CASE("String literals are copied verbatim") {
        CHECK(normalize_value("`a\n  b`") == "`a\n  b`");
        CHECK(normalize_value("\"a  // b\"") == "\"a  // b\"");
    }
}

TEST_SUITE("Emitter - Rendering") {
    TEST_CASE("Helper call without extras") {
        auto c = render(declaration_site("w", "\t"), widget_rule(), widget_plan({}), "&Widget");
        CHECK(c.call == "newWidget(\"a\", 3)");
        CHECK(c.assignments.empty());
    }

    TEST_CASE("Extra fields become assignments in source order") {
        auto plan = widget_plan({make_field("Color", "\"red\""), make_field("Tags", "[]string{\n\t\t\"x\",\n\t}")});
        auto c = render(declaration_site("w", "\t"), widget_rule(), plan, "&Widget");

        REQUIRE(c.assignments.size() == 2);
        CHECK(c.assignments[0] == "w.Color = \"red\"");
        CHECK(c.assignments[1] == "w.Tags = []string{ \"x\", }");
    }

    TEST_CASE("Explode rule constructs the empty literal") {
        rewrite_plan plan;
        plan.extra_fields = {make_field("Serial", "serial")};

        auto c = render(declaration_site("snap", ""), rewrite_rule{}, plan, "&storage.MetricsSnapshot");
        CHECK(c.call == "&storage.MetricsSnapshot{}");
        REQUIRE(c.assignments.size() == 1);
        CHECK(c.assignments[0] == "snap.Serial = serial");
    }

    TEST_CASE("Extras without receiver are rejected") {
        construction_site site;
        auto plan = widget_plan({make_field("Color", "\"red\"")});
        CHECK_THROWS_AS(render(site, widget_rule(), plan, "&Widget"), litfix_error);
    }

    TEST_CASE("Replacement keeps the call on the literal's line") {
        auto site = declaration_site("w", "\t");
        auto c = render(site, widget_rule(), widget_plan({make_field("Color", "\"red\"")}), "&Widget");
        CHECK(render_replacement(site, c) == "newWidget(\"a\", 3)\n\tw.Color = \"red\"");
    }

    TEST_CASE("Hoisted statements") {
        construction_site site;
        site.receiver = "widget";
        site.indent = "\t\t";

        auto c = render(site, widget_rule(), widget_plan({make_field("Color", "\"red\"")}), "&Widget");
        CHECK(render_hoisted(site, c) ==
              "\t\twidget := newWidget(\"a\", 3)\n"
              "\t\twidget.Color = \"red\"\n");
    }

    TEST_CASE("Declaration block") {
        CHECK(render_declaration_block("\nfunc f() {\n\treturn\n}\n\n") == "\nfunc f() {\n\treturn\n}\n");
        CHECK(render_declaration_block("func f() {\n\treturn\n}\n", "\r\n") ==
              "\r\nfunc f() {\r\n\treturn\r\n}\r\n");
    }

    TEST_CASE("CRLF sites") {
        auto site = declaration_site("w", "\t");
        site.newline = "\r\n";
        auto c = render(site, widget_rule(), widget_plan({make_field("Color", "\"red\"")}), "&Widget");

        CHECK(render_replacement(site, c) == "newWidget(\"a\", 3)\r\n\tw.Color = \"red\"");

        site.receiver = "widget";
        c = render(site, widget_rule(), widget_plan({make_field("Color", "\"red\"")}), "&Widget");
        CHECK(render_hoisted(site, c) ==
              "\twidget := newWidget(\"a\", 3)\r\n"
              "\twidget.Color = \"red\"\r\n");
    }
}
