//
// Unit tests for rule matching
//

#include <doctest/doctest.h>
#include <litfix/rewrite_policy.hh>
#include <string>
#include <utility>
#include <variant>
#include <vector>

using namespace litfix;

namespace {
    std::vector<field> make_fields(std::initializer_list<std::pair<const char*, const char*>> entries) {
        std::vector<field> fields;
        for (const auto& [name, value] : entries) {
            field f;
            f.name = name;
            f.raw_value = value;
            fields.push_back(std::move(f));
        }
        return fields;
    }

    rewrite_rule helper_rule(std::string helper, std::vector<rule_param> params) {
        rewrite_rule rule;
        rule.helper = std::move(helper);
        rule.params = std::move(params);
        return rule;
    }

    std::vector<std::string> names_of(const std::vector<field>& fields) {
        std::vector<std::string> names;
        for (const auto& f : fields) names.push_back(f.name);
        return names;
    }
}

TEST_SUITE("Rewrite Policy") {
    TEST_CASE("Required fields in parameter order") {
        std::vector<rewrite_rule> rules{
            helper_rule("newWidget", {rule_param::required("Name"), rule_param::required("Size")})
        };
        auto fields = make_fields({{"Size", "3"}, {"Color", "\"red\""}, {"Name", "\"a\""}});

        auto verdict = decide(fields, rules);
        REQUIRE(std::holds_alternative<rewrite_plan>(verdict));
        const auto& plan = std::get<rewrite_plan>(verdict);

        CHECK(plan.rule_index == 0);
        CHECK(plan.arguments == std::vector<std::string>{"\"a\"", "3"});
        CHECK(names_of(plan.core_fields) == std::vector<std::string>{"Name", "Size"});
        CHECK(names_of(plan.extra_fields) == std::vector<std::string>{"Color"});
    }

    TEST_CASE("First satisfying rule wins") {
        auto full = helper_rule("newFullWidget",
            {rule_param::required("Name"), rule_param::required("Size"), rule_param::required("Color")});
        auto basic = helper_rule("newWidget", {rule_param::required("Name"), rule_param::required("Size")});
        auto fields = make_fields({{"Name", "\"a\""}, {"Size", "3"}, {"Color", "\"red\""}});

        SUBCASE("Most specific first") {
            auto verdict = decide(fields, {full, basic});
            REQUIRE(std::holds_alternative<rewrite_plan>(verdict));
            CHECK(std::get<rewrite_plan>(verdict).rule_index == 0);
            CHECK(std::get<rewrite_plan>(verdict).extra_fields.empty());
        }

        SUBCASE("Less specific first shadows the later rule") {
            auto verdict = decide(fields, {basic, full});
            REQUIRE(std::holds_alternative<rewrite_plan>(verdict));
            CHECK(std::get<rewrite_plan>(verdict).rule_index == 0);
            CHECK(names_of(std::get<rewrite_plan>(verdict).extra_fields) == std::vector<std::string>{"Color"});
        }

        SUBCASE("Fallback when the specific rule is not satisfied") {
            auto verdict = decide(make_fields({{"Name", "\"a\""}, {"Size", "3"}}), {full, basic});
            REQUIRE(std::holds_alternative<rewrite_plan>(verdict));
            CHECK(std::get<rewrite_plan>(verdict).rule_index == 1);
        }
    }

    TEST_CASE("Optional fields and constants") {
        std::vector<rewrite_rule> rules{
            helper_rule("newTestDevice", {
                rule_param::required("Serial"),
                rule_param::required("IP"),
                rule_param::optional("IsSaved", "false"),
                rule_param::constant("true")
            })
        };

        SUBCASE("Default used when the field is absent") {
            auto verdict = decide(make_fields({{"Serial", "\"S\""}, {"IP", "\"ip\""}}), rules);
            REQUIRE(std::holds_alternative<rewrite_plan>(verdict));
            CHECK(std::get<rewrite_plan>(verdict).arguments ==
                  std::vector<std::string>{"\"S\"", "\"ip\"", "false", "true"});
        }

        SUBCASE("Field value used when present") {
            auto verdict = decide(make_fields({{"IsSaved", "saved"}, {"IP", "\"ip\""}, {"Serial", "\"S\""}}), rules);
            REQUIRE(std::holds_alternative<rewrite_plan>(verdict));
            const auto& plan = std::get<rewrite_plan>(verdict);
            CHECK(plan.arguments == std::vector<std::string>{"\"S\"", "\"ip\"", "saved", "true"});
            CHECK(names_of(plan.core_fields) == std::vector<std::string>{"Serial", "IP", "IsSaved"});
            CHECK(plan.extra_fields.empty());
        }

        SUBCASE("Only required fields gate the match") {
            CHECK(rules[0].required_fields() == std::vector<std::string>{"Serial", "IP"});
            auto verdict = decide(make_fields({{"Serial", "\"S\""}, {"IsSaved", "true"}}), rules);
            REQUIRE(std::holds_alternative<no_rewrite>(verdict));
            CHECK(std::get<no_rewrite>(verdict).reason == no_rewrite_reason::no_rule_matched);
        }
    }

    TEST_CASE("Field names compare case-sensitively") {
        std::vector<rewrite_rule> rules{helper_rule("newWidget", {rule_param::required("Name")})};
        auto verdict = decide(make_fields({{"name", "\"a\""}}), rules);
        CHECK(std::holds_alternative<no_rewrite>(verdict));
    }

    TEST_CASE("Explode rule moves every field to the extras") {
        std::vector<rewrite_rule> rules{rewrite_rule{}};
        REQUIRE(rules[0].is_explode());

        auto verdict = decide(make_fields({{"B", "2"}, {"A", "1"}}), rules);
        REQUIRE(std::holds_alternative<rewrite_plan>(verdict));
        const auto& plan = std::get<rewrite_plan>(verdict);
        CHECK(plan.arguments.empty());
        CHECK(names_of(plan.extra_fields) == std::vector<std::string>{"B", "A"});
    }

    TEST_CASE("Empty literal is already rewritten") {
        std::vector<rewrite_rule> rules{rewrite_rule{}};
        auto verdict = decide({}, rules);
        REQUIRE(std::holds_alternative<no_rewrite>(verdict));
        CHECK(std::get<no_rewrite>(verdict).reason == no_rewrite_reason::already_rewritten);
        CHECK(std::string(to_string(no_rewrite_reason::already_rewritten)) == "already rewritten");
    }

    TEST_CASE("Declaration marker defaults to the func signature") {
        auto rule = helper_rule("newWidget", {});
        CHECK(rule.declaration_marker() == "func newWidget(");
        rule.marker = "// widget helpers";
        CHECK(rule.declaration_marker() == "// widget helpers");
        CHECK_FALSE(rule.uses_field("Name"));
    }
}
