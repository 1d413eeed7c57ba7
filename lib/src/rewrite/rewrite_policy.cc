//
// Rewrite policy implementation
//

#include <litfix/rewrite_policy.hh>

#include <algorithm>

namespace litfix {

namespace {
    const field* find_field(const std::vector<field>& fields, const std::string& name) {
        auto it = std::find_if(fields.begin(), fields.end(),
            [&](const field& f) { return f.name == name; });
        return it == fields.end() ? nullptr : &*it;
    }

    bool satisfies(const std::vector<field>& fields, const rewrite_rule& rule) {
        return std::all_of(rule.params.begin(), rule.params.end(),
            [&](const rule_param& p) {
                return !p.is_required() || find_field(fields, p.field) != nullptr;
            });
    }

    rewrite_plan make_plan(const std::vector<field>& fields,
                           const rewrite_rule& rule,
                           std::size_t rule_index) {
        rewrite_plan plan;
        plan.rule_index = rule_index;

        for (const auto& p : rule.params) {
            if (p.is_constant()) {
                plan.arguments.push_back(*p.default_value);
                continue;
            }

            if (const field* f = find_field(fields, p.field)) {
                plan.arguments.push_back(f->raw_value);
                plan.core_fields.push_back(*f);
            } else {
                plan.arguments.push_back(*p.default_value);
            }
        }

        for (const auto& f : fields) {
            if (!rule.uses_field(f.name)) {
                plan.extra_fields.push_back(f);
            }
        }
        return plan;
    }
}

decision decide(const std::vector<field>& fields, const std::vector<rewrite_rule>& rules) {
    if (fields.empty()) {
        return no_rewrite{no_rewrite_reason::already_rewritten};
    }

    for (std::size_t i = 0; i < rules.size(); ++i) {
        if (satisfies(fields, rules[i])) {
            return make_plan(fields, rules[i], i);
        }
    }
    return no_rewrite{no_rewrite_reason::no_rule_matched};
}

const char* to_string(no_rewrite_reason reason) {
    switch (reason) {
        case no_rewrite_reason::already_rewritten: return "already rewritten";
        case no_rewrite_reason::no_rule_matched:   return "no rule matched";
    }
    return "unknown";
}

} // namespace litfix
