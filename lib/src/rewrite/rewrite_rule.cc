//
// Rewrite rule helpers
//

#include <litfix/rewrite_rule.hh>

#include <algorithm>
#include <utility>

namespace litfix {

rule_param rule_param::required(std::string field_name) {
    return rule_param{std::move(field_name), std::nullopt};
}

rule_param rule_param::optional(std::string field_name, std::string default_text) {
    return rule_param{std::move(field_name), std::move(default_text)};
}

rule_param rule_param::constant(std::string text) {
    return rule_param{std::string(), std::move(text)};
}

std::vector<std::string> rewrite_rule::required_fields() const {
    std::vector<std::string> result;
    for (const auto& p : params) {
        if (p.is_required()) {
            result.push_back(p.field);
        }
    }
    return result;
}

bool rewrite_rule::uses_field(const std::string& name) const {
    return std::any_of(params.begin(), params.end(),
        [&](const rule_param& p) { return !p.is_constant() && p.field == name; });
}

std::string rewrite_rule::declaration_marker() const {
    if (!marker.empty()) {
        return marker;
    }
    return "func " + helper + "(";
}

} // namespace litfix
