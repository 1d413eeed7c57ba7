//
// Rewrite policy: picks the output shape for an extracted field list
//

#pragma once

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

#include <litfix/rewrite_rule.hh>
#include <litfix/span.hh>

namespace litfix {

struct rewrite_plan {
    std::size_t rule_index = 0;

    /// Argument text per rule parameter, in parameter order (raw, not yet normalized)
    std::vector<std::string> arguments;

    /// Fields consumed by the call, in parameter order
    std::vector<field> core_fields;

    /// Fields left for follow-on assignments, in source order
    std::vector<field> extra_fields;
};

enum class no_rewrite_reason {
    already_rewritten,   // empty literal: the engine's own output form
    no_rule_matched
};

struct no_rewrite {
    no_rewrite_reason reason = no_rewrite_reason::no_rule_matched;
};

using decision = std::variant<rewrite_plan, no_rewrite>;

/**
 * Choose the first rule whose required fields are all present.
 *
 * Rules are evaluated in order and the first satisfying rule wins even when
 * a later one would consume more fields, so callers list the most specific
 * rules first. Field names compare case-sensitively.
 */
decision decide(const std::vector<field>& fields, const std::vector<rewrite_rule>& rules);

const char* to_string(no_rewrite_reason reason);

} // namespace litfix
