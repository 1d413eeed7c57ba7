//
// Rewrite rule configuration: which helper replaces which literal shape
//

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace litfix {

/// One positional argument of a helper call.
///
/// - required field:  field set, no default
/// - optional field:  field set, default_value used when the field is absent
/// - constant:        field empty, default_value is the argument text
struct rule_param {
    std::string field;
    std::optional<std::string> default_value;

    static rule_param required(std::string field_name);
    static rule_param optional(std::string field_name, std::string default_text);
    static rule_param constant(std::string text);

    [[nodiscard]] bool is_constant() const { return field.empty(); }
    [[nodiscard]] bool is_required() const { return !field.empty() && !default_value.has_value(); }
};

/// A literal shape and the helper that constructs it.
///
/// An explode rule (empty helper, no params) rewrites `x := &T{A: a, B: b}`
/// into `x := &T{}` followed by one assignment per field.
struct rewrite_rule {
    std::string helper;
    std::vector<rule_param> params;

    /// Source of the helper, inserted once per file when `marker` is absent
    std::string declaration;

    /// Text whose presence proves the helper is declared; defaults to "func <helper>("
    std::string marker;

    [[nodiscard]] bool is_explode() const { return helper.empty(); }

    /// Field names that must all be present for the rule to match, in parameter order
    [[nodiscard]] std::vector<std::string> required_fields() const;

    /// True if `name` is consumed by one of the parameters
    [[nodiscard]] bool uses_field(const std::string& name) const;

    [[nodiscard]] std::string declaration_marker() const;
};

/// One literal prefix and its rules, tried in order (first match wins).
struct rewrite_target {
    std::string prefix;          // e.g. "&Device", "&storage.MetricsSnapshot"
    std::string receiver;        // name for hoisted in-place literals; empty disables hoisting
    std::vector<rewrite_rule> rules;
};

struct rule_set {
    std::vector<rewrite_target> targets;

    /// Upper bound on repeated passes per target (nested literals need more than one)
    std::size_t max_passes = 8;
};

} // namespace litfix
