//
// Emitter: renders the replacement text for a rewritten literal
//

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <litfix/construction_site.hh>
#include <litfix/rewrite_policy.hh>
#include <litfix/rewrite_rule.hh>

namespace litfix::emit {

/// A rendered construction: the constructor expression and the follow-on
/// assignment statements (without indentation).
struct construction {
    std::string call;
    std::vector<std::string> assignments;
};

/**
 * Collapse embedded line breaks of a field value to single spaces.
 *
 * Whitespace runs that contain a newline or a comment become one space;
 * comments are dropped. String, rune and raw-string literals are copied
 * verbatim, so a multi-line raw string keeps its line breaks.
 */
std::string normalize_value(std::string_view raw);

/**
 * Render the constructor call and the assignments for the extra fields.
 *
 * The call is `helper(arg, ...)` with one argument per rule parameter, or
 * `<prefix>{}` for an explode rule. Each extra field becomes
 * `<site.receiver>.<Name> = <value>`.
 *
 * @throws litfix_error if there are extra fields and the site has no receiver
 */
construction render(const construction_site& site,
                    const rewrite_rule& rule,
                    const rewrite_plan& plan,
                    std::string_view prefix);

/// Text replacing the literal span: the call, then one indented line per assignment.
/// Lines are separated by `site.newline`.
std::string render_replacement(const construction_site& site, const construction& c);

/// Statements placed in front of the enclosing statement of an in-place literal:
/// `<receiver> := <call>` and the assignments, each on its own indented line.
std::string render_hoisted(const construction_site& site, const construction& c);

/// A helper declaration block preceded by a blank line, each line ended by `newline`.
std::string render_declaration_block(std::string_view declaration, const std::string& newline = "\n");

} // namespace litfix::emit
