//
// Idempotence guard: decides whether a buffer needs any work and whether
// helper declarations still have to be inserted.
//

#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

#include <litfix/rewrite_rule.hh>

namespace litfix {

/// True if any target prefix opens a literal somewhere in `buffer`.
bool has_candidates(std::string_view buffer, const rule_set& rules);

/// True if `rule` carries a declaration and its marker is absent from `buffer`.
bool needs_helper_declaration(std::string_view buffer, const rewrite_rule& rule);

/// True if at least one of `rules` needs its declaration inserted.
bool needs_helper_declaration(std::string_view buffer, const std::vector<const rewrite_rule*>& rules);

/**
 * Offset at which helper declarations are inserted.
 *
 * The start of the line after the last top-level import declaration (a
 * single `import "x"` line or a parenthesized group); without imports, the
 * line after the `package` clause; otherwise 0. When that line is the last
 * one and has no newline, the anchor is the end of the buffer.
 */
std::size_t declaration_anchor(std::string_view buffer);

} // namespace litfix
