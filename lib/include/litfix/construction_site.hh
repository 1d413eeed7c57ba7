//
// Where a literal sits in its statement: the right-hand side of a
// declaration, or an expression used in place (e.g. a call argument)
//

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include <litfix/span.hh>

namespace litfix {

enum class site_kind {
    declaration,   // `x := <literal>`, `x = <literal>`, `var x T = <literal>` ending the line
    in_place       // anything else
};

/// Where the statement holding an in-place literal sits, which decides
/// whether the literal can be moved into statements in front of it.
enum class hoist_context {
    statement,        // plain statement in a function body
    package_scope,    // not inside any function body
    grouped,          // innermost open bracket is '(' or '[' (e.g. a `var (` group)
    case_clause,      // `case` or `default` clause head
    else_branch,      // statement begins with '}' (`} else if ...`)
    loop_header,      // `for` clause, evaluated on every iteration
    func_literal      // function literal within the statement
};

/// Short description for diagnostics, e.g. "a for clause".
const char* to_string(hoist_context context);

struct construction_site {
    site_kind kind = site_kind::in_place;

    /// Variable the assignments target: the declared name, or the hoisted
    /// receiver chosen by the engine for in-place literals
    std::string receiver;

    /// Leading whitespace of the line that starts the statement
    std::string indent;

    /// Offset of the first line of the enclosing statement (in-place only)
    std::size_t statement_start = 0;

    /// Whether hoisting in front of `statement_start` keeps the code equivalent (in-place only)
    hoist_context hoist = hoist_context::statement;

    /// Line terminator of the literal's line, used for every emitted line
    std::string newline = "\n";
};

/// Classify the literal bounded by `literal`.
construction_site classify_site(std::string_view buffer, const span& literal);

/**
 * Start of the first line of the statement containing `pos`.
 *
 * Walks back over continuation lines: a line starts a statement when the
 * previous code line ends one (identifier, literal, ')', ']', '}', "++",
 * "--"), opens a block ("if ... {", "func(...) {", "else {", a bare "{") or
 * ends a case clause.
 */
std::size_t statement_start(std::string_view buffer, std::size_t pos);

/**
 * Hoist context of a literal at `literal_start` whose statement begins at
 * `stmt_start`: the brackets still open at the statement start and the
 * statement head before the literal decide it.
 */
hoist_context hoist_context_of(std::string_view buffer, std::size_t stmt_start, std::size_t literal_start);

/// "\r\n" if the line holding `pos` ends with CRLF (the first line of the
/// buffer decides when that line has no terminator), else "\n".
std::string_view line_terminator(std::string_view buffer, std::size_t pos);

/// Offset of the beginning of the line holding `pos`.
std::size_t line_start(std::string_view buffer, std::size_t pos);

/// Leading whitespace of the line beginning at `start`.
std::string_view line_indent(std::string_view buffer, std::size_t start);

/// True if `name` occurs in `buffer` as a whole identifier outside strings and comments.
bool contains_identifier(std::string_view buffer, std::string_view name);

} // namespace litfix
