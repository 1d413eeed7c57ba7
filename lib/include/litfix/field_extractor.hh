//
// Field extractor: splits a bounded construction expression into its
// ordered `name: value` fields.
//

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <litfix/span.hh>

namespace litfix {

/// Content that cannot be split into valid fields. The caller leaves the span untouched.
struct malformed_literal {
    std::string reason;
    std::size_t position = 0;   ///< Buffer offset of the offending segment
};

using extract_result = std::variant<std::vector<field>, malformed_literal>;

/**
 * Extract the fields of the literal bounded by `literal`.
 *
 * The inner content (between the first '{' of the span and its final '}')
 * is split on commas at nesting depth zero outside strings and comments.
 * Each non-empty segment is split on its first top-level ':'. Segments
 * holding only whitespace or comments, such as the one after a trailing
 * comma, are dropped.
 *
 * Malformed when a segment has no top-level ':', the name is not an
 * identifier, the value is empty, or a name repeats.
 */
extract_result extract_fields(std::string_view buffer, const span& literal);

} // namespace litfix
