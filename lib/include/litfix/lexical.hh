//
// Lexical regions of Go-like source text.
//
// The scanner and the field extractor never look inside string literals or
// comments; these helpers tell them where such regions begin and end.
//

#pragma once

#include <cstddef>
#include <string_view>

namespace litfix::lexical {

enum class region {
    none,           // plain code
    string,         // "..." with backslash escapes
    rune,           // '...' with backslash escapes
    raw_string,     // `...`, may span lines
    line_comment,   // // up to end of line
    block_comment   // /* ... */
};

constexpr std::size_t npos = std::string_view::npos;

/// Region that begins at `pos` (region::none if `pos` is plain code).
region region_at(std::string_view text, std::size_t pos);

/**
 * One past the end of the region of kind `r` beginning at `pos`.
 *
 * Line comments end before their newline. Quoted strings and runes end at the
 * closing quote or, when malformed, at the newline that interrupts them.
 * Returns npos when a raw string, block comment or quoted literal runs past
 * the end of `text`.
 */
std::size_t region_end(std::string_view text, std::size_t pos, region r);

/// True for regions that carry no code (comments).
inline bool is_comment(region r) {
    return r == region::line_comment || r == region::block_comment;
}

inline bool is_ident_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '_';
}

inline bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

inline bool is_opener(char c) {
    return c == '(' || c == '[' || c == '{';
}

inline bool is_closer(char c) {
    return c == ')' || c == ']' || c == '}';
}

inline char closer_for(char opener) {
    switch (opener) {
        case '(': return ')';
        case '[': return ']';
        default:  return '}';
    }
}

/// True if `text` is a non-empty identifier that does not start with a digit.
bool is_identifier(std::string_view text);

struct range {
    std::size_t begin;
    std::size_t end;

    [[nodiscard]] bool empty() const { return begin == end; }
};

/**
 * Narrow [begin, end) to the part that holds code or literals, dropping
 * surrounding whitespace and comments. Returns an empty range at `end`
 * when nothing but trivia is present.
 */
range trim_trivia(std::string_view text, std::size_t begin, std::size_t end);

} // namespace litfix::lexical
