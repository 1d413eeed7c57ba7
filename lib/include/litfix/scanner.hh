//
// Token scanner: finds the next construction expression `<prefix>{ ... }`
// and bounds it at its balancing closer.
//

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include <litfix/span.hh>

namespace litfix {

enum class scan_status {
    found,         // `where` covers prefix through the matching '}'
    not_found,     // no further candidates after the start position
    unterminated   // marker at where.start, buffer ended with brackets open
};

struct scan_result {
    scan_status status = scan_status::not_found;
    span where;
    std::size_t body_start = 0;   // position of the opening '{'
    bool mismatched = false;      // a closer did not match the innermost opener

    [[nodiscard]] bool found() const { return status == scan_status::found; }
};

/**
 * Scans for `<prefix>{` outside strings and comments and follows bracket
 * nesting to the matching closer.
 *
 * The prefix only matches at an identifier boundary and must be followed
 * directly by '{': with prefix "&Device", "&DeviceInfo{" and "x&Device {"
 * are not candidates.
 */
class scanner {
public:
    explicit scanner(std::string prefix);

    /// Next candidate at or after `from`. `from` must not be inside a string or comment.
    [[nodiscard]] scan_result scan(std::string_view buffer, std::size_t from) const;

    /// Position of the next marker at or after `from`, or npos.
    [[nodiscard]] std::size_t find_marker(std::string_view buffer, std::size_t from) const;

    [[nodiscard]] const std::string& prefix() const { return prefix_; }

private:
    [[nodiscard]] bool at_marker(std::string_view buffer, std::size_t pos) const;

    std::string prefix_;
};

} // namespace litfix
