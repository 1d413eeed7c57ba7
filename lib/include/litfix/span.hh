//
// Source buffer positions and the values that flow between the scanner,
// the field extractor and the emitter
//

#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace litfix {
    // Half-open [start, end) byte range into a source buffer
    struct span {
        std::size_t start = 0;
        std::size_t end = 0;

        [[nodiscard]] std::size_t length() const { return end - start; }
        [[nodiscard]] bool empty() const { return start == end; }

        [[nodiscard]] bool overlaps(const span& other) const {
            return start < other.end && other.start < end;
        }

        [[nodiscard]] std::string_view text(std::string_view buffer) const {
            return buffer.substr(start, end - start);
        }

        bool operator==(const span&) const = default;
    };

    // One `name: value` entry of a construction expression
    struct field {
        std::string name;
        std::string raw_value;   // trimmed of surrounding whitespace/comments, line breaks kept
        span value_span;
    };

    // Replace `where` with `replacement`. An empty span is an insertion.
    struct rewrite {
        span where;
        std::string replacement;
    };

    /**
     * Build a new buffer from `buffer` with all rewrites applied.
     *
     * Rewrites are sorted by start position and must not overlap; the output is
     * assembled left to right so no offset is ever adjusted after a splice.
     * Two insertions at the same position keep their relative order.
     *
     * @throws litfix_error if two rewrites overlap or a span lies outside the buffer
     */
    std::string apply_rewrites(std::string_view buffer, std::vector<rewrite> rewrites);
}
