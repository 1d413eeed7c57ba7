//
// Field extractor implementation
//

#include <litfix/field_extractor.hh>
#include <litfix/lexical.hh>

#include <set>
#include <utility>

namespace litfix {

namespace {
    using lexical::npos;

    // Top-level segments of [begin, end): split on depth-0 commas
    std::vector<lexical::range> split_segments(std::string_view buffer,
                                               std::size_t begin,
                                               std::size_t end) {
        std::vector<lexical::range> segments;
        std::size_t seg_start = begin;
        int depth = 0;

        std::size_t pos = begin;
        while (pos < end) {
            auto r = lexical::region_at(buffer, pos);
            if (r != lexical::region::none) {
                std::size_t e = lexical::region_end(buffer, pos, r);
                pos = (e == npos || e > end) ? end : e;
                continue;
            }

            const char c = buffer[pos];
            if (lexical::is_opener(c)) {
                ++depth;
            } else if (lexical::is_closer(c)) {
                --depth;
            } else if (c == ',' && depth == 0) {
                segments.push_back({seg_start, pos});
                seg_start = pos + 1;
            }
            ++pos;
        }
        segments.push_back({seg_start, end});
        return segments;
    }

    // First depth-0 ':' in [begin, end), or npos
    std::size_t find_separator(std::string_view buffer, std::size_t begin, std::size_t end) {
        int depth = 0;
        std::size_t pos = begin;
        while (pos < end) {
            auto r = lexical::region_at(buffer, pos);
            if (r != lexical::region::none) {
                std::size_t e = lexical::region_end(buffer, pos, r);
                pos = (e == npos || e > end) ? end : e;
                continue;
            }

            const char c = buffer[pos];
            if (lexical::is_opener(c)) {
                ++depth;
            } else if (lexical::is_closer(c)) {
                --depth;
            } else if (c == ':' && depth == 0) {
                return pos;
            }
            ++pos;
        }
        return npos;
    }
}

extract_result extract_fields(std::string_view buffer, const span& literal) {
    const std::size_t open = buffer.find('{', literal.start);
    if (open == npos || open >= literal.end || literal.end == 0 || buffer[literal.end - 1] != '}') {
        return malformed_literal{"literal is not enclosed in braces", literal.start};
    }

    std::vector<field> fields;
    std::set<std::string> seen;

    for (const auto& segment : split_segments(buffer, open + 1, literal.end - 1)) {
        auto content = lexical::trim_trivia(buffer, segment.begin, segment.end);
        if (content.empty()) {
            continue;
        }

        const std::size_t colon = find_separator(buffer, content.begin, content.end);
        if (colon == npos) {
            return malformed_literal{
                "element '" + std::string(buffer.substr(content.begin, content.end - content.begin)) +
                "' has no field name",
                content.begin};
        }

        auto name_range = lexical::trim_trivia(buffer, content.begin, colon);
        std::string_view name = buffer.substr(name_range.begin, name_range.end - name_range.begin);
        if (!lexical::is_identifier(name)) {
            return malformed_literal{"invalid field name '" + std::string(name) + "'", content.begin};
        }

        auto value_range = lexical::trim_trivia(buffer, colon + 1, content.end);
        if (value_range.empty()) {
            return malformed_literal{"field '" + std::string(name) + "' has no value", colon};
        }

        if (!seen.insert(std::string(name)).second) {
            return malformed_literal{"duplicate field '" + std::string(name) + "'", content.begin};
        }

        field f;
        f.name = std::string(name);
        f.value_span = {value_range.begin, value_range.end};
        f.raw_value = std::string(f.value_span.text(buffer));
        fields.push_back(std::move(f));
    }

    return fields;
}

} // namespace litfix
