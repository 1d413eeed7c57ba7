//
// Lexical region detection
//

#include <litfix/lexical.hh>

namespace litfix::lexical {

region region_at(std::string_view text, std::size_t pos) {
    if (pos >= text.size()) {
        return region::none;
    }

    switch (text[pos]) {
        case '"':  return region::string;
        case '\'': return region::rune;
        case '`':  return region::raw_string;
        case '/':
            if (pos + 1 < text.size()) {
                if (text[pos + 1] == '/') return region::line_comment;
                if (text[pos + 1] == '*') return region::block_comment;
            }
            return region::none;
        default:
            return region::none;
    }
}

std::size_t region_end(std::string_view text, std::size_t pos, region r) {
    switch (r) {
        case region::none:
            return pos;

        case region::string:
        case region::rune: {
            const char quote = text[pos];
            std::size_t i = pos + 1;
            while (i < text.size()) {
                const char c = text[i];
                if (c == '\\') {
                    i += 2;
                    continue;
                }
                if (c == quote) {
                    return i + 1;
                }
                if (c == '\n') {
                    // Interpreted literals cannot span lines; stop here
                    return i;
                }
                ++i;
            }
            return npos;
        }

        case region::raw_string: {
            std::size_t close = text.find('`', pos + 1);
            return close == std::string_view::npos ? npos : close + 1;
        }

        case region::line_comment: {
            std::size_t nl = text.find('\n', pos);
            return nl == std::string_view::npos ? text.size() : nl;
        }

        case region::block_comment: {
            std::size_t close = text.find("*/", pos + 2);
            return close == std::string_view::npos ? npos : close + 2;
        }
    }
    return npos;
}

bool is_identifier(std::string_view text) {
    if (text.empty() || (text[0] >= '0' && text[0] <= '9')) {
        return false;
    }
    for (char c : text) {
        if (!is_ident_char(c)) {
            return false;
        }
    }
    return true;
}

range trim_trivia(std::string_view text, std::size_t begin, std::size_t end) {
    std::size_t first = npos;
    std::size_t last = begin;

    std::size_t i = begin;
    while (i < end) {
        region r = region_at(text, i);
        if (r != region::none) {
            std::size_t e = region_end(text, i, r);
            if (e == npos || e > end) {
                e = end;
            }
            if (!is_comment(r)) {
                if (first == npos) first = i;
                last = e;
            }
            i = e;
            continue;
        }

        if (is_space(text[i])) {
            ++i;
            continue;
        }

        if (first == npos) first = i;
        last = i + 1;
        ++i;
    }

    if (first == npos) {
        return {end, end};
    }
    return {first, last};
}

} // namespace litfix::lexical
