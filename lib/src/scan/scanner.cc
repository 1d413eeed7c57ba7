//
// Token scanner implementation
//

#include <litfix/scanner.hh>
#include <litfix/lexical.hh>

#include <utility>
#include <vector>

namespace litfix {

scanner::scanner(std::string prefix)
    : prefix_(std::move(prefix))
{
}

bool scanner::at_marker(std::string_view buffer, std::size_t pos) const {
    if (prefix_.empty() || buffer.compare(pos, prefix_.size(), prefix_) != 0) {
        return false;
    }

    const std::size_t after = pos + prefix_.size();
    if (after >= buffer.size() || buffer[after] != '{') {
        return false;
    }

    // "&Device" must not match inside "x.Device" or "MyDevice"
    if (pos > 0 && lexical::is_ident_char(prefix_.front())) {
        const char before = buffer[pos - 1];
        if (lexical::is_ident_char(before) || before == '.') {
            return false;
        }
    }
    return true;
}

std::size_t scanner::find_marker(std::string_view buffer, std::size_t from) const {
    std::size_t pos = from;
    while (pos < buffer.size()) {
        auto r = lexical::region_at(buffer, pos);
        if (r != lexical::region::none) {
            std::size_t e = lexical::region_end(buffer, pos, r);
            if (e == lexical::npos) {
                return lexical::npos;
            }
            pos = e;
            continue;
        }

        if (at_marker(buffer, pos)) {
            return pos;
        }
        ++pos;
    }
    return lexical::npos;
}

scan_result scanner::scan(std::string_view buffer, std::size_t from) const {
    scan_result result;

    const std::size_t marker = find_marker(buffer, from);
    if (marker == lexical::npos) {
        return result;
    }

    result.where.start = marker;
    result.body_start = marker + prefix_.size();

    // Closers expected for each open bracket, innermost last
    std::vector<char> expected;
    std::size_t pos = result.body_start;

    while (pos < buffer.size()) {
        auto r = lexical::region_at(buffer, pos);
        if (r != lexical::region::none) {
            std::size_t e = lexical::region_end(buffer, pos, r);
            if (e == lexical::npos) {
                break;
            }
            pos = e;
            continue;
        }

        const char c = buffer[pos];
        if (lexical::is_opener(c)) {
            expected.push_back(lexical::closer_for(c));
        } else if (lexical::is_closer(c)) {
            if (expected.back() != c) {
                result.mismatched = true;
            }
            expected.pop_back();
            if (expected.empty()) {
                result.status = scan_status::found;
                result.where.end = pos + 1;
                return result;
            }
        }
        ++pos;
    }

    result.status = scan_status::unterminated;
    result.where.end = buffer.size();
    return result;
}

} // namespace litfix
