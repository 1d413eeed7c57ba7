//
// Construction site classification
//

#include <litfix/construction_site.hh>
#include <litfix/lexical.hh>

#include <utility>
#include <vector>

namespace litfix {

namespace {
    using lexical::npos;

    std::string_view trim(std::string_view s) {
        std::size_t b = 0;
        while (b < s.size() && lexical::is_space(s[b])) ++b;
        std::size_t e = s.size();
        while (e > b && lexical::is_space(s[e - 1])) --e;
        return s.substr(b, e - b);
    }

    std::vector<std::string_view> split_words(std::string_view s) {
        std::vector<std::string_view> words;
        std::size_t i = 0;
        while (i < s.size()) {
            while (i < s.size() && lexical::is_space(s[i])) ++i;
            std::size_t b = i;
            while (i < s.size() && !lexical::is_space(s[i])) ++i;
            if (i > b) words.push_back(s.substr(b, i - b));
        }
        return words;
    }

    // `a` or `a.b.c`
    bool is_selector(std::string_view s) {
        std::size_t b = 0;
        while (b <= s.size()) {
            std::size_t dot = s.find('.', b);
            std::string_view part = s.substr(b, dot == npos ? npos : dot - b);
            if (!lexical::is_identifier(part)) {
                return false;
            }
            if (dot == npos) {
                return true;
            }
            b = dot + 1;
        }
        return false;
    }

    // Receiver named by the statement head before the literal, or empty
    std::string declared_receiver(std::string_view head) {
        head = trim(head);

        if (head.size() > 2 && head.substr(head.size() - 2) == ":=") {
            std::string_view lhs = trim(head.substr(0, head.size() - 2));
            return lexical::is_identifier(lhs) ? std::string(lhs) : std::string();
        }

        if (head.size() > 1 && head.back() == '=') {
            // Reject ==, !=, <=, >=, +=, ... and :=
            const char before = head[head.size() - 2];
            if (std::string_view("=!<>:+-*/%&|^").find(before) != npos) {
                return {};
            }
            std::string_view lhs = trim(head.substr(0, head.size() - 1));

            auto words = split_words(lhs);
            if (words.size() >= 2 && words[0] == "var") {
                return lexical::is_identifier(words[1]) ? std::string(words[1]) : std::string();
            }
            if (words.size() == 1 && is_selector(words[0])) {
                return std::string(words[0]);
            }
        }
        return {};
    }

    // Only whitespace or comments between `pos` and the end of its line
    bool rest_of_line_is_trivia(std::string_view buffer, std::size_t pos) {
        std::size_t eol = buffer.find('\n', pos);
        if (eol == npos) eol = buffer.size();

        auto r = lexical::trim_trivia(buffer, pos, eol);
        return r.empty();
    }

    // Code content of the line [start, end) without comments and surrounding whitespace
    std::string_view line_code(std::string_view buffer, std::size_t start, std::size_t end) {
        auto r = lexical::trim_trivia(buffer, start, end);
        if (r.empty()) {
            return {};
        }

        // trim_trivia keeps interior comments; cut a trailing line comment
        std::string_view code = buffer.substr(r.begin, r.end - r.begin);
        std::size_t pos = 0;
        std::size_t last_code = 0;
        while (pos < code.size()) {
            auto reg = lexical::region_at(code, pos);
            if (reg != lexical::region::none) {
                std::size_t e = lexical::region_end(code, pos, reg);
                if (e == npos) e = code.size();
                if (!lexical::is_comment(reg)) last_code = e;
                pos = e;
                continue;
            }
            if (!lexical::is_space(code[pos])) last_code = pos + 1;
            ++pos;
        }
        return code.substr(0, last_code);
    }

    bool starts_with_word(std::string_view s, std::string_view word) {
        if (s.size() < word.size() || s.substr(0, word.size()) != word) {
            return false;
        }
        return s.size() == word.size() || !lexical::is_ident_char(s[word.size()]);
    }

    // True if a new statement begins on the line after `code`
    bool ends_statement(std::string_view code) {
        if (code.empty()) {
            return true;
        }

        const char last = code.back();

        if (last == '{') {
            std::string_view head = trim(code.substr(0, code.size() - 1));
            if (head.empty() || head.back() == ')') {
                return true;
            }
            for (std::string_view kw : {"if", "for", "switch", "select", "else", "} else", "func", "go", "defer"}) {
                if (starts_with_word(code, kw)) {
                    return true;
                }
            }
            // `f := func() *T {` opens a function body
            return contains_identifier(code, "func");
        }

        if (last == ':') {
            return starts_with_word(code, "case") || starts_with_word(code, "default");
        }

        if (code.size() >= 2) {
            std::string_view tail = code.substr(code.size() - 2);
            if (tail == "++" || tail == "--") {
                return true;
            }
        }

        return lexical::is_ident_char(last) || last == ')' || last == ']' || last == '}' ||
               last == '"' || last == '\'' || last == '`' || last == ';';
    }
}

const char* to_string(hoist_context context) {
    switch (context) {
        case hoist_context::statement:     return "a statement";
        case hoist_context::package_scope: return "package scope";
        case hoist_context::grouped:       return "a parenthesized group";
        case hoist_context::case_clause:   return "a case clause";
        case hoist_context::else_branch:   return "an else branch";
        case hoist_context::loop_header:   return "a for clause";
        case hoist_context::func_literal:  return "a function literal";
    }
    return "unknown context";
}

hoist_context hoist_context_of(std::string_view buffer, std::size_t stmt_start, std::size_t literal_start) {
    std::vector<char> open;
    std::size_t pos = 0;
    while (pos < stmt_start) {
        auto r = lexical::region_at(buffer, pos);
        if (r != lexical::region::none) {
            std::size_t e = lexical::region_end(buffer, pos, r);
            if (e == npos) break;
            pos = e;
            continue;
        }

        const char c = buffer[pos];
        if (lexical::is_opener(c)) {
            open.push_back(c);
        } else if (lexical::is_closer(c) && !open.empty()) {
            open.pop_back();
        }
        ++pos;
    }

    if (open.empty()) {
        return hoist_context::package_scope;
    }
    if (open.back() != '{') {
        return hoist_context::grouped;
    }

    auto r = lexical::trim_trivia(buffer, stmt_start, literal_start);
    std::string_view head = buffer.substr(r.begin, r.end - r.begin);

    if (!head.empty() && head.front() == '}') {
        return hoist_context::else_branch;
    }
    if (starts_with_word(head, "case") || starts_with_word(head, "default")) {
        return hoist_context::case_clause;
    }
    if (starts_with_word(head, "for")) {
        return hoist_context::loop_header;
    }
    if (contains_identifier(head, "func")) {
        return hoist_context::func_literal;
    }
    return hoist_context::statement;
}

std::string_view line_terminator(std::string_view buffer, std::size_t pos) {
    std::size_t nl = buffer.find('\n', pos);
    if (nl == npos) {
        nl = buffer.find('\n');
    }
    if (nl != npos && nl > 0 && buffer[nl - 1] == '\r') {
        return "\r\n";
    }
    return "\n";
}

std::size_t line_start(std::string_view buffer, std::size_t pos) {
    if (pos == 0) {
        return 0;
    }
    std::size_t nl = buffer.rfind('\n', pos - 1);
    return nl == npos ? 0 : nl + 1;
}

std::string_view line_indent(std::string_view buffer, std::size_t start) {
    std::size_t e = start;
    while (e < buffer.size() && (buffer[e] == ' ' || buffer[e] == '\t')) ++e;
    return buffer.substr(start, e - start);
}

std::size_t statement_start(std::string_view buffer, std::size_t pos) {
    std::size_t start = line_start(buffer, pos);

    while (start > 0) {
        // Previous line that carries code
        std::size_t prev_end = start - 1;
        std::size_t prev_start = line_start(buffer, prev_end);
        std::string_view code = line_code(buffer, prev_start, prev_end);
        while (code.empty() && prev_start > 0) {
            prev_end = prev_start - 1;
            prev_start = line_start(buffer, prev_end);
            code = line_code(buffer, prev_start, prev_end);
        }

        if (ends_statement(code)) {
            return start;
        }
        start = prev_start;
    }
    return 0;
}

bool contains_identifier(std::string_view buffer, std::string_view name) {
    std::size_t pos = 0;
    while (pos < buffer.size()) {
        auto r = lexical::region_at(buffer, pos);
        if (r != lexical::region::none) {
            std::size_t e = lexical::region_end(buffer, pos, r);
            if (e == npos) return false;
            pos = e;
            continue;
        }

        if (lexical::is_ident_char(buffer[pos])) {
            std::size_t b = pos;
            while (pos < buffer.size() && lexical::is_ident_char(buffer[pos])) ++pos;
            if (buffer.substr(b, pos - b) == name) {
                return true;
            }
            continue;
        }
        ++pos;
    }
    return false;
}

construction_site classify_site(std::string_view buffer, const span& literal) {
    construction_site site;
    site.newline = std::string(line_terminator(buffer, literal.start));

    const std::size_t start = line_start(buffer, literal.start);
    site.indent = std::string(line_indent(buffer, start));
    site.statement_start = start;

    std::string receiver = declared_receiver(buffer.substr(start, literal.start - start));
    if (!receiver.empty() && rest_of_line_is_trivia(buffer, literal.end)) {
        site.kind = site_kind::declaration;
        site.receiver = std::move(receiver);
        return site;
    }

    site.statement_start = statement_start(buffer, literal.start);
    site.indent = std::string(line_indent(buffer, site.statement_start));
    site.hoist = hoist_context_of(buffer, site.statement_start, literal.start);
    return site;
}

} // namespace litfix
