//
// Idempotence guard implementation
//

#include <litfix/idempotence_guard.hh>
#include <litfix/lexical.hh>
#include <litfix/scanner.hh>

#include <algorithm>

namespace litfix {

namespace {
    using lexical::npos;

    bool keyword_at(std::string_view buffer, std::size_t pos, std::string_view kw) {
        if (buffer.compare(pos, kw.size(), kw) != 0) {
            return false;
        }
        const std::size_t after = pos + kw.size();
        return after >= buffer.size() || !lexical::is_ident_char(buffer[after]);
    }

    std::size_t next_line(std::string_view buffer, std::size_t pos) {
        std::size_t nl = buffer.find('\n', pos);
        return nl == npos ? buffer.size() : nl + 1;
    }

    std::size_t skip_inline_space(std::string_view buffer, std::size_t pos) {
        while (pos < buffer.size() && (buffer[pos] == ' ' || buffer[pos] == '\t')) ++pos;
        return pos;
    }

    // One past the ')' that closes the group opened at `open`, or npos
    std::size_t close_group(std::string_view buffer, std::size_t open) {
        int depth = 0;
        std::size_t pos = open;
        while (pos < buffer.size()) {
            auto r = lexical::region_at(buffer, pos);
            if (r != lexical::region::none) {
                std::size_t e = lexical::region_end(buffer, pos, r);
                if (e == npos) return npos;
                pos = e;
                continue;
            }
            if (buffer[pos] == '(') {
                ++depth;
            } else if (buffer[pos] == ')' && --depth == 0) {
                return pos + 1;
            }
            ++pos;
        }
        return npos;
    }
}

bool has_candidates(std::string_view buffer, const rule_set& rules) {
    return std::any_of(rules.targets.begin(), rules.targets.end(),
        [&](const rewrite_target& target) {
            return scanner(target.prefix).find_marker(buffer, 0) != npos;
        });
}

bool needs_helper_declaration(std::string_view buffer, const rewrite_rule& rule) {
    if (rule.declaration.empty()) {
        return false;
    }
    return buffer.find(rule.declaration_marker()) == npos;
}

bool needs_helper_declaration(std::string_view buffer, const std::vector<const rewrite_rule*>& rules) {
    return std::any_of(rules.begin(), rules.end(),
        [&](const rewrite_rule* rule) { return needs_helper_declaration(buffer, *rule); });
}

std::size_t declaration_anchor(std::string_view buffer) {
    std::size_t package_anchor = npos;
    std::size_t import_anchor = npos;

    // Walk top-level lines; declarations start in column 0
    std::size_t pos = 0;
    while (pos < buffer.size()) {
        auto r = lexical::region_at(buffer, pos);
        if (r != lexical::region::none) {
            std::size_t e = lexical::region_end(buffer, pos, r);
            if (e == npos) break;
            pos = next_line(buffer, e);
            continue;
        }

        if (keyword_at(buffer, pos, "package")) {
            package_anchor = next_line(buffer, pos);
        } else if (keyword_at(buffer, pos, "import")) {
            std::size_t after = skip_inline_space(buffer, pos + 6);
            if (after < buffer.size() && buffer[after] == '(') {
                std::size_t close = close_group(buffer, after);
                if (close == npos) break;
                import_anchor = next_line(buffer, close);
            } else {
                import_anchor = next_line(buffer, pos);
            }
            pos = import_anchor;
            continue;
        } else if (keyword_at(buffer, pos, "func") || keyword_at(buffer, pos, "type") ||
                   keyword_at(buffer, pos, "var") || keyword_at(buffer, pos, "const")) {
            // Imports precede all other declarations
            break;
        }

        pos = next_line(buffer, pos);
    }

    if (import_anchor != npos) return import_anchor;
    if (package_anchor != npos) return package_anchor;
    return 0;
}

} // namespace litfix
