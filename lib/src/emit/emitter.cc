//
// Emitter implementation
//

#include <litfix/emit/emitter.hh>
#include <litfix/emit/code_writer.hh>
#include <litfix/errors.hh>
#include <litfix/lexical.hh>

#include <sstream>

namespace litfix::emit {

std::string normalize_value(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());

    std::size_t pos = 0;
    while (pos < raw.size()) {
        auto r = lexical::region_at(raw, pos);

        if (r == lexical::region::none && !lexical::is_space(raw[pos])) {
            out += raw[pos++];
            continue;
        }

        if (r != lexical::region::none && !lexical::is_comment(r)) {
            std::size_t e = lexical::region_end(raw, pos, r);
            if (e == lexical::npos) e = raw.size();
            out.append(raw.substr(pos, e - pos));
            pos = e;
            continue;
        }

        // Run of whitespace and comments
        const std::size_t run_start = pos;
        bool collapse = false;
        while (pos < raw.size()) {
            auto rr = lexical::region_at(raw, pos);
            if (lexical::is_comment(rr)) {
                std::size_t e = lexical::region_end(raw, pos, rr);
                pos = (e == lexical::npos) ? raw.size() : e;
                collapse = true;
                continue;
            }
            if (rr != lexical::region::none || !lexical::is_space(raw[pos])) {
                break;
            }
            if (raw[pos] == '\n') {
                collapse = true;
            }
            ++pos;
        }

        if (collapse) {
            out += ' ';
        } else {
            out.append(raw.substr(run_start, pos - run_start));
        }
    }

    auto trimmed = lexical::trim_trivia(out, 0, out.size());
    return out.substr(trimmed.begin, trimmed.end - trimmed.begin);
}

construction render(const construction_site& site,
                    const rewrite_rule& rule,
                    const rewrite_plan& plan,
                    std::string_view prefix) {
    construction c;

    if (rule.is_explode()) {
        c.call = std::string(prefix) + "{}";
    } else {
        std::ostringstream call;
        call << rule.helper << "(";
        for (std::size_t i = 0; i < plan.arguments.size(); ++i) {
            if (i > 0) call << ", ";
            call << normalize_value(plan.arguments[i]);
        }
        call << ")";
        c.call = call.str();
    }

    if (!plan.extra_fields.empty() && site.receiver.empty()) {
        throw litfix_error("Cannot assign extra fields without a receiver");
    }

    for (const auto& f : plan.extra_fields) {
        c.assignments.push_back(site.receiver + "." + f.name + " = " + normalize_value(f.raw_value));
    }
    return c;
}

std::string render_replacement(const construction_site& site, const construction& c) {
    std::ostringstream oss;
    CodeWriter writer(oss, site.indent, site.newline);

    writer.write_raw(c.call);
    for (const auto& assignment : c.assignments) {
        writer.write_continuation(assignment);
    }
    return oss.str();
}

std::string render_hoisted(const construction_site& site, const construction& c) {
    std::ostringstream oss;
    CodeWriter writer(oss, site.indent, site.newline);

    writer << site.receiver << " := " << c.call << endl;
    for (const auto& assignment : c.assignments) {
        writer.write_line(assignment);
    }
    return oss.str();
}

std::string render_declaration_block(std::string_view declaration, const std::string& newline) {
    auto body = lexical::range{0, declaration.size()};
    while (body.begin < body.end && (declaration[body.begin] == '\n' || declaration[body.begin] == '\r')) {
        ++body.begin;
    }
    while (body.end > body.begin && lexical::is_space(declaration[body.end - 1])) {
        --body.end;
    }

    std::ostringstream oss;
    CodeWriter writer(oss, {}, newline);
    writer << blank;
    writer.write_lines(declaration.substr(body.begin, body.end - body.begin));
    return oss.str();
}

} // namespace litfix::emit
