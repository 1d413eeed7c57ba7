//
// Rewrite engine implementation
//

#include <litfix/rewrite_engine.hh>
#include <litfix/construction_site.hh>
#include <litfix/emit/emitter.hh>
#include <litfix/field_extractor.hh>
#include <litfix/idempotence_guard.hh>
#include <litfix/rewrite_policy.hh>

#include <algorithm>
#include <iterator>
#include <utility>
#include <variant>

namespace litfix {

rewrite_engine::rewrite_engine(rule_set rules)
    : rules_(std::move(rules))
{
    scanners_.reserve(rules_.targets.size());
    for (const auto& target : rules_.targets) {
        scanners_.emplace_back(target.prefix);
    }
}

std::string fresh_receiver(std::string_view buffer,
                           const std::string& base,
                           const std::vector<std::string>& reserved) {
    auto taken = [&](const std::string& name) {
        return contains_identifier(buffer, name) ||
               std::find(reserved.begin(), reserved.end(), name) != reserved.end();
    };

    std::string name = base;
    for (int n = 2; taken(name); ++n) {
        name = base + std::to_string(n);
    }
    return name;
}

rewrite_engine::pass_outcome rewrite_engine::run_pass(std::size_t target_index,
                                                      std::string& buffer,
                                                      const std::string& file_name,
                                                      std::set<const rewrite_rule*>& used_rules) const {
    const auto& target = rules_.targets[target_index];
    const auto& scan = scanners_[target_index];

    pass_outcome outcome;
    std::vector<rewrite> rewrites;
    std::vector<std::string> hoisted_names;
    std::size_t consumed_end = 0;
    std::size_t pos = 0;

    auto report = [&](diagnostic_level level, const char* code, std::string message, std::size_t at) {
        pending_diagnostic p;
        p.diag.level = level;
        p.diag.code = code;
        p.diag.message = std::move(message);
        p.diag.file = file_name;
        p.offset = at;
        outcome.diagnostics.push_back(std::move(p));
    };

    while (true) {
        scan_result found = scan.scan(buffer, pos);
        if (found.status == scan_status::not_found) {
            break;
        }
        if (found.status == scan_status::unterminated) {
            report(diagnostic_level::warning, diag_codes::E_UNTERMINATED_LITERAL,
                   "unterminated '" + target.prefix + "{' literal; rest of file left unchanged",
                   found.where.start);
            break;
        }

        const span literal = found.where;
        pos = literal.end;

        if (found.mismatched) {
            report(diagnostic_level::warning, diag_codes::E_MALFORMED_LITERAL,
                   "mismatched brackets in '" + target.prefix + "{' literal", literal.start);
            continue;
        }

        auto extracted = extract_fields(buffer, literal);
        if (auto* bad = std::get_if<malformed_literal>(&extracted)) {
            report(diagnostic_level::warning, diag_codes::E_MALFORMED_LITERAL,
                   "malformed '" + target.prefix + "{' literal: " + bad->reason, bad->position);
            continue;
        }
        const auto& fields = std::get<std::vector<field>>(extracted);

        auto verdict = decide(fields, target.rules);
        if (auto* skip = std::get_if<no_rewrite>(&verdict)) {
            if (skip->reason == no_rewrite_reason::no_rule_matched) {
                report(diagnostic_level::warning, diag_codes::W_NO_RULE_MATCHED,
                       "no rule matches the fields of this '" + target.prefix + "{' literal",
                       literal.start);
            }
            continue;
        }
        const auto& plan = std::get<rewrite_plan>(verdict);
        const auto& rule = target.rules[plan.rule_index];

        construction_site site = classify_site(buffer, literal);

        if (site.kind == site_kind::declaration || plan.extra_fields.empty()) {
            auto rendered = emit::render(site, rule, plan, target.prefix);
            rewrites.push_back({literal, emit::render_replacement(site, rendered)});
        } else {
            // In-place literal with extra fields: hoist into statements before
            // the enclosing statement and leave the receiver in its place
            if (target.receiver.empty()) {
                report(diagnostic_level::warning, diag_codes::W_NO_RECEIVER,
                       "literal has extra fields but no receiver is configured for '" +
                       target.prefix + "'", literal.start);
                continue;
            }
            if (site.hoist != hoist_context::statement) {
                report(diagnostic_level::warning, diag_codes::W_HOIST_UNSAFE,
                       std::string("literal has extra fields but cannot be hoisted out of ") +
                       to_string(site.hoist), literal.start);
                continue;
            }
            if (site.statement_start < consumed_end) {
                report(diagnostic_level::warning, diag_codes::W_HOIST_CONFLICT,
                       "cannot hoist literal in front of a statement that is already rewritten",
                       literal.start);
                continue;
            }

            site.receiver = fresh_receiver(buffer, target.receiver, hoisted_names);
            hoisted_names.push_back(site.receiver);

            auto rendered = emit::render(site, rule, plan, target.prefix);
            std::string replacement = emit::render_hoisted(site, rendered);
            replacement.append(buffer, site.statement_start, literal.start - site.statement_start);
            replacement += site.receiver;
            rewrites.push_back({{site.statement_start, literal.end}, std::move(replacement)});
        }

        consumed_end = literal.end;
        used_rules.insert(&rule);
    }

    outcome.rewrites = rewrites.size();
    for (const auto& rw : rewrites) {
        outcome.edits.push_back({rw.where.start, rw.where.end, rw.replacement.size()});
    }
    std::sort(outcome.edits.begin(), outcome.edits.end(),
              [](const edit& a, const edit& b) { return a.start < b.start; });

    if (!rewrites.empty()) {
        buffer = apply_rewrites(buffer, std::move(rewrites));
    }
    return outcome;
}

void rewrite_engine::shift(std::vector<pending_diagnostic>& pending, const std::vector<edit>& edits) {
    for (auto& p : pending) {
        if (!p.anchored) {
            continue;
        }

        long long delta = 0;
        std::size_t moved = p.offset;
        for (const auto& e : edits) {
            if (e.end <= p.offset) {
                delta += static_cast<long long>(e.length) - static_cast<long long>(e.end - e.start);
            } else if (e.start <= p.offset) {
                // Inside replaced text: point at the replacement
                moved = e.start;
                break;
            } else {
                break;
            }
        }
        p.offset = static_cast<std::size_t>(static_cast<long long>(moved) + delta);
    }
}

buffer_rewrite rewrite_engine::rewrite_text(const std::string& text, const std::string& file_name) const {
    buffer_rewrite result;
    result.text = text;

    if (!has_candidates(text, rules_)) {
        return result;
    }
    result.had_candidates = true;

    std::set<const rewrite_rule*> used_rules;
    std::vector<pending_diagnostic> kept;

    for (std::size_t t = 0; t < rules_.targets.size(); ++t) {
        pass_outcome last;
        std::size_t passes = 0;
        do {
            last = run_pass(t, result.text, file_name, used_rules);
            result.rewrite_count += last.rewrites;
            shift(kept, last.edits);
            ++passes;
        } while (last.rewrites > 0 && passes < rules_.max_passes);

        bool converged = last.rewrites == 0;
        if (!converged) {
            // Limit reached: check on a copy whether another pass would change anything
            std::string scratch = result.text;
            std::set<const rewrite_rule*> scratch_rules;
            pass_outcome check = run_pass(t, scratch, file_name, scratch_rules);
            if (check.rewrites == 0) {
                last = std::move(check);
                converged = true;
            }
        }

        // The final pass saw every literal still left in the buffer
        shift(last.diagnostics, last.edits);
        kept.insert(kept.end(), std::make_move_iterator(last.diagnostics.begin()),
                    std::make_move_iterator(last.diagnostics.end()));

        if (!converged) {
            pending_diagnostic limit;
            limit.diag.level = diagnostic_level::warning;
            limit.diag.code = diag_codes::W_PASS_LIMIT;
            limit.diag.message = "stopped after " + std::to_string(passes) + " passes over '" +
                                 rules_.targets[t].prefix + "' literals before reaching a fixed point";
            limit.diag.file = file_name;
            limit.anchored = false;
            kept.push_back(std::move(limit));
        }
    }

    if (result.changed()) {
        // Helper declarations, once per file, in configuration order
        const std::string newline(line_terminator(result.text, 0));
        std::string block;
        for (const auto& target : rules_.targets) {
            for (const auto& rule : target.rules) {
                if (used_rules.count(&rule) == 0 || !needs_helper_declaration(result.text, rule)) {
                    continue;
                }
                if (block.find(rule.declaration_marker()) != std::string::npos) {
                    continue;
                }
                block += emit::render_declaration_block(rule.declaration, newline);
                result.inserted_helpers.push_back(rule.helper);
            }
        }

        if (!block.empty()) {
            const std::size_t anchor = declaration_anchor(result.text);
            if (anchor == result.text.size() && !result.text.empty() && result.text.back() != '\n') {
                block.insert(0, newline);
            }
            shift(kept, {{anchor, anchor, block.size()}});
            result.text = apply_rewrites(result.text, {{{anchor, anchor}, std::move(block)}});
        }
    }

    for (auto& p : kept) {
        if (p.anchored) {
            p.diag.position = position_of(result.text, p.offset);
        }
        result.diagnostics.push_back(std::move(p.diag));
    }

    return result;
}

} // namespace litfix
