//
// Rewrite engine: turns one source buffer into its rewritten form
//

#pragma once

#include <cstddef>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <litfix/diagnostics.hh>
#include <litfix/rewrite_rule.hh>
#include <litfix/scanner.hh>
#include <litfix/span.hh>

namespace litfix {

/// Result of rewriting one buffer. `text` equals the input when nothing changed.
struct buffer_rewrite {
    std::string text;
    std::size_t rewrite_count = 0;              ///< Literals replaced (helper insertions not counted)
    bool had_candidates = false;                ///< False when the guard skipped the buffer
    std::vector<std::string> inserted_helpers;  ///< Helpers whose declaration was added
    std::vector<diagnostic> diagnostics;        ///< Literals left untouched and why

    [[nodiscard]] bool changed() const { return rewrite_count > 0; }
};

/**
 * Applies a rule set to source buffers.
 *
 * The engine is immutable after construction and shared by all workers;
 * rewrite_text() is a pure function of its input.
 *
 * Per target, the buffer is scanned left to right; each literal is
 * extracted, matched against the target's rules, rendered and collected as a
 * non-overlapping rewrite, and the buffer is rebuilt once per pass. Passes
 * repeat until one makes no change, so literals nested in field values are
 * rewritten in the same run. When the pass limit is reached, one more pass is
 * run on a copy to tell convergence from a real cutoff (W004). Finally,
 * helper declarations used by at least one rewrite are inserted at the
 * declaration anchor unless already present.
 *
 * Diagnostic positions refer to the returned text.
 */
class rewrite_engine {
public:
    explicit rewrite_engine(rule_set rules);

    [[nodiscard]] buffer_rewrite rewrite_text(const std::string& text,
                                              const std::string& file_name = "<input>") const;

    [[nodiscard]] const rule_set& rules() const { return rules_; }

private:
    /// A diagnostic whose position is still a byte offset into some pass's
    /// input buffer; it is moved along with every later edit and resolved
    /// against the final text.
    struct pending_diagnostic {
        diagnostic diag;
        std::size_t offset = 0;
        bool anchored = true;   ///< false for whole-file diagnostics (reported at 1:1)
    };

    /// [start, end) of a pass's input replaced by `length` bytes
    struct edit {
        std::size_t start;
        std::size_t end;
        std::size_t length;
    };

    struct pass_outcome {
        std::size_t rewrites = 0;
        std::vector<pending_diagnostic> diagnostics;
        std::vector<edit> edits;    ///< ascending, non-overlapping
    };

    static void shift(std::vector<pending_diagnostic>& pending, const std::vector<edit>& edits);

    pass_outcome run_pass(std::size_t target_index,
                          std::string& buffer,
                          const std::string& file_name,
                          std::set<const rewrite_rule*>& used_rules) const;

    rule_set rules_;
    std::vector<scanner> scanners_;   // one per target
};

/// Receiver name for a hoisted literal: `base`, then `base2`, `base3`, ...
/// skipping names used as identifiers in `buffer` and names in `reserved`.
std::string fresh_receiver(std::string_view buffer,
                           const std::string& base,
                           const std::vector<std::string>& reserved = {});

} // namespace litfix
