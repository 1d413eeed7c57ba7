//
// Per-file diagnostics reported by the rewrite engine
//

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace litfix {

/// Severity level for diagnostic messages.
enum class diagnostic_level {
    error,    ///< The file (or a region of it) could not be processed
    warning,  ///< A literal was left untouched
    note      ///< Informational
};

/// Diagnostic codes.
///
/// E0xx codes name the error kinds of a run, W0xx codes name literals that
/// were recognized but deliberately left unchanged.
namespace diag_codes {
    constexpr const char* E_MALFORMED_LITERAL = "E001";    ///< Segment without name/value separator, duplicate field, bad brackets
    constexpr const char* E_UNTERMINATED_LITERAL = "E002"; ///< End of buffer reached inside a literal
    constexpr const char* E_BACKUP_FAILURE = "E003";       ///< Backup copy could not be written
    constexpr const char* E_IO_FAILURE = "E004";           ///< File unreadable or unwritable

    constexpr const char* W_NO_RULE_MATCHED = "W001";      ///< No rule's required fields are all present
    constexpr const char* W_NO_RECEIVER = "W002";          ///< In-place literal has extra fields but no receiver is configured
    constexpr const char* W_HOIST_CONFLICT = "W003";       ///< Hoisted statements would overlap an earlier rewrite
    constexpr const char* W_PASS_LIMIT = "W004";           ///< Passes stopped before the buffer converged
    constexpr const char* W_HOIST_UNSAFE = "W005";         ///< In-place literal sits where hoisting would change the code
}

/// 1-based line and column of a byte offset.
struct text_position {
    std::size_t line = 1;
    std::size_t column = 1;
};

/// Compute the line/column of `offset` in `buffer` (offset is clamped to the buffer size).
text_position position_of(std::string_view buffer, std::size_t offset);

/// A single diagnostic message.
///
/// Example output:
///   agent/storage/sqlite_test.go:41:12: warning: literal has no 'Serial' field [W001]
struct diagnostic {
    diagnostic_level level = diagnostic_level::warning;
    std::string code;       ///< One of diag_codes
    std::string message;
    std::string file;
    text_position position;

    /// Format as "file:line:column: level: message [code]" (no trailing newline).
    std::string format() const;
};

size_t count_level(const std::vector<diagnostic>& diagnostics, diagnostic_level level);

} // namespace litfix
