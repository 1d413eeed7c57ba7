#pragma once

#include <iostream>
#include <string>

#include <litfix/diagnostics.hh>

namespace litfix::driver {

enum class LogLevel {
    Quiet,   // Errors only
    Normal,  // Errors, warnings, rewritten files, summary
    Verbose  // + unchanged and skipped files, inserted helpers
};

enum class ColorMode {
    Auto,    // Auto-detect TTY
    Always,  // Force colors
    Never    // Disable colors
};

/**
 * CLI logger with color support.
 * Uses termcolor for TTY detection and color handling.
 *
 * Output routing:
 * - Errors, warnings → stderr
 * - Diagnostics → stderr
 * - Success, verbose, summary → stdout
 *
 * The logger itself is not synchronized; the file processor serializes the
 * progress callback that calls it.
 */
class Logger {
public:
    explicit Logger(LogLevel level = LogLevel::Normal,
                   ColorMode color = ColorMode::Auto);

    void error(const std::string& message);
    void warning(const std::string& message);
    void success(const std::string& message);
    void verbose(const std::string& message);

    /**
     * Print a rewrite diagnostic as `file:line:col: level: message [code]`.
     * Errors print at every level, warnings from Normal, notes from Verbose.
     */
    void report(const litfix::diagnostic& diag);

    void bullet(const std::string& message, LogLevel min_level = LogLevel::Normal);

    /// Bold header line, e.g. the run summary
    void heading(const std::string& message);

    void set_level(LogLevel level) { level_ = level; }
    LogLevel get_level() const { return level_; }

private:
    LogLevel level_;
    ColorMode color_mode_;

    bool should_log(LogLevel required_level) const;
};

} // namespace litfix::driver
