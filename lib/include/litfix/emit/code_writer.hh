//
// Code Writer - line output for statements spliced into existing source
//
// Every emitted line starts with the indentation of the source line the
// output replaces, so assignments and hoisted statements line up with the
// surrounding code. Empty lines are never indented. Lines end with the
// terminator of the buffer being edited, so CRLF sources stay CRLF.
//

#pragma once

#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace litfix::emit {

class CodeWriter {
public:
    explicit CodeWriter(std::ostream& output, std::string indent = {}, std::string newline = "\n");

    CodeWriter(const CodeWriter&) = delete;
    CodeWriter& operator=(const CodeWriter&) = delete;

    // Write a complete line at the current indentation
    void write_line(std::string_view line);

    // Write text as-is, no indentation, no newline
    void write_raw(std::string_view text);

    // Terminate the current line and start an indented one, left open;
    // used to append statements after text that is already on the line
    void write_continuation(std::string_view line);

    // Write each line of a multi-line block; its own line endings are replaced
    void write_lines(std::string_view text);

    void set_indent(std::string indent) { indent_ = std::move(indent); }
    const std::string& indent() const { return indent_; }

    void set_newline(std::string newline) { newline_ = std::move(newline); }
    const std::string& newline() const { return newline_; }

    // Accumulate text until endl
    CodeWriter& operator<<(std::string_view text);
    CodeWriter& operator<<(char c);
    CodeWriter& operator<<(CodeWriter& (*manip)(CodeWriter&));

    friend CodeWriter& endl(CodeWriter& writer);
    friend CodeWriter& blank(CodeWriter& writer);

private:
    std::ostream& output_;
    std::string indent_;
    std::string newline_;
    std::string pending_;
};

// Flush the accumulated text as one line
CodeWriter& endl(CodeWriter& writer);

// Write an empty line
CodeWriter& blank(CodeWriter& writer);

} // namespace litfix::emit
