//
// Code Writer Implementation
//

#include <litfix/emit/code_writer.hh>

#include <utility>

namespace litfix::emit {

CodeWriter::CodeWriter(std::ostream& output, std::string indent, std::string newline)
    : output_(output),
      indent_(std::move(indent)),
      newline_(std::move(newline))
{
}

void CodeWriter::write_line(std::string_view line) {
    if (!line.empty()) {
        output_ << indent_ << line;
    }
    output_ << newline_;
}

void CodeWriter::write_raw(std::string_view text) {
    output_ << text;
}

void CodeWriter::write_continuation(std::string_view line) {
    output_ << newline_ << indent_ << line;
}

void CodeWriter::write_lines(std::string_view text) {
    std::size_t pos = 0;
    while (pos < text.size()) {
        std::size_t nl = text.find('\n', pos);
        if (nl == std::string_view::npos) {
            nl = text.size();
        }

        std::string_view line = text.substr(pos, nl - pos);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        write_line(line);
        pos = nl + 1;
    }
}

// ============================================================================
// Streaming
// ============================================================================

CodeWriter& CodeWriter::operator<<(std::string_view text) {
    pending_ += text;
    return *this;
}

CodeWriter& CodeWriter::operator<<(char c) {
    pending_ += c;
    return *this;
}

CodeWriter& CodeWriter::operator<<(CodeWriter& (*manip)(CodeWriter&)) {
    return manip(*this);
}

CodeWriter& endl(CodeWriter& writer) {
    writer.write_line(writer.pending_);
    writer.pending_.clear();
    return writer;
}

CodeWriter& blank(CodeWriter& writer) {
    writer.output_ << writer.newline_;
    return writer;
}

} // namespace litfix::emit
