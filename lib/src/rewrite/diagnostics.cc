//
// Diagnostic formatting and utilities
//

#include <litfix/diagnostics.hh>

#include <algorithm>
#include <sstream>

namespace litfix {

text_position position_of(std::string_view buffer, std::size_t offset) {
    offset = std::min(offset, buffer.size());

    text_position pos;
    for (std::size_t i = 0; i < offset; ++i) {
        if (buffer[i] == '\n') {
            ++pos.line;
            pos.column = 1;
        } else {
            ++pos.column;
        }
    }
    return pos;
}

std::string diagnostic::format() const {
    std::ostringstream oss;

    // Format: file:line:column: level: message [code]
    oss << file << ":"
        << position.line << ":"
        << position.column << ": ";

    switch (level) {
        case diagnostic_level::error:
            oss << "error: ";
            break;
        case diagnostic_level::warning:
            oss << "warning: ";
            break;
        case diagnostic_level::note:
            oss << "note: ";
            break;
    }

    oss << message;

    if (!code.empty()) {
        oss << " [" << code << "]";
    }

    return oss.str();
}

size_t count_level(const std::vector<diagnostic>& diagnostics, diagnostic_level level) {
    return static_cast<size_t>(std::count_if(diagnostics.begin(), diagnostics.end(),
        [level](const auto& d) { return d.level == level; }));
}

} // namespace litfix
