//
// Left-to-right buffer rebuild
//

#include <litfix/span.hh>
#include <litfix/errors.hh>

#include <algorithm>

namespace litfix {

std::string apply_rewrites(std::string_view buffer, std::vector<rewrite> rewrites) {
    // Insertions sort ahead of a replacement that starts at the same position
    std::stable_sort(rewrites.begin(), rewrites.end(),
        [](const rewrite& a, const rewrite& b) {
            if (a.where.start != b.where.start) {
                return a.where.start < b.where.start;
            }
            return a.where.empty() && !b.where.empty();
        });

    std::string out;
    out.reserve(buffer.size());

    std::size_t cursor = 0;
    for (const auto& rw : rewrites) {
        if (rw.where.start > rw.where.end || rw.where.end > buffer.size()) {
            throw litfix_error("Rewrite span [" + std::to_string(rw.where.start) + ", " +
                               std::to_string(rw.where.end) + ") is outside the buffer");
        }
        if (rw.where.start < cursor) {
            throw litfix_error("Overlapping rewrites at offset " + std::to_string(rw.where.start));
        }

        out.append(buffer.substr(cursor, rw.where.start - cursor));
        out += rw.replacement;
        cursor = rw.where.end;
    }
    out.append(buffer.substr(cursor));

    return out;
}

} // namespace litfix
